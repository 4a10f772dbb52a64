#pragma once

#include <arrow/result.h>
#include <arrow/status.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "client/cpp/upload_transport.h"

namespace datahub::client {

inline uint32_t DefaultUploadThreads() {
  return std::max(1u, std::thread::hardware_concurrency());
}

struct UploadOptions {
  uint32_t                  threads = DefaultUploadThreads();
  // extra attempts per part after the first; only IOError is retried
  uint32_t                  retries = 3;
  std::chrono::milliseconds retry_backoff{200};
  // per attempt; also bounds starting the session and direct ingest. Zero waits forever.
  std::chrono::milliseconds part_timeout{std::chrono::minutes(5)};
  // the server assembles and verifies the whole file before answering
  std::chrono::milliseconds complete_timeout{std::chrono::minutes(30)};
  // files up to this size go through IngestSmallFile in one call
  uint64_t                  small_file_threshold = 10ull * 1024 * 1024;
  // called after each part that reaches the server
  std::function<void(uint32_t received, uint32_t total)> on_progress;
};

struct UploadFileRequest {
  std::string              path;
  std::string              dataset_name;
  std::string              description;
  std::vector<std::string> tags;
  // defaults to the dataset name on the server side
  std::string              filename;
};

struct UploadOutcome {
  datahub::v1::Dataset dataset;
  uint32_t             version_id = 0;
  std::string          upload_id; // empty for direct ingest
  bool                 resumed    = false;
  uint32_t             parts_sent = 0;
};

/*
  Attached to the status of an upload that ended with parts missing.
  The session is left as it is; Upload with the same file resumes it.
*/
class MissingPartsDetail : public arrow::StatusDetail {
 public:
  MissingPartsDetail(std::string upload_id, std::vector<uint32_t> missing_parts);

  const char* type_id() const override;
  std::string ToString() const override;

  const std::string& upload_id() const {
    return upload_id_;
  }
  const std::vector<uint32_t>& missing_parts() const {
    return missing_parts_;
  }

 private:
  std::string           upload_id_;
  std::vector<uint32_t> missing_parts_;
};

// nullptr unless `status` came from an upload with parts missing.
std::shared_ptr<MissingPartsDetail> MissingPartsOf(const arrow::Status& status);

// "1-3, 7, 9-11"
std::string FormatPartList(const std::vector<uint32_t>& parts);

/*
  Client side of resumable ingestion.

      checksum file (streaming) -> StartOrResumeUpload
        -> send every part the server lacks on `threads` workers
        -> CompleteUpload

  Parts are read with positional reads on one shared file handle. A part
  that still fails after its retries is recorded and the workers carry on
  with the rest; the call then fails without completing and its status
  carries a MissingPartsDetail. A rejection other than IOError stops
  further parts from being sent. Running Upload again with the same file
  resumes the session and sends only what is missing.
*/
class ParallelUploader {
 public:
  ParallelUploader(std::shared_ptr<UploadTransport> transport, UploadOptions options = {});

  arrow::Result<UploadOutcome> Upload(const UploadFileRequest& request) const;

 private:
  arrow::Result<UploadOutcome> UploadSmall(const UploadFileRequest& request, const std::string& checksum, int64_t size) const;

  // Retries `call` on IOError with linear backoff.
  template <typename T>
  arrow::Result<T> WithRetries(const std::function<arrow::Result<T>()>& call) const;

  std::shared_ptr<UploadTransport> transport_;
  UploadOptions                    options_;
};

} // namespace datahub::client
