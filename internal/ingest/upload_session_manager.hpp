#pragma once

#include <arrow/buffer.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "config/config.pb.h"
#include "datahub/core/v1/types.pb.h"
#include "internal/catalog/dataset_version_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/ingest/chunk_planner.hpp"
#include "internal/quota/quota_guard.hpp"
#include "internal/storage/object_store.hpp"
#include "internal/util/time.hpp"

namespace datahub::ingest {

struct IngestOptions {
  ChunkPolicy          chunk_policy;
  std::chrono::seconds session_ttl{24 * 60 * 60};
  uint64_t             small_file_threshold = 10 * kMiB;
};

IngestOptions OptionsFromConfig(const datahub::runtime::config::IngestConfig& config);

struct StartRequest {
  std::string              uid;
  std::string              dataset_name;
  std::string              description;
  std::vector<std::string> tags;
  std::string              filename;
  std::string              checksum;
  uint64_t                 total_size = 0;
};

struct SessionView {
  db::model::UploadSessionRecord session;
  std::set<uint32_t>             received_parts;

  std::vector<uint32_t> MissingParts() const;
};

struct StartResult {
  SessionView view;
  bool        resumed = false;
};

struct PartResult {
  uint32_t part_number    = 0;
  bool     already_stored = false;
  uint32_t received_count = 0;
};

struct CompleteResult {
  catalog::DatasetView dataset;
  uint32_t             version_id = 0;
};

struct SmallFileRequest {
  std::string                    uid;
  std::string                    dataset_name;
  std::string                    description;
  std::vector<std::string>       tags;
  std::string                    filename;
  std::string                    checksum; // optional; verified when present
  std::shared_ptr<arrow::Buffer> data;
};

struct ReapStats {
  size_t aborted = 0; // unfinished sessions dropped with their staged parts
  size_t purged  = 0; // persisted sessions past their replay window
};

/*
  Server side of resumable chunked ingestion.

  Session lifecycle (durable, keyed by uid + dataset name + checksum):

      CREATED -> PARTS_PENDING -> FINALIZING -> DATASET_PERSISTED
                        ^              |
                        +--- FAILED <--+

  - StartOrResume admits through the quota guard only when it creates a
    session; resuming is never denied
  - part bytes go to object storage outside any lock; the received-part
    row is a conditional insert under the per-upload mutex
  - Complete commits all metadata in one transaction and is replay-safe
    on upload_id
*/
class UploadSessionManager {
 public:
  UploadSessionManager(std::shared_ptr<db::Repository> repo, std::shared_ptr<storage::ObjectStore> store,
                       std::shared_ptr<quota::QuotaGuard> quota, std::shared_ptr<catalog::DatasetVersionStore> versions,
                       IngestOptions options, util::ClockFn clock = util::Now);

  StartResult StartOrResume(const StartRequest& request);

  PartResult UploadPart(const std::string& uid, const std::string& upload_id, uint32_t part_number,
                        const std::shared_ptr<arrow::Buffer>& data, const std::string& part_checksum);

  CompleteResult Complete(const std::string& uid, const std::string& upload_id);

  SessionView Describe(const std::string& uid, const std::string& upload_id);

  void Abort(const std::string& uid, const std::string& upload_id);

  // Drops sessions idle for longer than the TTL.
  ReapStats ReapExpired();

  CompleteResult IngestSmallFile(const SmallFileRequest& request);

  const IngestOptions& options() const {
    return options_;
  }

 private:
  std::shared_ptr<std::mutex> UploadMutex(const std::string& upload_id);
  void                        ForgetUploadMutex(const std::string& upload_id);

  SessionView LoadView(db::Transaction& tx, db::model::UploadSessionRecord session);
  db::model::UploadSessionRecord LoadOwned(db::Transaction& tx, const std::string& uid, const std::string& upload_id);

  // Creates the backend multipart on first use. Caller holds the upload mutex.
  db::model::UploadSessionRecord EnsureMultipart(const std::string& uid, const std::string& upload_id);

  void MarkFailed(const std::string& upload_id, const std::string& reason);

  // Deletes storage for a session that will never be persisted.
  void DiscardStorage(const db::model::UploadSessionRecord& session);

  CompleteResult LoadPersisted(const db::model::UploadSessionRecord& session);

  std::shared_ptr<db::Repository>               repo_;
  std::shared_ptr<storage::ObjectStore>         store_;
  std::shared_ptr<quota::QuotaGuard>            quota_;
  std::shared_ptr<catalog::DatasetVersionStore> versions_;
  IngestOptions                                 options_;
  util::ClockFn                                 clock_;

  std::mutex                                                   upload_mutexes_guard_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> upload_mutexes_;
};

datahub::core::v1::UploadSession ToProto(const SessionView& view);

} // namespace datahub::ingest
