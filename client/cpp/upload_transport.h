#pragma once

#include <arrow/result.h>

#include <chrono>
#include <string>

#include "datahub/v1.hpp"

namespace datahub::client {

using Deadline = std::chrono::system_clock::time_point;

constexpr Deadline kNoDeadline = Deadline::max();

// kNoDeadline for a zero or negative timeout.
inline Deadline DeadlineAfter(std::chrono::milliseconds timeout) {
  if (timeout.count() <= 0) return kNoDeadline;
  return std::chrono::system_clock::now() + timeout;
}

/*
  The ingest calls the parallel uploader needs. HubClient implements it
  over gRPC; tests plug in an in-process implementation.

  A call still running at `deadline` is abandoned and reported as IOError.
  Implementations must be safe to call from several threads at once.
*/
class UploadTransport {
 public:
  virtual ~UploadTransport() = default;

  virtual arrow::Result<datahub::v1::StartOrResumeUploadResponse> StartOrResumeUpload(
      const datahub::v1::StartOrResumeUploadRequest& request, Deadline deadline) const = 0;

  virtual arrow::Result<datahub::v1::UploadPartResponse> UploadPart(const datahub::v1::UploadPartRequest& request,
                                                                    Deadline deadline) const = 0;

  virtual arrow::Result<datahub::v1::CompleteUploadResponse> CompleteUpload(const std::string& upload_id, Deadline deadline) const = 0;

  virtual arrow::Result<datahub::v1::IngestSmallFileResponse> IngestSmallFile(const datahub::v1::IngestSmallFileRequest& request,
                                                                              Deadline deadline) const = 0;
};

} // namespace datahub::client
