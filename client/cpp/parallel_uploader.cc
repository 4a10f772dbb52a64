#include "client/cpp/parallel_uploader.h"

#include <arrow/io/file.h>

#include <algorithm>
#include <atomic>
#include <mutex>
#include <sstream>
#include <thread>

#include "internal/checksum/checksum_engine.hpp"
#include "internal/ingest/chunk_planner.hpp"

namespace datahub::client {

namespace {

constexpr char kMissingPartsDetailType[] = "datahub::client::MissingPartsDetail";

} // namespace

MissingPartsDetail::MissingPartsDetail(std::string upload_id, std::vector<uint32_t> missing_parts)
    : upload_id_(std::move(upload_id)), missing_parts_(std::move(missing_parts)) {}

const char* MissingPartsDetail::type_id() const {
  return kMissingPartsDetailType;
}

std::string MissingPartsDetail::ToString() const {
  return "upload " + upload_id_ + " missing parts " + FormatPartList(missing_parts_);
}

std::shared_ptr<MissingPartsDetail> MissingPartsOf(const arrow::Status& status) {
  const auto& detail = status.detail();
  if (!detail || std::string(detail->type_id()) != kMissingPartsDetailType) {
    return nullptr;
  }
  return std::static_pointer_cast<MissingPartsDetail>(detail);
}

std::string FormatPartList(const std::vector<uint32_t>& parts) {
  std::ostringstream out;
  for (size_t i = 0; i < parts.size();) {
    size_t j = i;
    while (j + 1 < parts.size() && parts[j + 1] == parts[j] + 1) ++j;

    if (i > 0) out << ", ";
    out << parts[i];
    if (j > i) out << "-" << parts[j];
    i = j + 1;
  }
  return out.str();
}

ParallelUploader::ParallelUploader(std::shared_ptr<UploadTransport> transport, UploadOptions options)
    : transport_(std::move(transport)), options_(std::move(options)) {
  if (options_.threads == 0) options_.threads = 1;
}

template <typename T>
arrow::Result<T> ParallelUploader::WithRetries(const std::function<arrow::Result<T>()>& call) const {
  arrow::Result<T> result = call();
  for (uint32_t attempt = 1; attempt <= options_.retries && !result.ok() && result.status().IsIOError(); ++attempt) {
    std::this_thread::sleep_for(options_.retry_backoff * attempt);
    result = call();
  }
  return result;
}

arrow::Result<UploadOutcome> ParallelUploader::Upload(const UploadFileRequest& request) const {
  ARROW_ASSIGN_OR_RAISE(auto checksum, datahub::checksum::FileChecksum(request.path));
  ARROW_ASSIGN_OR_RAISE(auto file, arrow::io::ReadableFile::Open(request.path));
  ARROW_ASSIGN_OR_RAISE(const int64_t size, file->GetSize());

  if (static_cast<uint64_t>(size) <= options_.small_file_threshold) {
    ARROW_RETURN_NOT_OK(file->Close());
    return UploadSmall(request, checksum, size);
  }

  // ------------------------------------------------------------------
  // session
  // ------------------------------------------------------------------
  datahub::v1::StartOrResumeUploadRequest start;
  start.set_dataset_name(request.dataset_name);
  start.set_description(request.description);
  for (const auto& tag : request.tags) start.add_tags(tag);
  start.set_filename(request.filename);
  start.set_checksum(checksum);
  start.set_total_size(static_cast<uint64_t>(size));

  ARROW_ASSIGN_OR_RAISE(auto started, WithRetries<datahub::v1::StartOrResumeUploadResponse>([&] {
                          return transport_->StartOrResumeUpload(start, DeadlineAfter(options_.part_timeout));
                        }));
  const auto& session = started.session();

  if (session.chunk_size() == 0) {
    return arrow::Status::Invalid("upload ", session.upload_id(), " has no chunk size");
  }
  const auto plan = datahub::ingest::PlanWithChunkSize(static_cast<uint64_t>(size), session.chunk_size());
  if (plan.part_count != session.part_count()) {
    return arrow::Status::Invalid("upload ", session.upload_id(), " expects ", session.part_count(), " parts, file splits into ",
                                  plan.part_count);
  }
  const std::vector<uint32_t> received(session.received_parts().begin(), session.received_parts().end());
  const auto                  pending = plan.MissingParts(received);

  // ------------------------------------------------------------------
  // parts
  // ------------------------------------------------------------------
  std::atomic<size_t>   next{0};
  std::atomic<bool>     stop{false};
  std::atomic<uint32_t> received_count{plan.part_count - static_cast<uint32_t>(pending.size())};
  std::atomic<uint32_t> sent{0};
  std::mutex            error_mutex;
  arrow::Status         first_error;
  uint32_t              first_failed_part = 0;
  std::vector<uint32_t> failed;

  auto send_part = [&](uint32_t part_number) -> arrow::Status {
    const auto range = plan.Part(part_number);
    ARROW_ASSIGN_OR_RAISE(auto data, file->ReadAt(static_cast<int64_t>(range.offset), static_cast<int64_t>(range.length)));

    datahub::v1::UploadPartRequest part;
    part.set_upload_id(session.upload_id());
    part.set_part_number(part_number);
    part.set_data(data->data(), static_cast<size_t>(data->size()));
    part.set_part_checksum(datahub::checksum::Md5Hex(*data));

    ARROW_ASSIGN_OR_RAISE(auto resp, WithRetries<datahub::v1::UploadPartResponse>([&] {
                            return transport_->UploadPart(part, DeadlineAfter(options_.part_timeout));
                          }));
    if (!resp.already_stored()) ++sent;
    const auto count = ++received_count;
    if (options_.on_progress) options_.on_progress(count, plan.part_count);
    return arrow::Status::OK();
  };

  auto worker = [&] {
    while (!stop) {
      const size_t i = next++;
      if (i >= pending.size()) return;

      auto status = send_part(pending[i]);
      if (status.ok()) continue;

      std::lock_guard<std::mutex> lock(error_mutex);
      failed.push_back(pending[i]);
      if (first_error.ok()) {
        first_error       = status;
        first_failed_part = pending[i];
      }
      // retries are spent; anything else concerns the session, not this part
      if (!status.IsIOError()) stop = true;
    }
  };

  const auto thread_count = std::min<size_t>(options_.threads, std::max<size_t>(pending.size(), 1));
  std::vector<std::thread> threads;
  threads.reserve(thread_count);
  for (size_t t = 0; t < thread_count; ++t) threads.emplace_back(worker);
  for (auto& thread : threads) thread.join();

  ARROW_RETURN_NOT_OK(file->Close());

  if (!first_error.ok()) {
    // parts never handed to a worker are missing as well
    for (size_t i = std::min(next.load(), pending.size()); i < pending.size(); ++i) failed.push_back(pending[i]);
    std::sort(failed.begin(), failed.end());

    return first_error
        .WithMessage("upload ", session.upload_id(), " is missing parts ", FormatPartList(failed), "; part ", first_failed_part, ": ",
                     first_error.message())
        .WithDetail(std::make_shared<MissingPartsDetail>(session.upload_id(), failed));
  }

  // ------------------------------------------------------------------
  // finalize
  // ------------------------------------------------------------------
  ARROW_ASSIGN_OR_RAISE(auto done, WithRetries<datahub::v1::CompleteUploadResponse>([&] {
                          return transport_->CompleteUpload(session.upload_id(), DeadlineAfter(options_.complete_timeout));
                        }));

  UploadOutcome outcome;
  outcome.dataset    = done.dataset();
  outcome.version_id = done.version_id();
  outcome.upload_id  = session.upload_id();
  outcome.resumed    = started.resumed();
  outcome.parts_sent = sent;
  return outcome;
}

arrow::Result<UploadOutcome> ParallelUploader::UploadSmall(const UploadFileRequest& request, const std::string& checksum,
                                                           int64_t size) const {
  ARROW_ASSIGN_OR_RAISE(auto file, arrow::io::ReadableFile::Open(request.path));
  ARROW_ASSIGN_OR_RAISE(auto data, file->Read(size));
  ARROW_RETURN_NOT_OK(file->Close());

  datahub::v1::IngestSmallFileRequest ingest;
  ingest.set_dataset_name(request.dataset_name);
  ingest.set_description(request.description);
  for (const auto& tag : request.tags) ingest.add_tags(tag);
  ingest.set_filename(request.filename);
  ingest.set_checksum(checksum);
  ingest.set_data(data->data(), static_cast<size_t>(data->size()));

  ARROW_ASSIGN_OR_RAISE(auto done, WithRetries<datahub::v1::IngestSmallFileResponse>([&] {
                          return transport_->IngestSmallFile(ingest, DeadlineAfter(options_.part_timeout));
                        }));

  UploadOutcome outcome;
  outcome.dataset    = done.dataset();
  outcome.version_id = done.version_id();
  outcome.parts_sent = 1;
  return outcome;
}

} // namespace datahub::client
