#include "ingest_service.hpp"

#include <arrow/buffer.h>

#include "internal/catalog/dataset_version_store.hpp"
#include "internal/ingest/upload_session_manager.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace datahub::service {

using namespace datahub::v1;

namespace {

std::vector<std::string> Tags(const google::protobuf::RepeatedPtrField<std::string>& tags) {
  return {tags.begin(), tags.end()};
}

void RequireUploadId(const std::string& upload_id) {
  if (upload_id.empty()) {
    throw datahub::util::ValidationError("upload_id is required");
  }
}

} // namespace

IngestService::IngestService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

StartOrResumeUploadResponse IngestService::StartOrResume(const std::string& uid, const StartOrResumeUploadRequest& req) {
  return ObserveRpc("IngestService.StartOrResume", req.dataset_name(), [&] {
    ingest::StartRequest start;
    start.uid          = uid;
    start.dataset_name = req.dataset_name();
    start.description  = req.description();
    start.tags         = Tags(req.tags());
    start.filename     = req.filename();
    start.checksum     = req.checksum();
    start.total_size   = req.total_size();

    auto started = ctx_.sessions->StartOrResume(start);

    StartOrResumeUploadResponse resp;
    *resp.mutable_session() = ingest::ToProto(started.view);
    resp.set_resumed(started.resumed);
    return resp;
  });
}

UploadPartResponse IngestService::UploadPart(const std::string& uid, const UploadPartRequest& req) {
  return ObserveRpc("IngestService.UploadPart", req.upload_id(), [&] {
    RequireUploadId(req.upload_id());

    auto part = ctx_.sessions->UploadPart(uid, req.upload_id(), req.part_number(), arrow::Buffer::FromString(req.data()),
                                          req.part_checksum());

    UploadPartResponse resp;
    resp.set_part_number(part.part_number);
    resp.set_already_stored(part.already_stored);
    resp.set_received_count(part.received_count);
    return resp;
  });
}

CompleteUploadResponse IngestService::Complete(const std::string& uid, const CompleteUploadRequest& req) {
  return ObserveRpc("IngestService.Complete", req.upload_id(), [&] {
    RequireUploadId(req.upload_id());

    auto done = ctx_.sessions->Complete(uid, req.upload_id());

    CompleteUploadResponse resp;
    *resp.mutable_dataset() = catalog::ToProto(done.dataset);
    resp.set_version_id(done.version_id);
    return resp;
  });
}

DescribeUploadResponse IngestService::Describe(const std::string& uid, const DescribeUploadRequest& req) {
  return ObserveRpc("IngestService.Describe", req.upload_id(), [&] {
    RequireUploadId(req.upload_id());

    DescribeUploadResponse resp;
    *resp.mutable_session() = ingest::ToProto(ctx_.sessions->Describe(uid, req.upload_id()));
    return resp;
  });
}

void IngestService::Abort(const std::string& uid, const AbortUploadRequest& req) {
  ObserveRpc("IngestService.Abort", req.upload_id(), [&] {
    RequireUploadId(req.upload_id());
    ctx_.sessions->Abort(uid, req.upload_id());
  });
}

IngestSmallFileResponse IngestService::IngestSmallFile(const std::string& uid, const IngestSmallFileRequest& req) {
  return ObserveRpc("IngestService.IngestSmallFile", req.dataset_name(), [&] {
    ingest::SmallFileRequest small;
    small.uid          = uid;
    small.dataset_name = req.dataset_name();
    small.description  = req.description();
    small.tags         = Tags(req.tags());
    small.filename     = req.filename();
    small.checksum     = req.checksum();
    small.data         = arrow::Buffer::FromString(req.data());

    auto done = ctx_.sessions->IngestSmallFile(small);

    IngestSmallFileResponse resp;
    *resp.mutable_dataset() = catalog::ToProto(done.dataset);
    resp.set_version_id(done.version_id);
    return resp;
  });
}

}
