#include "client/cpp/hub_client.h"

#include <arrow/io/file.h>

#include "internal/checksum/checksum_engine.hpp"

namespace datahub::client {

arrow::Status GrpcToArrow(const ::grpc::Status& status, std::string_view action) {
  if (status.ok()) {
    return arrow::Status::OK();
  }
  switch (status.error_code()) {
    case ::grpc::StatusCode::DATA_LOSS:
    case ::grpc::StatusCode::UNAVAILABLE:
    case ::grpc::StatusCode::DEADLINE_EXCEEDED:
    case ::grpc::StatusCode::ABORTED:
    case ::grpc::StatusCode::INTERNAL:
      return arrow::Status::IOError(std::string(action), " failed: ", status.error_message());
    case ::grpc::StatusCode::NOT_FOUND:
      return arrow::Status::KeyError(std::string(action), " failed: ", status.error_message());
    default:
      return arrow::Status::Invalid(std::string(action), " failed: ", status.error_message());
  }
}

HubClient::HubClient(std::shared_ptr<::grpc::Channel> channel, std::string token)
    : token_(std::move(token)),
      ingest_stub_(datahub::v1::DatasetIngestService::NewStub(channel)),
      catalog_stub_(datahub::v1::DatasetCatalogService::NewStub(std::move(channel))) {}

void HubClient::Authorize(::grpc::ClientContext* ctx) const {
  if (!token_.empty()) {
    ctx->AddMetadata("authorization", "Bearer " + token_);
  }
}

void HubClient::ApplyDeadline(::grpc::ClientContext* ctx, Deadline deadline) {
  if (deadline != kNoDeadline) {
    ctx->set_deadline(deadline);
  }
}

arrow::Result<datahub::v1::StartOrResumeUploadResponse> HubClient::StartOrResumeUpload(
    const datahub::v1::StartOrResumeUploadRequest& request, Deadline deadline) const {
  datahub::v1::StartOrResumeUploadResponse resp;
  ::grpc::ClientContext                      ctx;
  Authorize(&ctx);
  ApplyDeadline(&ctx, deadline);

  ARROW_RETURN_NOT_OK(GrpcToArrow(ingest_stub_->StartOrResumeUpload(&ctx, request, &resp), "StartOrResumeUpload"));
  return resp;
}

arrow::Result<datahub::v1::UploadPartResponse> HubClient::UploadPart(const datahub::v1::UploadPartRequest& request,
                                                                     Deadline deadline) const {
  datahub::v1::UploadPartResponse resp;
  ::grpc::ClientContext             ctx;
  Authorize(&ctx);
  ApplyDeadline(&ctx, deadline);

  ARROW_RETURN_NOT_OK(GrpcToArrow(ingest_stub_->UploadPart(&ctx, request, &resp), "UploadPart"));
  return resp;
}

arrow::Result<datahub::v1::CompleteUploadResponse> HubClient::CompleteUpload(const std::string& upload_id, Deadline deadline) const {
  datahub::v1::CompleteUploadRequest req;
  req.set_upload_id(upload_id);

  datahub::v1::CompleteUploadResponse resp;
  ::grpc::ClientContext                 ctx;
  Authorize(&ctx);
  ApplyDeadline(&ctx, deadline);

  ARROW_RETURN_NOT_OK(GrpcToArrow(ingest_stub_->CompleteUpload(&ctx, req, &resp), "CompleteUpload"));
  return resp;
}

arrow::Result<datahub::v1::IngestSmallFileResponse> HubClient::IngestSmallFile(const datahub::v1::IngestSmallFileRequest& request,
                                                                               Deadline deadline) const {
  datahub::v1::IngestSmallFileResponse resp;
  ::grpc::ClientContext                  ctx;
  Authorize(&ctx);
  ApplyDeadline(&ctx, deadline);

  ARROW_RETURN_NOT_OK(GrpcToArrow(ingest_stub_->IngestSmallFile(&ctx, request, &resp), "IngestSmallFile"));
  return resp;
}

arrow::Result<datahub::v1::UploadSession> HubClient::DescribeUpload(const std::string& upload_id) const {
  datahub::v1::DescribeUploadRequest req;
  req.set_upload_id(upload_id);

  datahub::v1::DescribeUploadResponse resp;
  ::grpc::ClientContext                 ctx;
  Authorize(&ctx);

  ARROW_RETURN_NOT_OK(GrpcToArrow(ingest_stub_->DescribeUpload(&ctx, req, &resp), "DescribeUpload"));
  return resp.session();
}

arrow::Status HubClient::AbortUpload(const std::string& upload_id) const {
  datahub::v1::AbortUploadRequest req;
  req.set_upload_id(upload_id);

  datahub::v1::AbortUploadResponse resp;
  ::grpc::ClientContext              ctx;
  Authorize(&ctx);

  return GrpcToArrow(ingest_stub_->AbortUpload(&ctx, req, &resp), "AbortUpload");
}

arrow::Result<datahub::v1::Dataset> HubClient::GetDataset(const datahub::v1::GetDatasetRequest& request) const {
  datahub::v1::GetDatasetResponse resp;
  ::grpc::ClientContext             ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(catalog_stub_->GetDataset(&ctx, request, &resp), "GetDataset"));
  return resp.dataset();
}

arrow::Result<datahub::v1::ListDatasetsResponse> HubClient::ListDatasets(const datahub::v1::ListDatasetsRequest& request) const {
  datahub::v1::ListDatasetsResponse resp;
  ::grpc::ClientContext               ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(catalog_stub_->ListDatasets(&ctx, request, &resp), "ListDatasets"));
  return resp;
}

arrow::Result<datahub::v1::ListFilesResponse> HubClient::ListFiles(const datahub::v1::ListFilesRequest& request) const {
  datahub::v1::ListFilesResponse resp;
  ::grpc::ClientContext            ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(catalog_stub_->ListFiles(&ctx, request, &resp), "ListFiles"));
  return resp;
}

arrow::Result<datahub::v1::Dataset> HubClient::EditDataset(const datahub::v1::EditDatasetRequest& request) const {
  datahub::v1::EditDatasetResponse resp;
  ::grpc::ClientContext              ctx;
  Authorize(&ctx);

  ARROW_RETURN_NOT_OK(GrpcToArrow(catalog_stub_->EditDataset(&ctx, request, &resp), "EditDataset"));
  return resp.dataset();
}

arrow::Result<datahub::v1::DownloadPlan> HubClient::GetDownloadPlan(const std::string& dataset_id, uint32_t version_id) const {
  datahub::v1::GetDownloadPlanRequest req;
  req.set_dataset_id(dataset_id);
  req.set_version_id(version_id);

  datahub::v1::GetDownloadPlanResponse resp;
  ::grpc::ClientContext                  ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(catalog_stub_->GetDownloadPlan(&ctx, req, &resp), "GetDownloadPlan"));
  return resp.plan();
}

arrow::Status HubClient::DownloadFile(const std::string& object_key, const std::string& path, const std::string& checksum) const {
  datahub::v1::DownloadFileRequest req;
  req.set_object_key(object_key);

  ::grpc::ClientContext ctx;
  auto                reader = catalog_stub_->DownloadFile(&ctx, req);

  ARROW_ASSIGN_OR_RAISE(auto out, arrow::io::FileOutputStream::Open(path));
  datahub::checksum::Md5Digest digest;

  datahub::v1::DownloadFileChunk chunk;
  uint64_t                       written = 0;
  while (reader->Read(&chunk)) {
    if (chunk.offset() != written) {
      return arrow::Status::IOError("DownloadFile: out of order chunk at ", chunk.offset(), ", expected ", written);
    }
    const auto* bytes = reinterpret_cast<const uint8_t*>(chunk.data().data());
    ARROW_RETURN_NOT_OK(out->Write(bytes, static_cast<int64_t>(chunk.data().size())));
    digest.Update(bytes, chunk.data().size());
    written += chunk.data().size();
  }
  ARROW_RETURN_NOT_OK(GrpcToArrow(reader->Finish(), "DownloadFile"));
  ARROW_RETURN_NOT_OK(out->Close());

  if (!checksum.empty()) {
    const auto actual = digest.FinishHex();
    if (actual != checksum) {
      return arrow::Status::IOError("DownloadFile: checksum mismatch for ", object_key, ": expected ", checksum, ", got ", actual);
    }
  }
  return arrow::Status::OK();
}

} // namespace datahub::client
