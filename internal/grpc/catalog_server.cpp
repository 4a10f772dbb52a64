#include "catalog_server.hpp"

#include <algorithm>

#include "grpc_error.hpp"
#include "internal/storage/common/arrow_utils.hpp"

namespace datahub::grpc {

namespace {

constexpr int64_t kDownloadChunkBytes = 1 << 20;

} // namespace

CatalogServer::CatalogServer(std::shared_ptr<datahub::service::CatalogService> svc,
                             std::shared_ptr<datahub::identity::Authenticator> auth)
    : service_(std::move(svc)), auth_(std::move(auth)) {}

::grpc::Status CatalogServer::GetDataset(::grpc::ServerContext*,
                                         const datahub::v1::GetDatasetRequest* req,
                                         datahub::v1::GetDatasetResponse* resp) {
  try {
    *resp = service_->GetDataset(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CatalogServer::ListDatasets(::grpc::ServerContext*,
                                           const datahub::v1::ListDatasetsRequest* req,
                                           datahub::v1::ListDatasetsResponse* resp) {
  try {
    *resp = service_->ListDatasets(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CatalogServer::ListFiles(::grpc::ServerContext*,
                                        const datahub::v1::ListFilesRequest* req,
                                        datahub::v1::ListFilesResponse* resp) {
  try {
    *resp = service_->ListFiles(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CatalogServer::EditDataset(::grpc::ServerContext* ctx,
                                          const datahub::v1::EditDatasetRequest* req,
                                          datahub::v1::EditDatasetResponse* resp) {
  try {
    *resp = service_->EditDataset(CallerUid(ctx, *auth_), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CatalogServer::GetDownloadPlan(::grpc::ServerContext*,
                                              const datahub::v1::GetDownloadPlanRequest* req,
                                              datahub::v1::GetDownloadPlanResponse* resp) {
  try {
    *resp = service_->GetDownloadPlan(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CatalogServer::DownloadFile(::grpc::ServerContext* ctx,
                                           const datahub::v1::DownloadFileRequest* req,
                                           ::grpc::ServerWriter<datahub::v1::DownloadFileChunk>* writer) {
  try {
    auto file = service_->OpenDownload(*req);
    const auto size = storage::common::Unwrap(file->GetSize());

    for (int64_t offset = 0; offset < size; offset += kDownloadChunkBytes) {
      if (ctx->IsCancelled()) {
        return {::grpc::StatusCode::CANCELLED, "download cancelled"};
      }
      auto block = storage::common::Unwrap(file->ReadAt(offset, std::min(kDownloadChunkBytes, size - offset)));

      datahub::v1::DownloadFileChunk chunk;
      chunk.set_offset(static_cast<uint64_t>(offset));
      chunk.set_data(block->data(), static_cast<size_t>(block->size()));
      if (!writer->Write(chunk)) {
        return {::grpc::StatusCode::CANCELLED, "client went away"};
      }
    }
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
