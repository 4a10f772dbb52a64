#include "ingest_server.hpp"
#include "grpc_error.hpp"

namespace datahub::grpc {

IngestServer::IngestServer(std::shared_ptr<datahub::service::IngestService> svc, std::shared_ptr<datahub::identity::Authenticator> auth)
    : service_(std::move(svc)), auth_(std::move(auth)) {}

::grpc::Status IngestServer::StartOrResumeUpload(::grpc::ServerContext* ctx,
                                                 const datahub::v1::StartOrResumeUploadRequest* req,
                                                 datahub::v1::StartOrResumeUploadResponse* resp) {
  try {
    *resp = service_->StartOrResume(CallerUid(ctx, *auth_), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status IngestServer::UploadPart(::grpc::ServerContext* ctx,
                                        const datahub::v1::UploadPartRequest* req,
                                        datahub::v1::UploadPartResponse* resp) {
  try {
    *resp = service_->UploadPart(CallerUid(ctx, *auth_), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status IngestServer::CompleteUpload(::grpc::ServerContext* ctx,
                                            const datahub::v1::CompleteUploadRequest* req,
                                            datahub::v1::CompleteUploadResponse* resp) {
  try {
    *resp = service_->Complete(CallerUid(ctx, *auth_), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status IngestServer::DescribeUpload(::grpc::ServerContext* ctx,
                                            const datahub::v1::DescribeUploadRequest* req,
                                            datahub::v1::DescribeUploadResponse* resp) {
  try {
    *resp = service_->Describe(CallerUid(ctx, *auth_), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status IngestServer::AbortUpload(::grpc::ServerContext* ctx,
                                         const datahub::v1::AbortUploadRequest* req,
                                         datahub::v1::AbortUploadResponse*) {
  try {
    service_->Abort(CallerUid(ctx, *auth_), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status IngestServer::IngestSmallFile(::grpc::ServerContext* ctx,
                                             const datahub::v1::IngestSmallFileRequest* req,
                                             datahub::v1::IngestSmallFileResponse* resp) {
  try {
    *resp = service_->IngestSmallFile(CallerUid(ctx, *auth_), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
