#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "internal/identity/authenticator.hpp"
#include "internal/service/ingest_service.hpp"
#include "datahub/v1.hpp"

namespace datahub::grpc {

class IngestServer final : public datahub::v1::DatasetIngestService::Service {
public:
  IngestServer(std::shared_ptr<datahub::service::IngestService> svc, std::shared_ptr<datahub::identity::Authenticator> auth);

  ::grpc::Status StartOrResumeUpload(::grpc::ServerContext*,
                                     const datahub::v1::StartOrResumeUploadRequest*,
                                     datahub::v1::StartOrResumeUploadResponse*) override;

  ::grpc::Status UploadPart(::grpc::ServerContext*,
                            const datahub::v1::UploadPartRequest*,
                            datahub::v1::UploadPartResponse*) override;

  ::grpc::Status CompleteUpload(::grpc::ServerContext*,
                                const datahub::v1::CompleteUploadRequest*,
                                datahub::v1::CompleteUploadResponse*) override;

  ::grpc::Status DescribeUpload(::grpc::ServerContext*,
                                const datahub::v1::DescribeUploadRequest*,
                                datahub::v1::DescribeUploadResponse*) override;

  ::grpc::Status AbortUpload(::grpc::ServerContext*,
                             const datahub::v1::AbortUploadRequest*,
                             datahub::v1::AbortUploadResponse*) override;

  ::grpc::Status IngestSmallFile(::grpc::ServerContext*,
                                 const datahub::v1::IngestSmallFileRequest*,
                                 datahub::v1::IngestSmallFileResponse*) override;

private:
  std::shared_ptr<datahub::service::IngestService>  service_;
  std::shared_ptr<datahub::identity::Authenticator> auth_;
};

}
