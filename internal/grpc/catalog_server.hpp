#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "internal/identity/authenticator.hpp"
#include "internal/service/catalog_service.hpp"
#include "datahub/v1.hpp"

namespace datahub::grpc {

// Reads are open; EditDataset requires a bearer token.
class CatalogServer final : public datahub::v1::DatasetCatalogService::Service {
public:
  CatalogServer(std::shared_ptr<datahub::service::CatalogService> svc, std::shared_ptr<datahub::identity::Authenticator> auth);

  ::grpc::Status GetDataset(::grpc::ServerContext*,
                            const datahub::v1::GetDatasetRequest*,
                            datahub::v1::GetDatasetResponse*) override;

  ::grpc::Status ListDatasets(::grpc::ServerContext*,
                              const datahub::v1::ListDatasetsRequest*,
                              datahub::v1::ListDatasetsResponse*) override;

  ::grpc::Status ListFiles(::grpc::ServerContext*,
                           const datahub::v1::ListFilesRequest*,
                           datahub::v1::ListFilesResponse*) override;

  ::grpc::Status EditDataset(::grpc::ServerContext*,
                             const datahub::v1::EditDatasetRequest*,
                             datahub::v1::EditDatasetResponse*) override;

  ::grpc::Status GetDownloadPlan(::grpc::ServerContext*,
                                 const datahub::v1::GetDownloadPlanRequest*,
                                 datahub::v1::GetDownloadPlanResponse*) override;

  ::grpc::Status DownloadFile(::grpc::ServerContext*,
                              const datahub::v1::DownloadFileRequest*,
                              ::grpc::ServerWriter<datahub::v1::DownloadFileChunk>*) override;

private:
  std::shared_ptr<datahub::service::CatalogService> service_;
  std::shared_ptr<datahub::identity::Authenticator> auth_;
};

}
