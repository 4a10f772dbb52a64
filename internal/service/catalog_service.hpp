#pragma once

#include <arrow/io/interfaces.h>

#include <memory>
#include <string>

#include "datahub/v1.hpp"
#include "service_context.hpp"

namespace datahub::service {

class CatalogService {
public:
  explicit CatalogService(ServiceContext ctx);

  datahub::v1::GetDatasetResponse GetDataset(const datahub::v1::GetDatasetRequest& req);

  datahub::v1::ListDatasetsResponse ListDatasets(const datahub::v1::ListDatasetsRequest& req);

  datahub::v1::ListFilesResponse ListFiles(const datahub::v1::ListFilesRequest& req);

  // Owner only.
  datahub::v1::EditDatasetResponse EditDataset(const std::string& uid, const datahub::v1::EditDatasetRequest& req);

  datahub::v1::GetDownloadPlanResponse GetDownloadPlan(const datahub::v1::GetDownloadPlanRequest& req);

  /*
    Opens a stored file for streaming. Only keys that belong to a file
    of some dataset are served.
  */
  std::shared_ptr<arrow::io::RandomAccessFile> OpenDownload(const datahub::v1::DownloadFileRequest& req);

private:
  ServiceContext ctx_;
};

}
