#include "catalog_service.hpp"

#include "internal/catalog/dataset_version_store.hpp"
#include "internal/db/api/tx_helpers.hpp"
#include "internal/storage/object_store.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace datahub::service {

using namespace datahub::v1;

CatalogService::CatalogService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

GetDatasetResponse CatalogService::GetDataset(const GetDatasetRequest& req) {
  const auto& subject = req.has_dataset_id() ? req.dataset_id() : req.name();
  return ObserveRpc("CatalogService.GetDataset", subject, [&] {
    auto view = db::RunInTransaction(*ctx_.repository, [&](db::Transaction& tx) {
      switch (req.selector_case()) {
        case GetDatasetRequest::kDatasetId:
          return ctx_.versions->Get(tx, req.dataset_id());
        case GetDatasetRequest::kName:
          return ctx_.versions->GetByName(tx, req.name());
        default:
          throw datahub::util::ValidationError("dataset_id or name is required");
      }
    });
    if (!view) {
      throw datahub::util::NotFound("dataset " + subject);
    }

    GetDatasetResponse resp;
    *resp.mutable_dataset() = catalog::ToProto(*view);
    return resp;
  });
}

ListDatasetsResponse CatalogService::ListDatasets(const ListDatasetsRequest& req) {
  return ObserveRpc("CatalogService.ListDatasets", req.name_filter(), [&] {
    db::model::DatasetFilter filter;
    filter.name_contains = req.name_filter();
    filter.limit         = req.limit();

    auto views = db::RunInTransaction(*ctx_.repository, [&](db::Transaction& tx) { return ctx_.versions->List(tx, filter); });

    ListDatasetsResponse resp;
    for (const auto& view : views) {
      *resp.add_datasets() = catalog::ToProto(view);
    }
    return resp;
  });
}

ListFilesResponse CatalogService::ListFiles(const ListFilesRequest& req) {
  return ObserveRpc("CatalogService.ListFiles", req.dataset_id(), [&] {
    auto files = db::RunInTransaction(*ctx_.repository,
                                      [&](db::Transaction& tx) { return ctx_.versions->ListFiles(tx, req.dataset_id(), req.version_id()); });

    ListFilesResponse resp;
    for (const auto& file : files) {
      *resp.add_files() = catalog::ToProto(file);
    }
    return resp;
  });
}

EditDatasetResponse CatalogService::EditDataset(const std::string& uid, const EditDatasetRequest& req) {
  return ObserveRpc("CatalogService.EditDataset", req.dataset_id(), [&] {
    catalog::EditRequest edit;
    edit.dataset_id = req.dataset_id();
    if (!req.name().empty()) edit.name = req.name();
    if (!req.description().empty()) edit.description = req.description();
    if (req.replace_tags()) edit.tags = std::vector<std::string>(req.tags().begin(), req.tags().end());

    auto view = db::RunInTransaction(*ctx_.repository, [&](db::Transaction& tx) { return ctx_.versions->Edit(tx, uid, edit); });

    EditDatasetResponse resp;
    *resp.mutable_dataset() = catalog::ToProto(view);
    return resp;
  });
}

GetDownloadPlanResponse CatalogService::GetDownloadPlan(const GetDownloadPlanRequest& req) {
  return ObserveRpc("CatalogService.GetDownloadPlan", req.dataset_id(), [&] {
    GetDownloadPlanResponse resp;
    *resp.mutable_plan() = db::RunInTransaction(
        *ctx_.repository, [&](db::Transaction& tx) { return ctx_.versions->DownloadPlan(tx, req.dataset_id(), req.version_id()); });
    return resp;
  });
}

std::shared_ptr<arrow::io::RandomAccessFile> CatalogService::OpenDownload(const DownloadFileRequest& req) {
  return ObserveRpc("CatalogService.DownloadFile", req.object_key(), [&] {
    // <dataset_id>/<checksum>_<size>
    const auto& key   = req.object_key();
    const auto  slash = key.find('/');
    const auto  under = key.rfind('_');
    if (slash == std::string::npos || under == std::string::npos || under < slash) {
      throw datahub::util::NotFound("object " + key);
    }
    const auto dataset_id = key.substr(0, slash);
    const auto checksum   = key.substr(slash + 1, under - slash - 1);

    const bool served = db::RunInTransaction(*ctx_.repository, [&](db::Transaction& tx) {
      auto file = ctx_.repository->GetFile(tx, dataset_id, checksum);
      return file.has_value() && file->object_key == key;
    });
    if (!served) {
      throw datahub::util::NotFound("object " + key);
    }
    return ctx_.store->OpenObject(key);
  });
}

}
