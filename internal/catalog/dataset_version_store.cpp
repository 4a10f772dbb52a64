#include "dataset_version_store.hpp"

#include <algorithm>
#include <regex>

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include "internal/db/api/tx_helpers.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace datahub::catalog {

using datahub::db::model::DatasetRecord;
using datahub::db::model::FileRecord;
using datahub::db::model::VersionRecord;

namespace {

const std::regex& NamePattern() {
  static const std::regex kPattern("^[A-Za-z][A-Za-z0-9-]*$");
  return kPattern;
}

std::string UsagePayload(const FinalizeInput& input, uint32_t version_id) {
  google::protobuf::Struct payload;
  auto& fields = *payload.mutable_fields();
  fields["dataset"].set_string_value(input.dataset_id);
  fields["version"].set_number_value(version_id);
  fields["upload_id"].set_string_value(input.upload_id);
  fields["size"].set_number_value(static_cast<double>(input.size));

  std::string json;
  auto status = google::protobuf::util::MessageToJsonString(payload, &json);
  if (!status.ok()) {
    throw std::runtime_error("encode usage payload: " + std::string(status.message()));
  }
  return json;
}

} // namespace

void ValidateName(const std::string& name) {
  if (!std::regex_match(name, NamePattern())) {
    throw util::NameCharsValidationError();
  }
  if (name.size() < kNameMinLength || name.size() > kNameMaxLength) {
    throw util::NameLengthValidationError(kNameMinLength, kNameMaxLength);
  }
}

void ValidateDescription(const std::string& description) {
  if (description.size() < kDescriptionMinLength || description.size() > kDescriptionMaxLength) {
    throw util::DescriptionLengthValidationError(kDescriptionMinLength, kDescriptionMaxLength);
  }
}

std::string ObjectKeyFor(const std::string& dataset_id, const std::string& checksum, uint64_t size) {
  return dataset_id + "/" + checksum + "_" + std::to_string(size);
}

DatasetVersionStore::DatasetVersionStore(std::shared_ptr<db::Repository> repo, util::ClockFn clock)
    : repo_(std::move(repo)), clock_(std::move(clock)) {
}

std::string DatasetVersionStore::ResolveTarget(db::Transaction& tx, const std::string& uid, const std::string& name) {
  if (auto existing = repo_->GetDatasetByName(tx, name)) {
    if (existing->uid != uid) {
      throw util::DatasetAlreadyExistsError(name);
    }
    return existing->id;
  }

  std::string reserved_id;
  for (const auto& session : repo_->ListActiveUploadSessionsByName(tx, name)) {
    if (session.uid != uid) {
      throw util::DatasetAlreadyExistsError(name);
    }
    reserved_id = session.dataset_id;
  }
  return reserved_id.empty() ? util::NewId() : reserved_id;
}

std::optional<FileRecord> DatasetVersionStore::FindIdenticalFile(db::Transaction& tx, const std::string& dataset_id,
                                                                 const std::string& checksum, uint64_t size) {
  auto file = repo_->GetFile(tx, dataset_id, checksum);
  if (file && file->size == size) {
    return file;
  }
  return std::nullopt;
}

FinalizeResult DatasetVersionStore::ApplyFinalize(db::Transaction& tx, const FinalizeInput& input) {
  const auto now_ms = util::ToUnixMillis(clock_());

  FinalizeResult result;
  auto dataset = repo_->GetDataset(tx, input.dataset_id);

  // ------------------------------------------------------------------
  // dataset or next version
  // ------------------------------------------------------------------
  if (!dataset) {
    if (repo_->GetDatasetByName(tx, input.dataset_name)) {
      throw util::DatasetAlreadyExistsError(input.dataset_name);
    }

    DatasetRecord record;
    record.id            = input.dataset_id;
    record.uid           = input.uid;
    record.name          = input.dataset_name;
    record.description   = input.description;
    record.tags          = input.tags;
    record.created_at_ms = now_ms;
    record.updated_at_ms = now_ms;
    db::ThrowIfDbError(repo_->InsertDataset(tx, record), "insert dataset " + record.name);
    db::ThrowIfDbError(repo_->IncrementUserDatasetCount(tx, input.uid, 1), "increment dataset count");

    dataset        = record;
    result.created = true;
  } else if (dataset->uid != input.uid) {
    throw util::DatasetAlreadyExistsError(dataset->name);
  }

  const auto versions   = repo_->ListVersions(tx, input.dataset_id);
  const auto previous   = versions.empty() ? 0u : versions.back().version_id;
  const auto version_id = previous + 1;

  // ------------------------------------------------------------------
  // files: carry the previous snapshot forward, then add the new content
  // ------------------------------------------------------------------
  uint64_t version_size = 0;
  bool     content_seen = false;
  for (auto file : repo_->ListFiles(tx, input.dataset_id)) {
    const bool is_new_content = file.checksum == input.checksum && file.size == input.size;
    const bool in_previous    = previous != 0 && file.versions.count(previous) != 0;

    if (is_new_content) {
      content_seen = true;
    } else if (!in_previous || file.name == input.filename) {
      continue;
    }

    file.versions.insert(version_id);
    version_size += file.size;
    db::ThrowIfDbError(repo_->UpsertFile(tx, file), "upsert file " + file.checksum);
  }

  if (!content_seen) {
    FileRecord file;
    file.dataset_id    = input.dataset_id;
    file.checksum      = input.checksum;
    file.name          = input.filename;
    file.size          = input.size;
    file.object_key    = input.object_key;
    file.versions      = {version_id};
    file.created_at_ms = now_ms;
    version_size += file.size;
    db::ThrowIfDbError(repo_->UpsertFile(tx, file), "upsert file " + file.checksum);
  }

  db::ThrowIfDbError(repo_->InsertVersion(tx, VersionRecord{input.dataset_id, version_id, version_size, now_ms}),
                     "insert version");

  db::model::UsageRecord usage;
  usage.uid          = input.uid;
  usage.type         = db::model::kUsageDatasetIngested;
  usage.payload_json = UsagePayload(input, version_id);
  usage.timestamp_ms = now_ms;
  db::ThrowIfDbError(repo_->InsertUsage(tx, usage), "insert usage");

  result.version_id = version_id;
  result.view       = LoadView(tx, *dataset);
  return result;
}

DatasetView DatasetVersionStore::LoadView(db::Transaction& tx, DatasetRecord dataset) {
  DatasetView view;
  view.versions = repo_->ListVersions(tx, dataset.id);
  view.dataset  = std::move(dataset);
  return view;
}

std::optional<DatasetView> DatasetVersionStore::Get(db::Transaction& tx, const std::string& dataset_id) {
  auto dataset = repo_->GetDataset(tx, dataset_id);
  if (!dataset) return std::nullopt;
  return LoadView(tx, std::move(*dataset));
}

std::optional<DatasetView> DatasetVersionStore::GetByName(db::Transaction& tx, const std::string& name) {
  auto dataset = repo_->GetDatasetByName(tx, name);
  if (!dataset) return std::nullopt;
  return LoadView(tx, std::move(*dataset));
}

std::vector<DatasetView> DatasetVersionStore::List(db::Transaction& tx, const db::model::DatasetFilter& filter) {
  std::vector<DatasetView> out;
  for (auto& dataset : repo_->ListDatasets(tx, filter)) {
    out.push_back(LoadView(tx, std::move(dataset)));
  }
  return out;
}

std::vector<FileRecord> DatasetVersionStore::ListFiles(db::Transaction& tx, const std::string& dataset_id, uint32_t version_id) {
  if (!repo_->GetDataset(tx, dataset_id)) {
    throw util::NotFound("dataset " + dataset_id);
  }

  auto files = repo_->ListFiles(tx, dataset_id);
  if (version_id == 0) {
    return files;
  }
  files.erase(std::remove_if(files.begin(), files.end(),
                             [version_id](const FileRecord& f) { return f.versions.count(version_id) == 0; }),
              files.end());
  return files;
}

DatasetView DatasetVersionStore::Edit(db::Transaction& tx, const std::string& uid, const EditRequest& request) {
  auto dataset = repo_->GetDataset(tx, request.dataset_id);
  if (!dataset) {
    throw util::NotFound("dataset " + request.dataset_id);
  }
  if (dataset->uid != uid) {
    throw util::PermissionDenied("dataset " + dataset->name + " is owned by another user");
  }

  if (request.name && *request.name != dataset->name) {
    ValidateName(*request.name);
    if (repo_->GetDatasetByName(tx, *request.name)) {
      throw util::DatasetAlreadyExistsError(*request.name);
    }
    for (const auto& session : repo_->ListActiveUploadSessionsByName(tx, *request.name)) {
      if (session.dataset_id != dataset->id) {
        throw util::DatasetAlreadyExistsError(*request.name);
      }
    }
    dataset->name = *request.name;
  }
  if (request.description) {
    ValidateDescription(*request.description);
    dataset->description = *request.description;
  }
  if (request.tags) {
    dataset->tags = *request.tags;
  }
  dataset->updated_at_ms = util::ToUnixMillis(clock_());

  db::ThrowIfDbError(repo_->UpdateDataset(tx, *dataset), "update dataset " + dataset->id);
  return LoadView(tx, std::move(*dataset));
}

datahub::core::v1::DownloadPlan DatasetVersionStore::DownloadPlan(db::Transaction& tx, const std::string& dataset_id, uint32_t version_id) {
  auto dataset = repo_->GetDataset(tx, dataset_id);
  if (!dataset) {
    throw util::NotFound("dataset " + dataset_id);
  }

  const auto versions = repo_->ListVersions(tx, dataset_id);
  if (versions.empty()) {
    throw util::NotFound("dataset " + dataset_id + " has no versions");
  }
  if (version_id == 0) {
    version_id = versions.back().version_id;
  } else if (std::none_of(versions.begin(), versions.end(), [version_id](const VersionRecord& v) { return v.version_id == version_id; })) {
    throw util::NotFound("dataset " + dataset_id + " has no version " + std::to_string(version_id));
  }

  datahub::core::v1::DownloadPlan plan;
  for (const auto& file : ListFiles(tx, dataset_id, version_id)) {
    auto* entry = plan.add_entries();
    entry->set_dataset_id(dataset_id);
    entry->set_version_id(version_id);
    entry->set_filename(file.name);
    entry->set_object_key(file.object_key);
    entry->set_size(file.size);
    entry->set_checksum(file.checksum);
  }

  db::ThrowIfDbError(repo_->IncrementDatasetCounter(tx, dataset_id, db::model::DatasetCounter::Downloads, 1), "increment downloads");
  return plan;
}

// ------------------------------------------------------------------
// Proto conversion
// ------------------------------------------------------------------

datahub::core::v1::Dataset ToProto(const DatasetView& view) {
  datahub::core::v1::Dataset out;
  out.set_id(view.dataset.id);
  out.set_uid(view.dataset.uid);
  out.set_name(view.dataset.name);
  out.set_description(view.dataset.description);
  for (const auto& tag : view.dataset.tags) out.add_tags(tag);
  out.set_likes(view.dataset.likes);
  out.set_downloads(view.dataset.downloads);
  for (const auto& version : view.versions) {
    auto* v = out.add_versions();
    v->set_version_id(version.version_id);
    v->set_size(version.size);
    *v->mutable_created_at() = util::MillisToProto(version.created_at_ms);
  }
  *out.mutable_created_at() = util::MillisToProto(view.dataset.created_at_ms);
  *out.mutable_updated_at() = util::MillisToProto(view.dataset.updated_at_ms);
  return out;
}

datahub::core::v1::File ToProto(const FileRecord& file) {
  datahub::core::v1::File out;
  out.set_checksum(file.checksum);
  out.set_name(file.name);
  out.set_size(file.size);
  out.set_object_key(file.object_key);
  for (auto version : file.versions) out.add_versions(version);
  return out;
}

} // namespace datahub::catalog
