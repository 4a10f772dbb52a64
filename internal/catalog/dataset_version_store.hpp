#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "datahub/core/v1/types.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace datahub::catalog {

inline constexpr size_t kNameMinLength        = 3;
inline constexpr size_t kNameMaxLength        = 15;
inline constexpr size_t kDescriptionMinLength = 5;
inline constexpr size_t kDescriptionMaxLength = 50;

// Letters, digits and hyphens; first character a letter. Length checked after.
void ValidateName(const std::string& name);
void ValidateDescription(const std::string& description);

// <dataset_id>/<checksum>_<size>
std::string ObjectKeyFor(const std::string& dataset_id, const std::string& checksum, uint64_t size);

struct DatasetView {
  db::model::DatasetRecord              dataset;
  std::vector<db::model::VersionRecord> versions;
};

struct FinalizeInput {
  std::string              upload_id;
  std::string              uid;
  std::string              dataset_id;
  std::string              dataset_name;
  std::string              description;
  std::vector<std::string> tags;
  std::string              filename;
  std::string              checksum;
  uint64_t                 size = 0;
  std::string              object_key;
};

struct FinalizeResult {
  DatasetView view;
  uint32_t    version_id = 0;
  bool        created    = false; // first version of a new dataset
};

struct EditRequest {
  std::string                             dataset_id;
  std::optional<std::string>              name;
  std::optional<std::string>              description;
  std::optional<std::vector<std::string>> tags;
};

/*
  Dataset / version / file bookkeeping.

  Versions are snapshots: version N+1 carries every file of version N,
  except a file with the ingested filename, which is replaced by the new
  content. A file whose checksum and size already exist in the dataset is
  not stored again; the new version is added to its versions set.

  Every write method runs inside the caller's transaction; the caller
  commits. Nothing here touches object storage.
*/
class DatasetVersionStore {
 public:
  DatasetVersionStore(std::shared_ptr<db::Repository> repo, util::ClockFn clock = util::Now);

  /*
    Dataset id an upload of `name` by `uid` should land in.

    - dataset owned by uid          -> its id (new version)
    - dataset owned by someone else -> DatasetAlreadyExistsError
    - open session of another uid   -> DatasetAlreadyExistsError
    - open session of uid           -> that session's dataset id
    - otherwise                     -> fresh id
  */
  std::string ResolveTarget(db::Transaction& tx, const std::string& uid, const std::string& name);

  // Existing file with identical content in the dataset, if any.
  std::optional<db::model::FileRecord> FindIdenticalFile(db::Transaction& tx, const std::string& dataset_id,
                                                         const std::string& checksum, uint64_t size);

  /*
    Commits dataset-or-version, file, user counter and usage record.
    All writes go through tx; a failure leaves nothing behind once the
    caller drops the transaction.
  */
  FinalizeResult ApplyFinalize(db::Transaction& tx, const FinalizeInput& input);

  std::optional<DatasetView> Get(db::Transaction& tx, const std::string& dataset_id);
  std::optional<DatasetView> GetByName(db::Transaction& tx, const std::string& name);
  std::vector<DatasetView>   List(db::Transaction& tx, const db::model::DatasetFilter& filter);

  // version_id 0 lists every file.
  std::vector<db::model::FileRecord> ListFiles(db::Transaction& tx, const std::string& dataset_id, uint32_t version_id);

  DatasetView Edit(db::Transaction& tx, const std::string& uid, const EditRequest& request);

  // version_id 0 selects the latest version. Counts as one download.
  datahub::core::v1::DownloadPlan DownloadPlan(db::Transaction& tx, const std::string& dataset_id, uint32_t version_id);

 private:
  DatasetView LoadView(db::Transaction& tx, db::model::DatasetRecord dataset);

  std::shared_ptr<db::Repository> repo_;
  util::ClockFn                   clock_;
};

datahub::core::v1::Dataset ToProto(const DatasetView& view);
datahub::core::v1::File    ToProto(const db::model::FileRecord& file);

} // namespace datahub::catalog
