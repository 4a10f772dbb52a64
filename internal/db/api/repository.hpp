#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/dataset_record.hpp"
#include "internal/db/model/file_record.hpp"
#include "internal/db/model/upload_session_record.hpp"
#include "internal/db/model/usage_record.hpp"
#include "internal/db/model/user_record.hpp"
#include "internal/db/model/version_record.hpp"

namespace datahub::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Counter increments are atomic
  - Upload session inserts are conditional on the active
    (uid, dataset_name, checksum) key; the loser gets AlreadyExists
  - Upload part inserts are conditional on (upload_id, part_number)

  The DB is the source of truth for:
    datasets / versions / files
    users / tiers / usage
    upload sessions and their received parts
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Datasets
  // ---------------------------------------------------------------------

  // AlreadyExists when id or name is taken.
  virtual Result InsertDataset(Transaction&, const model::DatasetRecord&) = 0;

  virtual std::optional<model::DatasetRecord> GetDataset(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::DatasetRecord> GetDatasetByName(Transaction&, const std::string& name) = 0;

  // Ordered by creation time.
  virtual std::vector<model::DatasetRecord> ListDatasets(Transaction&, const model::DatasetFilter&) = 0;

  // Rewrites name/description/tags/updated_at. AlreadyExists on name clash.
  virtual Result UpdateDataset(Transaction&, const model::DatasetRecord&) = 0;

  virtual Result IncrementDatasetCounter(Transaction&, const std::string& id, model::DatasetCounter counter, int64_t delta) = 0;

  // ---------------------------------------------------------------------
  // Versions
  // ---------------------------------------------------------------------

  virtual Result InsertVersion(Transaction&, const model::VersionRecord&) = 0;

  // Ascending by version_id.
  virtual std::vector<model::VersionRecord> ListVersions(Transaction&, const std::string& dataset_id) = 0;

  // ---------------------------------------------------------------------
  // Files
  // ---------------------------------------------------------------------

  virtual std::optional<model::FileRecord> GetFile(Transaction&, const std::string& dataset_id, const std::string& checksum) = 0;

  // Inserts or replaces the file including its versions set.
  virtual Result UpsertFile(Transaction&, const model::FileRecord&) = 0;

  virtual std::vector<model::FileRecord> ListFiles(Transaction&, const std::string& dataset_id) = 0;

  // ---------------------------------------------------------------------
  // Users / tiers / usage
  // ---------------------------------------------------------------------

  virtual std::optional<model::UserRecord> GetUser(Transaction&, const std::string& uid) = 0;

  // AlreadyExists if the uid is present.
  virtual Result InsertUser(Transaction&, const model::UserRecord&) = 0;

  virtual Result IncrementUserDatasetCount(Transaction&, const std::string& uid, int64_t delta) = 0;

  virtual std::optional<model::TierRecord> GetTier(Transaction&, const std::string& name) = 0;

  virtual Result UpsertTier(Transaction&, const model::TierRecord&) = 0;

  virtual Result InsertUsage(Transaction&, const model::UsageRecord&) = 0;

  // Counts records with timestamp_ms >= since_ms.
  virtual uint64_t CountUsageSince(Transaction&, const std::string& uid, const std::string& type, uint64_t since_ms) = 0;

  // ---------------------------------------------------------------------
  // Upload sessions
  // ---------------------------------------------------------------------

  virtual Result InsertUploadSession(Transaction&, const model::UploadSessionRecord&) = 0;

  virtual std::optional<model::UploadSessionRecord> GetUploadSession(Transaction&, const std::string& upload_id) = 0;

  // Non-persisted session for the key, if any.
  virtual std::optional<model::UploadSessionRecord> FindActiveUploadSession(Transaction&, const std::string& uid,
                                                                            const std::string& dataset_name,
                                                                            const std::string& checksum) = 0;

  // Non-persisted sessions that reserve a dataset name.
  virtual std::vector<model::UploadSessionRecord> ListActiveUploadSessionsByName(Transaction&, const std::string& dataset_name) = 0;

  virtual uint64_t CountActiveUploadSessionsSince(Transaction&, const std::string& uid, uint64_t since_ms) = 0;

  virtual std::vector<model::UploadSessionRecord> ListUploadSessionsUpdatedBefore(Transaction&, uint64_t before_ms) = 0;

  virtual Result UpdateUploadSession(Transaction&, const model::UploadSessionRecord&) = 0;

  // Removes the session and its part rows.
  virtual Result DeleteUploadSession(Transaction&, const std::string& upload_id) = 0;

  virtual Result InsertUploadPart(Transaction&, const model::UploadPartRecord&) = 0;

  // Ascending by part_number.
  virtual std::vector<model::UploadPartRecord> ListUploadParts(Transaction&, const std::string& upload_id) = 0;
};

} // namespace datahub::db
