#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace datahub::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertDataset(Transaction&, const model::DatasetRecord&) override;
  std::optional<model::DatasetRecord> GetDataset(Transaction&, const std::string&) override;
  std::optional<model::DatasetRecord> GetDatasetByName(Transaction&, const std::string&) override;
  std::vector<model::DatasetRecord> ListDatasets(Transaction&, const model::DatasetFilter&) override;
  Result UpdateDataset(Transaction&, const model::DatasetRecord&) override;
  Result IncrementDatasetCounter(Transaction&, const std::string&, model::DatasetCounter, int64_t) override;

  Result InsertVersion(Transaction&, const model::VersionRecord&) override;
  std::vector<model::VersionRecord> ListVersions(Transaction&, const std::string&) override;

  std::optional<model::FileRecord> GetFile(Transaction&, const std::string&, const std::string&) override;
  Result UpsertFile(Transaction&, const model::FileRecord&) override;
  std::vector<model::FileRecord> ListFiles(Transaction&, const std::string&) override;

  std::optional<model::UserRecord> GetUser(Transaction&, const std::string&) override;
  Result InsertUser(Transaction&, const model::UserRecord&) override;
  Result IncrementUserDatasetCount(Transaction&, const std::string&, int64_t) override;
  std::optional<model::TierRecord> GetTier(Transaction&, const std::string&) override;
  Result UpsertTier(Transaction&, const model::TierRecord&) override;
  Result InsertUsage(Transaction&, const model::UsageRecord&) override;
  uint64_t CountUsageSince(Transaction&, const std::string&, const std::string&, uint64_t) override;

  Result InsertUploadSession(Transaction&, const model::UploadSessionRecord&) override;
  std::optional<model::UploadSessionRecord> GetUploadSession(Transaction&, const std::string&) override;
  std::optional<model::UploadSessionRecord> FindActiveUploadSession(
      Transaction&, const std::string& uid, const std::string& dataset_name, const std::string& checksum) override;
  std::vector<model::UploadSessionRecord> ListActiveUploadSessionsByName(Transaction&, const std::string&) override;
  uint64_t CountActiveUploadSessionsSince(Transaction&, const std::string&, uint64_t) override;
  std::vector<model::UploadSessionRecord> ListUploadSessionsUpdatedBefore(Transaction&, uint64_t) override;
  Result UpdateUploadSession(Transaction&, const model::UploadSessionRecord&) override;
  Result DeleteUploadSession(Transaction&, const std::string&) override;
  Result InsertUploadPart(Transaction&, const model::UploadPartRecord&) override;
  std::vector<model::UploadPartRecord> ListUploadParts(Transaction&, const std::string&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
