#include "pg_repository.hpp"

#include "internal/db/sql/tag_codec.hpp"
#include "internal/util/errors.hpp"

namespace datahub::db::postgres {

namespace {

constexpr int kPersistedState = datahub::core::v1::UPLOAD_SESSION_STATE_DATASET_PERSISTED;

// Reads outside a write path still have to surface serialization failures
// as conflicts so RunInTransaction restarts the unit.
template <typename... Args>
pqxx::result Query(SerializableWork& work, const char* sql, Args&&... args) {
  try {
    return work.exec_params(sql, std::forward<Args>(args)...);
  } catch (const pqxx::serialization_failure& e) {
    throw util::TransactionConflict(e.what());
  } catch (const pqxx::deadlock_detected& e) {
    throw util::TransactionConflict(e.what());
  }
}

int64_t I64(uint64_t v) {
  return static_cast<int64_t>(v);
}

uint64_t U64(const pqxx::field& f) {
  return f.is_null() ? 0 : static_cast<uint64_t>(f.as<int64_t>());
}

std::string Text(const pqxx::field& f) {
  return f.is_null() ? "" : f.c_str();
}

constexpr const char* kDatasetSelect =
    "SELECT id,uid,name,description,tags,likes,downloads,created_at_ms,updated_at_ms FROM datasets ";

model::DatasetRecord ReadDataset(const pqxx::row& row) {
  model::DatasetRecord r;
  r.id            = Text(row[0]);
  r.uid           = Text(row[1]);
  r.name          = Text(row[2]);
  r.description   = Text(row[3]);
  r.tags          = sql::DecodeTags(Text(row[4]));
  r.likes         = U64(row[5]);
  r.downloads     = U64(row[6]);
  r.created_at_ms = U64(row[7]);
  r.updated_at_ms = U64(row[8]);
  return r;
}

constexpr const char* kSessionSelect =
    "SELECT upload_id,uid,dataset_name,checksum,dataset_id,filename,description,tags,total_size,chunk_size,part_count,"
    "state,storage_upload_id,object_key,deduplicated,version_id,error_message,created_at_ms,updated_at_ms "
    "FROM upload_sessions ";

model::UploadSessionRecord ReadSession(const pqxx::row& row) {
  model::UploadSessionRecord r;
  r.upload_id         = Text(row[0]);
  r.uid               = Text(row[1]);
  r.dataset_name      = Text(row[2]);
  r.checksum          = Text(row[3]);
  r.dataset_id        = Text(row[4]);
  r.filename          = Text(row[5]);
  r.description       = Text(row[6]);
  r.tags              = sql::DecodeTags(Text(row[7]));
  r.total_size        = U64(row[8]);
  r.chunk_size        = U64(row[9]);
  r.part_count        = static_cast<uint32_t>(U64(row[10]));
  r.state             = static_cast<datahub::core::v1::UploadSessionState>(row[11].as<int>());
  r.storage_upload_id = Text(row[12]);
  r.object_key        = Text(row[13]);
  r.deduplicated      = row[14].as<bool>();
  r.version_id        = static_cast<uint32_t>(U64(row[15]));
  r.error_message     = Text(row[16]);
  r.created_at_ms     = U64(row[17]);
  r.updated_at_ms     = U64(row[18]);
  return r;
}

std::vector<model::UploadSessionRecord> ReadSessions(const pqxx::result& res) {
  std::vector<model::UploadSessionRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadSession(row));
  return out;
}

model::FileRecord ReadFile(const pqxx::row& row) {
  model::FileRecord r;
  r.dataset_id    = Text(row[0]);
  r.checksum      = Text(row[1]);
  r.name          = Text(row[2]);
  r.size          = U64(row[3]);
  r.object_key    = Text(row[4]);
  r.created_at_ms = U64(row[5]);
  return r;
}

std::set<uint32_t> LoadFileVersions(SerializableWork& work, const std::string& dataset_id, const std::string& checksum) {
  auto res = Query(work, "SELECT version_id FROM file_versions WHERE dataset_id=$1 AND checksum=$2 ORDER BY version_id;",
                   dataset_id, checksum);
  std::set<uint32_t> versions;
  for (const auto& row : res) versions.insert(static_cast<uint32_t>(U64(row[0])));
  return versions;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::foreign_key_violation*>(&e)) {
    return Result::Err(ErrorCode::NotFound, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::Conflict, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Datasets
// ------------------------------------------------------------------

Result PgRepository::InsertDataset(Transaction& t, const model::DatasetRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO datasets(id,uid,name,description,tags,likes,downloads,created_at_ms,updated_at_ms) "
        "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9) ON CONFLICT DO NOTHING;",
        r.id, r.uid, r.name, r.description, sql::EncodeTags(r.tags), I64(r.likes), I64(r.downloads),
        I64(r.created_at_ms), I64(r.updated_at_ms));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists, "dataset " + r.name);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::DatasetRecord> PgRepository::GetDataset(Transaction& t, const std::string& id) {
  auto res = Query(TX(t).Work(), (std::string(kDatasetSelect) + "WHERE id=$1;").c_str(), id);
  if (res.empty()) return std::nullopt;
  return ReadDataset(res[0]);
}

std::optional<model::DatasetRecord> PgRepository::GetDatasetByName(Transaction& t, const std::string& name) {
  auto res = Query(TX(t).Work(), (std::string(kDatasetSelect) + "WHERE name=$1;").c_str(), name);
  if (res.empty()) return std::nullopt;
  return ReadDataset(res[0]);
}

std::vector<model::DatasetRecord> PgRepository::ListDatasets(Transaction& t, const model::DatasetFilter& filter) {
  // LIMIT NULL is unbounded
  auto res = Query(TX(t).Work(),
                   (std::string(kDatasetSelect) +
                    "WHERE ($1 = '' OR strpos(name, $1) > 0) ORDER BY created_at_ms ASC, id ASC LIMIT NULLIF($2::bigint, 0);")
                       .c_str(),
                   filter.name_contains, static_cast<int64_t>(filter.limit));

  std::vector<model::DatasetRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadDataset(row));
  return out;
}

Result PgRepository::UpdateDataset(Transaction& t, const model::DatasetRecord& r) {
  try {
    // a unique_violation would abort the whole transaction
    auto& work  = TX(t).Work();
    auto  taken = work.exec_params("SELECT 1 FROM datasets WHERE name=$1 AND id<>$2;", r.name, r.id);
    if (!taken.empty()) return Result::Err(ErrorCode::AlreadyExists, "dataset " + r.name);

    auto res = work.exec_params("UPDATE datasets SET name=$2,description=$3,tags=$4,updated_at_ms=$5 WHERE id=$1;",
                                        r.id, r.name, r.description, sql::EncodeTags(r.tags), I64(r.updated_at_ms));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::IncrementDatasetCounter(Transaction& t, const std::string& id, model::DatasetCounter counter, int64_t delta) {
  const char* sql = counter == model::DatasetCounter::Likes
      ? "UPDATE datasets SET likes=GREATEST(0, likes + $2) WHERE id=$1;"
      : "UPDATE datasets SET downloads=GREATEST(0, downloads + $2) WHERE id=$1;";
  try {
    auto res = TX(t).Work().exec_params(sql, id, delta);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Versions
// ------------------------------------------------------------------

Result PgRepository::InsertVersion(Transaction& t, const model::VersionRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO dataset_versions(dataset_id,version_id,size,created_at_ms) VALUES($1,$2,$3,$4) ON CONFLICT DO NOTHING;",
        r.dataset_id, static_cast<int64_t>(r.version_id), I64(r.size), I64(r.created_at_ms));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists, "version " + std::to_string(r.version_id));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::VersionRecord> PgRepository::ListVersions(Transaction& t, const std::string& dataset_id) {
  auto res = Query(TX(t).Work(),
                   "SELECT dataset_id,version_id,size,created_at_ms FROM dataset_versions WHERE dataset_id=$1 ORDER BY version_id ASC;",
                   dataset_id);

  std::vector<model::VersionRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::VersionRecord r;
    r.dataset_id    = Text(row[0]);
    r.version_id    = static_cast<uint32_t>(U64(row[1]));
    r.size          = U64(row[2]);
    r.created_at_ms = U64(row[3]);
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Files
// ------------------------------------------------------------------

std::optional<model::FileRecord> PgRepository::GetFile(Transaction& t, const std::string& dataset_id, const std::string& checksum) {
  auto& work = TX(t).Work();
  auto  res  = Query(work,
                     "SELECT dataset_id,checksum,name,size,object_key,created_at_ms FROM files WHERE dataset_id=$1 AND checksum=$2;",
                     dataset_id, checksum);
  if (res.empty()) return std::nullopt;

  auto r     = ReadFile(res[0]);
  r.versions = LoadFileVersions(work, dataset_id, checksum);
  return r;
}

Result PgRepository::UpsertFile(Transaction& t, const model::FileRecord& r) {
  try {
    auto& work = TX(t).Work();
    work.exec_params(
        "INSERT INTO files(dataset_id,checksum,name,size,object_key,created_at_ms) VALUES($1,$2,$3,$4,$5,$6) "
        "ON CONFLICT(dataset_id,checksum) DO UPDATE SET name=EXCLUDED.name,size=EXCLUDED.size,object_key=EXCLUDED.object_key;",
        r.dataset_id, r.checksum, r.name, I64(r.size), r.object_key, I64(r.created_at_ms));
    work.exec_params("DELETE FROM file_versions WHERE dataset_id=$1 AND checksum=$2;", r.dataset_id, r.checksum);
    for (uint32_t version : r.versions) {
      work.exec_params("INSERT INTO file_versions(dataset_id,checksum,version_id) VALUES($1,$2,$3);",
                       r.dataset_id, r.checksum, static_cast<int64_t>(version));
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::FileRecord> PgRepository::ListFiles(Transaction& t, const std::string& dataset_id) {
  auto& work = TX(t).Work();
  auto  res  = Query(work,
                     "SELECT dataset_id,checksum,name,size,object_key,created_at_ms FROM files WHERE dataset_id=$1 "
                     "ORDER BY created_at_ms ASC, checksum ASC;",
                     dataset_id);

  std::vector<model::FileRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadFile(row));
  for (auto& file : out) file.versions = LoadFileVersions(work, file.dataset_id, file.checksum);
  return out;
}

// ------------------------------------------------------------------
// Users / tiers / usage
// ------------------------------------------------------------------

std::optional<model::UserRecord> PgRepository::GetUser(Transaction& t, const std::string& uid) {
  auto res = Query(TX(t).Work(), "SELECT uid,tier,dataset_count,created_at_ms FROM users WHERE uid=$1;", uid);
  if (res.empty()) return std::nullopt;

  model::UserRecord r;
  r.uid           = Text(res[0][0]);
  r.tier          = Text(res[0][1]);
  r.dataset_count = U64(res[0][2]);
  r.created_at_ms = U64(res[0][3]);
  return r;
}

Result PgRepository::InsertUser(Transaction& t, const model::UserRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO users(uid,tier,dataset_count,created_at_ms) VALUES($1,$2,$3,$4) ON CONFLICT DO NOTHING;",
        r.uid, r.tier, I64(r.dataset_count), I64(r.created_at_ms));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists, "user " + r.uid);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::IncrementUserDatasetCount(Transaction& t, const std::string& uid, int64_t delta) {
  try {
    auto res = TX(t).Work().exec_params("UPDATE users SET dataset_count=GREATEST(0, dataset_count + $2) WHERE uid=$1;", uid, delta);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::TierRecord> PgRepository::GetTier(Transaction& t, const std::string& name) {
  auto res = Query(TX(t).Work(), "SELECT name,datasets_upload_per_day FROM tiers WHERE name=$1;", name);
  if (res.empty()) return std::nullopt;

  model::TierRecord r;
  r.name                    = Text(res[0][0]);
  r.datasets_upload_per_day = U64(res[0][1]);
  return r;
}

Result PgRepository::UpsertTier(Transaction& t, const model::TierRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO tiers(name,datasets_upload_per_day) VALUES($1,$2) "
        "ON CONFLICT(name) DO UPDATE SET datasets_upload_per_day=EXCLUDED.datasets_upload_per_day;",
        r.name, I64(r.datasets_upload_per_day));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertUsage(Transaction& t, const model::UsageRecord& r) {
  try {
    TX(t).Work().exec_params("INSERT INTO usage(uid,type,payload,timestamp_ms) VALUES($1,$2,$3::jsonb,$4);",
                             r.uid, r.type, r.payload_json, I64(r.timestamp_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

uint64_t PgRepository::CountUsageSince(Transaction& t, const std::string& uid, const std::string& type, uint64_t since_ms) {
  auto res = Query(TX(t).Work(), "SELECT COUNT(*) FROM usage WHERE uid=$1 AND type=$2 AND timestamp_ms>=$3;",
                   uid, type, I64(since_ms));
  return res.empty() ? 0 : U64(res[0][0]);
}

// ------------------------------------------------------------------
// Upload sessions
// ------------------------------------------------------------------

Result PgRepository::InsertUploadSession(Transaction& t, const model::UploadSessionRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO upload_sessions(upload_id,uid,dataset_name,checksum,dataset_id,filename,description,tags,total_size,"
        "chunk_size,part_count,state,storage_upload_id,object_key,deduplicated,version_id,error_message,created_at_ms,updated_at_ms) "
        "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16,$17,$18,$19) ON CONFLICT DO NOTHING;",
        r.upload_id, r.uid, r.dataset_name, r.checksum, r.dataset_id, r.filename, r.description, sql::EncodeTags(r.tags),
        I64(r.total_size), I64(r.chunk_size), static_cast<int64_t>(r.part_count), static_cast<int>(r.state),
        r.storage_upload_id, r.object_key, r.deduplicated, static_cast<int64_t>(r.version_id), r.error_message,
        I64(r.created_at_ms), I64(r.updated_at_ms));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists, "upload session " + r.upload_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::UploadSessionRecord> PgRepository::GetUploadSession(Transaction& t, const std::string& upload_id) {
  auto res = Query(TX(t).Work(), (std::string(kSessionSelect) + "WHERE upload_id=$1;").c_str(), upload_id);
  if (res.empty()) return std::nullopt;
  return ReadSession(res[0]);
}

std::optional<model::UploadSessionRecord> PgRepository::FindActiveUploadSession(Transaction& t, const std::string& uid,
                                                                                const std::string& dataset_name,
                                                                                const std::string& checksum) {
  auto res = Query(TX(t).Work(),
                   (std::string(kSessionSelect) + "WHERE uid=$1 AND dataset_name=$2 AND checksum=$3 AND state<>$4;").c_str(),
                   uid, dataset_name, checksum, kPersistedState);
  if (res.empty()) return std::nullopt;
  return ReadSession(res[0]);
}

std::vector<model::UploadSessionRecord> PgRepository::ListActiveUploadSessionsByName(Transaction& t, const std::string& dataset_name) {
  auto res = Query(TX(t).Work(), (std::string(kSessionSelect) + "WHERE dataset_name=$1 AND state<>$2;").c_str(),
                   dataset_name, kPersistedState);
  return ReadSessions(res);
}

uint64_t PgRepository::CountActiveUploadSessionsSince(Transaction& t, const std::string& uid, uint64_t since_ms) {
  auto res = Query(TX(t).Work(), "SELECT COUNT(*) FROM upload_sessions WHERE uid=$1 AND state<>$2 AND created_at_ms>=$3;",
                   uid, kPersistedState, I64(since_ms));
  return res.empty() ? 0 : U64(res[0][0]);
}

std::vector<model::UploadSessionRecord> PgRepository::ListUploadSessionsUpdatedBefore(Transaction& t, uint64_t before_ms) {
  auto res = Query(TX(t).Work(), (std::string(kSessionSelect) + "WHERE updated_at_ms<$1 ORDER BY updated_at_ms ASC;").c_str(),
                   I64(before_ms));
  return ReadSessions(res);
}

Result PgRepository::UpdateUploadSession(Transaction& t, const model::UploadSessionRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE upload_sessions SET uid=$2,dataset_name=$3,checksum=$4,dataset_id=$5,filename=$6,description=$7,tags=$8,"
        "total_size=$9,chunk_size=$10,part_count=$11,state=$12,storage_upload_id=$13,object_key=$14,deduplicated=$15,"
        "version_id=$16,error_message=$17,created_at_ms=$18,updated_at_ms=$19 WHERE upload_id=$1;",
        r.upload_id, r.uid, r.dataset_name, r.checksum, r.dataset_id, r.filename, r.description, sql::EncodeTags(r.tags),
        I64(r.total_size), I64(r.chunk_size), static_cast<int64_t>(r.part_count), static_cast<int>(r.state),
        r.storage_upload_id, r.object_key, r.deduplicated, static_cast<int64_t>(r.version_id), r.error_message,
        I64(r.created_at_ms), I64(r.updated_at_ms));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteUploadSession(Transaction& t, const std::string& upload_id) {
  try {
    TX(t).Work().exec_params("DELETE FROM upload_sessions WHERE upload_id=$1;", upload_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertUploadPart(Transaction& t, const model::UploadPartRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO upload_parts(upload_id,part_number,size,checksum,etag,received_at_ms) VALUES($1,$2,$3,$4,$5,$6) "
        "ON CONFLICT DO NOTHING;",
        r.upload_id, static_cast<int64_t>(r.part_number), I64(r.size), r.checksum, r.etag, I64(r.received_at_ms));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists, "upload part");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::UploadPartRecord> PgRepository::ListUploadParts(Transaction& t, const std::string& upload_id) {
  auto res = Query(TX(t).Work(),
                   "SELECT upload_id,part_number,size,checksum,etag,received_at_ms FROM upload_parts WHERE upload_id=$1 "
                   "ORDER BY part_number ASC;",
                   upload_id);

  std::vector<model::UploadPartRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::UploadPartRecord r;
    r.upload_id      = Text(row[0]);
    r.part_number    = static_cast<uint32_t>(U64(row[1]));
    r.size           = U64(row[2]);
    r.checksum       = Text(row[3]);
    r.etag           = Text(row[4]);
    r.received_at_ms = U64(row[5]);
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace datahub::db::postgres
