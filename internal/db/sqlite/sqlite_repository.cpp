#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/tag_codec.hpp"

namespace datahub::db::sqlite {

using datahub::db::ErrorCode;
using datahub::db::Result;

namespace {

/*
  Prepared statement scoped to one call.
*/
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) st_ = nullptr;
    }
    ~Statement() { sqlite3_finalize(st_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return st_ != nullptr; }
    sqlite3_stmt* get() const { return st_; }
    int Step() { return sqlite3_step(st_); }

    // Reads go through here; a statement that fails to prepare is a schema bug.
    void Require(const char* what) const {
        if (!st_) throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db_));
    }

private:
    sqlite3* db_;
    sqlite3_stmt* st_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

constexpr const char* kDatasetColumns =
    "id,uid,name,description,tags,likes,downloads,created_at_ms,updated_at_ms";

model::DatasetRecord ReadDataset(sqlite3_stmt* st) {
    model::DatasetRecord r;
    r.id = ColText(st, 0);
    r.uid = ColText(st, 1);
    r.name = ColText(st, 2);
    r.description = ColText(st, 3);
    r.tags = sql::DecodeTags(ColText(st, 4));
    r.likes = ColU64(st, 5);
    r.downloads = ColU64(st, 6);
    r.created_at_ms = ColU64(st, 7);
    r.updated_at_ms = ColU64(st, 8);
    return r;
}

constexpr const char* kSessionColumns =
    "upload_id,uid,dataset_name,checksum,dataset_id,filename,description,tags,total_size,chunk_size,part_count,"
    "state,storage_upload_id,object_key,deduplicated,version_id,error_message,created_at_ms,updated_at_ms";

model::UploadSessionRecord ReadSession(sqlite3_stmt* st) {
    model::UploadSessionRecord r;
    r.upload_id = ColText(st, 0);
    r.uid = ColText(st, 1);
    r.dataset_name = ColText(st, 2);
    r.checksum = ColText(st, 3);
    r.dataset_id = ColText(st, 4);
    r.filename = ColText(st, 5);
    r.description = ColText(st, 6);
    r.tags = sql::DecodeTags(ColText(st, 7));
    r.total_size = ColU64(st, 8);
    r.chunk_size = ColU64(st, 9);
    r.part_count = static_cast<uint32_t>(ColU64(st, 10));
    r.state = static_cast<datahub::core::v1::UploadSessionState>(ColI32(st, 11));
    r.storage_upload_id = ColText(st, 12);
    r.object_key = ColText(st, 13);
    r.deduplicated = ColI32(st, 14) != 0;
    r.version_id = static_cast<uint32_t>(ColU64(st, 15));
    r.error_message = ColText(st, 16);
    r.created_at_ms = ColU64(st, 17);
    r.updated_at_ms = ColU64(st, 18);
    return r;
}

std::vector<model::UploadSessionRecord> ReadSessions(Statement& st) {
    std::vector<model::UploadSessionRecord> out;
    while (st.Step() == SQLITE_ROW)
        out.push_back(ReadSession(st.get()));
    return out;
}

// Binds every session column except upload_id, starting at idx.
void BindSessionFields(sqlite3_stmt* st, int idx, const model::UploadSessionRecord& r) {
    BindText(st, idx++, r.uid);
    BindText(st, idx++, r.dataset_name);
    BindText(st, idx++, r.checksum);
    BindText(st, idx++, r.dataset_id);
    BindText(st, idx++, r.filename);
    BindText(st, idx++, r.description);
    BindText(st, idx++, sql::EncodeTags(r.tags));
    BindU64(st, idx++, r.total_size);
    BindU64(st, idx++, r.chunk_size);
    BindU64(st, idx++, r.part_count);
    BindI32(st, idx++, static_cast<int>(r.state));
    BindText(st, idx++, r.storage_upload_id);
    BindText(st, idx++, r.object_key);
    BindI32(st, idx++, r.deduplicated ? 1 : 0);
    BindU64(st, idx++, r.version_id);
    BindText(st, idx++, r.error_message);
    BindU64(st, idx++, r.created_at_ms);
    BindU64(st, idx++, r.updated_at_ms);
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc) {
        case SQLITE_CONSTRAINT_PRIMARYKEY:
        case SQLITE_CONSTRAINT_UNIQUE:
            return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT_FOREIGNKEY:
            return Result::Err(ErrorCode::NotFound, sqlite3_errmsg(db));
        default:
            break;
    }

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Datasets
// ------------------------------------------------------------------

Result SqliteRepository::InsertDataset(Transaction& t, const model::DatasetRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db,
        "INSERT INTO datasets(id,uid,name,description,tags,likes,downloads,created_at_ms,updated_at_ms) "
        "VALUES(?,?,?,?,?,?,?,?,?);");
    if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.uid);
    BindText(st.get(), 3, r.name);
    BindText(st.get(), 4, r.description);
    BindText(st.get(), 5, sql::EncodeTags(r.tags));
    BindU64(st.get(), 6, r.likes);
    BindU64(st.get(), 7, r.downloads);
    BindU64(st.get(), 8, r.created_at_ms);
    BindU64(st.get(), 9, r.updated_at_ms);

    return Translate(db, st.Step());
}

std::optional<model::DatasetRecord>
SqliteRepository::GetDataset(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kDatasetColumns + " FROM datasets WHERE id=?;";
    Statement st(db, sql.c_str());
    st.Require("get dataset");

    BindText(st.get(), 1, id);
    if (st.Step() != SQLITE_ROW) return std::nullopt;
    return ReadDataset(st.get());
}

std::optional<model::DatasetRecord>
SqliteRepository::GetDatasetByName(Transaction& t, const std::string& name) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kDatasetColumns + " FROM datasets WHERE name=?;";
    Statement st(db, sql.c_str());
    st.Require("get dataset by name");

    BindText(st.get(), 1, name);
    if (st.Step() != SQLITE_ROW) return std::nullopt;
    return ReadDataset(st.get());
}

std::vector<model::DatasetRecord>
SqliteRepository::ListDatasets(Transaction& t, const model::DatasetFilter& filter) {
    auto* db = TX(t).Handle();

    // instr() instead of LIKE: no wildcard escaping, case-sensitive like the other backends.
    const std::string sql = std::string("SELECT ") + kDatasetColumns +
        " FROM datasets WHERE (?1 = '' OR instr(name, ?1) > 0) ORDER BY created_at_ms ASC, id ASC LIMIT ?2;";
    Statement st(db, sql.c_str());
    st.Require("list datasets");

    BindText(st.get(), 1, filter.name_contains);
    BindI64(st.get(), 2, filter.limit > 0 ? static_cast<int64_t>(filter.limit) : -1);

    std::vector<model::DatasetRecord> out;
    while (st.Step() == SQLITE_ROW)
        out.push_back(ReadDataset(st.get()));
    return out;
}

Result SqliteRepository::UpdateDataset(Transaction& t, const model::DatasetRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, "UPDATE datasets SET name=?,description=?,tags=?,updated_at_ms=? WHERE id=?;");
    if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.name);
    BindText(st.get(), 2, r.description);
    BindText(st.get(), 3, sql::EncodeTags(r.tags));
    BindU64(st.get(), 4, r.updated_at_ms);
    BindText(st.get(), 5, r.id);

    auto result = Translate(db, st.Step());
    if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
    return result;
}

Result SqliteRepository::IncrementDatasetCounter(Transaction& t, const std::string& id, model::DatasetCounter counter, int64_t delta) {
    auto* db = TX(t).Handle();

    const char* sql = counter == model::DatasetCounter::Likes
        ? "UPDATE datasets SET likes=MAX(0, likes + ?) WHERE id=?;"
        : "UPDATE datasets SET downloads=MAX(0, downloads + ?) WHERE id=?;";
    Statement st(db, sql);
    if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st.get(), 1, delta);
    BindText(st.get(), 2, id);

    auto result = Translate(db, st.Step());
    if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
    return result;
}

// ------------------------------------------------------------------
// Versions
// ------------------------------------------------------------------

Result SqliteRepository::InsertVersion(Transaction& t, const model::VersionRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, "INSERT INTO dataset_versions(dataset_id,version_id,size,created_at_ms) VALUES(?,?,?,?);");
    if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.dataset_id);
    BindU64(st.get(), 2, r.version_id);
    BindU64(st.get(), 3, r.size);
    BindU64(st.get(), 4, r.created_at_ms);

    return Translate(db, st.Step());
}

std::vector<model::VersionRecord>
SqliteRepository::ListVersions(Transaction& t, const std::string& dataset_id) {
    auto* db = TX(t).Handle();

    Statement st(db,
        "SELECT dataset_id,version_id,size,created_at_ms FROM dataset_versions WHERE dataset_id=? ORDER BY version_id ASC;");
    st.Require("list versions");

    BindText(st.get(), 1, dataset_id);

    std::vector<model::VersionRecord> out;
    while (st.Step() == SQLITE_ROW) {
        model::VersionRecord r;
        r.dataset_id = ColText(st.get(), 0);
        r.version_id = static_cast<uint32_t>(ColU64(st.get(), 1));
        r.size = ColU64(st.get(), 2);
        r.created_at_ms = ColU64(st.get(), 3);
        out.push_back(std::move(r));
    }
    return out;
}

// ------------------------------------------------------------------
// Files
// ------------------------------------------------------------------

namespace {

std::set<uint32_t> LoadFileVersions(sqlite3* db, const std::string& dataset_id, const std::string& checksum) {
    Statement st(db, "SELECT version_id FROM file_versions WHERE dataset_id=? AND checksum=? ORDER BY version_id ASC;");
    st.Require("list file versions");

    BindText(st.get(), 1, dataset_id);
    BindText(st.get(), 2, checksum);

    std::set<uint32_t> versions;
    while (st.Step() == SQLITE_ROW)
        versions.insert(static_cast<uint32_t>(ColU64(st.get(), 0)));
    return versions;
}

model::FileRecord ReadFile(sqlite3_stmt* st) {
    model::FileRecord r;
    r.dataset_id = ColText(st, 0);
    r.checksum = ColText(st, 1);
    r.name = ColText(st, 2);
    r.size = ColU64(st, 3);
    r.object_key = ColText(st, 4);
    r.created_at_ms = ColU64(st, 5);
    return r;
}

} // namespace

std::optional<model::FileRecord>
SqliteRepository::GetFile(Transaction& t, const std::string& dataset_id, const std::string& checksum) {
    auto* db = TX(t).Handle();

    Statement st(db,
        "SELECT dataset_id,checksum,name,size,object_key,created_at_ms FROM files WHERE dataset_id=? AND checksum=?;");
    st.Require("get file");

    BindText(st.get(), 1, dataset_id);
    BindText(st.get(), 2, checksum);
    if (st.Step() != SQLITE_ROW) return std::nullopt;

    auto r = ReadFile(st.get());
    r.versions = LoadFileVersions(db, dataset_id, checksum);
    return r;
}

Result SqliteRepository::UpsertFile(Transaction& t, const model::FileRecord& r) {
    auto* db = TX(t).Handle();

    {
        Statement st(db,
            "INSERT INTO files(dataset_id,checksum,name,size,object_key,created_at_ms) VALUES(?,?,?,?,?,?) "
            "ON CONFLICT(dataset_id,checksum) DO UPDATE SET name=excluded.name, size=excluded.size, object_key=excluded.object_key;");
        if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

        BindText(st.get(), 1, r.dataset_id);
        BindText(st.get(), 2, r.checksum);
        BindText(st.get(), 3, r.name);
        BindU64(st.get(), 4, r.size);
        BindText(st.get(), 5, r.object_key);
        BindU64(st.get(), 6, r.created_at_ms);

        auto result = Translate(db, st.Step());
        if (!result) return result;
    }

    {
        Statement st(db, "DELETE FROM file_versions WHERE dataset_id=? AND checksum=?;");
        if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
        BindText(st.get(), 1, r.dataset_id);
        BindText(st.get(), 2, r.checksum);
        auto result = Translate(db, st.Step());
        if (!result) return result;
    }

    for (uint32_t version : r.versions) {
        Statement st(db, "INSERT INTO file_versions(dataset_id,checksum,version_id) VALUES(?,?,?);");
        if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
        BindText(st.get(), 1, r.dataset_id);
        BindText(st.get(), 2, r.checksum);
        BindU64(st.get(), 3, version);
        auto result = Translate(db, st.Step());
        if (!result) return result;
    }
    return Result::Ok();
}

std::vector<model::FileRecord>
SqliteRepository::ListFiles(Transaction& t, const std::string& dataset_id) {
    auto* db = TX(t).Handle();

    Statement st(db,
        "SELECT dataset_id,checksum,name,size,object_key,created_at_ms FROM files WHERE dataset_id=? "
        "ORDER BY created_at_ms ASC, checksum ASC;");
    st.Require("list files");

    BindText(st.get(), 1, dataset_id);

    std::vector<model::FileRecord> out;
    while (st.Step() == SQLITE_ROW)
        out.push_back(ReadFile(st.get()));
    for (auto& file : out)
        file.versions = LoadFileVersions(db, file.dataset_id, file.checksum);
    return out;
}

// ------------------------------------------------------------------
// Users / tiers / usage
// ------------------------------------------------------------------

std::optional<model::UserRecord>
SqliteRepository::GetUser(Transaction& t, const std::string& uid) {
    auto* db = TX(t).Handle();

    Statement st(db, "SELECT uid,tier,dataset_count,created_at_ms FROM users WHERE uid=?;");
    st.Require("get user");

    BindText(st.get(), 1, uid);
    if (st.Step() != SQLITE_ROW) return std::nullopt;

    model::UserRecord r;
    r.uid = ColText(st.get(), 0);
    r.tier = ColText(st.get(), 1);
    r.dataset_count = ColU64(st.get(), 2);
    r.created_at_ms = ColU64(st.get(), 3);
    return r;
}

Result SqliteRepository::InsertUser(Transaction& t, const model::UserRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, "INSERT INTO users(uid,tier,dataset_count,created_at_ms) VALUES(?,?,?,?);");
    if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.uid);
    BindText(st.get(), 2, r.tier);
    BindU64(st.get(), 3, r.dataset_count);
    BindU64(st.get(), 4, r.created_at_ms);

    return Translate(db, st.Step());
}

Result SqliteRepository::IncrementUserDatasetCount(Transaction& t, const std::string& uid, int64_t delta) {
    auto* db = TX(t).Handle();

    Statement st(db, "UPDATE users SET dataset_count=MAX(0, dataset_count + ?) WHERE uid=?;");
    if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st.get(), 1, delta);
    BindText(st.get(), 2, uid);

    auto result = Translate(db, st.Step());
    if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
    return result;
}

std::optional<model::TierRecord>
SqliteRepository::GetTier(Transaction& t, const std::string& name) {
    auto* db = TX(t).Handle();

    Statement st(db, "SELECT name,datasets_upload_per_day FROM tiers WHERE name=?;");
    st.Require("get tier");

    BindText(st.get(), 1, name);
    if (st.Step() != SQLITE_ROW) return std::nullopt;

    model::TierRecord r;
    r.name = ColText(st.get(), 0);
    r.datasets_upload_per_day = ColU64(st.get(), 1);
    return r;
}

Result SqliteRepository::UpsertTier(Transaction& t, const model::TierRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db,
        "INSERT INTO tiers(name,datasets_upload_per_day) VALUES(?,?) "
        "ON CONFLICT(name) DO UPDATE SET datasets_upload_per_day=excluded.datasets_upload_per_day;");
    if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.name);
    BindU64(st.get(), 2, r.datasets_upload_per_day);

    return Translate(db, st.Step());
}

Result SqliteRepository::InsertUsage(Transaction& t, const model::UsageRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, "INSERT INTO usage(uid,type,payload,timestamp_ms) VALUES(?,?,?,?);");
    if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.uid);
    BindText(st.get(), 2, r.type);
    BindText(st.get(), 3, r.payload_json);
    BindU64(st.get(), 4, r.timestamp_ms);

    return Translate(db, st.Step());
}

uint64_t SqliteRepository::CountUsageSince(Transaction& t, const std::string& uid, const std::string& type, uint64_t since_ms) {
    auto* db = TX(t).Handle();

    Statement st(db, "SELECT COUNT(*) FROM usage WHERE uid=? AND type=? AND timestamp_ms>=?;");
    st.Require("count usage");

    BindText(st.get(), 1, uid);
    BindText(st.get(), 2, type);
    BindU64(st.get(), 3, since_ms);

    if (st.Step() != SQLITE_ROW) return 0;
    return ColU64(st.get(), 0);
}

// ------------------------------------------------------------------
// Upload sessions
// ------------------------------------------------------------------

Result SqliteRepository::InsertUploadSession(Transaction& t, const model::UploadSessionRecord& r) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("INSERT INTO upload_sessions(") + kSessionColumns +
        ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";
    Statement st(db, sql.c_str());
    if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.upload_id);
    BindSessionFields(st.get(), 2, r);

    return Translate(db, st.Step());
}

std::optional<model::UploadSessionRecord>
SqliteRepository::GetUploadSession(Transaction& t, const std::string& upload_id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kSessionColumns + " FROM upload_sessions WHERE upload_id=?;";
    Statement st(db, sql.c_str());
    st.Require("get upload session");

    BindText(st.get(), 1, upload_id);
    if (st.Step() != SQLITE_ROW) return std::nullopt;
    return ReadSession(st.get());
}

std::optional<model::UploadSessionRecord>
SqliteRepository::FindActiveUploadSession(Transaction& t, const std::string& uid, const std::string& dataset_name,
                                          const std::string& checksum) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kSessionColumns +
        " FROM upload_sessions WHERE uid=? AND dataset_name=? AND checksum=? AND state<>?;";
    Statement st(db, sql.c_str());
    st.Require("find upload session");

    BindText(st.get(), 1, uid);
    BindText(st.get(), 2, dataset_name);
    BindText(st.get(), 3, checksum);
    BindI32(st.get(), 4, datahub::core::v1::UPLOAD_SESSION_STATE_DATASET_PERSISTED);
    if (st.Step() != SQLITE_ROW) return std::nullopt;
    return ReadSession(st.get());
}

std::vector<model::UploadSessionRecord>
SqliteRepository::ListActiveUploadSessionsByName(Transaction& t, const std::string& dataset_name) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kSessionColumns +
        " FROM upload_sessions WHERE dataset_name=? AND state<>?;";
    Statement st(db, sql.c_str());
    st.Require("list upload sessions by name");

    BindText(st.get(), 1, dataset_name);
    BindI32(st.get(), 2, datahub::core::v1::UPLOAD_SESSION_STATE_DATASET_PERSISTED);
    return ReadSessions(st);
}

uint64_t SqliteRepository::CountActiveUploadSessionsSince(Transaction& t, const std::string& uid, uint64_t since_ms) {
    auto* db = TX(t).Handle();

    Statement st(db, "SELECT COUNT(*) FROM upload_sessions WHERE uid=? AND state<>? AND created_at_ms>=?;");
    st.Require("count upload sessions");

    BindText(st.get(), 1, uid);
    BindI32(st.get(), 2, datahub::core::v1::UPLOAD_SESSION_STATE_DATASET_PERSISTED);
    BindU64(st.get(), 3, since_ms);

    if (st.Step() != SQLITE_ROW) return 0;
    return ColU64(st.get(), 0);
}

std::vector<model::UploadSessionRecord>
SqliteRepository::ListUploadSessionsUpdatedBefore(Transaction& t, uint64_t before_ms) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kSessionColumns +
        " FROM upload_sessions WHERE updated_at_ms<? ORDER BY updated_at_ms ASC;";
    Statement st(db, sql.c_str());
    st.Require("list stale upload sessions");

    BindU64(st.get(), 1, before_ms);
    return ReadSessions(st);
}

Result SqliteRepository::UpdateUploadSession(Transaction& t, const model::UploadSessionRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db,
        "UPDATE upload_sessions SET uid=?,dataset_name=?,checksum=?,dataset_id=?,filename=?,description=?,tags=?,"
        "total_size=?,chunk_size=?,part_count=?,state=?,storage_upload_id=?,object_key=?,deduplicated=?,version_id=?,"
        "error_message=?,created_at_ms=?,updated_at_ms=? WHERE upload_id=?;");
    if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindSessionFields(st.get(), 1, r);
    BindText(st.get(), 19, r.upload_id);

    auto result = Translate(db, st.Step());
    if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
    return result;
}

Result SqliteRepository::DeleteUploadSession(Transaction& t, const std::string& upload_id) {
    auto* db = TX(t).Handle();

    // upload_parts rows go with ON DELETE CASCADE
    Statement st(db, "DELETE FROM upload_sessions WHERE upload_id=?;");
    if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, upload_id);
    return Translate(db, st.Step());
}

Result SqliteRepository::InsertUploadPart(Transaction& t, const model::UploadPartRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db,
        "INSERT INTO upload_parts(upload_id,part_number,size,checksum,etag,received_at_ms) VALUES(?,?,?,?,?,?);");
    if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.upload_id);
    BindU64(st.get(), 2, r.part_number);
    BindU64(st.get(), 3, r.size);
    BindText(st.get(), 4, r.checksum);
    BindText(st.get(), 5, r.etag);
    BindU64(st.get(), 6, r.received_at_ms);

    return Translate(db, st.Step());
}

std::vector<model::UploadPartRecord>
SqliteRepository::ListUploadParts(Transaction& t, const std::string& upload_id) {
    auto* db = TX(t).Handle();

    Statement st(db,
        "SELECT upload_id,part_number,size,checksum,etag,received_at_ms FROM upload_parts WHERE upload_id=? "
        "ORDER BY part_number ASC;");
    st.Require("list upload parts");

    BindText(st.get(), 1, upload_id);

    std::vector<model::UploadPartRecord> out;
    while (st.Step() == SQLITE_ROW) {
        model::UploadPartRecord r;
        r.upload_id = ColText(st.get(), 0);
        r.part_number = static_cast<uint32_t>(ColU64(st.get(), 1));
        r.size = ColU64(st.get(), 2);
        r.checksum = ColText(st.get(), 3);
        r.etag = ColText(st.get(), 4);
        r.received_at_ms = ColU64(st.get(), 5);
        out.push_back(std::move(r));
    }
    return out;
}

} // namespace datahub::db::sqlite
