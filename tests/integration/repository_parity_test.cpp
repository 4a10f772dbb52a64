#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/api/tx_helpers.hpp"
#include "internal/db/memory/memory_repository.hpp"

#if DATAHUB_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

#if DATAHUB_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/db/postgres/pg_schema.hpp"
#endif

namespace {

using datahub::core::v1::UPLOAD_SESSION_STATE_CREATED;
using datahub::core::v1::UPLOAD_SESSION_STATE_DATASET_PERSISTED;
using datahub::core::v1::UPLOAD_SESSION_STATE_PARTS_PENDING;
using datahub::db::ErrorCode;
using datahub::db::Repository;
using datahub::db::Transaction;
using datahub::db::memory::MemoryRepository;
using datahub::db::model::DatasetCounter;
using datahub::db::model::DatasetFilter;
using datahub::db::model::DatasetRecord;
using datahub::db::model::FileRecord;
using datahub::db::model::TierRecord;
using datahub::db::model::UploadPartRecord;
using datahub::db::model::UploadSessionRecord;
using datahub::db::model::UsageRecord;
using datahub::db::model::UserRecord;
using datahub::db::model::VersionRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

DatasetRecord MakeDataset(const std::string& id, const std::string& name, uint64_t created_at_ms) {
  DatasetRecord dataset;
  dataset.id            = id;
  dataset.uid           = "alice";
  dataset.name          = name;
  dataset.description   = "integration dataset";
  dataset.tags          = {"climate", "hourly"};
  dataset.created_at_ms = created_at_ms;
  dataset.updated_at_ms = created_at_ms;
  return dataset;
}

UploadSessionRecord MakeSession(const std::string& upload_id, const std::string& dataset_name, const std::string& checksum) {
  UploadSessionRecord session;
  session.upload_id         = upload_id;
  session.uid               = "alice";
  session.dataset_name      = dataset_name;
  session.checksum          = checksum;
  session.dataset_id        = dataset_name + "-id";
  session.filename          = "data.csv";
  session.description       = "integration upload";
  session.tags              = {"a"};
  session.total_size        = 12;
  session.chunk_size        = 4;
  session.part_count        = 3;
  session.state             = UPLOAD_SESSION_STATE_CREATED;
  session.object_key        = session.dataset_id + "/" + checksum + "_12";
  session.storage_upload_id = "mp-" + upload_id;
  session.created_at_ms     = 1000;
  session.updated_at_ms     = 1000;
  return session;
}

void VerifyDatasetsVersionsFiles(Repository& repo, const std::string& prefix) {
  const auto id    = prefix + "-ds";
  const auto name  = prefix + "-climate";
  const auto other = prefix + "-traffic";

  {
    auto tx = repo.Begin();
    assert(repo.InsertDataset(*tx, MakeDataset(id, name, 10)));
    assert(repo.InsertDataset(*tx, MakeDataset(id + "-2", other, 20)));

    // name is unique across the hub
    auto clash = repo.InsertDataset(*tx, MakeDataset(id + "-3", name, 30));
    assert(!clash);
    assert(clash.code == ErrorCode::AlreadyExists);
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    auto by_name = repo.GetDatasetByName(*tx, name);
    assert(by_name.has_value());
    assert(by_name->id == id);
    assert(by_name->tags == (std::vector<std::string>{"climate", "hourly"}));

    DatasetFilter filter;
    filter.name_contains = prefix;
    auto listed          = repo.ListDatasets(*tx, filter);
    assert(listed.size() == 2);
    assert(listed[0].id == id);

    filter.limit = 1;
    assert(repo.ListDatasets(*tx, filter).size() == 1);

    by_name->name        = other;
    auto rename_conflict = repo.UpdateDataset(*tx, *by_name);
    assert(rename_conflict.code == ErrorCode::AlreadyExists);

    by_name->name        = name + "-renamed";
    by_name->description = "renamed";
    by_name->tags.clear();
    assert(repo.UpdateDataset(*tx, *by_name));
    assert(!repo.GetDatasetByName(*tx, name).has_value());
    auto renamed = repo.GetDataset(*tx, id);
    assert(renamed->name == name + "-renamed");
    assert(renamed->tags.empty());

    assert(repo.IncrementDatasetCounter(*tx, id, DatasetCounter::Downloads, 3));
    assert(repo.IncrementDatasetCounter(*tx, id, DatasetCounter::Likes, 1));
    assert(repo.GetDataset(*tx, id)->downloads == 3);
    assert(repo.GetDataset(*tx, id)->likes == 1);
    assert(repo.IncrementDatasetCounter(*tx, prefix + "-missing", DatasetCounter::Likes, 1).code == ErrorCode::NotFound);
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    assert(repo.InsertVersion(*tx, VersionRecord{id, 2, 20, 200}));
    assert(repo.InsertVersion(*tx, VersionRecord{id, 1, 10, 100}));
    assert(repo.InsertVersion(*tx, VersionRecord{id, 1, 10, 100}).code == ErrorCode::AlreadyExists);

    auto versions = repo.ListVersions(*tx, id);
    assert(versions.size() == 2);
    assert(versions[0].version_id == 1);
    assert(versions[1].version_id == 2);

    FileRecord file;
    file.dataset_id    = id;
    file.checksum      = "0123456789abcdef0123456789abcdef";
    file.name          = "a.csv";
    file.size          = 10;
    file.object_key    = id + "/" + file.checksum + "_10";
    file.versions      = {1};
    file.created_at_ms = 100;
    assert(repo.UpsertFile(*tx, file));

    // a file carried into the next version is stored once
    file.versions.insert(2);
    assert(repo.UpsertFile(*tx, file));

    auto stored = repo.GetFile(*tx, id, file.checksum);
    assert(stored.has_value());
    assert(stored->versions == (std::set<uint32_t>{1, 2}));
    assert(stored->object_key == file.object_key);
    assert(repo.ListFiles(*tx, id).size() == 1);
    assert(!repo.GetFile(*tx, id, "ffffffffffffffffffffffffffffffff").has_value());
    tx->Commit();
  }
}

void VerifyUsersTiersUsage(Repository& repo, const std::string& prefix) {
  const auto uid = prefix + "-user";

  auto tx = repo.Begin();
  assert(repo.InsertUser(*tx, UserRecord{uid, "free", 0, 1}));
  assert(repo.InsertUser(*tx, UserRecord{uid, "pro", 0, 1}).code == ErrorCode::AlreadyExists);
  assert(repo.IncrementUserDatasetCount(*tx, uid, 2));
  assert(repo.GetUser(*tx, uid)->dataset_count == 2);
  assert(repo.GetUser(*tx, uid)->tier == "free");

  assert(repo.UpsertTier(*tx, TierRecord{prefix + "-tier", 10}));
  assert(repo.UpsertTier(*tx, TierRecord{prefix + "-tier", 25}));
  assert(repo.GetTier(*tx, prefix + "-tier")->datasets_upload_per_day == 25);
  assert(!repo.GetTier(*tx, prefix + "-nope").has_value());

  for (uint64_t ts : {100, 200, 300}) {
    assert(repo.InsertUsage(*tx, UsageRecord{uid, datahub::db::model::kUsageDatasetIngested, R"({"dataset":"x"})", ts}));
  }
  assert(repo.InsertUsage(*tx, UsageRecord{uid, "dataset_downloaded", "{}", 300}));
  assert(repo.CountUsageSince(*tx, uid, datahub::db::model::kUsageDatasetIngested, 0) == 3);
  assert(repo.CountUsageSince(*tx, uid, datahub::db::model::kUsageDatasetIngested, 200) == 2);
  assert(repo.CountUsageSince(*tx, uid, datahub::db::model::kUsageDatasetIngested, 301) == 0);
  tx->Commit();
}

void VerifyUploadSessions(Repository& repo, const std::string& prefix) {
  const auto name     = prefix + "-upload";
  const auto checksum = "00112233445566778899aabbccddeeff";
  const auto first    = prefix + "-session-1";
  const auto second   = prefix + "-session-2";

  {
    auto tx = repo.Begin();
    assert(repo.InsertUploadSession(*tx, MakeSession(first, name, checksum)));

    // the active key admits one session
    auto duplicate = repo.InsertUploadSession(*tx, MakeSession(second, name, checksum));
    assert(duplicate.code == ErrorCode::AlreadyExists);

    auto active = repo.FindActiveUploadSession(*tx, "alice", name, checksum);
    assert(active.has_value());
    assert(active->upload_id == first);
    assert(active->storage_upload_id == "mp-" + first);
    assert(active->tags == (std::vector<std::string>{"a"}));
    assert(repo.ListActiveUploadSessionsByName(*tx, name).size() == 1);
    assert(repo.CountActiveUploadSessionsSince(*tx, "alice", 1000) >= 1);
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    for (uint32_t part : {3u, 1u}) {
      assert(repo.InsertUploadPart(*tx, UploadPartRecord{first, part, 4, "part-md5", "etag", 1100}));
    }
    assert(repo.InsertUploadPart(*tx, UploadPartRecord{first, 1, 4, "part-md5", "etag", 1200}).code == ErrorCode::AlreadyExists);

    auto parts = repo.ListUploadParts(*tx, first);
    assert(parts.size() == 2);
    assert(parts[0].part_number == 1);
    assert(parts[1].part_number == 3);
    assert(parts[0].received_at_ms == 1100);

    auto session  = *repo.GetUploadSession(*tx, first);
    session.state = UPLOAD_SESSION_STATE_PARTS_PENDING;
    assert(repo.UpdateUploadSession(*tx, session));
    tx->Commit();
  }

  {
    // a persisted session no longer holds the key
    auto tx         = repo.Begin();
    auto session    = *repo.GetUploadSession(*tx, first);
    session.state   = UPLOAD_SESSION_STATE_DATASET_PERSISTED;
    session.version_id    = 1;
    session.updated_at_ms = 2000;
    assert(repo.UpdateUploadSession(*tx, session));
    assert(!repo.FindActiveUploadSession(*tx, "alice", name, checksum).has_value());
    assert(repo.ListActiveUploadSessionsByName(*tx, name).empty());

    assert(repo.InsertUploadSession(*tx, MakeSession(second, name, checksum)));
    assert(repo.FindActiveUploadSession(*tx, "alice", name, checksum)->upload_id == second);
    assert(repo.GetUploadSession(*tx, first)->version_id == 1);
    tx->Commit();
  }

  {
    auto tx    = repo.Begin();
    auto stale = repo.ListUploadSessionsUpdatedBefore(*tx, 1500);
    bool found = false;
    for (const auto& s : stale) found = found || s.upload_id == second;
    assert(found);

    assert(repo.DeleteUploadSession(*tx, first));
    assert(!repo.GetUploadSession(*tx, first).has_value());
    assert(repo.ListUploadParts(*tx, first).empty());
    assert(repo.DeleteUploadSession(*tx, second));
    tx->Commit();
  }

  {
    auto missing = MakeSession(prefix + "-never", name, checksum);
    auto tx      = repo.Begin();
    assert(repo.UpdateUploadSession(*tx, missing).code == ErrorCode::NotFound);
    tx->Rollback();
  }
}

void VerifyRollbackBehavior(Repository& repo, const std::string& prefix) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertDataset(*tx, MakeDataset(prefix + "-rolled", prefix + "-rolled", 1)));
    tx->Rollback();
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetDataset(*check_tx, prefix + "-rolled").has_value());
  check_tx->Commit();
}

void VerifyConcurrentIncrements(Repository& repo, const std::string& prefix) {
  const auto id = prefix + "-concurrent";
  datahub::db::RunInTransaction(repo, [&](Transaction& tx) {
    datahub::db::ThrowIfDbError(repo.InsertDataset(tx, MakeDataset(id, id, 1)), "insert dataset");
  });

  constexpr int kThreads    = 4;
  constexpr int kIncrements = 10;

  std::vector<std::thread> workers;
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([&] {
      for (int i = 0; i < kIncrements; ++i) {
        datahub::db::RunInTransaction(
            repo,
            [&](Transaction& tx) {
              datahub::db::ThrowIfDbError(repo.IncrementDatasetCounter(tx, id, DatasetCounter::Downloads, 1), "increment downloads");
            },
            100);
      }
    });
  }
  for (auto& worker : workers) worker.join();

  auto tx = repo.Begin();
  assert(repo.GetDataset(*tx, id)->downloads == kThreads * kIncrements);
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->InsertDataset(*tx, MakeDataset(prefix + "-durable", prefix + "-durable", 5)));
    assert(repo->InsertVersion(*tx, VersionRecord{prefix + "-durable", 1, 7, 5}));
    assert(repo->InsertUploadSession(*tx, MakeSession(prefix + "-durable-session", prefix + "-durable", "ffeeddccbbaa99887766554433221100")));
    assert(repo->InsertUploadPart(*tx, UploadPartRecord{prefix + "-durable-session", 2, 4, "md5", "etag", 1}));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto dataset = repo->GetDataset(*tx, prefix + "-durable");
  assert(dataset.has_value());
  assert(dataset->tags.size() == 2);
  assert(repo->ListVersions(*tx, prefix + "-durable").size() == 1);

  auto session = repo->GetUploadSession(*tx, prefix + "-durable-session");
  assert(session.has_value());
  assert(session->part_count == 3);
  auto parts = repo->ListUploadParts(*tx, prefix + "-durable-session");
  assert(parts.size() == 1);
  assert(parts[0].part_number == 2);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if DATAHUB_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("dataset_hub_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<datahub::db::sqlite::SqliteDB>(db_path);
    datahub::db::sqlite::BootstrapSchema(db);
    return std::make_shared<datahub::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

#if DATAHUB_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("DATAHUB_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("DATAHUB_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<datahub::db::postgres::PgPool>(conninfo);
    datahub::db::postgres::BootstrapSchema(pool);
    return std::make_shared<datahub::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  // rows from earlier runs stay in a shared postgres database
  const auto prefix = backend.name + "-" + std::to_string(NowMs());

  {
    auto repo = backend.make_repository();

    VerifyDatasetsVersionsFiles(*repo, prefix);
    VerifyUsersTiersUsage(*repo, prefix);
    VerifyUploadSessions(*repo, prefix);
    VerifyRollbackBehavior(*repo, prefix);
    VerifyConcurrentIncrements(*repo, prefix);
  }

  VerifyRestartDurability(backend, prefix);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if DATAHUB_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if DATAHUB_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "dataset_hub_integration_repository_parity: pass\n";
  return 0;
}
