#include <atomic>
#include <cassert>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "hub_test_fixture.hpp"
#include "internal/db/api/tx_helpers.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/runtime/session_reaper.hpp"
#include "internal/util/errors.hpp"

namespace {

using datahub::checksum::Md5Hex;
using datahub::core::v1::UPLOAD_SESSION_STATE_CREATED;
using datahub::core::v1::UPLOAD_SESSION_STATE_DATASET_PERSISTED;
using datahub::core::v1::UPLOAD_SESSION_STATE_FAILED;
using datahub::core::v1::UPLOAD_SESSION_STATE_PARTS_PENDING;
using datahub::db::memory::MemoryRepository;
using datahub::db::model::FileRecord;
using datahub::storage::CompletedPart;
using datahub::storage::ObjectInfo;
using datahub::storage::ObjectStore;
using datahub::storage::ObjectStorePtr;
using datahub::testing::Hub;
using datahub::testing::HubOptions;
using datahub::testing::MakeHub;
using datahub::testing::ManualClock;
using datahub::testing::PartOf;
using datahub::testing::ReadObject;
using datahub::testing::SendAllParts;
using datahub::testing::StartFor;
using datahub::testing::TempDir;
using datahub::testing::Throws;

const std::string kContent = "hello dataset hub"; // 17 bytes -> 5 parts of 4

/*
  Delegates to a real store. PutPart and CompleteMultipart fail
  permanently while the matching flag is set. after_put runs once a part
  has been written, once per assignment.
*/
class FlakyStore final : public ObjectStore {
 public:
  explicit FlakyStore(ObjectStorePtr inner) : inner_(std::move(inner)) {
  }

  std::string CreateMultipart(const std::string& key) override {
    return inner_->CreateMultipart(key);
  }

  std::string PutPart(const std::string& upload_id, uint32_t part_number, const std::shared_ptr<arrow::Buffer>& data) override {
    if (fail_put) throw datahub::util::StorageBackendError("injected put failure", /*transient=*/false);
    auto etag = inner_->PutPart(upload_id, part_number, data);
    if (after_put) {
      auto hook = std::move(after_put);
      after_put = nullptr;
      hook();
    }
    return etag;
  }

  ObjectInfo CompleteMultipart(const std::string& upload_id, const std::vector<CompletedPart>& parts) override {
    if (fail_complete) throw datahub::util::StorageBackendError("injected complete failure", /*transient=*/false);
    return inner_->CompleteMultipart(upload_id, parts);
  }

  void AbortMultipart(const std::string& upload_id) override {
    inner_->AbortMultipart(upload_id);
  }

  bool MultipartExists(const std::string& upload_id) override {
    return inner_->MultipartExists(upload_id);
  }

  ObjectInfo PutObject(const std::string& key, const std::shared_ptr<arrow::Buffer>& data) override {
    return inner_->PutObject(key, data);
  }

  std::shared_ptr<arrow::io::RandomAccessFile> OpenObject(const std::string& key) override {
    return inner_->OpenObject(key);
  }

  std::optional<ObjectInfo> Stat(const std::string& key) override {
    return inner_->Stat(key);
  }

  void DeleteObject(const std::string& key) override {
    inner_->DeleteObject(key);
  }

  std::atomic<bool> fail_put{false};
  std::atomic<bool> fail_complete{false};
  std::function<void()> after_put;

 private:
  ObjectStorePtr inner_;
};

Hub NewHub(const ManualClock& clock, HubOptions options = {}) {
  return MakeHub(std::make_shared<MemoryRepository>(), TempDir("sessions"), clock, std::move(options));
}

std::vector<FileRecord> FilesOf(Hub& hub, const std::string& dataset_id, uint32_t version) {
  return datahub::db::RunInTransaction(*hub.repo,
                                       [&](datahub::db::Transaction& tx) { return hub.versions->ListFiles(tx, dataset_id, version); });
}

std::set<std::string> NamesOf(const std::vector<FileRecord>& files) {
  std::set<std::string> names;
  for (const auto& f : files) names.insert(f.name + ":" + f.checksum);
  return names;
}

datahub::ingest::CompleteResult Ingest(Hub& hub, const std::string& uid, const std::string& name, const std::string& content,
                                       const std::string& filename = "data.bin") {
  auto started = hub.sessions->StartOrResume(StartFor(uid, name, content, filename));
  SendAllParts(*hub.sessions, uid, started.view, content);
  return hub.sessions->Complete(uid, started.view.session.upload_id);
}

// ---------------------------------------------------------------------
// happy path
// ---------------------------------------------------------------------

void TestFullUploadPersistsDataset() {
  ManualClock clock;
  auto        hub = NewHub(clock);

  auto started = hub.sessions->StartOrResume(StartFor("alice", "weather", kContent));
  assert(!started.resumed);
  const auto session = started.view.session;
  assert(session.state == UPLOAD_SESSION_STATE_CREATED);
  assert(session.part_count == 5);
  assert(session.chunk_size == 4);
  assert(session.object_key == session.dataset_id + "/" + Md5Hex(kContent) + "_17");
  assert(started.view.MissingParts().size() == 5);

  SendAllParts(*hub.sessions, "alice", started.view, kContent);
  auto described = hub.sessions->Describe("alice", session.upload_id);
  assert(described.session.state == UPLOAD_SESSION_STATE_PARTS_PENDING);
  assert(described.MissingParts().empty());

  auto done = hub.sessions->Complete("alice", session.upload_id);
  assert(done.version_id == 1);
  assert(done.dataset.dataset.name == "weather");
  assert(done.dataset.dataset.uid == "alice");
  assert(done.dataset.versions.size() == 1);
  assert(done.dataset.versions[0].size == kContent.size());
  assert(ReadObject(*hub.store, session.object_key) == kContent);

  auto persisted = hub.sessions->Describe("alice", session.upload_id);
  assert(persisted.session.state == UPLOAD_SESSION_STATE_DATASET_PERSISTED);
  assert(persisted.session.version_id == 1);

  auto files = FilesOf(hub, done.dataset.dataset.id, 1);
  assert(files.size() == 1);
  assert(files[0].name == "data.bin");
  assert(files[0].checksum == Md5Hex(kContent));

  auto user = datahub::db::RunInTransaction(*hub.repo, [&](datahub::db::Transaction& tx) { return hub.repo->GetUser(tx, "alice"); });
  assert(user.has_value());
  assert(user->dataset_count == 1);
}

void TestCompleteIsReplaySafe() {
  ManualClock clock;
  auto        hub = NewHub(clock);

  auto started   = hub.sessions->StartOrResume(StartFor("alice", "replay", kContent));
  const auto id  = started.view.session.upload_id;
  SendAllParts(*hub.sessions, "alice", started.view, kContent);

  auto first  = hub.sessions->Complete("alice", id);
  auto second = hub.sessions->Complete("alice", id);
  assert(first.version_id == second.version_id);
  assert(second.dataset.versions.size() == 1);

  // a late retry of an already stored part is still acknowledged
  auto late = hub.sessions->UploadPart("alice", id, 2, PartOf(kContent, 4, 2), Md5Hex(*PartOf(kContent, 4, 2)));
  assert(late.already_stored);
}

void TestZeroByteContentIsOnePart() {
  ManualClock clock;
  auto        hub = NewHub(clock);

  auto started = hub.sessions->StartOrResume(StartFor("alice", "empty-set", ""));
  assert(started.view.session.part_count == 1);
  SendAllParts(*hub.sessions, "alice", started.view, "");
  auto done = hub.sessions->Complete("alice", started.view.session.upload_id);
  assert(done.version_id == 1);
  assert(ReadObject(*hub.store, started.view.session.object_key).empty());
}

// ---------------------------------------------------------------------
// parts
// ---------------------------------------------------------------------

void TestPartUploadIsIdempotent() {
  ManualClock clock;
  auto        hub = NewHub(clock);

  auto       started = hub.sessions->StartOrResume(StartFor("alice", "idem", kContent));
  const auto id      = started.view.session.upload_id;
  auto       part    = PartOf(kContent, 4, 1);

  auto first = hub.sessions->UploadPart("alice", id, 1, part, Md5Hex(*part));
  assert(!first.already_stored);
  assert(first.received_count == 1);

  auto again = hub.sessions->UploadPart("alice", id, 1, part, Md5Hex(*part));
  assert(again.already_stored);
  assert(again.received_count == 1);
}

void TestPartValidation() {
  ManualClock clock;
  auto        hub = NewHub(clock);

  auto       started = hub.sessions->StartOrResume(StartFor("alice", "checks", kContent));
  const auto id      = started.view.session.upload_id;
  auto       part    = PartOf(kContent, 4, 1);

  assert(Throws<datahub::util::ChecksumMismatch>(
      [&] { hub.sessions->UploadPart("alice", id, 1, part, Md5Hex(std::string("something else"))); }));

  // last part is 1 byte
  assert(Throws<datahub::util::ValidationError>([&] { hub.sessions->UploadPart("alice", id, 5, part, Md5Hex(*part)); }));
  assert(Throws<datahub::util::ValidationError>([&] { hub.sessions->UploadPart("alice", id, 6, part, Md5Hex(*part)); }));
  assert(Throws<datahub::util::ValidationError>([&] { hub.sessions->UploadPart("alice", id, 0, part, Md5Hex(*part)); }));
  assert(Throws<datahub::util::ValidationError>([&] { hub.sessions->UploadPart("alice", id, 1, part, ""); }));

  // upper-case hex is accepted
  std::string upper = Md5Hex(*part);
  for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  assert(!hub.sessions->UploadPart("alice", id, 1, part, upper).already_stored);

  auto view = hub.sessions->Describe("alice", id);
  assert(view.received_parts == std::set<uint32_t>{1});
}

// ---------------------------------------------------------------------
// resume
// ---------------------------------------------------------------------

void TestResumeReturnsReceivedParts() {
  ManualClock clock;
  auto        hub = NewHub(clock);

  auto       request = StartFor("alice", "resumable", kContent);
  auto       started = hub.sessions->StartOrResume(request);
  const auto id      = started.view.session.upload_id;

  for (uint32_t n : {1u, 3u}) {
    auto part = PartOf(kContent, 4, n);
    hub.sessions->UploadPart("alice", id, n, part, Md5Hex(*part));
  }

  auto resumed = hub.sessions->StartOrResume(request);
  assert(resumed.resumed);
  assert(resumed.view.session.upload_id == id);
  assert(resumed.view.received_parts == (std::set<uint32_t>{1, 3}));
  assert(resumed.view.MissingParts() == (std::vector<uint32_t>{2, 4, 5}));

  // same key, different size
  auto wrong_size       = request;
  wrong_size.total_size = kContent.size() + 1;
  assert(Throws<datahub::util::ValidationError>([&] { hub.sessions->StartOrResume(wrong_size); }));

  // completion is refused with the gaps listed, and nothing changes
  bool finalize_failed = false;
  try {
    hub.sessions->Complete("alice", id);
  } catch (const datahub::util::FinalizeError& e) {
    finalize_failed = true;
    assert(e.missing_parts() == (std::vector<uint32_t>{2, 4, 5}));
  }
  assert(finalize_failed);
  assert(hub.sessions->Describe("alice", id).session.state == UPLOAD_SESSION_STATE_PARTS_PENDING);

  SendAllParts(*hub.sessions, "alice", resumed.view, kContent);
  assert(hub.sessions->Complete("alice", id).version_id == 1);
}

void TestConcurrentStartsShareOneSession() {
  ManualClock clock;
  auto        hub = NewHub(clock);

  const auto               request = StartFor("alice", "racy", kContent);
  std::vector<std::string> ids(8);
  std::atomic<int>         created{0};

  std::vector<std::thread> threads;
  for (size_t i = 0; i < ids.size(); ++i) {
    threads.emplace_back([&, i] {
      auto result = hub.sessions->StartOrResume(request);
      ids[i]      = result.view.session.upload_id;
      if (!result.resumed) created.fetch_add(1);
    });
  }
  for (auto& t : threads) t.join();

  assert(created.load() == 1);
  for (const auto& id : ids) assert(id == ids.front());
}

// ---------------------------------------------------------------------
// versions and dedup
// ---------------------------------------------------------------------

void TestVersionsAreSnapshots() {
  ManualClock clock;
  auto        hub = NewHub(clock);

  const std::string a1 = "first revision of a";
  const std::string b1 = "content of b";
  const std::string a2 = "second revision of a";

  auto v1 = Ingest(hub, "alice", "snapshots", a1, "a.csv");
  auto v2 = Ingest(hub, "alice", "snapshots", b1, "b.csv");
  auto v3 = Ingest(hub, "alice", "snapshots", a2, "a.csv");
  assert(v1.version_id == 1);
  assert(v2.version_id == 2);
  assert(v3.version_id == 3);

  const auto id = v3.dataset.dataset.id;
  assert(v1.dataset.dataset.id == id);
  assert(v3.dataset.versions.size() == 3);

  assert(NamesOf(FilesOf(hub, id, 1)) == (std::set<std::string>{"a.csv:" + Md5Hex(a1)}));
  assert(NamesOf(FilesOf(hub, id, 2)) == (std::set<std::string>{"a.csv:" + Md5Hex(a1), "b.csv:" + Md5Hex(b1)}));
  assert(NamesOf(FilesOf(hub, id, 3)) == (std::set<std::string>{"a.csv:" + Md5Hex(a2), "b.csv:" + Md5Hex(b1)}));
  assert(FilesOf(hub, id, 0).size() == 3);
  assert(v3.dataset.versions[2].size == a2.size() + b1.size());
}

void TestIdenticalContentIsDeduplicated() {
  ManualClock clock;
  auto        hub = NewHub(clock);

  auto first = Ingest(hub, "alice", "dedup", kContent);

  auto again = hub.sessions->StartOrResume(StartFor("alice", "dedup", kContent));
  assert(!again.resumed);
  assert(again.view.session.deduplicated);
  assert(again.view.MissingParts().empty());
  assert(again.view.session.storage_upload_id.empty());

  auto second = hub.sessions->Complete("alice", again.view.session.upload_id);
  assert(second.version_id == 2);

  auto files = FilesOf(hub, first.dataset.dataset.id, 0);
  assert(files.size() == 1);
  assert(files[0].versions == (std::set<uint32_t>{1, 2}));
  assert(ReadObject(*hub.store, files[0].object_key) == kContent);
}

// ---------------------------------------------------------------------
// ownership
// ---------------------------------------------------------------------

void TestOwnershipRules() {
  ManualClock clock;
  auto        hub = NewHub(clock);

  auto open = hub.sessions->StartOrResume(StartFor("alice", "claimed", kContent));

  // an open session reserves the name
  assert(Throws<datahub::util::DatasetAlreadyExistsError>([&] { hub.sessions->StartOrResume(StartFor("bob", "claimed", "other")); }));

  const auto id   = open.view.session.upload_id;
  auto       part = PartOf(kContent, 4, 1);
  assert(Throws<datahub::util::PermissionDenied>([&] { hub.sessions->UploadPart("bob", id, 1, part, Md5Hex(*part)); }));
  assert(Throws<datahub::util::PermissionDenied>([&] { hub.sessions->Complete("bob", id); }));
  assert(Throws<datahub::util::PermissionDenied>([&] { hub.sessions->Abort("bob", id); }));
  assert(Throws<datahub::util::NotFound>([&] { hub.sessions->Describe("alice", "no-such-upload"); }));

  SendAllParts(*hub.sessions, "alice", open.view, kContent);
  hub.sessions->Complete("alice", id);

  // and a persisted dataset keeps it
  assert(Throws<datahub::util::DatasetAlreadyExistsError>([&] { hub.sessions->StartOrResume(StartFor("bob", "claimed", "other")); }));
}

void TestRequestValidation() {
  ManualClock clock;
  auto        hub = NewHub(clock);

  auto request = StartFor("alice", "valid-name", kContent);

  auto bad = request;
  bad.dataset_name = "9lives";
  assert(Throws<datahub::util::NameCharsValidationError>([&] { hub.sessions->StartOrResume(bad); }));

  bad = request;
  bad.dataset_name = "ab";
  assert(Throws<datahub::util::NameLengthValidationError>([&] { hub.sessions->StartOrResume(bad); }));

  bad = request;
  bad.description = "tiny";
  assert(Throws<datahub::util::DescriptionLengthValidationError>([&] { hub.sessions->StartOrResume(bad); }));

  bad = request;
  bad.checksum = "not-a-checksum";
  assert(Throws<datahub::util::ValidationError>([&] { hub.sessions->StartOrResume(bad); }));

  bad = request;
  bad.filename = "../escape.bin";
  assert(Throws<datahub::util::ValidationError>([&] { hub.sessions->StartOrResume(bad); }));

  // an empty filename takes the dataset name
  auto unnamed     = request;
  unnamed.filename = "";
  assert(hub.sessions->StartOrResume(unnamed).view.session.filename == "valid-name");
}

// ---------------------------------------------------------------------
// failures
// ---------------------------------------------------------------------

void TestStorageFailureMarksSessionFailed() {
  ManualClock                 clock;
  std::shared_ptr<FlakyStore> flaky;

  HubOptions options;
  options.wrap_store = [&](ObjectStorePtr inner) {
    flaky = std::make_shared<FlakyStore>(std::move(inner));
    return flaky;
  };
  auto hub = NewHub(clock, options);

  auto       started = hub.sessions->StartOrResume(StartFor("alice", "flaky", kContent));
  const auto id      = started.view.session.upload_id;
  SendAllParts(*hub.sessions, "alice", started.view, kContent);

  flaky->fail_complete = true;
  assert(Throws<datahub::util::StorageBackendError>([&] { hub.sessions->Complete("alice", id); }));

  auto failed = hub.sessions->Describe("alice", id);
  assert(failed.session.state == UPLOAD_SESSION_STATE_FAILED);
  assert(!failed.session.error_message.empty());
  assert(failed.MissingParts().empty());

  // nothing was committed
  auto dataset = datahub::db::RunInTransaction(*hub.repo, [&](datahub::db::Transaction& tx) {
    return hub.repo->GetDatasetByName(tx, "flaky");
  });
  assert(!dataset.has_value());

  flaky->fail_complete = false;
  assert(hub.sessions->Complete("alice", id).version_id == 1);
}

void TestPermanentPartFailureMarksSessionFailed() {
  ManualClock                 clock;
  std::shared_ptr<FlakyStore> flaky;

  HubOptions options;
  options.wrap_store = [&](ObjectStorePtr inner) {
    flaky = std::make_shared<FlakyStore>(std::move(inner));
    return flaky;
  };
  auto hub = NewHub(clock, options);

  auto       started = hub.sessions->StartOrResume(StartFor("alice", "part-fail", kContent));
  const auto id      = started.view.session.upload_id;
  auto       part    = PartOf(kContent, 4, 1);

  flaky->fail_put = true;
  assert(Throws<datahub::util::StorageBackendError>([&] { hub.sessions->UploadPart("alice", id, 1, part, Md5Hex(*part)); }));
  assert(hub.sessions->Describe("alice", id).session.state == UPLOAD_SESSION_STATE_FAILED);

  // a later successful part moves it back to pending
  flaky->fail_put = false;
  hub.sessions->UploadPart("alice", id, 1, part, Md5Hex(*part));
  assert(hub.sessions->Describe("alice", id).session.state == UPLOAD_SESSION_STATE_PARTS_PENDING);
}

// ---------------------------------------------------------------------
// abort and reaping
// ---------------------------------------------------------------------

void TestAbortDropsSession() {
  ManualClock clock;
  auto        hub = NewHub(clock);

  auto       request = StartFor("alice", "aborted", kContent);
  auto       started = hub.sessions->StartOrResume(request);
  const auto id      = started.view.session.upload_id;
  auto       part    = PartOf(kContent, 4, 1);
  hub.sessions->UploadPart("alice", id, 1, part, Md5Hex(*part));

  const auto staging = hub.sessions->Describe("alice", id).session.storage_upload_id;
  assert(!staging.empty());
  assert(hub.store->MultipartExists(staging));

  hub.sessions->Abort("alice", id);
  assert(!hub.store->MultipartExists(staging));
  assert(Throws<datahub::util::NotFound>([&] { hub.sessions->Describe("alice", id); }));

  // the key is free again
  auto fresh = hub.sessions->StartOrResume(request);
  assert(!fresh.resumed);
  assert(fresh.view.session.upload_id != id);

  SendAllParts(*hub.sessions, "alice", fresh.view, kContent);
  hub.sessions->Complete("alice", fresh.view.session.upload_id);
  assert(Throws<datahub::util::InvalidState>([&] { hub.sessions->Abort("alice", fresh.view.session.upload_id); }));
}

void TestAbortDuringPartWriteLeavesNoStaging() {
  ManualClock                 clock;
  std::shared_ptr<FlakyStore> flaky;

  HubOptions options;
  options.wrap_store = [&](ObjectStorePtr inner) {
    flaky = std::make_shared<FlakyStore>(std::move(inner));
    return flaky;
  };
  auto hub = NewHub(clock, options);

  auto       started = hub.sessions->StartOrResume(StartFor("alice", "late-part", kContent));
  const auto id      = started.view.session.upload_id;
  auto       first   = PartOf(kContent, 4, 1);
  hub.sessions->UploadPart("alice", id, 1, first, Md5Hex(*first));

  const auto staging     = hub.sessions->Describe("alice", id).session.storage_upload_id;
  const auto staging_dir = std::filesystem::path(hub.root) / ".multipart" / staging;
  assert(std::filesystem::exists(staging_dir));

  // The session is aborted while part 2 is being written, and the write
  // lands after the staging area was removed.
  flaky->after_put = [&] {
    hub.sessions->Abort("alice", id);
    std::filesystem::create_directories(staging_dir);
    std::ofstream(staging_dir / "part-00002") << "late";
  };

  auto second = PartOf(kContent, 4, 2);
  assert(Throws<datahub::util::NotFound>([&] { hub.sessions->UploadPart("alice", id, 2, second, Md5Hex(*second)); }));

  assert(!std::filesystem::exists(staging_dir));
  assert(!hub.store->MultipartExists(staging));
  assert(Throws<datahub::util::NotFound>([&] { hub.sessions->Describe("alice", id); }));
}

void TestPartWrittenAfterCompleteIsDiscarded() {
  ManualClock                 clock;
  std::shared_ptr<FlakyStore> flaky;

  HubOptions options;
  options.wrap_store = [&](ObjectStorePtr inner) {
    flaky = std::make_shared<FlakyStore>(std::move(inner));
    return flaky;
  };
  auto hub = NewHub(clock, options);

  auto       started = hub.sessions->StartOrResume(StartFor("alice", "late-resend", kContent));
  const auto id      = started.view.session.upload_id;
  for (uint32_t n = 1; n < started.view.session.part_count; ++n) {
    auto part = PartOf(kContent, 4, n);
    hub.sessions->UploadPart("alice", id, n, part, Md5Hex(*part));
  }

  const auto last        = started.view.session.part_count;
  const auto staging     = hub.sessions->Describe("alice", id).session.storage_upload_id;
  const auto staging_dir = std::filesystem::path(hub.root) / ".multipart" / staging;

  // A duplicate of the last part is still in flight when the first copy
  // has been recorded and the upload completed.
  auto tail        = PartOf(kContent, 4, last);
  flaky->after_put = [&] {
    hub.sessions->UploadPart("alice", id, last, tail, Md5Hex(*tail));
    hub.sessions->Complete("alice", id);
    std::filesystem::create_directories(staging_dir);
    std::ofstream(staging_dir / "part-00005") << "late";
  };

  auto result = hub.sessions->UploadPart("alice", id, last, tail, Md5Hex(*tail));
  assert(result.already_stored);
  assert(!std::filesystem::exists(staging_dir));
  assert(hub.sessions->Describe("alice", id).session.state == UPLOAD_SESSION_STATE_DATASET_PERSISTED);
  assert(ReadObject(*hub.store, hub.sessions->Describe("alice", id).session.object_key) == kContent);
}

void TestReaperDropsIdleSessions() {
  ManualClock clock;
  HubOptions  options;
  options.session_ttl = std::chrono::seconds(60);
  auto hub            = NewHub(clock, options);

  auto idle = hub.sessions->StartOrResume(StartFor("alice", "idle", kContent));
  auto part = PartOf(kContent, 4, 1);
  hub.sessions->UploadPart("alice", idle.view.session.upload_id, 1, part, Md5Hex(*part));
  const auto staging = hub.sessions->Describe("alice", idle.view.session.upload_id).session.storage_upload_id;

  auto finished = hub.sessions->StartOrResume(StartFor("alice", "finished", kContent));
  SendAllParts(*hub.sessions, "alice", finished.view, kContent);
  hub.sessions->Complete("alice", finished.view.session.upload_id);

  // nothing is old enough yet
  auto early = hub.sessions->ReapExpired();
  assert(early.aborted == 0);
  assert(early.purged == 0);

  clock.Advance(std::chrono::seconds(61));
  auto active = hub.sessions->StartOrResume(StartFor("alice", "active", kContent));

  auto stats = hub.sessions->ReapExpired();
  assert(stats.aborted == 1);
  assert(stats.purged == 1);
  assert(!hub.store->MultipartExists(staging));
  assert(Throws<datahub::util::NotFound>([&] { hub.sessions->Describe("alice", idle.view.session.upload_id); }));
  assert(Throws<datahub::util::NotFound>([&] { hub.sessions->Describe("alice", finished.view.session.upload_id); }));
  assert(hub.sessions->Describe("alice", active.view.session.upload_id).session.state == UPLOAD_SESSION_STATE_CREATED);

  // the persisted dataset survives its session
  auto files = FilesOf(hub, finished.view.session.dataset_id, 1);
  assert(files.size() == 1);
  assert(ReadObject(*hub.store, files[0].object_key) == kContent);
}

void TestReaperWorker() {
  ManualClock clock;
  HubOptions  options;
  options.session_ttl = std::chrono::seconds(60);
  auto hub            = NewHub(clock, options);

  auto idle = hub.sessions->StartOrResume(StartFor("alice", "worker", kContent));

  datahub::runtime::SessionReaper reaper(hub.sessions, std::chrono::seconds(3600));
  reaper.Start();

  clock.Advance(std::chrono::minutes(2));
  reaper.RunOnce();
  assert(Throws<datahub::util::NotFound>([&] { hub.sessions->Describe("alice", idle.view.session.upload_id); }));

  // Stop does not wait out the interval
  reaper.Stop();
  reaper.Stop();
}

// ---------------------------------------------------------------------
// direct ingest
// ---------------------------------------------------------------------

void TestSmallFileIngest() {
  ManualClock clock;
  auto        hub = NewHub(clock);

  datahub::ingest::SmallFileRequest request;
  request.uid          = "alice";
  request.dataset_name = "small";
  request.description  = "a small file";
  request.filename     = "notes.txt";
  request.data         = arrow::Buffer::FromString("tiny payload");

  auto done = hub.sessions->IngestSmallFile(request);
  assert(done.version_id == 1);

  auto files = FilesOf(hub, done.dataset.dataset.id, 1);
  assert(files.size() == 1);
  assert(files[0].name == "notes.txt");
  assert(ReadObject(*hub.store, files[0].object_key) == "tiny payload");

  auto wrong     = request;
  wrong.checksum = Md5Hex(std::string("not the payload"));
  assert(Throws<datahub::util::ChecksumMismatch>([&] { hub.sessions->IngestSmallFile(wrong); }));

  auto large = request;
  large.data = arrow::Buffer::FromString(std::string(65, 'x'));
  assert(Throws<datahub::util::ValidationError>([&] { hub.sessions->IngestSmallFile(large); }));

  auto foreign = request;
  foreign.uid  = "bob";
  assert(Throws<datahub::util::DatasetAlreadyExistsError>([&] { hub.sessions->IngestSmallFile(foreign); }));

  // same bytes again: a new version sharing the stored file
  auto again = hub.sessions->IngestSmallFile(request);
  assert(again.version_id == 2);
  assert(FilesOf(hub, done.dataset.dataset.id, 0).size() == 1);
}

} // namespace

int main() {
  TestFullUploadPersistsDataset();
  TestCompleteIsReplaySafe();
  TestZeroByteContentIsOnePart();
  TestPartUploadIsIdempotent();
  TestPartValidation();
  TestResumeReturnsReceivedParts();
  TestConcurrentStartsShareOneSession();
  TestVersionsAreSnapshots();
  TestIdenticalContentIsDeduplicated();
  TestOwnershipRules();
  TestRequestValidation();
  TestStorageFailureMarksSessionFailed();
  TestPermanentPartFailureMarksSessionFailed();
  TestAbortDropsSession();
  TestAbortDuringPartWriteLeavesNoStaging();
  TestPartWrittenAfterCompleteIsDiscarded();
  TestReaperDropsIdleSessions();
  TestReaperWorker();
  TestSmallFileIngest();

  std::cout << "dataset_hub_unit_upload_session_manager: pass\n";
  return 0;
}
