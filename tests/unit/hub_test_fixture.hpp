#pragma once

#include <arrow/buffer.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

#include "config/config.pb.h"
#include "internal/catalog/dataset_version_store.hpp"
#include "internal/checksum/checksum_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/ingest/upload_session_manager.hpp"
#include "internal/quota/quota_guard.hpp"
#include "internal/storage/storage_factory.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace datahub::testing {

// 2026-01-01T00:00:00Z
constexpr uint64_t kEpochMs = 1767225600000ull;

class ManualClock {
 public:
  explicit ManualClock(uint64_t start_ms = kEpochMs) : now_ms_(std::make_shared<std::atomic<uint64_t>>(start_ms)) {
  }

  util::ClockFn Fn() const {
    auto now_ms = now_ms_;
    return [now_ms] { return util::FromUnixMillis(now_ms->load()); };
  }

  uint64_t NowMs() const {
    return now_ms_->load();
  }

  void Advance(std::chrono::milliseconds by) {
    now_ms_->fetch_add(static_cast<uint64_t>(by.count()));
  }

 private:
  std::shared_ptr<std::atomic<uint64_t>> now_ms_;
};

inline std::string TempDir(const std::string& name) {
  auto dir = std::filesystem::temp_directory_path() / ("dataset_hub_" + name + "_" + util::NewId());
  std::filesystem::create_directories(dir);
  return dir.string();
}

struct HubOptions {
  uint64_t             cap        = 100;
  uint64_t             chunk_size = 4;
  std::chrono::seconds session_ttl{24 * 60 * 60};

  // Decorates the local store, e.g. to inject backend failures.
  std::function<storage::ObjectStorePtr(storage::ObjectStorePtr)> wrap_store;
};

/*
  The ingest core wired over a local object store under `root`.
  Parts are `chunk_size` bytes so short strings span several parts.
*/
struct Hub {
  std::shared_ptr<db::Repository>               repo;
  std::shared_ptr<storage::ObjectStore>         store;
  std::shared_ptr<quota::QuotaGuard>            quota;
  std::shared_ptr<catalog::DatasetVersionStore> versions;
  std::shared_ptr<ingest::UploadSessionManager> sessions;
  std::string                                   root;
};

inline Hub MakeHub(std::shared_ptr<db::Repository> repo, const std::string& root, const ManualClock& clock, HubOptions options = {}) {
  Hub hub;
  hub.repo = std::move(repo);
  hub.root = root;

  datahub::runtime::config::StorageConfig storage;
  storage.set_root_uri(root);
  hub.store = storage::StorageFactory::Build(storage);
  if (options.wrap_store) {
    hub.store = options.wrap_store(hub.store);
  }

  quota::QuotaOptions quota_options;
  quota_options.tier_caps["free"] = options.cap;
  hub.quota = std::make_shared<quota::QuotaGuard>(hub.repo, quota_options, clock.Fn());
  hub.quota->SeedTiers();

  hub.versions = std::make_shared<catalog::DatasetVersionStore>(hub.repo, clock.Fn());

  ingest::IngestOptions ingest_options;
  ingest_options.chunk_policy.small_chunk  = options.chunk_size;
  ingest_options.chunk_policy.medium_chunk = options.chunk_size;
  ingest_options.chunk_policy.large_chunk  = options.chunk_size;
  ingest_options.chunk_policy.alignment    = 1;
  ingest_options.session_ttl               = options.session_ttl;
  ingest_options.small_file_threshold      = 64;
  hub.sessions = std::make_shared<ingest::UploadSessionManager>(hub.repo, hub.store, hub.quota, hub.versions, ingest_options, clock.Fn());
  return hub;
}

inline ingest::StartRequest StartFor(const std::string& uid, const std::string& name, const std::string& content,
                                     const std::string& filename = "data.bin") {
  ingest::StartRequest request;
  request.uid          = uid;
  request.dataset_name = name;
  request.description  = "test dataset";
  request.filename     = filename;
  request.checksum     = checksum::Md5Hex(content);
  request.total_size   = content.size();
  return request;
}

inline std::shared_ptr<arrow::Buffer> PartOf(const std::string& content, uint64_t chunk_size, uint32_t part_number) {
  const auto offset = static_cast<size_t>((part_number - 1) * chunk_size);
  return arrow::Buffer::FromString(content.substr(offset, static_cast<size_t>(chunk_size)));
}

// Sends every part of `content` to the session.
inline void SendAllParts(ingest::UploadSessionManager& sessions, const std::string& uid, const ingest::SessionView& view,
                         const std::string& content) {
  for (uint32_t n = 1; n <= view.session.part_count; ++n) {
    auto part = PartOf(content, view.session.chunk_size, n);
    sessions.UploadPart(uid, view.session.upload_id, n, part, checksum::Md5Hex(*part));
  }
}

template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

inline std::string ReadObject(storage::ObjectStore& store, const std::string& key) {
  auto file = store.OpenObject(key);
  auto size = file->GetSize().ValueOrDie();
  return file->Read(size).ValueOrDie()->ToString();
}

} // namespace datahub::testing
