#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace datahub::db::memory {

using datahub::core::v1::UPLOAD_SESSION_STATE_DATASET_PERSISTED;

namespace {

bool IsActive(const model::UploadSessionRecord& r) {
  return r.state != UPLOAD_SESSION_STATE_DATASET_PERSISTED;
}

bool SameSessionKey(const model::UploadSessionRecord& a, const model::UploadSessionRecord& b) {
  return a.uid == b.uid && a.dataset_name == b.dataset_name && a.checksum == b.checksum;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Datasets
// ------------------------------------------------------------------

Result MemoryRepository::InsertDataset(Transaction& t, const model::DatasetRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.datasets.contains(r.id) || s.dataset_name_to_id.contains(r.name)) return Result::Err(ErrorCode::AlreadyExists);
  s.datasets[r.id]              = r;
  s.dataset_name_to_id[r.name] = r.id;
  return Result::Ok();
}

std::optional<model::DatasetRecord> MemoryRepository::GetDataset(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.datasets.find(id);
  if (it == s.datasets.end()) return std::nullopt;
  return it->second;
}

std::optional<model::DatasetRecord> MemoryRepository::GetDatasetByName(Transaction& t, const std::string& name) {
  const auto& s  = TX(t).View();
  auto        it = s.dataset_name_to_id.find(name);
  if (it == s.dataset_name_to_id.end()) return std::nullopt;
  return s.datasets.at(it->second);
}

std::vector<model::DatasetRecord> MemoryRepository::ListDatasets(Transaction& t, const model::DatasetFilter& filter) {
  const auto&                       s = TX(t).View();
  std::vector<model::DatasetRecord> out;
  for (const auto& [_, record] : s.datasets) {
    if (!filter.name_contains.empty() && record.name.find(filter.name_contains) == std::string::npos) continue;
    out.push_back(record);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return a.created_at_ms != b.created_at_ms ? a.created_at_ms < b.created_at_ms : a.id < b.id;
  });
  if (filter.limit > 0 && out.size() > filter.limit) out.resize(filter.limit);
  return out;
}

Result MemoryRepository::UpdateDataset(Transaction& t, const model::DatasetRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.datasets.find(r.id);
  if (it == s.datasets.end()) return Result::Err(ErrorCode::NotFound);

  if (it->second.name != r.name) {
    if (s.dataset_name_to_id.contains(r.name)) return Result::Err(ErrorCode::AlreadyExists);
    s.dataset_name_to_id.erase(it->second.name);
    s.dataset_name_to_id[r.name] = r.id;
  }
  it->second.name          = r.name;
  it->second.description   = r.description;
  it->second.tags          = r.tags;
  it->second.updated_at_ms = r.updated_at_ms;
  return Result::Ok();
}

Result MemoryRepository::IncrementDatasetCounter(Transaction& t, const std::string& id, model::DatasetCounter counter, int64_t delta) {
  auto& s  = TX(t).Mutable();
  auto  it = s.datasets.find(id);
  if (it == s.datasets.end()) return Result::Err(ErrorCode::NotFound);
  auto& value = counter == model::DatasetCounter::Likes ? it->second.likes : it->second.downloads;
  value       = static_cast<uint64_t>(std::max<int64_t>(0, static_cast<int64_t>(value) + delta));
  return Result::Ok();
}

// ------------------------------------------------------------------
// Versions
// ------------------------------------------------------------------

Result MemoryRepository::InsertVersion(Transaction& t, const model::VersionRecord& r) {
  auto& s        = TX(t).Mutable();
  auto& versions = s.versions[r.dataset_id];
  for (const auto& v : versions)
    if (v.version_id == r.version_id) return Result::Err(ErrorCode::AlreadyExists);
  versions.push_back(r);
  std::sort(versions.begin(), versions.end(), [](const auto& a, const auto& b) { return a.version_id < b.version_id; });
  return Result::Ok();
}

std::vector<model::VersionRecord> MemoryRepository::ListVersions(Transaction& t, const std::string& dataset_id) {
  const auto& s  = TX(t).View();
  auto        it = s.versions.find(dataset_id);
  if (it == s.versions.end()) return {};
  return it->second;
}

// ------------------------------------------------------------------
// Files
// ------------------------------------------------------------------

std::optional<model::FileRecord> MemoryRepository::GetFile(Transaction& t, const std::string& dataset_id, const std::string& checksum) {
  const auto& s  = TX(t).View();
  auto        it = s.files.find(dataset_id);
  if (it == s.files.end()) return std::nullopt;
  auto file = it->second.find(checksum);
  if (file == it->second.end()) return std::nullopt;
  return file->second;
}

Result MemoryRepository::UpsertFile(Transaction& t, const model::FileRecord& r) {
  TX(t).Mutable().files[r.dataset_id][r.checksum] = r;
  return Result::Ok();
}

std::vector<model::FileRecord> MemoryRepository::ListFiles(Transaction& t, const std::string& dataset_id) {
  const auto&                    s = TX(t).View();
  std::vector<model::FileRecord> out;
  auto                           it = s.files.find(dataset_id);
  if (it == s.files.end()) return out;
  for (const auto& [_, file] : it->second)
    out.push_back(file);
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return a.created_at_ms != b.created_at_ms ? a.created_at_ms < b.created_at_ms : a.checksum < b.checksum;
  });
  return out;
}

// ------------------------------------------------------------------
// Users / tiers / usage
// ------------------------------------------------------------------

std::optional<model::UserRecord> MemoryRepository::GetUser(Transaction& t, const std::string& uid) {
  const auto& s  = TX(t).View();
  auto        it = s.users.find(uid);
  if (it == s.users.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::InsertUser(Transaction& t, const model::UserRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.users.contains(r.uid)) return Result::Err(ErrorCode::AlreadyExists);
  s.users[r.uid] = r;
  return Result::Ok();
}

Result MemoryRepository::IncrementUserDatasetCount(Transaction& t, const std::string& uid, int64_t delta) {
  auto& s  = TX(t).Mutable();
  auto  it = s.users.find(uid);
  if (it == s.users.end()) return Result::Err(ErrorCode::NotFound);
  it->second.dataset_count = static_cast<uint64_t>(std::max<int64_t>(0, static_cast<int64_t>(it->second.dataset_count) + delta));
  return Result::Ok();
}

std::optional<model::TierRecord> MemoryRepository::GetTier(Transaction& t, const std::string& name) {
  const auto& s  = TX(t).View();
  auto        it = s.tiers.find(name);
  if (it == s.tiers.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertTier(Transaction& t, const model::TierRecord& r) {
  TX(t).Mutable().tiers[r.name] = r;
  return Result::Ok();
}

Result MemoryRepository::InsertUsage(Transaction& t, const model::UsageRecord& r) {
  TX(t).Mutable().usage.push_back(r);
  return Result::Ok();
}

uint64_t MemoryRepository::CountUsageSince(Transaction& t, const std::string& uid, const std::string& type, uint64_t since_ms) {
  uint64_t count = 0;
  for (const auto& r : TX(t).View().usage)
    if (r.uid == uid && r.type == type && r.timestamp_ms >= since_ms) ++count;
  return count;
}

// ------------------------------------------------------------------
// Upload sessions
// ------------------------------------------------------------------

Result MemoryRepository::InsertUploadSession(Transaction& t, const model::UploadSessionRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.sessions.contains(r.upload_id)) return Result::Err(ErrorCode::AlreadyExists, "upload id taken");
  if (IsActive(r)) {
    for (const auto& [_, existing] : s.sessions) {
      if (IsActive(existing) && SameSessionKey(existing, r)) {
        return Result::Err(ErrorCode::AlreadyExists, "active session exists for key");
      }
    }
  }
  s.sessions[r.upload_id] = r;
  return Result::Ok();
}

std::optional<model::UploadSessionRecord> MemoryRepository::GetUploadSession(Transaction& t, const std::string& upload_id) {
  const auto& s  = TX(t).View();
  auto        it = s.sessions.find(upload_id);
  if (it == s.sessions.end()) return std::nullopt;
  return it->second;
}

std::optional<model::UploadSessionRecord> MemoryRepository::FindActiveUploadSession(Transaction& t, const std::string& uid,
                                                                                    const std::string& dataset_name,
                                                                                    const std::string& checksum) {
  for (const auto& [_, r] : TX(t).View().sessions) {
    if (IsActive(r) && r.uid == uid && r.dataset_name == dataset_name && r.checksum == checksum) return r;
  }
  return std::nullopt;
}

std::vector<model::UploadSessionRecord> MemoryRepository::ListActiveUploadSessionsByName(Transaction& t, const std::string& dataset_name) {
  std::vector<model::UploadSessionRecord> out;
  for (const auto& [_, r] : TX(t).View().sessions)
    if (IsActive(r) && r.dataset_name == dataset_name) out.push_back(r);
  return out;
}

uint64_t MemoryRepository::CountActiveUploadSessionsSince(Transaction& t, const std::string& uid, uint64_t since_ms) {
  uint64_t count = 0;
  for (const auto& [_, r] : TX(t).View().sessions)
    if (IsActive(r) && r.uid == uid && r.created_at_ms >= since_ms) ++count;
  return count;
}

std::vector<model::UploadSessionRecord> MemoryRepository::ListUploadSessionsUpdatedBefore(Transaction& t, uint64_t before_ms) {
  std::vector<model::UploadSessionRecord> out;
  for (const auto& [_, r] : TX(t).View().sessions)
    if (r.updated_at_ms < before_ms) out.push_back(r);
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.updated_at_ms < b.updated_at_ms; });
  return out;
}

Result MemoryRepository::UpdateUploadSession(Transaction& t, const model::UploadSessionRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.sessions.find(r.upload_id);
  if (it == s.sessions.end()) return Result::Err(ErrorCode::NotFound);
  it->second = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteUploadSession(Transaction& t, const std::string& upload_id) {
  auto& s = TX(t).Mutable();
  s.sessions.erase(upload_id);
  s.parts.erase(upload_id);
  return Result::Ok();
}

Result MemoryRepository::InsertUploadPart(Transaction& t, const model::UploadPartRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.sessions.contains(r.upload_id)) return Result::Err(ErrorCode::NotFound);
  auto [_, inserted] = s.parts[r.upload_id].try_emplace(r.part_number, r);
  if (!inserted) return Result::Err(ErrorCode::AlreadyExists);
  return Result::Ok();
}

std::vector<model::UploadPartRecord> MemoryRepository::ListUploadParts(Transaction& t, const std::string& upload_id) {
  const auto&                          s = TX(t).View();
  std::vector<model::UploadPartRecord> out;
  auto                                 it = s.parts.find(upload_id);
  if (it == s.parts.end()) return out;
  for (const auto& [_, part] : it->second)
    out.push_back(part);
  return out;
}

} // namespace datahub::db::memory
