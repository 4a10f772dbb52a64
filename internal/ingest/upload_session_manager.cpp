#include "upload_session_manager.hpp"

#include <algorithm>
#include <cctype>

#include "internal/checksum/checksum_engine.hpp"
#include "internal/db/api/tx_helpers.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace datahub::ingest {

using datahub::db::model::UploadPartRecord;
using datahub::db::model::UploadSessionRecord;
using datahub::observability::StringField;
using datahub::observability::UintField;

namespace {

constexpr auto kCreated      = datahub::core::v1::UPLOAD_SESSION_STATE_CREATED;
constexpr auto kPartsPending = datahub::core::v1::UPLOAD_SESSION_STATE_PARTS_PENDING;
constexpr auto kFinalizing   = datahub::core::v1::UPLOAD_SESSION_STATE_FINALIZING;
constexpr auto kPersisted    = datahub::core::v1::UPLOAD_SESSION_STATE_DATASET_PERSISTED;
constexpr auto kFailed       = datahub::core::v1::UPLOAD_SESSION_STATE_FAILED;

std::string NormalizeChecksum(const std::string& checksum) {
  std::string out = checksum;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (out.size() != 32 || !std::all_of(out.begin(), out.end(), [](unsigned char c) { return std::isxdigit(c) != 0; })) {
    throw util::ValidationError("checksum must be 32 hex characters (md5)");
  }
  return out;
}

std::string ResolveFilename(const std::string& filename, const std::string& dataset_name) {
  if (filename.empty()) {
    return dataset_name;
  }
  if (filename.find('/') != std::string::npos || filename.find('\\') != std::string::npos || filename == "." || filename == "..") {
    throw util::ValidationError("filename must be a plain file name: " + filename);
  }
  return filename;
}

catalog::FinalizeInput FinalizeInputFor(const UploadSessionRecord& session) {
  catalog::FinalizeInput input;
  input.upload_id    = session.upload_id;
  input.uid          = session.uid;
  input.dataset_id   = session.dataset_id;
  input.dataset_name = session.dataset_name;
  input.description  = session.description;
  input.tags         = session.tags;
  input.filename     = session.filename;
  input.checksum     = session.checksum;
  input.size         = session.total_size;
  input.object_key   = session.object_key;
  return input;
}

} // namespace

IngestOptions OptionsFromConfig(const datahub::runtime::config::IngestConfig& config) {
  IngestOptions options;
  if (config.max_parts() > 0) {
    options.chunk_policy.max_parts = config.max_parts();
  }
  if (config.max_part_size_bytes() > 0) {
    options.chunk_policy.max_part_size = config.max_part_size_bytes();
  }
  if (config.session_ttl_seconds() > 0) {
    options.session_ttl = std::chrono::seconds(config.session_ttl_seconds());
  }
  if (config.small_file_threshold_bytes() > 0) {
    options.small_file_threshold = config.small_file_threshold_bytes();
  }
  return options;
}

std::vector<uint32_t> SessionView::MissingParts() const {
  std::vector<uint32_t> missing;
  for (uint32_t n = 1; n <= session.part_count; ++n) {
    if (received_parts.count(n) == 0) missing.push_back(n);
  }
  return missing;
}

UploadSessionManager::UploadSessionManager(std::shared_ptr<db::Repository> repo, std::shared_ptr<storage::ObjectStore> store,
                                           std::shared_ptr<quota::QuotaGuard> quota,
                                           std::shared_ptr<catalog::DatasetVersionStore> versions, IngestOptions options,
                                           util::ClockFn clock)
    : repo_(std::move(repo)),
      store_(std::move(store)),
      quota_(std::move(quota)),
      versions_(std::move(versions)),
      options_(std::move(options)),
      clock_(std::move(clock)) {
}

std::shared_ptr<std::mutex> UploadSessionManager::UploadMutex(const std::string& upload_id) {
  std::lock_guard<std::mutex> lock(upload_mutexes_guard_);
  auto&                       upload_mutex = upload_mutexes_[upload_id];
  if (!upload_mutex) {
    upload_mutex = std::make_shared<std::mutex>();
  }
  return upload_mutex;
}

void UploadSessionManager::ForgetUploadMutex(const std::string& upload_id) {
  std::lock_guard<std::mutex> lock(upload_mutexes_guard_);
  upload_mutexes_.erase(upload_id);
}

SessionView UploadSessionManager::LoadView(db::Transaction& tx, UploadSessionRecord session) {
  SessionView view;
  if (session.deduplicated) {
    for (uint32_t n = 1; n <= session.part_count; ++n) view.received_parts.insert(n);
  } else {
    for (const auto& part : repo_->ListUploadParts(tx, session.upload_id)) view.received_parts.insert(part.part_number);
  }
  view.session = std::move(session);
  return view;
}

UploadSessionRecord UploadSessionManager::LoadOwned(db::Transaction& tx, const std::string& uid, const std::string& upload_id) {
  auto session = repo_->GetUploadSession(tx, upload_id);
  if (!session) {
    throw util::NotFound("upload session " + upload_id);
  }
  if (session->uid != uid) {
    throw util::PermissionDenied("upload session " + upload_id + " belongs to another user");
  }
  return *session;
}

// ------------------------------------------------------------------
// Start / resume
// ------------------------------------------------------------------

StartResult UploadSessionManager::StartOrResume(const StartRequest& request) {
  catalog::ValidateName(request.dataset_name);
  catalog::ValidateDescription(request.description);
  const auto checksum   = NormalizeChecksum(request.checksum);
  const auto filename   = ResolveFilename(request.filename, request.dataset_name);
  const auto chunk_size = PlanChunkSize(request.total_size, options_.chunk_policy);

  auto result = db::RunInTransaction(*repo_, [&](db::Transaction& tx) {
    StartResult out;

    if (auto existing = repo_->FindActiveUploadSession(tx, request.uid, request.dataset_name, checksum)) {
      if (existing->total_size != request.total_size) {
        throw util::ValidationError("upload session " + existing->upload_id + " was started for " +
                                    std::to_string(existing->total_size) + " bytes");
      }
      out.view    = LoadView(tx, std::move(*existing));
      out.resumed = true;
      return out;
    }

    const auto dataset_id = versions_->ResolveTarget(tx, request.uid, request.dataset_name);
    quota_->Admit(tx, request.uid);

    const auto now_ms = util::ToUnixMillis(clock_());

    UploadSessionRecord session;
    session.upload_id     = util::NewId();
    session.uid           = request.uid;
    session.dataset_name  = request.dataset_name;
    session.checksum      = checksum;
    session.dataset_id    = dataset_id;
    session.filename      = filename;
    session.description   = request.description;
    session.tags          = request.tags;
    session.total_size    = request.total_size;
    session.chunk_size    = chunk_size;
    session.part_count    = PartCount(request.total_size, chunk_size);
    session.state         = kCreated;
    session.object_key    = catalog::ObjectKeyFor(dataset_id, checksum, request.total_size);
    session.created_at_ms = now_ms;
    session.updated_at_ms = now_ms;

    if (auto identical = versions_->FindIdenticalFile(tx, dataset_id, checksum, request.total_size)) {
      session.deduplicated = true;
      session.object_key   = identical->object_key;
    }

    auto inserted = repo_->InsertUploadSession(tx, session);
    if (inserted.code == db::ErrorCode::AlreadyExists) {
      // A concurrent start won the key; the retry resumes its session.
      throw util::TransactionConflict("upload session key taken: " + inserted.message);
    }
    db::ThrowIfDbError(inserted, "insert upload session");

    out.view = LoadView(tx, std::move(session));
    return out;
  });

  const auto& session = result.view.session;
  DATAHUB_LOG_INFO(result.resumed ? "upload session resumed" : "upload session created",
                   {StringField("upload_id", session.upload_id), StringField("uid", session.uid),
                    StringField("dataset", session.dataset_name), UintField("parts", session.part_count),
                    UintField("received", result.view.received_parts.size()),
                    observability::BoolField("deduplicated", session.deduplicated)});
  return result;
}

// ------------------------------------------------------------------
// Parts
// ------------------------------------------------------------------

UploadSessionRecord UploadSessionManager::EnsureMultipart(const std::string& uid, const std::string& upload_id) {
  auto session = db::RunInTransaction(*repo_, [&](db::Transaction& tx) { return LoadOwned(tx, uid, upload_id); });
  if (!session.storage_upload_id.empty()) {
    return session;
  }

  const auto storage_upload_id = store_->CreateMultipart(session.object_key);

  return db::RunInTransaction(*repo_, [&](db::Transaction& tx) {
    auto current              = LoadOwned(tx, uid, upload_id);
    current.storage_upload_id = storage_upload_id;
    current.updated_at_ms     = util::ToUnixMillis(clock_());
    db::ThrowIfDbError(repo_->UpdateUploadSession(tx, current), "update upload session");
    DATAHUB_LOG_DEBUG("multipart upload created", {StringField("upload_id", upload_id), StringField("object_key", current.object_key)});
    return current;
  });
}

PartResult UploadSessionManager::UploadPart(const std::string& uid, const std::string& upload_id, uint32_t part_number,
                                            const std::shared_ptr<arrow::Buffer>& data, const std::string& part_checksum) {
  if (!data) {
    throw util::ValidationError("part data is required");
  }

  auto view = db::RunInTransaction(*repo_, [&](db::Transaction& tx) { return LoadView(tx, LoadOwned(tx, uid, upload_id)); });
  const auto& session = view.session;

  const auto range = PlanWithChunkSize(session.total_size, session.chunk_size).Part(part_number);
  if (static_cast<uint64_t>(data->size()) != range.length) {
    throw util::ValidationError("part " + std::to_string(part_number) + " must be " + std::to_string(range.length) + " bytes, got " +
                                std::to_string(data->size()));
  }

  const auto actual = checksum::Md5Hex(*data);
  if (part_checksum.empty()) {
    throw util::ValidationError("part checksum is required");
  }
  std::string expected = part_checksum;
  std::transform(expected.begin(), expected.end(), expected.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (expected != actual) {
    DATAHUB_LOG_WARN("part checksum mismatch", {StringField("upload_id", upload_id), UintField("part", part_number)});
    throw util::ChecksumMismatch(part_number, expected, actual);
  }

  PartResult result;
  result.part_number = part_number;

  if (session.state == kPersisted || session.deduplicated || view.received_parts.count(part_number) != 0) {
    result.already_stored = true;
    result.received_count = static_cast<uint32_t>(view.received_parts.size());
    return result;
  }
  if (session.state == kFinalizing) {
    throw util::InvalidState("upload session " + upload_id + " is finalizing");
  }

  std::string storage_upload_id = session.storage_upload_id;
  if (storage_upload_id.empty()) {
    auto upload_mutex = UploadMutex(upload_id);
    std::lock_guard<std::mutex> lock(*upload_mutex);
    storage_upload_id = EnsureMultipart(uid, upload_id).storage_upload_id;
  }

  std::string etag;
  try {
    etag = store_->PutPart(storage_upload_id, part_number, data);
  } catch (const util::StorageBackendError& e) {
    if (!e.transient()) {
      MarkFailed(upload_id, e.what());
    }
    throw;
  }

  auto upload_mutex = UploadMutex(upload_id);
  std::lock_guard<std::mutex> lock(*upload_mutex);

  // Abort, Complete or the reaper may have dropped the staging area while
  // the part was being written; the write then re-created it for nobody.
  auto latest = db::RunInTransaction(*repo_, [&](db::Transaction& tx) { return repo_->GetUploadSession(tx, upload_id); });
  if (!latest || latest->state == kPersisted || latest->storage_upload_id != storage_upload_id) {
    store_->AbortMultipart(storage_upload_id);
    DATAHUB_LOG_DEBUG("discarded late part", {StringField("upload_id", upload_id), UintField("part", part_number),
                                              StringField("storage_upload_id", storage_upload_id)});
    if (!latest) {
      throw util::NotFound("upload session " + upload_id);
    }
    if (latest->state == kPersisted) {
      PartResult late;
      late.part_number    = part_number;
      late.already_stored = true;
      late.received_count = latest->part_count;
      return late;
    }
    throw util::InvalidState("upload session " + upload_id + " was restarted; resend part " + std::to_string(part_number));
  }

  return db::RunInTransaction(*repo_, [&](db::Transaction& tx) {
    auto current = LoadOwned(tx, uid, upload_id);

    PartResult out;
    out.part_number = part_number;

    UploadPartRecord part;
    part.upload_id      = upload_id;
    part.part_number    = part_number;
    part.size           = range.length;
    part.checksum       = actual;
    part.etag           = etag;
    part.received_at_ms = util::ToUnixMillis(clock_());

    auto inserted = repo_->InsertUploadPart(tx, part);
    if (inserted.code == db::ErrorCode::AlreadyExists) {
      out.already_stored = true;
    } else {
      db::ThrowIfDbError(inserted, "insert upload part");
      if (current.state == kCreated || current.state == kFailed) {
        current.state = kPartsPending;
        current.error_message.clear();
      }
      current.updated_at_ms = part.received_at_ms;
      db::ThrowIfDbError(repo_->UpdateUploadSession(tx, current), "update upload session");
    }

    out.received_count = static_cast<uint32_t>(repo_->ListUploadParts(tx, upload_id).size());
    DATAHUB_LOG_DEBUG("upload part stored", {StringField("upload_id", upload_id), UintField("part", part_number),
                                             UintField("received", out.received_count),
                                             observability::BoolField("already_stored", out.already_stored)});
    return out;
  });
}

// ------------------------------------------------------------------
// Finalize
// ------------------------------------------------------------------

void UploadSessionManager::MarkFailed(const std::string& upload_id, const std::string& reason) {
  try {
    db::RunInTransaction(*repo_, [&](db::Transaction& tx) {
      auto session = repo_->GetUploadSession(tx, upload_id);
      if (!session || session->state == kPersisted) return;
      session->state         = kFailed;
      session->error_message = reason;
      session->updated_at_ms = util::ToUnixMillis(clock_());
      db::ThrowIfDbError(repo_->UpdateUploadSession(tx, *session), "mark upload session failed");
    });
    DATAHUB_LOG_WARN("upload session failed", {StringField("upload_id", upload_id), StringField("error", reason)});
  } catch (const std::exception& e) {
    DATAHUB_LOG_ERROR("could not record upload failure", {StringField("upload_id", upload_id), StringField("error", e.what())});
  }
}

CompleteResult UploadSessionManager::LoadPersisted(const UploadSessionRecord& session) {
  return db::RunInTransaction(*repo_, [&](db::Transaction& tx) {
    auto view = versions_->Get(tx, session.dataset_id);
    if (!view) {
      throw util::NotFound("dataset " + session.dataset_id);
    }
    return CompleteResult{std::move(*view), session.version_id};
  });
}

CompleteResult UploadSessionManager::Complete(const std::string& uid, const std::string& upload_id) {
  auto upload_mutex = UploadMutex(upload_id);
  std::lock_guard<std::mutex> lock(*upload_mutex);

  // ------------------------------------------------------------------
  // 1. all parts present -> FINALIZING
  // ------------------------------------------------------------------
  auto view = db::RunInTransaction(*repo_, [&](db::Transaction& tx) {
    auto loaded = LoadView(tx, LoadOwned(tx, uid, upload_id));
    if (loaded.session.state == kPersisted) {
      return loaded;
    }

    const auto missing = loaded.MissingParts();
    if (!missing.empty()) {
      throw util::FinalizeError("upload session " + upload_id + " is missing " + std::to_string(missing.size()) + " of " +
                                    std::to_string(loaded.session.part_count) + " parts",
                                missing);
    }

    loaded.session.state         = kFinalizing;
    loaded.session.updated_at_ms = util::ToUnixMillis(clock_());
    db::ThrowIfDbError(repo_->UpdateUploadSession(tx, loaded.session), "update upload session");
    return loaded;
  });

  if (view.session.state == kPersisted) {
    return LoadPersisted(view.session);
  }

  auto& session = view.session;
  DATAHUB_LOG_INFO("upload finalize started", {StringField("upload_id", upload_id), UintField("parts", session.part_count)});

  // ------------------------------------------------------------------
  // 2. assemble the object
  // ------------------------------------------------------------------
  if (!session.deduplicated) {
    try {
      if (!session.storage_upload_id.empty() && store_->MultipartExists(session.storage_upload_id)) {
        std::vector<storage::CompletedPart> parts;
        for (const auto& part : db::RunInTransaction(*repo_, [&](db::Transaction& tx) { return repo_->ListUploadParts(tx, upload_id); })) {
          parts.push_back(storage::CompletedPart{part.part_number, part.etag});
        }
        const auto info = store_->CompleteMultipart(session.storage_upload_id, parts);
        if (info.size != session.total_size) {
          throw util::FinalizeError("assembled object is " + std::to_string(info.size) + " bytes, expected " +
                                    std::to_string(session.total_size));
        }
      } else {
        // Completed by an earlier attempt that did not reach the commit.
        const auto info = store_->Stat(session.object_key);
        if (!info || info->size != session.total_size) {
          throw util::FinalizeError("no staged parts or assembled object for upload session " + upload_id);
        }
      }
    } catch (const util::StorageBackendError& e) {
      MarkFailed(upload_id, e.what());
      throw;
    } catch (const util::FinalizeError& e) {
      MarkFailed(upload_id, e.what());
      throw;
    }
  }

  // ------------------------------------------------------------------
  // 3. metadata commit
  // ------------------------------------------------------------------
  CompleteResult result;
  try {
    result = db::RunInTransaction(*repo_, [&](db::Transaction& tx) {
      auto current = LoadOwned(tx, uid, upload_id);
      if (current.state == kPersisted) {
        auto stored = versions_->Get(tx, current.dataset_id);
        if (!stored) throw util::NotFound("dataset " + current.dataset_id);
        return CompleteResult{std::move(*stored), current.version_id};
      }

      auto finalized = versions_->ApplyFinalize(tx, FinalizeInputFor(current));

      current.state         = kPersisted;
      current.version_id    = finalized.version_id;
      current.error_message.clear();
      current.updated_at_ms = util::ToUnixMillis(clock_());
      db::ThrowIfDbError(repo_->UpdateUploadSession(tx, current), "update upload session");

      return CompleteResult{std::move(finalized.view), finalized.version_id};
    });
  } catch (const std::exception& e) {
    MarkFailed(upload_id, e.what());
    throw;
  }

  DATAHUB_LOG_INFO("dataset persisted", {StringField("upload_id", upload_id), StringField("dataset_id", result.dataset.dataset.id),
                                         StringField("dataset", result.dataset.dataset.name), UintField("version", result.version_id),
                                         UintField("size", session.total_size)});
  return result;
}

// ------------------------------------------------------------------
// Describe / abort / reap
// ------------------------------------------------------------------

SessionView UploadSessionManager::Describe(const std::string& uid, const std::string& upload_id) {
  return db::RunInTransaction(*repo_, [&](db::Transaction& tx) { return LoadView(tx, LoadOwned(tx, uid, upload_id)); });
}

void UploadSessionManager::DiscardStorage(const UploadSessionRecord& session) {
  if (!session.storage_upload_id.empty()) {
    store_->AbortMultipart(session.storage_upload_id);
  }
  if (session.deduplicated) {
    return;
  }

  // An assembled object nobody references is left over from a failed finalize.
  const bool referenced = db::RunInTransaction(*repo_, [&](db::Transaction& tx) {
    auto file = repo_->GetFile(tx, session.dataset_id, session.checksum);
    return file && file->object_key == session.object_key;
  });
  if (!referenced) {
    store_->DeleteObject(session.object_key);
  }
}

void UploadSessionManager::Abort(const std::string& uid, const std::string& upload_id) {
  auto upload_mutex = UploadMutex(upload_id);
  {
    std::lock_guard<std::mutex> lock(*upload_mutex);

    auto session = db::RunInTransaction(*repo_, [&](db::Transaction& tx) { return LoadOwned(tx, uid, upload_id); });
    if (session.state == kPersisted) {
      throw util::InvalidState("upload session " + upload_id + " is already persisted");
    }

    DiscardStorage(session);
    db::RunInTransaction(*repo_, [&](db::Transaction& tx) {
      db::ThrowIfDbError(repo_->DeleteUploadSession(tx, upload_id), "delete upload session");
    });
  }
  ForgetUploadMutex(upload_id);

  DATAHUB_LOG_INFO("upload session aborted", {StringField("upload_id", upload_id), StringField("uid", uid)});
}

ReapStats UploadSessionManager::ReapExpired() {
  const auto cutoff_ms = util::ToUnixMillis(clock_() - options_.session_ttl);

  const auto stale = db::RunInTransaction(*repo_, [&](db::Transaction& tx) { return repo_->ListUploadSessionsUpdatedBefore(tx, cutoff_ms); });

  ReapStats stats;
  for (const auto& candidate : stale) {
    const auto& upload_id = candidate.upload_id;
    try {
      auto upload_mutex = UploadMutex(upload_id);
      {
        std::lock_guard<std::mutex> lock(*upload_mutex);

        // Re-read: a part may have arrived since the listing.
        auto session = db::RunInTransaction(*repo_, [&](db::Transaction& tx) { return repo_->GetUploadSession(tx, upload_id); });
        if (!session || session->updated_at_ms >= cutoff_ms) {
          continue;
        }

        const bool persisted = session->state == kPersisted;
        if (!persisted) {
          DiscardStorage(*session);
        }
        db::RunInTransaction(*repo_, [&](db::Transaction& tx) {
          db::ThrowIfDbError(repo_->DeleteUploadSession(tx, upload_id), "delete upload session");
        });

        if (persisted) {
          ++stats.purged;
        } else {
          ++stats.aborted;
          DATAHUB_LOG_INFO("upload session reaped", {StringField("upload_id", upload_id), StringField("uid", session->uid),
                                                     StringField("state", datahub::core::v1::UploadSessionState_Name(session->state))});
        }
      }
      ForgetUploadMutex(upload_id);
    } catch (const std::exception& e) {
      DATAHUB_LOG_WARN("reaping upload session failed", {StringField("upload_id", upload_id), StringField("error", e.what())});
    }
  }
  return stats;
}

// ------------------------------------------------------------------
// Small files
// ------------------------------------------------------------------

CompleteResult UploadSessionManager::IngestSmallFile(const SmallFileRequest& request) {
  catalog::ValidateName(request.dataset_name);
  catalog::ValidateDescription(request.description);
  const auto filename = ResolveFilename(request.filename, request.dataset_name);

  if (!request.data) {
    throw util::ValidationError("file data is required");
  }
  const auto size = static_cast<uint64_t>(request.data->size());
  if (size > options_.small_file_threshold) {
    throw util::ValidationError("file of " + std::to_string(size) + " bytes exceeds the direct ingest limit of " +
                                std::to_string(options_.small_file_threshold) + " bytes; use a chunked upload");
  }

  const auto actual = checksum::Md5Hex(*request.data);
  if (!request.checksum.empty() && NormalizeChecksum(request.checksum) != actual) {
    throw util::ChecksumMismatch(1, NormalizeChecksum(request.checksum), actual);
  }

  // Admission and target before any storage I/O.
  struct Target {
    std::string dataset_id;
    std::string object_key;
    bool        stored = false;
  };
  auto target = db::RunInTransaction(*repo_, [&](db::Transaction& tx) {
    Target t;
    t.dataset_id = versions_->ResolveTarget(tx, request.uid, request.dataset_name);
    quota_->Admit(tx, request.uid);
    if (auto identical = versions_->FindIdenticalFile(tx, t.dataset_id, actual, size)) {
      t.object_key = identical->object_key;
      t.stored     = true;
    } else {
      t.object_key = catalog::ObjectKeyFor(t.dataset_id, actual, size);
    }
    return t;
  });

  if (!target.stored) {
    store_->PutObject(target.object_key, request.data);
  }

  catalog::FinalizeInput input;
  input.upload_id    = "direct-" + util::NewId();
  input.uid          = request.uid;
  input.dataset_id   = target.dataset_id;
  input.dataset_name = request.dataset_name;
  input.description  = request.description;
  input.tags         = request.tags;
  input.filename     = filename;
  input.checksum     = actual;
  input.size         = size;
  input.object_key   = target.object_key;

  CompleteResult result;
  try {
    result = db::RunInTransaction(*repo_, [&](db::Transaction& tx) {
      // The target may have moved while the bytes were written.
      if (auto existing = repo_->GetDatasetByName(tx, request.dataset_name)) {
        if (existing->uid != request.uid) throw util::DatasetAlreadyExistsError(request.dataset_name);
        if (existing->id != target.dataset_id) {
          throw util::InvalidState("dataset " + request.dataset_name + " changed during ingest; retry");
        }
      } else {
        for (const auto& session : repo_->ListActiveUploadSessionsByName(tx, request.dataset_name)) {
          if (session.uid != request.uid) throw util::DatasetAlreadyExistsError(request.dataset_name);
          if (session.dataset_id != target.dataset_id) {
            throw util::InvalidState("dataset " + request.dataset_name + " changed during ingest; retry");
          }
        }
      }
      quota_->Admit(tx, request.uid);

      auto finalized = versions_->ApplyFinalize(tx, input);
      return CompleteResult{std::move(finalized.view), finalized.version_id};
    });
  } catch (const std::exception& e) {
    if (!target.stored) {
      const bool referenced = db::RunInTransaction(*repo_, [&](db::Transaction& tx) {
        auto file = repo_->GetFile(tx, target.dataset_id, actual);
        return file.has_value() && file->object_key == target.object_key;
      });
      if (!referenced) store_->DeleteObject(target.object_key);
    }
    DATAHUB_LOG_WARN("direct ingest failed", {StringField("dataset", request.dataset_name), StringField("error", e.what())});
    throw;
  }

  DATAHUB_LOG_INFO("dataset persisted", {StringField("dataset_id", result.dataset.dataset.id), StringField("dataset", request.dataset_name),
                                         UintField("version", result.version_id), UintField("size", size),
                                         observability::BoolField("direct", true)});
  return result;
}

// ------------------------------------------------------------------
// Proto conversion
// ------------------------------------------------------------------

datahub::core::v1::UploadSession ToProto(const SessionView& view) {
  const auto& s = view.session;

  datahub::core::v1::UploadSession out;
  out.set_upload_id(s.upload_id);
  out.set_state(s.state);
  out.set_dataset_id(s.dataset_id);
  out.set_dataset_name(s.dataset_name);
  out.set_checksum(s.checksum);
  out.set_filename(s.filename);
  out.set_total_size(s.total_size);
  out.set_chunk_size(s.chunk_size);
  out.set_part_count(s.part_count);
  for (auto part : view.received_parts) out.add_received_parts(part);
  out.set_deduplicated(s.deduplicated);
  out.set_error_message(s.error_message);
  *out.mutable_created_at() = util::MillisToProto(s.created_at_ms);
  *out.mutable_updated_at() = util::MillisToProto(s.updated_at_ms);
  return out;
}

} // namespace datahub::ingest
