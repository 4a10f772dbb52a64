#include "object_arrow_store.hpp"

#include <algorithm>
#include <cstdio>

#include <arrow/io/interfaces.h>
#include <arrow/result.h>

#include "internal/checksum/checksum_engine.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/uuid.hpp"

namespace datahub::storage {

using namespace datahub::storage::common;

namespace {

constexpr const char* kStagingRoot = ".multipart";
constexpr int64_t kCopyBlockSize   = 8 * 1024 * 1024;

std::string ParentOf(const std::string& path) {
  const auto slash = path.find_last_of('/');
  return slash == std::string::npos ? std::string{} : path.substr(0, slash);
}

void ValidateUploadId(const std::string& upload_id) {
  if (upload_id.empty() || upload_id.find('/') != std::string::npos || upload_id == "." || upload_id == "..") {
    throw util::StorageBackendError("invalid multipart upload id: " + upload_id, false);
  }
}

} // namespace

ObjectArrowStore::ObjectArrowStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path)
    : fs_(std::move(fs)), root_path_(std::move(root_path)) {
}

std::string ObjectArrowStore::ObjectPath(const std::string& key) const {
  ValidateObjectKey(key);
  if (key.rfind(kStagingRoot, 0) == 0) {
    throw util::ValidationError("object key uses a reserved prefix: " + key);
  }
  return JoinPath(root_path_, key);
}

std::string ObjectArrowStore::StagingDir(const std::string& upload_id) const {
  ValidateUploadId(upload_id);
  return JoinPath(root_path_, std::string(kStagingRoot) + "/" + upload_id);
}

std::string ObjectArrowStore::ManifestPath(const std::string& upload_id) const {
  return StagingDir(upload_id) + "/manifest";
}

std::string ObjectArrowStore::PartPath(const std::string& upload_id, uint32_t part_number) const {
  char name[32];
  std::snprintf(name, sizeof(name), "part-%05u", part_number);
  return StagingDir(upload_id) + "/" + name;
}

void ObjectArrowStore::WriteFile(const std::string& path, const uint8_t* data, int64_t size) {
  const auto parent = ParentOf(path);
  if (!parent.empty()) {
    Unwrap(fs_->CreateDir(parent, /*recursive=*/true));
  }
  auto out = Unwrap(fs_->OpenOutputStream(path));
  if (size > 0) {
    Unwrap(out->Write(data, size));
  }
  Unwrap(out->Close());
}

std::string ObjectArrowStore::ReadManifest(const std::string& upload_id) {
  const auto path = ManifestPath(upload_id);
  auto info = Unwrap(fs_->GetFileInfo(path));
  if (info.type() != arrow::fs::FileType::File) {
    throw util::StorageBackendError("unknown multipart upload: " + upload_id, false);
  }
  auto input = Unwrap(fs_->OpenInputFile(path));
  auto buffer = ReadAll(input);
  return buffer->ToString();
}

// ------------------------------------------------------------------
// Multipart
// ------------------------------------------------------------------

std::string ObjectArrowStore::CreateMultipart(const std::string& key) {
  ObjectPath(key);

  const auto upload_id = util::NewId();
  WriteFile(ManifestPath(upload_id), reinterpret_cast<const uint8_t*>(key.data()), static_cast<int64_t>(key.size()));
  return upload_id;
}

/*
  Parts land in a temp file first and are moved into place, so a reader
  never observes a half-written part.
*/
std::string ObjectArrowStore::PutPart(const std::string& upload_id, uint32_t part_number, const std::shared_ptr<arrow::Buffer>& data) {
  if (part_number == 0) {
    throw util::ValidationError("part numbers start at 1");
  }
  ReadManifest(upload_id);

  const auto final_path = PartPath(upload_id, part_number);
  const auto tmp_path   = final_path + ".tmp-" + util::NewId();
  WriteFile(tmp_path, data->data(), data->size());
  Unwrap(fs_->Move(tmp_path, final_path));

  return checksum::Md5Hex(*data);
}

ObjectInfo ObjectArrowStore::CompleteMultipart(const std::string& upload_id, const std::vector<CompletedPart>& parts) {
  const auto key = ReadManifest(upload_id);
  if (parts.empty()) {
    throw util::StorageBackendError("multipart upload " + upload_id + " completed without parts", false);
  }

  auto ordered = parts;
  std::sort(ordered.begin(), ordered.end(),
            [](const CompletedPart& a, const CompletedPart& b) { return a.part_number < b.part_number; });

  for (const auto& part : ordered) {
    auto info = Unwrap(fs_->GetFileInfo(PartPath(upload_id, part.part_number)));
    if (info.type() != arrow::fs::FileType::File) {
      throw util::StorageBackendError("multipart upload " + upload_id + " is missing part " + std::to_string(part.part_number), false);
    }
  }

  const auto target = ObjectPath(key);
  const auto parent = ParentOf(target);
  if (!parent.empty()) {
    Unwrap(fs_->CreateDir(parent, /*recursive=*/true));
  }

  uint64_t total = 0;
  auto out = Unwrap(fs_->OpenOutputStream(target));
  for (const auto& part : ordered) {
    auto in = Unwrap(fs_->OpenInputStream(PartPath(upload_id, part.part_number)));
    for (;;) {
      auto block = Unwrap(in->Read(kCopyBlockSize));
      if (block->size() == 0) break;
      Unwrap(out->Write(block));
      total += static_cast<uint64_t>(block->size());
    }
    Unwrap(in->Close());
  }
  Unwrap(out->Close());

  Unwrap(fs_->DeleteDir(StagingDir(upload_id)));
  return ObjectInfo{key, total};
}

void ObjectArrowStore::AbortMultipart(const std::string& upload_id) {
  const auto dir = StagingDir(upload_id);
  auto info = Unwrap(fs_->GetFileInfo(dir));
  if (info.type() == arrow::fs::FileType::NotFound) {
    return;
  }
  Unwrap(fs_->DeleteDir(dir));
}

bool ObjectArrowStore::MultipartExists(const std::string& upload_id) {
  auto info = Unwrap(fs_->GetFileInfo(ManifestPath(upload_id)));
  return info.type() == arrow::fs::FileType::File;
}

// ------------------------------------------------------------------
// Objects
// ------------------------------------------------------------------

ObjectInfo ObjectArrowStore::PutObject(const std::string& key, const std::shared_ptr<arrow::Buffer>& data) {
  WriteFile(ObjectPath(key), data->data(), data->size());
  return ObjectInfo{key, static_cast<uint64_t>(data->size())};
}

std::shared_ptr<arrow::io::RandomAccessFile> ObjectArrowStore::OpenObject(const std::string& key) {
  return Unwrap(fs_->OpenInputFile(ObjectPath(key)));
}

std::optional<ObjectInfo> ObjectArrowStore::Stat(const std::string& key) {
  auto info = Unwrap(fs_->GetFileInfo(ObjectPath(key)));
  if (info.type() != arrow::fs::FileType::File) {
    return std::nullopt;
  }
  return ObjectInfo{key, static_cast<uint64_t>(info.size())};
}

void ObjectArrowStore::DeleteObject(const std::string& key) {
  const auto path = ObjectPath(key);
  auto info = Unwrap(fs_->GetFileInfo(path));
  if (info.type() == arrow::fs::FileType::NotFound) {
    return;
  }
  Unwrap(fs_->DeleteFile(path));
}

} // namespace datahub::storage
