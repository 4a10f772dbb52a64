#pragma once

#include <arrow/buffer.h>
#include <arrow/filesystem/filesystem.h>
#include <arrow/io/interfaces.h>
#include <arrow/result.h>

#include <memory>
#include <string>
#include <utility>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace datahub::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw util::StorageBackendError.

  IOError is the status Arrow uses for network and filesystem failures,
  so it is the one marked transient.
*/
inline util::StorageBackendError ToStorageError(const arrow::Status& status) {
  return util::StorageBackendError(status.ToString(), status.IsIOError());
}

template <typename T>
T Unwrap(arrow::Result<T> result) {
  if (!result.ok()) throw ToStorageError(result.status());
  return std::move(result).ValueUnsafe();
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw ToStorageError(status);
}

/*
  Read entire file into buffer
*/
inline std::shared_ptr<arrow::Buffer> ReadAll(const std::shared_ptr<arrow::io::RandomAccessFile>& file) {
  auto size = Unwrap(file->GetSize());
  return Unwrap(file->Read(size));
}

/*
  Resolve the filesystem and root path for the storage section.

    /data/hub, file:///data/hub  -> LocalFileSystem
    s3://bucket/prefix           -> S3FileSystem configured from s3 options
*/
arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(
    const datahub::runtime::config::StorageConfig& config);

} // namespace datahub::storage::common
