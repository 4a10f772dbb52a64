#pragma once

#include <arrow/buffer.h>
#include <arrow/io/interfaces.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace datahub::storage {

struct CompletedPart {
  uint32_t    part_number = 0;
  std::string etag;
};

struct ObjectInfo {
  std::string key;
  uint64_t    size = 0;
};

/*
  Object storage abstraction.

  Objects are immutable blobs addressed by key. Large objects are assembled
  through a multipart upload:

      id   = CreateMultipart(key)
      etag = PutPart(id, n, bytes)       // any order, re-put overwrites
      info = CompleteMultipart(id, parts)
      AbortMultipart(id)                 // drop staged parts

  Every method throws util::StorageBackendError on failure; transient()
  tells the caller whether a retry may succeed.
*/

class ObjectStore {
 public:
  virtual ~ObjectStore() = default;

  // ------------------------------------------------------------------
  // Multipart
  // ------------------------------------------------------------------

  virtual std::string CreateMultipart(const std::string& key) = 0;

  virtual std::string PutPart(const std::string& upload_id, uint32_t part_number, const std::shared_ptr<arrow::Buffer>& data) = 0;

  /*
    Concatenate the listed parts in ascending part_number order into the
    key given at CreateMultipart. The multipart upload ceases to exist.
  */
  virtual ObjectInfo CompleteMultipart(const std::string& upload_id, const std::vector<CompletedPart>& parts) = 0;

  // Idempotent; aborting an unknown id is not an error.
  virtual void AbortMultipart(const std::string& upload_id) = 0;

  virtual bool MultipartExists(const std::string& upload_id) = 0;

  // ------------------------------------------------------------------
  // Objects
  // ------------------------------------------------------------------

  virtual ObjectInfo PutObject(const std::string& key, const std::shared_ptr<arrow::Buffer>& data) = 0;

  virtual std::shared_ptr<arrow::io::RandomAccessFile> OpenObject(const std::string& key) = 0;

  // nullopt when the key does not exist.
  virtual std::optional<ObjectInfo> Stat(const std::string& key) = 0;

  virtual void DeleteObject(const std::string& key) = 0;
};

using ObjectStorePtr = std::shared_ptr<ObjectStore>;

} // namespace datahub::storage
