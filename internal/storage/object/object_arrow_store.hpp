#pragma once

#include <memory>
#include <string>

#include <arrow/filesystem/filesystem.h>

#include "internal/storage/object_store.hpp"

namespace datahub::storage {

/*
  Object store on any Arrow filesystem (local disk, S3, MinIO).

  Layout under root:

      <root>/<object key>
      <root>/.multipart/<upload id>/manifest     target key
      <root>/.multipart/<upload id>/part-<n>     staged part bytes

  Completion concatenates the staged parts into the target key and removes
  the staging directory.
*/

class ObjectArrowStore final : public ObjectStore {
public:
  ObjectArrowStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path);

  std::string CreateMultipart(const std::string& key) override;
  std::string PutPart(const std::string& upload_id, uint32_t part_number, const std::shared_ptr<arrow::Buffer>& data) override;
  ObjectInfo  CompleteMultipart(const std::string& upload_id, const std::vector<CompletedPart>& parts) override;
  void        AbortMultipart(const std::string& upload_id) override;
  bool        MultipartExists(const std::string& upload_id) override;

  ObjectInfo PutObject(const std::string& key, const std::shared_ptr<arrow::Buffer>& data) override;
  std::shared_ptr<arrow::io::RandomAccessFile> OpenObject(const std::string& key) override;
  std::optional<ObjectInfo> Stat(const std::string& key) override;
  void DeleteObject(const std::string& key) override;

private:
  std::string ObjectPath(const std::string& key) const;
  std::string StagingDir(const std::string& upload_id) const;
  std::string ManifestPath(const std::string& upload_id) const;
  std::string PartPath(const std::string& upload_id, uint32_t part_number) const;

  std::string ReadManifest(const std::string& upload_id);
  void WriteFile(const std::string& path, const uint8_t* data, int64_t size);

  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string root_path_;
};

}
