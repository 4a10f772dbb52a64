#include "arrow_utils.hpp"

#include <arrow/filesystem/localfs.h>
#include <arrow/filesystem/s3fs.h>

namespace datahub::storage::common {

namespace {

bool IsS3Uri(const std::string& uri) {
  return uri.rfind("s3://", 0) == 0;
}

arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveS3(
    const std::string& uri, const datahub::runtime::config::S3Options& proto_options) {
  ARROW_RETURN_NOT_OK(arrow::fs::EnsureS3Initialized());

  std::string root;
  ARROW_ASSIGN_OR_RAISE(auto options, arrow::fs::S3Options::FromUri(uri, &root));

  if (!proto_options.region().empty()) {
    options.region = proto_options.region();
  }
  if (!proto_options.endpoint_override().empty()) {
    options.endpoint_override = proto_options.endpoint_override();
  }
  if (!proto_options.scheme().empty()) {
    options.scheme = proto_options.scheme();
  }
  if (proto_options.request_timeout() > 0) {
    options.request_timeout = proto_options.request_timeout();
  }
  if (proto_options.connect_timeout() > 0) {
    options.connect_timeout = proto_options.connect_timeout();
  }
  if (!proto_options.access_key().empty()) {
    options.ConfigureAccessKey(proto_options.access_key(), proto_options.secret_key());
  }

  ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::S3FileSystem::Make(options));
  return std::make_pair(std::static_pointer_cast<arrow::fs::FileSystem>(std::move(fs)), root);
}

} // namespace

arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(
    const datahub::runtime::config::StorageConfig& config) {
  const std::string uri = config.root_uri().empty() ? std::string{"/tmp/dataset-hub"} : config.root_uri();

  if (IsS3Uri(uri)) {
    return ResolveS3(uri, config.s3());
  }

  std::string resolved_path;
  ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUriOrPath(uri, &resolved_path));
  ARROW_RETURN_NOT_OK(fs->CreateDir(resolved_path, /*recursive=*/true));
  return std::make_pair(std::move(fs), resolved_path);
}

} // namespace datahub::storage::common
