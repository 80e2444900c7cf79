#include "arrow_utils.hpp"

#include <arrow/filesystem/localfs.h>
#include <arrow/filesystem/s3fs.h>

namespace vigil::storage::common {

namespace {

arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveS3(
    const vigil::runtime::config::ObjectStoreConfig& config) {
  std::string resolved_path;
  ARROW_ASSIGN_OR_RAISE(auto options, arrow::fs::S3Options::FromUri(config.root_uri(), &resolved_path));

  const auto& s3 = config.s3();
  if (!s3.region().empty()) {
    options.region = s3.region();
  }
  if (!s3.endpoint_override().empty()) {
    options.endpoint_override = s3.endpoint_override();
  }
  if (!s3.scheme().empty()) {
    options.scheme = s3.scheme();
  }
  if (!s3.access_key().empty()) {
    options.ConfigureAccessKey(s3.access_key(), s3.secret_key());
  }
  options.allow_bucket_creation = s3.allow_bucket_creation();

  if (!arrow::fs::IsS3Initialized()) {
    ARROW_RETURN_NOT_OK(arrow::fs::InitializeS3(arrow::fs::S3GlobalOptions::Defaults()));
  }

  ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::S3FileSystem::Make(options));
  return std::make_pair(std::shared_ptr<arrow::fs::FileSystem>(std::move(fs)), resolved_path);
}

} // namespace

arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(
    const vigil::runtime::config::ObjectStoreConfig& config) {
  if (config.root_uri().empty()) {
    return arrow::Status::Invalid("object_store.root_uri must be set");
  }

  std::string resolved_path = config.root_uri();

  switch (config.filesystem()) {
    case vigil::runtime::config::FILE_SYSTEM_LOCAL:
      return std::make_pair(std::shared_ptr<arrow::fs::FileSystem>(std::make_shared<arrow::fs::LocalFileSystem>()), resolved_path);
    case vigil::runtime::config::FILE_SYSTEM_S3:
      return ResolveS3(config);
    case vigil::runtime::config::FILE_SYSTEM_AUTO:
    default: {
      if (resolved_path.rfind("s3://", 0) == 0) {
        return ResolveS3(config);
      }
      ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUriOrPath(resolved_path, &resolved_path));
      return std::make_pair(std::move(fs), resolved_path);
    }
  }
}

} // namespace vigil::storage::common
