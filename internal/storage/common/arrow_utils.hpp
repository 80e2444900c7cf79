#pragma once

#include <arrow/buffer.h>
#include <arrow/filesystem/filesystem.h>
#include <arrow/io/file.h>
#include <arrow/result.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "config/config.pb.h"

namespace vigil::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw std::runtime_error
*/
template <typename T>
T Unwrap(arrow::Result<T> result) {
  if (!result.ok()) throw std::runtime_error(result.status().ToString());
  return std::move(result).ValueUnsafe();
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw std::runtime_error(status.ToString());
}

/*
  Read entire file into buffer
*/
inline std::shared_ptr<arrow::Buffer> ReadAll(const std::shared_ptr<arrow::io::RandomAccessFile>& file) {
  auto size = Unwrap(file->GetSize());
  return Unwrap(file->ReadAt(0, size));
}

/*
  Resolve the object-store root into a filesystem plus the path inside it.

      /var/lib/vigil/batches        -> LocalFileSystem, same path
      file:///var/lib/vigil/batches -> LocalFileSystem
      s3://bucket/prefix            -> S3FileSystem, "bucket/prefix"
*/
arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(
    const vigil::runtime::config::ObjectStoreConfig& config);

} // namespace vigil::storage::common
