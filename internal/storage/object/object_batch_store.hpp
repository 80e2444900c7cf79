#pragma once

#include <arrow/buffer.h>
#include <arrow/filesystem/filesystem.h>

#include <memory>
#include <string>

#include "internal/storage/batch_store.hpp"

namespace vigil::storage {

/*
  Object storage for raw batches using Arrow filesystem.

  Characteristics:
    - immutable object writes
    - same code path for a local directory and S3 / MinIO
    - no fsync semantics
*/

class ObjectBatchStore final : public BatchStore {
public:
  ObjectBatchStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path);

  void Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) override;

  std::shared_ptr<arrow::Buffer> Get(const std::string& key) override;

  bool Exists(const std::string& key) override;

  uint64_t Size(const std::string& key) override;

  void Remove(const std::string& key) override;

private:
  std::string ObjectPath(const std::string& key) const;

  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string root_path_;
};

}
