#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>
#include <string>

namespace vigil::storage {

/*
  Raw batch storage abstraction.

  Every batch is stored exactly as it arrived (gzip NDJSON) under the key
  produced by common::BatchStorageKey. Put is an idempotent overwrite, so
  a retried ingest of the same batch rewrites identical bytes.

  Implementations:
    OBJECT → Arrow filesystem (local directory, S3 / MinIO)
*/

class BatchStore {
 public:
  virtual ~BatchStore() = default;

  virtual void Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) = 0;

  virtual std::shared_ptr<arrow::Buffer> Get(const std::string& key) = 0;

  virtual bool Exists(const std::string& key) = 0;

  /*
    Backends with cheap metadata lookups should override this.
  */
  virtual uint64_t Size(const std::string& key) {
    return static_cast<uint64_t>(Get(key)->size());
  }

  virtual void Remove(const std::string& key) = 0;
};

using BatchStorePtr = std::shared_ptr<BatchStore>;

} // namespace vigil::storage
