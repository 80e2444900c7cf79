#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/model/packet_batch.hpp"

namespace vigil::spool {

struct SpoolFileHandle {
  std::filesystem::path           path;
  std::string                     batch_id;
  uint64_t                        size_bytes = 0;
  std::filesystem::file_time_type modified;
};

/*
  On-disk durability for batches awaiting upload.

      <dir>/<prefix>-<epoch_ms>-<uuid>.ndjson.gz        published
      <dir>/<prefix>-<epoch_ms>-<uuid>.ndjson.gz.tmp    being written
      <dir>/quarantine/...                              rejected for good

  Publishing is write tmp -> flush -> close -> rename, so a file under its
  final name is always complete. Every directory mutation, and every read
  the uploader makes, goes through one mutex.

  The quota counts published and quarantined files. Before a write the
  oldest of them (by mtime, then name) are deleted until the new file
  fits; a file larger than the whole quota is still written.
*/

class DurableSpool {
 public:
  static constexpr uint64_t kDefaultMaxBytes = 256ull * 1024 * 1024;

  struct Options {
    std::filesystem::path dir;
    std::string           prefix    = "batch";
    uint64_t              max_bytes = kDefaultMaxBytes;
  };

  static Options OptionsFromConfig(const vigil::runtime::config::SpoolConfig& config);

  // Creates dir and quarantine/, removes stale .tmp files.
  explicit DurableSpool(Options options);

  // Encodes and publishes; nullopt on any failure (logged).
  std::optional<SpoolFileHandle> WriteBatch(const model::PacketBatch& batch);

  // Publishes already encoded bytes.
  std::optional<SpoolFileHandle> Publish(const std::shared_ptr<arrow::Buffer>& encoded);

  // Oldest first.
  std::vector<SpoolFileHandle> ListPublished() const;
  std::vector<SpoolFileHandle> ListQuarantined() const;

  // Throws util::NotFound if the file is gone.
  std::shared_ptr<arrow::Buffer> Read(const SpoolFileHandle& handle) const;

  // false if the file was already gone.
  bool Remove(const SpoolFileHandle& handle);
  bool Quarantine(const SpoolFileHandle& handle);

  uint64_t TotalBytes() const;

  const std::filesystem::path& Dir() const {
    return options_.dir;
  }

  static constexpr const char* kExtension = ".ndjson.gz";
  static constexpr const char* kTmpSuffix = ".tmp";

 private:
  std::vector<SpoolFileHandle> Scan(const std::filesystem::path& dir) const;
  uint64_t                     TotalBytesLocked() const;
  void                         EnforceQuotaLocked(uint64_t incoming_bytes);
  void                         RemoveStaleTmpFiles();
  std::string                  NextBatchId() const;

  Options                options_;
  std::filesystem::path  quarantine_dir_;
  mutable std::mutex     mutex_;
};

} // namespace vigil::spool
