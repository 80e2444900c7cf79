#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace vigil::db::model {

enum class BatchStatus : int {
  kIndexed    = 0,
  kDispatched = 1,
};

inline std::string_view ToString(BatchStatus status) {
  return status == BatchStatus::kDispatched ? "dispatched" : "indexed";
}

struct BatchIndexRecord {
  std::string storage_key;
  std::string batch_id;
  std::string source_id;
  std::string session_id;
  int64_t     created_at_ms      = 0;
  int64_t     ingested_at_ms     = 0;
  uint64_t    record_count       = 0;
  uint64_t    payload_bytes      = 0;
  BatchStatus status             = BatchStatus::kIndexed;
  uint32_t    dispatched_modules = 0;
};

} // namespace vigil::db::model
