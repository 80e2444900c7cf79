#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace vigil::db::model {

enum class DispatchStatus : int {
  kSent    = 0,
  kFailed  = 1,
  kSkipped = 2,
  kDropped = 3,
};

inline std::string_view ToString(DispatchStatus status) {
  switch (status) {
    case DispatchStatus::kSent:
      return "sent";
    case DispatchStatus::kFailed:
      return "failed";
    case DispatchStatus::kSkipped:
      return "skipped";
    case DispatchStatus::kDropped:
      return "dropped";
  }
  return "unknown";
}

struct DispatchRecord {
  std::string    storage_key;
  std::string    module;
  DispatchStatus status = DispatchStatus::kSent;
  std::string    error;
  int64_t        created_at_ms = 0;
};

} // namespace vigil::db::model
