#pragma once

#include <string>
#include <string_view>

#include "internal/util/errors.hpp"

namespace vigil::storage::common {

/*
  Components of object keys come from remote callers; anything that could
  escape the key layout is refused.
*/
inline void ValidateKeyComponent(std::string_view what, const std::string& value) {
  if (value.empty()) {
    throw util::InvalidArgument(std::string(what) + " must not be empty");
  }
  for (char c : value) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw util::InvalidArgument(std::string(what) + " contains invalid character");
    }
  }
  if (value == "." || value == "..") {
    throw util::InvalidArgument(std::string(what) + " must not be a relative path component");
  }
}

/*
  Object key layout:

      <source_id>/<session_id>/<batch_id>.ndjson.gz
*/
inline std::string BatchStorageKey(const std::string& source_id, const std::string& session_id, const std::string& batch_id) {
  ValidateKeyComponent("source_id", source_id);
  ValidateKeyComponent("session_id", session_id);
  ValidateKeyComponent("batch_id", batch_id);
  return source_id + "/" + session_id + "/" + batch_id + ".ndjson.gz";
}

} // namespace vigil::storage::common
