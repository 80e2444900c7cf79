#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace vigil::util {

/*
  UUID helpers

  Random RFC4122 version 4 ids, used for spool file names and
  dev session ids.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

inline std::string GenerateUUIDString() {
  return ToString(GenerateUUID());
}

} // namespace vigil::util
