#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "internal/util/strings.hpp"

namespace vigil::model {

// Cost/precision class of a detection module.
enum class ModuleTier : std::uint8_t {
  kUnspecified = 0,
  kCore        = 1,
  kAdvanced    = 2,
};

constexpr std::string_view ToString(ModuleTier tier) {
  switch (tier) {
    case ModuleTier::kCore:
      return "core";
    case ModuleTier::kAdvanced:
      return "advanced";
    case ModuleTier::kUnspecified:
    default:
      return "unspecified";
  }
}

inline std::optional<ModuleTier> ParseModuleTier(std::string_view name) {
  if (util::EqualsIgnoreCase(name, "core")) return ModuleTier::kCore;
  if (util::EqualsIgnoreCase(name, "advanced")) return ModuleTier::kAdvanced;
  return std::nullopt;
}

}  // namespace vigil::model
