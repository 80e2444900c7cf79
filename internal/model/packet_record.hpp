#pragma once

#include <cmath>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace vigil::model {

enum class Direction : std::uint8_t {
  kServerbound = 0,
  kClientbound = 1,
  // synthetic markers produced by dev sessions
  kDev = 2,
};

constexpr std::string_view ToString(Direction direction) {
  switch (direction) {
    case Direction::kClientbound:
      return "clientbound";
    case Direction::kDev:
      return "dev";
    case Direction::kServerbound:
    default:
      return "serverbound";
  }
}

inline std::optional<Direction> ParseDirection(std::string_view name) {
  if (name == "serverbound") return Direction::kServerbound;
  if (name == "clientbound") return Direction::kClientbound;
  if (name == "dev") return Direction::kDev;
  return std::nullopt;
}

/*
  Scalar field value extracted from a packet.

  The alternative index is the kind tag: null, boolean, number, string.
  Numbers are doubles, matching what the NDJSON wire form can carry.
*/
using FieldValue = std::variant<std::monostate, bool, double, std::string>;

using FieldMap = std::map<std::string, FieldValue, std::less<>>;

/*
  One captured event.

  Built by the capture layer and moved through the queue; nothing mutates
  it after construction. entity_id is optional here only so the capture
  path can tell "unresolved" apart; such records never reach the queue.
*/
struct PacketRecord {
  int64_t                    timestamp_ms = 0;
  Direction                  direction    = Direction::kServerbound;
  std::string                event_type;
  std::optional<std::string> entity_id;
  std::optional<std::string> entity_name;
  FieldMap                   fields;

  bool HasIdentity() const {
    return entity_id.has_value() && !entity_id->empty();
  }

  // NaN and infinities have no NDJSON form.
  bool HasFiniteFields() const {
    for (const auto& [key, value] : fields) {
      if (const auto* number = std::get_if<double>(&value); number && !std::isfinite(*number)) {
        return false;
      }
    }
    return true;
  }
};

inline constexpr std::string_view kDevMarkerPrefix = "DEV_";
inline constexpr std::string_view kDevMarkerEventType = "DEV_MARKER";

inline bool IsDevMarker(std::string_view event_type) {
  return event_type.substr(0, kDevMarkerPrefix.size()) == kDevMarkerPrefix;
}

}  // namespace vigil::model
