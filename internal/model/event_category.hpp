#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace vigil::model {

/*
  Coarse grouping of event types.

  Drives both the capture default allow-list (anything not kOther is kept)
  and module routing in the dispatcher.
*/
enum class EventCategory : std::uint8_t {
  kOther     = 0,
  kState     = 1,
  kMovement  = 2,
  kCombat    = 3,
  kBlock     = 4,
  kInventory = 5,
  kDev       = 6,
};

// Bitset over EventCategory values.
using CategoryMask = std::uint32_t;

constexpr CategoryMask MaskOf(EventCategory category) {
  return CategoryMask{1} << static_cast<std::uint8_t>(category);
}

EventCategory CategorizeEventType(std::string_view event_type);

std::string_view ToString(EventCategory category);

std::optional<EventCategory> ParseEventCategory(std::string_view name);

}  // namespace vigil::model
