#include "internal/model/event_category.hpp"

#include <array>

#include "internal/model/packet_record.hpp"
#include "internal/util/strings.hpp"

namespace vigil::model {

namespace {

struct CategoryPattern {
  std::string_view needle;
  EventCategory    category;
};

// Evaluated in order; first substring hit wins.
constexpr std::array<CategoryPattern, 31> kPatterns = {{
    {"PLAYER_STATE", EventCategory::kState},

    {"USE_ENTITY", EventCategory::kCombat},
    {"INTERACT_ENTITY", EventCategory::kCombat},
    {"ENTITY_ACTION", EventCategory::kCombat},
    {"ARM_ANIMATION", EventCategory::kCombat},
    {"SWING", EventCategory::kCombat},

    {"PLAYER_DIGGING", EventCategory::kBlock},
    {"BLOCK_DIG", EventCategory::kBlock},
    {"BLOCK_PLACE", EventCategory::kBlock},
    {"USE_ITEM", EventCategory::kBlock},
    {"INTERACT_BLOCK", EventCategory::kBlock},

    {"WINDOW_CLICK", EventCategory::kInventory},
    {"CLICK_WINDOW", EventCategory::kInventory},
    {"CLOSE_WINDOW", EventCategory::kInventory},
    {"HELD_ITEM_SLOT", EventCategory::kInventory},
    {"SET_CREATIVE_SLOT", EventCategory::kInventory},

    {"POSITION", EventCategory::kMovement},
    {"ROTATION", EventCategory::kMovement},
    {"LOOK", EventCategory::kMovement},
    {"FLYING", EventCategory::kMovement},
    {"ABILIT", EventCategory::kMovement},
    {"KEEP_ALIVE", EventCategory::kMovement},
    {"PING", EventCategory::kMovement},
    {"PONG", EventCategory::kMovement},
    {"TELEPORT", EventCategory::kMovement},
    {"CONFIRM", EventCategory::kMovement},
    {"SPAWN_", EventCategory::kMovement},
    {"DESTROY_ENTITIES", EventCategory::kMovement},
    {"ENTITY_TELEPORT", EventCategory::kMovement},
    {"ENTITY_RELATIVE_MOVE", EventCategory::kMovement},
    {"ENTITY_POSITION_SYNC", EventCategory::kMovement},
}};

constexpr std::array<std::string_view, 7> kNames = {"other", "state", "movement", "combat", "block", "inventory", "dev"};

} // namespace

EventCategory CategorizeEventType(std::string_view event_type) {
  const auto name = util::Trim(event_type);
  if (name.empty()) {
    return EventCategory::kOther;
  }
  if (util::StartsWithIgnoreCase(name, kDevMarkerPrefix)) {
    return EventCategory::kDev;
  }
  for (const auto& pattern : kPatterns) {
    if (util::ContainsIgnoreCase(name, pattern.needle)) {
      return pattern.category;
    }
  }
  return EventCategory::kOther;
}

std::string_view ToString(EventCategory category) {
  const auto index = static_cast<std::size_t>(category);
  return index < kNames.size() ? kNames[index] : "other";
}

std::optional<EventCategory> ParseEventCategory(std::string_view name) {
  const auto trimmed = util::Trim(name);
  for (std::size_t i = 0; i < kNames.size(); ++i) {
    if (util::EqualsIgnoreCase(trimmed, kNames[i])) {
      return static_cast<EventCategory>(i);
    }
  }
  return std::nullopt;
}

}  // namespace vigil::model
