#pragma once

#include <cstdint>
#include <string>

#include "internal/model/state_value.hpp"

namespace vigil::db::model {

/*
  One (source, entity, key) row. The value is stored in its encoded
  text form next to its kind so every backend keeps the type tag.
*/
struct PlayerStateRecord {
  std::string            source_id;
  std::string            entity_id;
  std::string            key;
  vigil::model::ValueKind kind = vigil::model::ValueKind::kNull;
  std::string            value;
  int64_t                updated_at_ms = 0;
};

} // namespace vigil::db::model
