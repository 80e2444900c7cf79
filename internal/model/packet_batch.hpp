#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/packet_record.hpp"

namespace vigil::model {

/*
  Unit of durability, transport and dispatch.
  record_count always equals records.size() once built.
*/
struct PacketBatch {
  std::string               source_id;
  std::string               session_id;
  int64_t                   created_at_ms = 0;
  std::vector<PacketRecord> records;

  int64_t RecordCount() const {
    return static_cast<int64_t>(records.size());
  }
};

}  // namespace vigil::model
