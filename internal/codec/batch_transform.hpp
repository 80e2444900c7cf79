#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "internal/codec/batch_codec.hpp"
#include "vigil/pipeline/v1/batch.pb.h"

namespace vigil::codec {

/*
  Derived views of a raw batch, chosen per detection module.

  A derived payload keeps the raw framing: gzip NDJSON, a BatchHeader line
  with transform set and event_count equal to the number of derived lines,
  then one MovementEvent or CombatEvent per line.

      raw_ndjson_gz                 the batch exactly as ingested
      movement_events_v1_ndjson_gz  positions with per-entity deltas and speed
      combat_events_v1_ndjson_gz    attacks with attacker pose and timing
*/

enum class BatchTransform {
  kRaw,
  kMovementEventsV1,
  kCombatEventsV1,
};

std::string_view ToString(BatchTransform transform);

// Case-insensitive; an empty name is kRaw.
std::optional<BatchTransform> ParseBatchTransform(std::string_view name);

// kRaw re-encodes the events unchanged. Callers holding the original bytes
// should pass those through instead.
std::shared_ptr<arrow::Buffer> ApplyTransform(BatchTransform transform, const DecodedBatch& raw);

template <typename Event>
struct DerivedBatch {
  vigil::pipeline::v1::BatchHeader header;
  std::vector<Event>               events;
};

// Throw util::InvalidArgument when the payload is not a view of that kind.
DerivedBatch<vigil::pipeline::v1::MovementEvent> DecodeMovementEvents(
    std::string_view payload, uint64_t max_decoded_bytes = kDefaultMaxDecodedBytes);
DerivedBatch<vigil::pipeline::v1::CombatEvent> DecodeCombatEvents(
    std::string_view payload, uint64_t max_decoded_bytes = kDefaultMaxDecodedBytes);

} // namespace vigil::codec
