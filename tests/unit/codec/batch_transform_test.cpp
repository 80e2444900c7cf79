#include <cassert>
#include <cmath>
#include <iostream>
#include <string>

#include "internal/codec/batch_codec.hpp"
#include "internal/codec/batch_transform.hpp"
#include "internal/util/errors.hpp"

namespace {

using vigil::codec::ApplyTransform;
using vigil::codec::BatchTransform;
using vigil::codec::DecodedBatch;
using vigil::codec::ParseEventLine;

std::string AsString(const std::shared_ptr<arrow::Buffer>& buffer) {
  return std::string(reinterpret_cast<const char*>(buffer->data()), static_cast<std::size_t>(buffer->size()));
}

template <typename Fn>
bool ThrowsInvalid(Fn&& fn) {
  try {
    fn();
  } catch (const vigil::util::InvalidArgument&) {
    return true;
  }
  return false;
}

bool Near(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

DecodedBatch RawBatch(std::initializer_list<const char*> lines) {
  DecodedBatch raw;
  raw.header.set_source_id("server-a");
  raw.header.set_session_id("boot-1");
  raw.header.set_created_at_ms(1000);
  for (const char* line : lines) {
    raw.events.push_back(ParseEventLine(line));
  }
  raw.header.set_event_count(static_cast<int64_t>(raw.events.size()));
  return raw;
}

void TestParseTransformNames() {
  assert(vigil::codec::ParseBatchTransform("") == BatchTransform::kRaw);
  assert(vigil::codec::ParseBatchTransform("raw_ndjson_gz") == BatchTransform::kRaw);
  assert(vigil::codec::ParseBatchTransform(" Movement_Events_V1_NDJSON_GZ ") == BatchTransform::kMovementEventsV1);
  assert(vigil::codec::ParseBatchTransform("combat_events_v1_ndjson_gz") == BatchTransform::kCombatEventsV1);
  assert(!vigil::codec::ParseBatchTransform("velocity_v2").has_value());
}

void TestMovementDeltasAndSpeed() {
  const auto raw = RawBatch({
      R"({"ts":"1000","pkt":"PLAYER_POSITION","uuid":"u-1","fields":{"x":0,"y":64,"z":0,"on_ground":true}})",
      R"({"ts":"1010","pkt":"PLAYER_POSITION","uuid":"u-2","fields":{"x":5}})",
      R"({"ts":"1500","pkt":"PLAYER_POSITION","uuid":"u-1","fields":{"x":3,"y":64,"z":4}})",
      R"({"ts":"1500","pkt":"PLAYER_POSITION","uuid":"u-1","fields":{"x":9,"y":64,"z":4}})",
  });

  const auto derived = vigil::codec::DecodeMovementEvents(AsString(ApplyTransform(BatchTransform::kMovementEventsV1, raw)));
  assert(derived.header.source_id() == "server-a");
  assert(derived.header.transform() == "movement_events_v1_ndjson_gz");
  // u-2 has no full position
  assert(derived.header.event_count() == 3);
  assert(derived.events.size() == 3);

  const auto& first = derived.events[0];
  assert(first.has_on_ground() && first.on_ground());
  assert(!first.has_dt_ms());

  const auto& second = derived.events[1];
  assert(Near(second.dt_ms(), 500.0));
  assert(Near(second.dx(), 3.0));
  assert(Near(second.dz(), 4.0));
  assert(Near(second.speed_bps(), 10.0));
  assert(!second.has_on_ground());

  // same timestamp: no deltas
  assert(!derived.events[2].has_dt_ms());
}

void TestCombatTimingAndPose() {
  const auto raw = RawBatch({
      R"({"ts":"1000","pkt":"INTERACT_ENTITY","uuid":"u-1","fields":{"action":"ATTACK","entity_id":7}})",
      R"({"ts":"1050","pkt":"PLAYER_POSITION_AND_ROTATION","uuid":"u-1","fields":{"x":1,"y":2,"z":3,"yaw":170}})",
      R"({"ts":"1100","pkt":"INTERACT_ENTITY","uuid":"u-1","fields":{"action":"ATTACK","entity_id":7,"sneaking":true}})",
      R"({"ts":"1150","pkt":"PLAYER_ROTATION","uuid":"u-1","fields":{"yaw":-170}})",
      R"({"ts":"1200","pkt":"USE_ENTITY","uuid":"u-1","fields":{"action":"ATTACK","entity_id":9}})",
      R"({"ts":"1300","pkt":"INTERACT_ENTITY","uuid":"u-1","fields":{"action":"INTERACT","entity_id":9}})",
  });

  const auto derived = vigil::codec::DecodeCombatEvents(AsString(ApplyTransform(BatchTransform::kCombatEventsV1, raw)));
  assert(derived.header.transform() == "combat_events_v1_ndjson_gz");
  assert(derived.events.size() == 3);

  const auto& first = derived.events[0];
  assert(first.entity_id() == 7);
  assert(!first.sneaking());
  assert(!first.has_player_x());
  assert(!first.has_dt_ms());

  const auto& second = derived.events[1];
  assert(second.sneaking());
  assert(Near(second.player_x(), 1.0));
  assert(Near(second.player_yaw(), 170.0));
  assert(Near(second.player_pitch(), 0.0));
  assert(Near(second.dt_ms(), 100.0));
  assert(Near(second.attacks_per_second(), 10.0));
  assert(!second.target_switched());
  // previous attack had no pose
  assert(!second.has_yaw_diff());

  const auto& third = derived.events[2];
  assert(third.entity_id() == 9);
  assert(third.target_switched());
  assert(Near(third.player_yaw(), -170.0));
  assert(Near(third.yaw_diff(), 20.0));
}

void TestRawViewMatchesInput() {
  const auto raw = RawBatch({R"({"ts":"1","pkt":"PLAYER_POSITION","uuid":"u-1"})"});
  const auto decoded = vigil::codec::DecodeBatch(AsString(ApplyTransform(BatchTransform::kRaw, raw)));
  assert(decoded.header.session_id() == "boot-1");
  assert(decoded.events.size() == 1);
  assert(decoded.events[0].uuid() == "u-1");
}

void TestViewKindIsChecked() {
  const auto raw      = RawBatch({R"({"ts":"1","pkt":"PLAYER_POSITION","uuid":"u-1","fields":{"x":0,"y":0,"z":0}})"});
  const auto movement = AsString(ApplyTransform(BatchTransform::kMovementEventsV1, raw));
  assert(ThrowsInvalid([&] { vigil::codec::DecodeCombatEvents(movement); }));
  assert(ThrowsInvalid([&] { vigil::codec::DecodeBatch(movement); }));

  const auto plain = AsString(ApplyTransform(BatchTransform::kRaw, raw));
  assert(ThrowsInvalid([&] { vigil::codec::DecodeMovementEvents(plain); }));
  assert(ThrowsInvalid([] { vigil::codec::DecodeMovementEvents(""); }));
}

} // namespace

int main() {
  TestParseTransformNames();
  TestMovementDeltasAndSpeed();
  TestCombatTimingAndPose();
  TestRawViewMatchesInput();
  TestViewKindIsChecked();
  std::cout << "vigil_batch_transform_test: pass\n";
  return 0;
}
