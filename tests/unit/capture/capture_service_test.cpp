#include <cassert>
#include <chrono>
#include <iostream>
#include <limits>
#include <memory>
#include <string>

#include "internal/capture/capture_service.hpp"

namespace {

using vigil::capture::CaptureOutcome;
using vigil::capture::CaptureService;
using vigil::capture::ExemptionTracker;
using vigil::capture::OverflowPolicy;
using vigil::capture::RecordQueue;
using vigil::model::Direction;
using vigil::model::PacketRecord;

constexpr const char* kPlayer = "8f14e45f-ceea-467a-9af0-0000000000aa";

PacketRecord MakeRecord(std::string type, int64_t ts, const char* entity = kPlayer) {
  PacketRecord r;
  r.timestamp_ms = ts;
  r.direction    = Direction::kServerbound;
  r.event_type   = std::move(type);
  if (entity) r.entity_id = entity;
  r.fields.emplace("x", 1.5);
  return r;
}

struct Fixture {
  std::shared_ptr<RecordQueue>      queue;
  std::shared_ptr<ExemptionTracker> exemptions;
  std::shared_ptr<CaptureService>   capture;

  explicit Fixture(vigil::runtime::config::CaptureConfig config = {}, std::size_t capacity = 1000,
                   OverflowPolicy policy = OverflowPolicy::kDropNewest) {
    queue      = std::make_shared<RecordQueue>(capacity, policy);
    exemptions = std::make_shared<ExemptionTracker>();
    capture    = std::make_shared<CaptureService>(queue, exemptions, config);
  }
};

void TestUnresolvedIdentityIsDropped() {
  Fixture f;
  assert(f.capture->Capture(MakeRecord("PLAYER_POSITION", 1, nullptr)) == CaptureOutcome::kDroppedUnresolved);
  assert(f.capture->Capture(MakeRecord("PLAYER_POSITION", 1, "")) == CaptureOutcome::kDroppedUnresolved);
  assert(f.queue->Size() == 0);
  assert(f.capture->Stats().unresolved == 2);
}

void TestNonFiniteFieldsAreDropped() {
  Fixture f;
  auto    nan = MakeRecord("PLAYER_POSITION", 1);
  nan.fields["y"] = std::numeric_limits<double>::quiet_NaN();
  auto inf        = MakeRecord("PLAYER_POSITION", 2);
  inf.fields["z"] = -std::numeric_limits<double>::infinity();

  assert(f.capture->Capture(std::move(nan)) == CaptureOutcome::kDroppedMalformed);
  assert(f.capture->Capture(std::move(inf)) == CaptureOutcome::kDroppedMalformed);
  assert(f.capture->Capture(MakeRecord("PLAYER_POSITION", 3)) == CaptureOutcome::kEnqueued);
  assert(f.queue->Size() == 1);
  assert(f.capture->Stats().malformed == 2);
  assert(f.capture->Stats().unresolved == 0);
}

void TestJoinGraceSuppressesBurst() {
  Fixture f;
  f.exemptions->OnConnect(kPlayer, "Steve", 1'000);

  for (int i = 0; i < 100; ++i) {
    auto outcome = f.capture->Capture(MakeRecord("PLAYER_POSITION", 1'000 + i * 20));
    assert(outcome == CaptureOutcome::kDroppedExempt);
  }
  assert(f.queue->Size() == 0);
  assert(f.capture->Stats().exempt == 100);

  assert(f.capture->Capture(MakeRecord("PLAYER_POSITION", 3'600)) == CaptureOutcome::kEnqueued);
  assert(f.queue->Size() == 1);
}

void TestFilterAppliesAfterExemption() {
  Fixture f;
  assert(f.capture->Capture(MakeRecord("CHAT_MESSAGE", 5)) == CaptureOutcome::kDroppedFiltered);
  assert(f.capture->Capture(MakeRecord("INTERACT_ENTITY", 5)) == CaptureOutcome::kEnqueued);

  auto stats = f.capture->Stats();
  assert(stats.filtered == 1);
  assert(stats.enqueued == 1);
}

void TestZeroSampleRateDropsEverything() {
  vigil::runtime::config::CaptureConfig config;
  config.set_sample_rate(0.0);
  Fixture f(config);

  for (int i = 0; i < 10; ++i) {
    assert(f.capture->Capture(MakeRecord("PLAYER_POSITION", 10 + i)) == CaptureOutcome::kDroppedSampled);
  }
  assert(f.capture->SampleRate() == 0.0);
  assert(f.capture->Stats().sampled == 10);
}

void TestDevMarkerBypassesChecks() {
  vigil::runtime::config::CaptureConfig config;
  config.set_sample_rate(0.0);
  config.add_enabled_packets("PLAYER_POSITION");
  Fixture f(config);
  f.exemptions->OnConnect(kPlayer, "Steve", 0);

  auto marker      = MakeRecord("DEV_MARKER", 10);
  marker.direction = Direction::kDev;
  assert(f.capture->Capture(std::move(marker)) == CaptureOutcome::kEnqueued);

  // identity is still required
  auto anonymous      = MakeRecord("DEV_MARKER", 10, nullptr);
  anonymous.direction = Direction::kDev;
  assert(f.capture->Capture(std::move(anonymous)) == CaptureOutcome::kDroppedUnresolved);
}

void TestOverflowIsCounted() {
  Fixture f({}, 2, OverflowPolicy::kDropNewest);
  assert(f.capture->Capture(MakeRecord("PLAYER_POSITION", 1)) == CaptureOutcome::kEnqueued);
  assert(f.capture->Capture(MakeRecord("PLAYER_POSITION", 2)) == CaptureOutcome::kEnqueued);
  assert(f.capture->Capture(MakeRecord("PLAYER_POSITION", 3)) == CaptureOutcome::kDroppedOverflow);
  assert(f.capture->Stats().overflow == 1);

  Fixture oldest({}, 2, OverflowPolicy::kDropOldest);
  for (int i = 0; i < 5; ++i) {
    assert(oldest.capture->Capture(MakeRecord("PLAYER_POSITION", 1 + i)) == CaptureOutcome::kEnqueued);
  }
  assert(oldest.capture->Stats().overflow == 3);

  auto kept = oldest.queue->DrainBatch(10, std::chrono::milliseconds(0));
  assert(kept.size() == 2);
  assert(kept[0].timestamp_ms == 4);
}

void TestReloadSwapsSnapshot() {
  Fixture f;
  assert(f.capture->Capture(MakeRecord("CHAT_MESSAGE", 1)) == CaptureOutcome::kDroppedFiltered);

  vigil::runtime::config::CaptureConfig capture;
  capture.add_enabled_packets("chat_message");
  vigil::runtime::config::ExemptionConfig exemptions;
  exemptions.set_join_grace_ms(10'000);
  f.capture->Reload(capture, exemptions);

  assert(f.capture->Capture(MakeRecord("CHAT_MESSAGE", 2)) == CaptureOutcome::kEnqueued);
  assert(f.capture->Capture(MakeRecord("PLAYER_POSITION", 3)) == CaptureOutcome::kDroppedFiltered);
  assert(f.exemptions->Policy()->join_grace_ms == 10'000);
}

} // namespace

int main() {
  TestUnresolvedIdentityIsDropped();
  TestNonFiniteFieldsAreDropped();
  TestJoinGraceSuppressesBurst();
  TestFilterAppliesAfterExemption();
  TestZeroSampleRateDropsEverything();
  TestDevMarkerBypassesChecks();
  TestOverflowIsCounted();
  TestReloadSwapsSnapshot();
  std::cout << "vigil_capture_service_test: pass\n";
  return 0;
}
