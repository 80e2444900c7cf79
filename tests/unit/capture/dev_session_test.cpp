#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <variant>

#include "internal/capture/capture_service.hpp"
#include "internal/capture/dev_session_manager.hpp"
#include "internal/model/dev_session.hpp"
#include "internal/util/errors.hpp"

namespace {

using vigil::capture::CaptureService;
using vigil::capture::DevSessionManager;
using vigil::capture::ExemptionTracker;
using vigil::capture::RecordQueue;
using vigil::model::DevLabel;
using vigil::model::DevPhase;
using vigil::model::DevSession;
using vigil::model::DevSessionSettings;
using vigil::model::DevTransition;

constexpr const char* kPlayer = "8f14e45f-ceea-467a-9af0-0000000000aa";

std::string Field(const vigil::model::PacketRecord& r, const char* name) {
  auto it = r.fields.find(name);
  assert(it != r.fields.end());
  return std::get<std::string>(it->second);
}

void TestStateMachineWarmupThenToggles() {
  DevSession session;
  session.settings = DevSessionSettings{20, 3, 5};

  assert(session.Begin() == DevTransition::kStarted);
  assert(session.phase == DevPhase::kWarmup);
  assert(session.StateName() == "off");
  assert(session.Begin() == DevTransition::kNone);

  assert(session.Tick() == DevTransition::kNone);
  assert(session.Tick() == DevTransition::kNone);
  assert(session.Tick() == DevTransition::kToggled);
  assert(session.phase == DevPhase::kActive);
  assert(session.active_label == DevLabel::kClean);

  for (int i = 0; i < 4; ++i) assert(session.Tick() == DevTransition::kNone);
  assert(session.Tick() == DevTransition::kToggled);
  assert(session.active_label == DevLabel::kCheat);
  assert(session.cycle_index == 1);
  assert(session.StateName() == "cheat");

  DevTransition last = DevTransition::kNone;
  while (session.phase != DevPhase::kStopped) last = session.Tick();
  assert(last == DevTransition::kFinished);
  assert(session.elapsed_seconds == 20);
  assert(session.Tick() == DevTransition::kNone);
  assert(session.Stop() == DevTransition::kNone);
}

void TestSettingsAreClamped() {
  DevSession session;
  session.settings = DevSessionSettings{1, -4, 0};
  session.Begin();
  assert(session.settings.duration_seconds == DevSessionSettings::kMinDurationSeconds);
  assert(session.settings.warmup_seconds == 0);
  assert(session.settings.toggle_seconds == DevSessionSettings::kMinToggleSeconds);
  // no warmup goes straight to active
  assert(session.phase == DevPhase::kActive);
}

struct Fixture {
  std::shared_ptr<RecordQueue>       queue;
  std::shared_ptr<CaptureService>    capture;
  std::unique_ptr<DevSessionManager> dev;

  explicit Fixture(bool enabled = true) {
    queue   = std::make_shared<RecordQueue>(100);
    capture = std::make_shared<CaptureService>(queue, std::make_shared<ExemptionTracker>(), vigil::runtime::config::CaptureConfig{});

    vigil::runtime::config::DevConfig config;
    config.set_enabled(enabled);
    config.set_default_duration_seconds(10);
    config.set_warmup_seconds(2);
    config.set_toggle_seconds(3);
    dev = std::make_unique<DevSessionManager>(capture, config);
  }

  std::vector<vigil::model::PacketRecord> Markers() {
    return queue->DrainBatch(100, std::chrono::milliseconds(0));
  }
};

void TestManagerEmitsMarkers() {
  Fixture f;
  auto    session = f.dev->Start(kPlayer, "killaura", std::nullopt, 1'000);
  assert(session.settings.duration_seconds == 10);
  assert(session.label == "killaura");
  assert(f.dev->ActiveSessions() == 1);

  auto start = f.Markers();
  assert(start.size() == 1);
  assert(start[0].event_type == "DEV_MARKER");
  assert(start[0].direction == vigil::model::Direction::kDev);
  assert(*start[0].entity_id == kPlayer);
  assert(Field(start[0], "dev_phase") == "start");
  assert(Field(start[0], "dev_state") == "off");
  assert(Field(start[0], "dev_session_id") == session.session_id);

  f.dev->Tick(2'000);
  f.dev->Tick(3'000);
  auto toggled = f.Markers();
  assert(toggled.size() == 1);
  assert(Field(toggled[0], "dev_phase") == "toggle");
  assert(Field(toggled[0], "dev_state") == "clean");

  for (int s = 4; s <= 11; ++s) f.dev->Tick(s * 1'000);
  auto rest = f.Markers();
  assert(!rest.empty());
  assert(Field(rest.back(), "dev_phase") == "stop");
  assert(f.dev->ActiveSessions() == 0);
  assert(!f.dev->Status(kPlayer).has_value());
}

void TestOneSessionPerEntity() {
  Fixture f;
  f.dev->Start(kPlayer, "reach", std::nullopt, 0);

  bool threw = false;
  try {
    f.dev->Start(kPlayer, "reach", std::nullopt, 10);
  } catch (const vigil::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  assert(f.dev->Status(kPlayer)->phase == DevPhase::kWarmup);
  assert(f.dev->Stop(kPlayer, 20));
  assert(!f.dev->Stop(kPlayer, 30));

  auto markers = f.Markers();
  assert(markers.size() == 2);
  assert(Field(markers[1], "dev_phase") == "stop");
}

void TestDisconnectStopsSession() {
  Fixture f;
  f.dev->Start(kPlayer, "fly", DevSessionSettings{30, 0, 5}, 0);
  assert(f.dev->Status(kPlayer)->phase == DevPhase::kActive);

  f.dev->OnDisconnect(kPlayer, 500);
  assert(f.dev->ActiveSessions() == 0);
}

void TestDisabledManagerRejectsStart() {
  Fixture f(false);
  bool    threw = false;
  try {
    f.dev->Start(kPlayer, "x", std::nullopt, 0);
  } catch (const vigil::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(f.queue->Size() == 0);
}

} // namespace

int main() {
  TestStateMachineWarmupThenToggles();
  TestSettingsAreClamped();
  TestManagerEmitsMarkers();
  TestOneSessionPerEntity();
  TestDisconnectStopsSession();
  TestDisabledManagerRejectsStart();
  std::cout << "vigil_dev_session_test: pass\n";
  return 0;
}
