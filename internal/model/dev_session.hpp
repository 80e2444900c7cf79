#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace vigil::model {

/*
  Labelled recording session used to tag traffic for detector tuning.

      idle -> warmup -> active(clean <-> cheat) -> stopped

  Time advances in whole seconds through Tick(). The session object is
  discarded by its owner once it reaches kStopped.
*/

enum class DevPhase : std::uint8_t {
  kIdle    = 0,
  kWarmup  = 1,
  kActive  = 2,
  kStopped = 3,
};

enum class DevLabel : std::uint8_t {
  kClean = 0,
  kCheat = 1,
};

enum class DevTransition : std::uint8_t {
  kNone = 0,
  kStarted,
  kToggled,
  kFinished,
};

constexpr std::string_view ToString(DevPhase phase) {
  switch (phase) {
    case DevPhase::kWarmup:
      return "warmup";
    case DevPhase::kActive:
      return "active";
    case DevPhase::kStopped:
      return "stopped";
    case DevPhase::kIdle:
    default:
      return "idle";
  }
}

constexpr std::string_view ToString(DevLabel label) {
  return label == DevLabel::kCheat ? "cheat" : "clean";
}

struct DevSessionSettings {
  int32_t duration_seconds = 60;
  int32_t warmup_seconds   = 3;
  int32_t toggle_seconds   = 10;

  static constexpr int32_t kMinDurationSeconds = 5;
  static constexpr int32_t kMinToggleSeconds   = 2;

  DevSessionSettings Clamped() const {
    DevSessionSettings s = *this;
    if (s.duration_seconds < kMinDurationSeconds) s.duration_seconds = kMinDurationSeconds;
    if (s.warmup_seconds < 0) s.warmup_seconds = 0;
    if (s.toggle_seconds < kMinToggleSeconds) s.toggle_seconds = kMinToggleSeconds;
    return s;
  }
};

struct DevSession {
  std::string        session_id;
  std::string        entity_id;
  std::string        label;
  DevSessionSettings settings;
  DevPhase           phase           = DevPhase::kIdle;
  DevLabel           active_label    = DevLabel::kClean;
  int64_t            elapsed_seconds = 0;
  int32_t            cycle_index     = 0;
  int64_t            started_at_ms   = 0;

  // "off" outside the active phase
  std::string_view StateName() const {
    return phase == DevPhase::kActive ? ToString(active_label) : std::string_view{"off"};
  }

  // idle -> warmup, or straight to active when there is no warmup.
  DevTransition Begin() {
    if (phase != DevPhase::kIdle) return DevTransition::kNone;
    settings = settings.Clamped();
    phase    = settings.warmup_seconds == 0 ? DevPhase::kActive : DevPhase::kWarmup;
    return DevTransition::kStarted;
  }

  // Advances one second.
  DevTransition Tick() {
    if (phase != DevPhase::kWarmup && phase != DevPhase::kActive) return DevTransition::kNone;

    ++elapsed_seconds;
    if (elapsed_seconds >= settings.duration_seconds) {
      phase = DevPhase::kStopped;
      return DevTransition::kFinished;
    }

    if (phase == DevPhase::kWarmup) {
      if (elapsed_seconds >= settings.warmup_seconds) {
        phase        = DevPhase::kActive;
        active_label = DevLabel::kClean;
        return DevTransition::kToggled;
      }
      return DevTransition::kNone;
    }

    const auto active_for = elapsed_seconds - settings.warmup_seconds;
    if (active_for > 0 && active_for % settings.toggle_seconds == 0) {
      active_label = active_label == DevLabel::kClean ? DevLabel::kCheat : DevLabel::kClean;
      ++cycle_index;
      return DevTransition::kToggled;
    }
    return DevTransition::kNone;
  }

  DevTransition Stop() {
    if (phase == DevPhase::kStopped) return DevTransition::kNone;
    phase = DevPhase::kStopped;
    return DevTransition::kFinished;
  }
};

}  // namespace vigil::model
