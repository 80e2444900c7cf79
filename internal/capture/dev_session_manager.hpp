#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "config/config.pb.h"
#include "internal/model/dev_session.hpp"

namespace vigil::capture {

class CaptureService;

/*
  Owns labelled recording sessions, at most one per entity.

  Every transition injects a DEV_MARKER record into capture so the
  backend sees where clean and cheat segments begin:

      dev_session_id, dev_label, dev_phase (start|toggle|stop),
      dev_state (clean|cheat|off), dev_cycle

  Tick() is driven once per second by the owner.
*/
class DevSessionManager {
 public:
  DevSessionManager(std::shared_ptr<CaptureService> capture, const vigil::runtime::config::DevConfig& config);

  // Throws util::InvalidState when disabled or a session is already running for the entity.
  model::DevSession Start(const std::string& entity_id, const std::string& label, std::optional<model::DevSessionSettings> settings,
                          int64_t now_ms);

  // false when the entity has no session
  bool Stop(std::string_view entity_id, int64_t now_ms);

  void Tick(int64_t now_ms);

  void OnDisconnect(std::string_view entity_id, int64_t now_ms);

  std::optional<model::DevSession> Status(std::string_view entity_id) const;

  std::size_t ActiveSessions() const;

  const model::DevSessionSettings& Defaults() const {
    return defaults_;
  }

 private:
  void EmitMarker(const model::DevSession& session, std::string_view phase, int64_t now_ms);

  std::shared_ptr<CaptureService> capture_;
  bool                            enabled_;
  model::DevSessionSettings       defaults_;

  mutable std::mutex                                 mutex_;
  std::unordered_map<std::string, model::DevSession> sessions_;
};

} // namespace vigil::capture
