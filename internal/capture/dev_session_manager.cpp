#include "dev_session_manager.hpp"

#include <vector>

#include "internal/capture/capture_service.hpp"
#include "internal/model/packet_record.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace vigil::capture {

DevSessionManager::DevSessionManager(std::shared_ptr<CaptureService> capture, const vigil::runtime::config::DevConfig& config)
    : capture_(std::move(capture)), enabled_(config.enabled()) {
  if (config.default_duration_seconds() > 0) defaults_.duration_seconds = static_cast<int32_t>(config.default_duration_seconds());
  if (config.warmup_seconds() > 0) defaults_.warmup_seconds = static_cast<int32_t>(config.warmup_seconds());
  if (config.toggle_seconds() > 0) defaults_.toggle_seconds = static_cast<int32_t>(config.toggle_seconds());
}

model::DevSession DevSessionManager::Start(const std::string& entity_id, const std::string& label,
                                           std::optional<model::DevSessionSettings> settings, int64_t now_ms) {
  if (!enabled_) {
    throw util::InvalidState("dev sessions are disabled");
  }
  if (entity_id.empty()) {
    throw util::InvalidArgument("dev session requires an entity id");
  }

  std::lock_guard lock(mutex_);
  if (sessions_.contains(entity_id)) {
    throw util::InvalidState("dev session already running for " + entity_id);
  }

  model::DevSession session;
  session.session_id    = util::GenerateUUIDString();
  session.entity_id     = entity_id;
  session.label         = label.empty() ? "unlabelled" : label;
  session.settings      = settings.value_or(defaults_);
  session.started_at_ms = now_ms;
  session.Begin();

  EmitMarker(session, "start", now_ms);
  VIGIL_LOG_INFO("Dev session started", {observability::StringField("entity_id", entity_id),
                                         observability::StringField("session_id", session.session_id),
                                         observability::StringField("label", session.label)});

  auto [it, _] = sessions_.emplace(entity_id, std::move(session));
  return it->second;
}

bool DevSessionManager::Stop(std::string_view entity_id, int64_t now_ms) {
  std::lock_guard lock(mutex_);
  auto            it = sessions_.find(std::string(entity_id));
  if (it == sessions_.end()) {
    return false;
  }
  it->second.Stop();
  EmitMarker(it->second, "stop", now_ms);
  VIGIL_LOG_INFO("Dev session stopped", {observability::StringField("session_id", it->second.session_id),
                                         observability::IntField("elapsed_seconds", it->second.elapsed_seconds)});
  sessions_.erase(it);
  return true;
}

void DevSessionManager::Tick(int64_t now_ms) {
  std::lock_guard lock(mutex_);
  for (auto it = sessions_.begin(); it != sessions_.end();) {
    auto&      session    = it->second;
    const auto transition = session.Tick();
    if (transition == model::DevTransition::kToggled) {
      EmitMarker(session, "toggle", now_ms);
    } else if (transition == model::DevTransition::kFinished) {
      EmitMarker(session, "stop", now_ms);
      VIGIL_LOG_INFO("Dev session finished", {observability::StringField("session_id", session.session_id),
                                              observability::IntField("cycles", session.cycle_index)});
      it = sessions_.erase(it);
      continue;
    }
    ++it;
  }
}

void DevSessionManager::OnDisconnect(std::string_view entity_id, int64_t now_ms) {
  Stop(entity_id, now_ms);
}

std::optional<model::DevSession> DevSessionManager::Status(std::string_view entity_id) const {
  std::lock_guard lock(mutex_);
  auto            it = sessions_.find(std::string(entity_id));
  if (it == sessions_.end()) return std::nullopt;
  return it->second;
}

std::size_t DevSessionManager::ActiveSessions() const {
  std::lock_guard lock(mutex_);
  return sessions_.size();
}

void DevSessionManager::EmitMarker(const model::DevSession& session, std::string_view phase, int64_t now_ms) {
  model::PacketRecord marker;
  marker.timestamp_ms = now_ms;
  marker.direction    = model::Direction::kDev;
  marker.event_type   = std::string(model::kDevMarkerEventType);
  marker.entity_id    = session.entity_id;

  marker.fields.emplace("dev_session_id", session.session_id);
  marker.fields.emplace("dev_label", session.label);
  marker.fields.emplace("dev_phase", std::string(phase));
  marker.fields.emplace("dev_state", std::string(session.StateName()));
  marker.fields.emplace("dev_cycle", static_cast<double>(session.cycle_index));

  const auto outcome = capture_->Capture(std::move(marker));
  if (outcome != CaptureOutcome::kEnqueued) {
    VIGIL_LOG_WARN("Dev marker not captured", {observability::StringField("session_id", session.session_id),
                                               observability::StringField("outcome", ToString(outcome))});
  }
}

} // namespace vigil::capture
