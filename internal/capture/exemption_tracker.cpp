#include "exemption_tracker.hpp"

#include <algorithm>
#include <mutex>

#include "internal/util/strings.hpp"

namespace vigil::capture {

namespace {

constexpr std::array<std::string_view, kExemptionReasonCount> kReasonNames = {
    "just_joined", "world_change", "bedrock_client", "spectator", "creative",   "dead",       "sleeping",     "vehicle",
    "flying",      "elytra",       "respawn",        "teleport",  "velocity",   "flight_cooldown", "levitation", "slow_falling",
};

} // namespace

std::string_view ToString(ExemptionReason reason) {
  const auto index = static_cast<std::size_t>(reason);
  return index < kReasonNames.size() ? kReasonNames[index] : "unknown";
}

std::optional<ExemptionReason> ParseExemptionReason(std::string_view name) {
  const auto trimmed = util::Trim(name);
  for (std::size_t i = 0; i < kExemptionReasonCount; ++i) {
    const auto reason = static_cast<ExemptionReason>(i);
    if (util::EqualsIgnoreCase(ToString(reason), trimmed)) {
      return reason;
    }
  }
  return std::nullopt;
}

ExemptionPolicy ExemptionPolicy::FromConfig(const vigil::runtime::config::ExemptionConfig& config) {
  ExemptionPolicy policy;
  if (config.join_grace_ms() > 0) policy.join_grace_ms = config.join_grace_ms();
  if (config.transfer_grace_ms() > 0) policy.transfer_grace_ms = config.transfer_grace_ms();
  if (config.has_client_category_exempt()) policy.client_category_exempt = config.client_category_exempt();
  if (config.exempt_name_prefixes_size() > 0) {
    policy.exempt_name_prefixes.assign(config.exempt_name_prefixes().begin(), config.exempt_name_prefixes().end());
  }
  if (config.exempt_id_prefixes_size() > 0) {
    policy.exempt_id_prefixes.assign(config.exempt_id_prefixes().begin(), config.exempt_id_prefixes().end());
  }
  if (config.entity_ttl_ms() > 0) policy.entity_ttl_ms = config.entity_ttl_ms();
  return policy;
}

bool ExemptionPolicy::MatchesClientCategory(std::string_view entity_id, std::optional<std::string_view> entity_name) const {
  for (const auto& prefix : exempt_id_prefixes) {
    if (!prefix.empty() && util::StartsWithIgnoreCase(entity_id, prefix)) {
      return true;
    }
  }
  if (entity_name) {
    for (const auto& prefix : exempt_name_prefixes) {
      if (!prefix.empty() && entity_name->substr(0, prefix.size()) == prefix) {
        return true;
      }
    }
  }
  return false;
}

ExemptionTracker::ExemptionTracker(ExemptionPolicy policy)
    : policy_(std::make_shared<const ExemptionPolicy>(std::move(policy))) {
}

void ExemptionTracker::UpdatePolicy(ExemptionPolicy policy) {
  policy_.store(std::make_shared<const ExemptionPolicy>(std::move(policy)), std::memory_order_release);
}

ExemptionTracker::EntityState& ExemptionTracker::Touch(std::string_view entity_id, int64_t now_ms) {
  auto it = entities_.find(entity_id);
  if (it == entities_.end()) {
    it = entities_.emplace(std::string(entity_id), EntityState{}).first;
  }
  it->second.last_activity_ms = std::max(it->second.last_activity_ms, now_ms);
  return it->second;
}

void ExemptionTracker::OnConnect(std::string_view entity_id, std::optional<std::string_view> entity_name, int64_t now_ms) {
  const auto policy = Policy();

  std::unique_lock lock(mutex_);
  auto&            state = Touch(entity_id, now_ms);
  state.joined_at_ms     = now_ms;
  state.client_category  = policy->MatchesClientCategory(entity_id, entity_name);
}

void ExemptionTracker::OnTransfer(std::string_view entity_id, int64_t now_ms) {
  std::unique_lock lock(mutex_);
  Touch(entity_id, now_ms).transferred_at_ms = now_ms;
}

void ExemptionTracker::OnDisconnect(std::string_view entity_id) {
  std::unique_lock lock(mutex_);
  auto             it = entities_.find(entity_id);
  if (it != entities_.end()) {
    entities_.erase(it);
  }
}

void ExemptionTracker::Exempt(std::string_view entity_id, ExemptionReason reason, int64_t duration_ms, int64_t now_ms) {
  if (duration_ms <= 0) {
    return;
  }
  std::unique_lock lock(mutex_);
  auto&            until = Touch(entity_id, now_ms).exempt_until_ms[static_cast<std::size_t>(reason)];
  until                  = std::max(until, now_ms + duration_ms);
}

template <typename Fn>
void ExemptionTracker::ForEachActive(const EntityState* state, const ExemptionPolicy& policy, std::string_view entity_id,
                                     int64_t now_ms, Fn&& fn) {
  if (policy.client_category_exempt) {
    const bool client_category = state ? state->client_category : policy.MatchesClientCategory(entity_id, std::nullopt);
    if (client_category && !fn(ExemptionReason::kBedrockClient)) return;
  }

  if (!state) {
    return;
  }

  if (InWindow(state->joined_at_ms, policy.join_grace_ms, now_ms) && !fn(ExemptionReason::kJustJoined)) return;
  if (InWindow(state->transferred_at_ms, policy.transfer_grace_ms, now_ms) && !fn(ExemptionReason::kWorldChange)) return;

  for (std::size_t i = 0; i < kExemptionReasonCount; ++i) {
    if (state->exempt_until_ms[i] > now_ms && !fn(static_cast<ExemptionReason>(i))) return;
  }
}

bool ExemptionTracker::IsExempt(std::string_view entity_id, int64_t now_ms) const {
  const auto policy = Policy();

  std::shared_lock   lock(mutex_);
  auto               it     = entities_.find(entity_id);
  const EntityState* state  = it == entities_.end() ? nullptr : &it->second;
  bool               exempt = false;
  ForEachActive(state, *policy, entity_id, now_ms, [&exempt](ExemptionReason) {
    exempt = true;
    return false;
  });
  return exempt;
}

std::vector<ExemptionReason> ExemptionTracker::ActiveReasons(std::string_view entity_id, int64_t now_ms) const {
  const auto policy = Policy();

  std::shared_lock             lock(mutex_);
  auto                         it    = entities_.find(entity_id);
  const EntityState*           state = it == entities_.end() ? nullptr : &it->second;
  std::vector<ExemptionReason> reasons;
  ForEachActive(state, *policy, entity_id, now_ms, [&reasons](ExemptionReason reason) {
    if (std::find(reasons.begin(), reasons.end(), reason) == reasons.end()) {
      reasons.push_back(reason);
    }
    return true;
  });
  return reasons;
}

std::size_t ExemptionTracker::Sweep(int64_t now_ms) {
  const auto policy = Policy();

  std::unique_lock lock(mutex_);
  std::size_t      removed = 0;
  for (auto it = entities_.begin(); it != entities_.end();) {
    const auto& state = it->second;
    // client category is only known from the connect event; it lives until disconnect
    bool active = state.client_category || InWindow(state.joined_at_ms, policy->join_grace_ms, now_ms) ||
                  InWindow(state.transferred_at_ms, policy->transfer_grace_ms, now_ms);
    for (auto until : state.exempt_until_ms) {
      active = active || until > now_ms;
    }

    if (!active && now_ms - state.last_activity_ms >= policy->entity_ttl_ms) {
      it = entities_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

std::size_t ExemptionTracker::TrackedEntities() const {
  std::shared_lock lock(mutex_);
  return entities_.size();
}

} // namespace vigil::capture
