#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "config/config.pb.h"

namespace vigil::capture {

enum class ExemptionReason : std::uint8_t {
  kJustJoined = 0,
  kWorldChange,
  kBedrockClient,
  kSpectator,
  kCreative,
  kDead,
  kSleeping,
  kVehicle,
  kFlying,
  kElytra,
  kRespawn,
  kTeleport,
  kVelocity,
  kFlightCooldown,
  kLevitation,
  kSlowFalling,
};

inline constexpr std::size_t kExemptionReasonCount = 16;

std::string_view ToString(ExemptionReason reason);

std::optional<ExemptionReason> ParseExemptionReason(std::string_view name);

struct ExemptionPolicy {
  int64_t                  join_grace_ms          = 2500;
  int64_t                  transfer_grace_ms      = 500;
  bool                     client_category_exempt = true;
  std::vector<std::string> exempt_name_prefixes{"."};
  std::vector<std::string> exempt_id_prefixes{"00000000-0000-0000"};
  int64_t                  entity_ttl_ms = 10 * 60 * 1000;

  static ExemptionPolicy FromConfig(const vigil::runtime::config::ExemptionConfig& config);

  bool MatchesClientCategory(std::string_view entity_id, std::optional<std::string_view> entity_name) const;
};

/*
  Per-entity suppression windows.

  Entity state lives in an arena keyed by entity id. IsExempt() is on the
  capture hot path: shared lock, heterogeneous lookup, no allocation.
  The policy is an immutable snapshot swapped atomically by UpdatePolicy().
*/

class ExemptionTracker {
 public:
  explicit ExemptionTracker(ExemptionPolicy policy = {});

  void UpdatePolicy(ExemptionPolicy policy);

  std::shared_ptr<const ExemptionPolicy> Policy() const {
    return policy_.load(std::memory_order_acquire);
  }

  void OnConnect(std::string_view entity_id, std::optional<std::string_view> entity_name, int64_t now_ms);
  void OnTransfer(std::string_view entity_id, int64_t now_ms);
  void OnDisconnect(std::string_view entity_id);

  // Timed exemption for any reason; extends an existing window, never shortens it.
  void Exempt(std::string_view entity_id, ExemptionReason reason, int64_t duration_ms, int64_t now_ms);

  bool IsExempt(std::string_view entity_id, int64_t now_ms) const;

  std::vector<ExemptionReason> ActiveReasons(std::string_view entity_id, int64_t now_ms) const;

  // Returns the number of entities removed.
  std::size_t Sweep(int64_t now_ms);

  std::size_t TrackedEntities() const;

 private:
  struct EntityState {
    int64_t joined_at_ms      = -1;
    int64_t transferred_at_ms = -1;
    bool    client_category   = false;
    int64_t last_activity_ms  = 0;
    // absolute expiry per reason; 0 means no window
    std::array<int64_t, kExemptionReasonCount> exempt_until_ms{};
  };

  struct StringHash {
    using is_transparent = void;
    std::size_t operator()(std::string_view value) const {
      return std::hash<std::string_view>{}(value);
    }
  };

  using Arena = std::unordered_map<std::string, EntityState, StringHash, std::equal_to<>>;

  EntityState& Touch(std::string_view entity_id, int64_t now_ms);

  static bool InWindow(int64_t started_at_ms, int64_t grace_ms, int64_t now_ms) {
    return started_at_ms >= 0 && grace_ms > 0 && now_ms - started_at_ms < grace_ms;
  }

  template <typename Fn>
  static void ForEachActive(const EntityState* state, const ExemptionPolicy& policy, std::string_view entity_id,
                            int64_t now_ms, Fn&& fn);

  mutable std::shared_mutex                           mutex_;
  Arena                                               entities_;
  std::atomic<std::shared_ptr<const ExemptionPolicy>> policy_;
};

} // namespace vigil::capture
