#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/codec/batch_transform.hpp"
#include "internal/model/event_category.hpp"
#include "internal/model/tier.hpp"
#include "internal/util/time.hpp"

namespace vigil::runtime::config {
class RuntimeConfig;
}

namespace vigil::dispatch {

struct ModuleSpec {
  std::string       name;
  std::string       endpoint;
  model::ModuleTier tier = model::ModuleTier::kCore;
  // 0 subscribes to every category
  model::CategoryMask       categories = 0;
  bool                      enabled    = true;
  std::chrono::milliseconds timeout{0};
  // payload view the module receives
  codec::BatchTransform transform = codec::BatchTransform::kRaw;

  bool Subscribes(model::CategoryMask batch) const {
    return categories == 0 || (categories & batch) != 0;
  }
};

struct ModuleHealth {
  uint32_t               consecutive_failures = 0;
  uint64_t               total_failures       = 0;
  uint64_t               total_successes      = 0;
  util::SteadyTimePoint  open_until{};
  bool                   open = false;
  // a half-open trial call is outstanding
  bool                   trial_in_flight = false;
};

struct HealthPolicy {
  uint32_t                  failure_threshold = 3;
  std::chrono::milliseconds cooldown{30000};
};

// Throws util::InvalidArgument on duplicate names, unknown categories or
// unknown transforms.
std::vector<ModuleSpec> SpecsFromConfig(const vigil::runtime::config::RuntimeConfig& config);

std::vector<model::ModuleTier> EnabledTiersFromConfig(const vigil::runtime::config::RuntimeConfig& config);

HealthPolicy HealthPolicyFromConfig(const vigil::runtime::config::RuntimeConfig& config);

/*
  Registered detection modules and their circuit state.

  After failure_threshold consecutive failures a module is skipped until
  the cooldown expires. After that exactly one trial call is let through;
  others are skipped until it completes. A failed trial reopens the circuit
  immediately. Health survives Replace() for modules that keep their name.
*/
class ModuleRegistry {
 public:
  ModuleRegistry(std::vector<ModuleSpec> modules, HealthPolicy policy,
                 std::vector<model::ModuleTier> enabled_tiers = {});

  void Replace(std::vector<ModuleSpec> modules, std::vector<model::ModuleTier> enabled_tiers);

  // Enabled modules in an enabled tier whose subscription overlaps the batch.
  std::vector<ModuleSpec> Select(model::CategoryMask batch_categories) const;

  std::vector<ModuleSpec>   Modules() const;
  std::optional<ModuleSpec> Find(const std::string& name) const;

  // Claims the trial slot when the cooldown has passed; a caller that gets
  // true must report RecordSuccess, RecordFailure or ReleaseTrial.
  bool AllowDispatch(const std::string& module, util::SteadyTimePoint now);
  // The claimed call never reached the module.
  void ReleaseTrial(const std::string& module);
  void RecordSuccess(const std::string& module);
  void RecordFailure(const std::string& module, util::SteadyTimePoint now);

  ModuleHealth Health(const std::string& module) const;

 private:
  bool TierEnabledLocked(model::ModuleTier tier) const;

  const HealthPolicy                   policy_;
  mutable std::mutex                   mutex_;
  std::vector<ModuleSpec>              modules_;
  std::vector<model::ModuleTier>       enabled_tiers_;
  std::map<std::string, ModuleHealth>  health_;
};

} // namespace vigil::dispatch
