#include "module_registry.hpp"

#include <algorithm>
#include <set>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace vigil::dispatch {

using vigil::observability::IntField;
using vigil::observability::StringField;

namespace {

model::ModuleTier FromProto(vigil::runtime::config::ModuleTier tier) {
  switch (tier) {
    case vigil::runtime::config::MODULE_TIER_ADVANCED:
      return model::ModuleTier::kAdvanced;
    case vigil::runtime::config::MODULE_TIER_CORE:
    case vigil::runtime::config::MODULE_TIER_UNSPECIFIED:
    default:
      return model::ModuleTier::kCore;
  }
}

} // namespace

std::vector<ModuleSpec> SpecsFromConfig(const vigil::runtime::config::RuntimeConfig& config) {
  std::vector<ModuleSpec> out;
  std::set<std::string>   names;

  for (const auto& m : config.modules()) {
    if (m.name().empty()) {
      throw util::InvalidArgument("module config: name must not be empty");
    }
    if (!names.insert(m.name()).second) {
      throw util::InvalidArgument("module config: duplicate module name '" + m.name() + "'");
    }
    if (m.endpoint().empty()) {
      throw util::InvalidArgument("module config: '" + m.name() + "' has no endpoint");
    }

    ModuleSpec spec;
    spec.name     = m.name();
    spec.endpoint = m.endpoint();
    spec.tier     = FromProto(m.tier());
    spec.enabled  = m.has_enabled() ? m.enabled() : true;
    spec.timeout  = std::chrono::milliseconds(m.timeout_ms());
    auto transform = codec::ParseBatchTransform(m.transform());
    if (!transform) {
      throw util::InvalidArgument("module config: '" + m.name() + "' has unknown transform '" + m.transform() + "'");
    }
    spec.transform = *transform;
    for (const auto& name : m.categories()) {
      auto category = model::ParseEventCategory(name);
      if (!category) {
        throw util::InvalidArgument("module config: '" + m.name() + "' has unknown category '" + name + "'");
      }
      spec.categories |= model::MaskOf(*category);
    }
    out.push_back(std::move(spec));
  }
  return out;
}

std::vector<model::ModuleTier> EnabledTiersFromConfig(const vigil::runtime::config::RuntimeConfig& config) {
  std::vector<model::ModuleTier> out;
  for (auto tier : config.dispatch().enabled_tiers()) {
    out.push_back(FromProto(static_cast<vigil::runtime::config::ModuleTier>(tier)));
  }
  return out;
}

HealthPolicy HealthPolicyFromConfig(const vigil::runtime::config::RuntimeConfig& config) {
  HealthPolicy policy;
  if (config.dispatch().failure_threshold() > 0) {
    policy.failure_threshold = config.dispatch().failure_threshold();
  }
  if (config.dispatch().cooldown_ms() > 0) {
    policy.cooldown = std::chrono::milliseconds(config.dispatch().cooldown_ms());
  }
  return policy;
}

ModuleRegistry::ModuleRegistry(std::vector<ModuleSpec> modules, HealthPolicy policy,
                               std::vector<model::ModuleTier> enabled_tiers)
    : policy_(policy), modules_(std::move(modules)), enabled_tiers_(std::move(enabled_tiers)) {
}

void ModuleRegistry::Replace(std::vector<ModuleSpec> modules, std::vector<model::ModuleTier> enabled_tiers) {
  std::lock_guard lock(mutex_);
  modules_       = std::move(modules);
  enabled_tiers_ = std::move(enabled_tiers);

  // drop health of modules that went away
  for (auto it = health_.begin(); it != health_.end();) {
    const bool known =
        std::any_of(modules_.begin(), modules_.end(), [&](const ModuleSpec& m) { return m.name == it->first; });
    it = known ? std::next(it) : health_.erase(it);
  }
}

bool ModuleRegistry::TierEnabledLocked(model::ModuleTier tier) const {
  // empty list enables every tier
  return enabled_tiers_.empty() || std::find(enabled_tiers_.begin(), enabled_tiers_.end(), tier) != enabled_tiers_.end();
}

std::vector<ModuleSpec> ModuleRegistry::Select(model::CategoryMask batch_categories) const {
  std::lock_guard         lock(mutex_);
  std::vector<ModuleSpec> out;
  for (const auto& m : modules_) {
    if (m.enabled && TierEnabledLocked(m.tier) && m.Subscribes(batch_categories)) {
      out.push_back(m);
    }
  }
  return out;
}

std::vector<ModuleSpec> ModuleRegistry::Modules() const {
  std::lock_guard lock(mutex_);
  return modules_;
}

std::optional<ModuleSpec> ModuleRegistry::Find(const std::string& name) const {
  std::lock_guard lock(mutex_);
  for (const auto& m : modules_) {
    if (m.name == name) return m;
  }
  return std::nullopt;
}

bool ModuleRegistry::AllowDispatch(const std::string& module, util::SteadyTimePoint now) {
  std::lock_guard lock(mutex_);
  auto            it = health_.find(module);
  if (it == health_.end() || !it->second.open) {
    return true;
  }
  auto& h = it->second;
  if (now < h.open_until || h.trial_in_flight) {
    return false;
  }
  h.trial_in_flight = true;
  return true;
}

void ModuleRegistry::ReleaseTrial(const std::string& module) {
  std::lock_guard lock(mutex_);
  auto            it = health_.find(module);
  if (it != health_.end()) {
    it->second.trial_in_flight = false;
  }
}

void ModuleRegistry::RecordSuccess(const std::string& module) {
  std::lock_guard lock(mutex_);
  auto&           h = health_[module];
  if (h.open) {
    VIGIL_LOG_INFO("module circuit closed", {StringField("module", module)});
  }
  h.consecutive_failures = 0;
  h.open                 = false;
  h.trial_in_flight      = false;
  ++h.total_successes;
}

void ModuleRegistry::RecordFailure(const std::string& module, util::SteadyTimePoint now) {
  std::lock_guard lock(mutex_);
  auto&           h = health_[module];
  ++h.consecutive_failures;
  ++h.total_failures;
  h.trial_in_flight = false;
  if (h.consecutive_failures >= policy_.failure_threshold) {
    h.open       = true;
    h.open_until = now + policy_.cooldown;
    VIGIL_LOG_WARN("module circuit open",
                   {StringField("module", module), IntField("consecutive_failures", h.consecutive_failures),
                    IntField("cooldown_ms", policy_.cooldown.count())});
  }
}

ModuleHealth ModuleRegistry::Health(const std::string& module) const {
  std::lock_guard lock(mutex_);
  auto            it = health_.find(module);
  return it == health_.end() ? ModuleHealth{} : it->second;
}

} // namespace vigil::dispatch
