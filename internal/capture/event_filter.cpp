#include "event_filter.hpp"

#include "internal/model/event_category.hpp"
#include "internal/util/strings.hpp"

namespace vigil::capture {

namespace {

std::vector<std::string> Normalize(std::vector<std::string> names) {
  std::vector<std::string> out;
  out.reserve(names.size());
  for (auto& name : names) {
    auto trimmed = util::Trim(name);
    if (!trimmed.empty()) {
      out.emplace_back(trimmed);
    }
  }
  return out;
}

} // namespace

EventFilter::EventFilter(std::vector<std::string> enabled, std::vector<std::string> disabled)
    : enabled_(Normalize(std::move(enabled))), disabled_(Normalize(std::move(disabled))) {
}

std::shared_ptr<const EventFilter> EventFilter::FromConfig(const vigil::runtime::config::CaptureConfig& config) {
  std::vector<std::string> enabled(config.enabled_packets().begin(), config.enabled_packets().end());
  std::vector<std::string> disabled(config.disabled_packets().begin(), config.disabled_packets().end());
  return std::make_shared<const EventFilter>(std::move(enabled), std::move(disabled));
}

bool EventFilter::Contains(const std::vector<std::string>& names, std::string_view name) {
  for (const auto& candidate : names) {
    if (util::EqualsIgnoreCase(candidate, name)) {
      return true;
    }
  }
  return false;
}

bool EventFilter::ShouldCapture(std::string_view event_type) const {
  const auto name = util::Trim(event_type);
  if (name.empty()) {
    return false;
  }

  if (Contains(disabled_, name)) {
    return false;
  }

  if (!enabled_.empty()) {
    return Contains(enabled_, name);
  }

  return model::CategorizeEventType(name) != model::EventCategory::kOther;
}

} // namespace vigil::capture
