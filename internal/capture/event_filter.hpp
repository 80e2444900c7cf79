#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "config/config.pb.h"

namespace vigil::capture {

/*
  Allow/deny decision per event-type name.

  Policy, in order:
    1. disabled list always wins
    2. a non-empty enabled list is authoritative (exact match)
    3. otherwise the default category table decides

  Names are compared trimmed and case-insensitively. The filter is
  immutable once built; CaptureService swaps whole snapshots on reload.
*/

class EventFilter {
 public:
  EventFilter(std::vector<std::string> enabled, std::vector<std::string> disabled);

  static std::shared_ptr<const EventFilter> FromConfig(const vigil::runtime::config::CaptureConfig& config);

  // Never allocates.
  bool ShouldCapture(std::string_view event_type) const;

  bool UsesDefaultAllowList() const {
    return enabled_.empty();
  }

 private:
  static bool Contains(const std::vector<std::string>& names, std::string_view name);

  std::vector<std::string> enabled_;
  std::vector<std::string> disabled_;
};

} // namespace vigil::capture
