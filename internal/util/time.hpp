#pragma once

#include <chrono>
#include <cstdint>

namespace vigil::util {

/*
  Wall and steady clock helpers.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

using SteadyClock     = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;

TimePoint Now();
SteadyTimePoint SteadyNow();

int64_t   ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(int64_t ms);

int64_t NowUnixMillis();

} // namespace vigil::util
