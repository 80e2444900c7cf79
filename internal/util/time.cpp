#include "time.hpp"

namespace vigil::util {

TimePoint Now() {
  return Clock::now();
}

SteadyTimePoint SteadyNow() {
  return SteadyClock::now();
}

int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(int64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

int64_t NowUnixMillis() {
  return ToUnixMillis(Now());
}

} // namespace vigil::util
