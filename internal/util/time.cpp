#include "time.hpp"

#include <cmath>

namespace tending::util {

TimePoint Now() {
  return Clock::now();
}

int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

int64_t NowMillis() {
  return ToUnixMillis(Now());
}

MillisClock SystemMillisClock() {
  return [] { return NowMillis(); };
}

std::optional<int64_t> MillisFromJsonNumber(double value) {
  if (!std::isfinite(value) || std::trunc(value) != value) {
    return std::nullopt;
  }
  if (std::fabs(value) > static_cast<double>(kMaxJsonMillis)) {
    return std::nullopt;
  }
  return static_cast<int64_t>(value);
}

} // namespace tending::util
