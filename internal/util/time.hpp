#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>

namespace tending::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Source of "now" in unix milliseconds. Injected where tests need
// deterministic timestamps.
using MillisClock = std::function<int64_t()>;

TimePoint Now();

int64_t ToUnixMillis(TimePoint tp);

int64_t NowMillis();

MillisClock SystemMillisClock();

// Largest magnitude a JSON number carries without losing integer precision.
constexpr int64_t kMaxJsonMillis = (int64_t{1} << 53) - 1;

// Converts a JSON number to unix milliseconds. nullopt unless the value is
// a whole number within +/- kMaxJsonMillis.
std::optional<int64_t> MillisFromJsonNumber(double value);

} // namespace tending::util
