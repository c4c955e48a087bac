#pragma once

#include <chrono>
#include <cstdint>

namespace vigil::util {

/*
  Time utilities: single place to control the clock source.

  Persisted timestamps are microseconds since the Unix epoch.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

std::int64_t ToUnixMicros(TimePoint tp);
TimePoint    FromUnixMicros(std::int64_t micros);

uint64_t ToUnixMillis(TimePoint tp);

} // namespace vigil::util
