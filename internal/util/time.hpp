#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace ure::util {

/*
  Time utilities. Wall clock for persisted timestamps.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

uint64_t NowMs();

// RFC 3339 UTC with millisecond precision, e.g. 2024-03-01T10:15:30.123Z
std::string FormatRfc3339(uint64_t unix_ms);

} // namespace ure::util
