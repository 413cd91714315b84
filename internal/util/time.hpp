#pragma once

#include <chrono>
#include <string>

namespace deploy::util {

/*
  Time utilities — single place to control clock source later.

  All formatted timestamps are UTC and fixed width, so lexicographic
  order equals chronological order.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

// 2025-03-21T16:25:04.123456Z
std::string ToIso8601(TimePoint tp);

// 20250321_162504 (backup artifact names)
std::string ToCompactStamp(TimePoint tp);

// 20250321162504123456 (archive tags)
std::string ToMicrosStamp(TimePoint tp);

} // namespace deploy::util
