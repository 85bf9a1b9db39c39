#pragma once

#include <chrono>
#include <string>

namespace warehouse::util {

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

// Local time, microsecond precision, e.g. 2024-03-01T09:15:02.123456
std::string ToIsoString(TimePoint tp);

} // namespace warehouse::util
