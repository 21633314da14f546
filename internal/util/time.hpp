#pragma once

#include <chrono>
#include <cstdint>

namespace catalog::util {

/*
  Time utilities, single place to control clock source later.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);

double MillisSince(std::chrono::steady_clock::time_point started_at);

} // namespace catalog::util
