#pragma once

#include <chrono>
#include <cstdint>

namespace ragturn::util {

/*
  Time utilities — single place to control clock source later.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

int64_t ToUnixMillis(TimePoint tp);
int64_t NowMillis();

// Elapsed wall time since a steady_clock start point, in milliseconds.
double MillisSince(std::chrono::steady_clock::time_point started_at);

} // namespace ragturn::util
