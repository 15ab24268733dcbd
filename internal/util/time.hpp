#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace shipx::util {

/*
  Time utilities. Everything date-related reads the clock through Now().
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

// Local calendar date of `tp` as YYYY-MM-DD.
std::string FormatDate(TimePoint tp);

// Courier collection date: the local calendar day after `tp`.
std::string NextDay(TimePoint tp);

} // namespace shipx::util
