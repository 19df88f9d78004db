#pragma once

#include <chrono>
#include <cstdint>

namespace debugpod::util {

/*
  Wall-clock helpers. Instance timestamps are persisted as unix
  milliseconds and compared against the system clock.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// Zero when since lies in the future (clock stepped back).
std::chrono::seconds AgeOf(TimePoint since);

} // namespace debugpod::util
