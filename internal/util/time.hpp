#pragma once

#include <chrono>
#include <cstdint>

namespace accessres::util {

/*
  Wall clock helpers.

  Frame timestamps are unsigned epoch milliseconds.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

std::uint64_t NowMillis();

std::uint64_t ToUnixMillis(TimePoint tp);

} // namespace accessres::util
