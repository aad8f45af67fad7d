#pragma once

#include <chrono>
#include <cstdint>

namespace imgvar::util {

// Wall clock. Record timestamps are unix milliseconds; generated file
// names carry unix seconds.

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);
int64_t  ToUnixSeconds(TimePoint tp);

} // namespace imgvar::util
