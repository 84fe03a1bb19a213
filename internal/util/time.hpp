#pragma once

#include <chrono>
#include <cstdint>

namespace actions::util {

/*
  Time utilities, the single place that picks the clock source.

  Trigger times are wall-clock instants (they survive restarts in the
  store), so everything here is system_clock based.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

int64_t ToUnixMillis(TimePoint tp);
// Throws InvalidArgument when `ms` is outside the clock's range.
TimePoint FromUnixMillis(int64_t ms);

// Truncates to the millisecond precision the store keeps.
TimePoint TruncateToMillis(TimePoint tp);

} // namespace actions::util
