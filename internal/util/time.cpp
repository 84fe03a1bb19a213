#include "time.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace actions::util {

namespace {

// system_clock counts nanoseconds on common platforms; not every int64 ms value fits.
constexpr int64_t kMaxUnixMillis = std::chrono::duration_cast<std::chrono::milliseconds>(TimePoint::duration::max()).count();
constexpr int64_t kMinUnixMillis = std::chrono::duration_cast<std::chrono::milliseconds>(TimePoint::duration::min()).count();

} // namespace

TimePoint Now() {
  return Clock::now();
}

int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(int64_t ms) {
  if (ms > kMaxUnixMillis || ms < kMinUnixMillis) {
    throw InvalidArgument("unix millis out of clock range: " + std::to_string(ms));
  }
  return TimePoint{} + std::chrono::milliseconds(ms);
}

TimePoint TruncateToMillis(TimePoint tp) {
  return std::chrono::time_point_cast<std::chrono::milliseconds>(tp);
}

} // namespace actions::util
