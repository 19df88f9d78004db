#include "time.hpp"

namespace debugpod::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
  return ms < 0 ? 0 : static_cast<uint64_t>(ms);
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(ms));
}

std::chrono::seconds AgeOf(TimePoint since) {
  const auto now = Now();
  if (since >= now) {
    return std::chrono::seconds(0);
  }
  return std::chrono::duration_cast<std::chrono::seconds>(now - since);
}

} // namespace debugpod::util
