#include "otto/common/clock.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>

namespace otto::common {

std::int64_t system_now_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

Clock system_clock() { return [] { return system_now_ms(); }; }

std::string format_iso8601(const std::int64_t epoch_ms) {
  std::int64_t seconds = epoch_ms / 1000;
  std::int64_t millis = epoch_ms % 1000;
  if (millis < 0) {
    millis += 1000;
    --seconds;
  }
  const auto as_time = static_cast<std::time_t>(seconds);
  std::tm tm{};
  gmtime_r(&as_time, &tm);
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", tm.tm_year + 1900,
                tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
                static_cast<int>(millis));
  return buffer;
}

} // namespace otto::common
