#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace otto::common {

/// Milliseconds since the Unix epoch. Every component takes one of these so tests can
/// pin time.
using Clock = std::function<std::int64_t()>;

[[nodiscard]] std::int64_t system_now_ms();
[[nodiscard]] Clock system_clock();

/// UTC timestamp in ISO-8601 with millisecond precision, e.g. 2026-01-05T09:30:00.000Z.
[[nodiscard]] std::string format_iso8601(std::int64_t epoch_ms);

} // namespace otto::common
