#pragma once

#include "otto/common/result.hpp"

#include <cstdint>
#include <string>

namespace otto::common {

/// True when `timezone` names a readable TZif file in the system zoneinfo database
/// (`TZDIR` overrides the root). Zones are parsed once and cached; the process-wide
/// `TZ` is never consulted or modified.
[[nodiscard]] bool is_valid_timezone(const std::string &timezone);

/// Seconds east of UTC in effect at `epoch_ms` in `timezone`.
[[nodiscard]] Result<std::int64_t> utc_offset_seconds(std::int64_t epoch_ms,
                                                      const std::string &timezone);

/// Minutes since local midnight (0..1439) of `epoch_ms` in `timezone`.
[[nodiscard]] Result<int> local_minute_of_day(std::int64_t epoch_ms, const std::string &timezone);

/// Local calendar date of `epoch_ms` in `timezone` as `YYYY-MM-DD`.
[[nodiscard]] Result<std::string> local_date_key(std::int64_t epoch_ms,
                                                 const std::string &timezone);

} // namespace otto::common
