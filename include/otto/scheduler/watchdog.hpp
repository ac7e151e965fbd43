#pragma once

#include "otto/common/result.hpp"
#include "otto/persistence/job_store.hpp"
#include "otto/persistence/outbound_store.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace otto::scheduler {

inline constexpr const char *kWatchdogTaskId = "system-watchdog-failures";
inline constexpr const char *kWatchdogTaskType = "watchdog_failures";
inline constexpr std::int64_t kDefaultWatchdogCadenceMinutes = 30;
/// Alert text lists at most this many failures.
inline constexpr std::size_t kWatchdogAlertSampleSize = 10;

struct WatchdogPayload {
  std::int64_t lookback_minutes = 120;
  std::int64_t max_failures = 20;
  std::int64_t threshold = 2;
  bool notify = true;
  /// Overrides the configured default alert chat.
  std::optional<std::int64_t> chat_id;
};

/// Decodes a watchdog job payload; an absent or null payload yields the defaults. Fields
/// are range-checked: lookback 5..1440, max_failures 1..200, threshold 1..50.
[[nodiscard]] common::Result<WatchdogPayload>
parse_watchdog_payload(const std::optional<std::string> &payload_json);
[[nodiscard]] std::string serialize_watchdog_payload(const WatchdogPayload &payload);

enum class WatchdogNotificationStatus { NotRequested, NoChatId, Enqueued, Duplicate };

[[nodiscard]] std::string_view to_string(WatchdogNotificationStatus value);

struct WatchdogCheckResult {
  std::int64_t lookback_minutes = 0;
  std::int64_t threshold = 0;
  std::size_t failed_count = 0;
  bool should_alert = false;
  WatchdogNotificationStatus notification_status = WatchdogNotificationStatus::NotRequested;
  std::vector<persistence::RunSummary> failures;
  std::optional<std::string> dedupe_key;
};

struct WatchdogCheckOptions {
  WatchdogPayload payload;
  /// Alert chat used when the payload names none.
  std::optional<std::int64_t> default_chat_id;
  /// Runs of this job type never count as failures.
  std::optional<std::string> exclude_task_type;
};

/// Dedupe key shared by every check over the same set of failed runs.
[[nodiscard]] std::string watchdog_dedupe_key(std::int64_t lookback_minutes,
                                              std::int64_t threshold,
                                              const std::vector<persistence::RunSummary> &failures);

[[nodiscard]] std::string build_watchdog_alert(const WatchdogCheckResult &result);

/// Counts failed runs inside the lookback window and, when the threshold is reached and
/// notification was requested, queues one high-priority alert.
[[nodiscard]] common::Result<WatchdogCheckResult>
check_task_failures(persistence::JobStore &jobs, persistence::OutboundStore &outbound,
                    const WatchdogCheckOptions &options, std::int64_t now);

struct EnsureWatchdogResult {
  bool created = false;
  std::string task_id;
  std::int64_t cadence_minutes = 0;
};

struct EnsureWatchdogOptions {
  std::int64_t cadence_minutes = kDefaultWatchdogCadenceMinutes;
  WatchdogPayload payload;
};

/// Creates the recurring system watchdog job unless it already exists.
[[nodiscard]] common::Result<EnsureWatchdogResult>
ensure_watchdog_task(persistence::JobStore &jobs, const EnsureWatchdogOptions &options,
                     std::int64_t now);

} // namespace otto::scheduler
