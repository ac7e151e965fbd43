#pragma once

#include "otto/common/result.hpp"
#include "otto/persistence/job_store.hpp"
#include "otto/persistence/outbound_store.hpp"
#include "otto/persistence/user_profile_store.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace otto::scheduler {

inline constexpr const char *kHeartbeatTaskId = "system-heartbeat";
inline constexpr const char *kHeartbeatTaskType = "heartbeat";
inline constexpr std::int64_t kDefaultHeartbeatTaskCadenceMinutes = 1;
/// A named heartbeat window stays due this many minutes after its start.
inline constexpr int kHeartbeatWindowSpanMinutes = 59;

struct HeartbeatPayload {
  /// Overrides the configured default chat.
  std::optional<std::int64_t> chat_id;
};

/// An absent or null payload yields the defaults.
[[nodiscard]] common::Result<HeartbeatPayload>
parse_heartbeat_payload(const std::optional<std::string> &payload_json);
[[nodiscard]] std::string serialize_heartbeat_payload(const HeartbeatPayload &payload);

enum class HeartbeatReason { OnboardingNeeded, OutsideCadence, Dedupe, SignalEmpty, QuietOrMuted, Queued };

[[nodiscard]] std::string_view to_string(HeartbeatReason value);

struct HeartbeatResult {
  HeartbeatReason reason = HeartbeatReason::SignalEmpty;
  std::string summary;
  bool emitted = false;
  bool onboarding_prompted = false;
};

struct HeartbeatOptions {
  HeartbeatPayload payload;
  std::optional<std::int64_t> default_chat_id;
};

/// Activity digest used as the heartbeat body; `runs` are newest first.
[[nodiscard]] std::string summarize_runs(const std::vector<persistence::RunSummary> &runs);

/// Emits at most one friendly status message per due window or cadence slot. Every
/// outcome is a success; only store failures are returned as errors.
[[nodiscard]] common::Result<HeartbeatResult>
execute_heartbeat(persistence::JobStore &jobs, persistence::OutboundStore &outbound,
                  persistence::UserProfileStore &profiles, const HeartbeatOptions &options,
                  std::int64_t now);

struct EnsureHeartbeatResult {
  bool created = false;
  std::string task_id;
  std::int64_t cadence_minutes = 0;
};

struct EnsureHeartbeatOptions {
  std::int64_t cadence_minutes = kDefaultHeartbeatTaskCadenceMinutes;
  HeartbeatPayload payload;
};

/// Creates the recurring heartbeat job unless it already exists. Cadence must be 1..60.
[[nodiscard]] common::Result<EnsureHeartbeatResult>
ensure_heartbeat_task(persistence::JobStore &jobs, const EnsureHeartbeatOptions &options,
                      std::int64_t now);

} // namespace otto::scheduler
