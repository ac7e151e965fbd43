#pragma once

#include "otto/persistence/outbound_store.hpp"
#include "otto/persistence/user_profile_store.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace otto::outbound {

inline constexpr const char *kDefaultTimezone = "Europe/Vienna";
inline constexpr const char *kDefaultHeartbeatMorning = "08:30";
inline constexpr const char *kDefaultHeartbeatMidday = "12:30";
inline constexpr const char *kDefaultHeartbeatEvening = "19:00";
inline constexpr std::int64_t kDefaultHeartbeatCadenceMinutes = 180;
/// Stored cadences below this fall back to the default.
inline constexpr std::int64_t kMinHeartbeatCadenceMinutes = 30;

/// Profile with defaults applied and the timezone validated.
struct EffectiveNotificationProfile {
  std::string timezone = kDefaultTimezone;
  std::optional<std::string> quiet_hours_start;
  std::optional<std::string> quiet_hours_end;
  persistence::QuietMode quiet_mode = persistence::QuietMode::CriticalOnly;
  std::optional<std::int64_t> mute_until;
  std::string heartbeat_morning = kDefaultHeartbeatMorning;
  std::string heartbeat_midday = kDefaultHeartbeatMidday;
  std::string heartbeat_evening = kDefaultHeartbeatEvening;
  std::int64_t heartbeat_cadence_minutes = kDefaultHeartbeatCadenceMinutes;
  bool heartbeat_only_if_signal = true;
  std::optional<std::int64_t> last_digest_at;
};

enum class GateReason { Allowed, OverrideTier, QuietHours, Muted };

struct GateDecision {
  bool deliver = true;
  GateReason reason = GateReason::Allowed;
  /// When a held message would become deliverable (informational).
  std::optional<std::int64_t> release_at;
};

[[nodiscard]] std::string_view to_string(GateReason reason);

[[nodiscard]] EffectiveNotificationProfile
resolve_effective_profile(const persistence::NotificationPolicy &policy);
[[nodiscard]] EffectiveNotificationProfile
resolve_effective_profile(const std::optional<persistence::NotificationPolicy> &policy);

/// Complete once explicitly marked, or once timezone and both quiet-hour bounds are set.
[[nodiscard]] bool is_onboarding_complete(const std::optional<persistence::NotificationPolicy> &policy);

/// `HH:MM` (hour 0-23, optional leading zero) to minutes after midnight.
[[nodiscard]] std::optional<int> parse_clock_minutes(const std::string &value);

/// Empty, unparsable or zero-length windows are never active; windows may wrap midnight.
[[nodiscard]] bool is_quiet_hours_active(const EffectiveNotificationProfile &profile,
                                         std::int64_t now);

[[nodiscard]] GateDecision evaluate_gate(const EffectiveNotificationProfile &profile,
                                         persistence::MessagePriority priority, std::int64_t now);

/// A missing policy never holds a message.
[[nodiscard]] GateDecision evaluate_gate(const std::optional<persistence::NotificationPolicy> &policy,
                                         persistence::MessagePriority priority, std::int64_t now);

} // namespace otto::outbound
