#include "otto/outbound/notification_policy.hpp"

#include "otto/common/fs.hpp"
#include "otto/common/local_time.hpp"

#include <regex>

namespace otto::outbound {

namespace {

constexpr std::int64_t kMinuteMs = 60'000;
constexpr int kMinutesPerDay = 24 * 60;

std::optional<int> window_bound(const std::optional<std::string> &value) {
  if (!value.has_value()) {
    return std::nullopt;
  }
  return parse_clock_minutes(*value);
}

std::string text_or(const std::optional<std::string> &value, const char *fallback) {
  const std::string trimmed = common::trim(value.value_or(""));
  return trimmed.empty() ? std::string(fallback) : trimmed;
}

bool has_text(const std::optional<std::string> &value) {
  return value.has_value() && !common::trim(*value).empty();
}

std::int64_t quiet_release_at(const int current, const int end, const std::int64_t now) {
  int delta = (end - current + kMinutesPerDay) % kMinutesPerDay;
  if (delta == 0) {
    delta = kMinutesPerDay;
  }
  return now - (now % kMinuteMs) + delta * kMinuteMs;
}

} // namespace

std::string_view to_string(const GateReason reason) {
  switch (reason) {
  case GateReason::Allowed:
    return "allowed";
  case GateReason::OverrideTier:
    return "override_tier";
  case GateReason::QuietHours:
    return "quiet_hours";
  case GateReason::Muted:
    return "muted";
  }
  return "allowed";
}

EffectiveNotificationProfile resolve_effective_profile(const persistence::NotificationPolicy &policy) {
  EffectiveNotificationProfile profile;
  const std::string timezone = common::trim(policy.timezone.value_or(""));
  if (!timezone.empty() && common::is_valid_timezone(timezone)) {
    profile.timezone = timezone;
  }
  profile.quiet_hours_start = policy.quiet_hours_start;
  profile.quiet_hours_end = policy.quiet_hours_end;
  profile.quiet_mode = policy.quiet_mode;
  profile.mute_until = policy.mute_until;
  profile.heartbeat_morning = text_or(policy.heartbeat_morning, kDefaultHeartbeatMorning);
  profile.heartbeat_midday = text_or(policy.heartbeat_midday, kDefaultHeartbeatMidday);
  profile.heartbeat_evening = text_or(policy.heartbeat_evening, kDefaultHeartbeatEvening);
  if (policy.heartbeat_cadence_minutes.has_value() &&
      *policy.heartbeat_cadence_minutes >= kMinHeartbeatCadenceMinutes) {
    profile.heartbeat_cadence_minutes = *policy.heartbeat_cadence_minutes;
  }
  profile.heartbeat_only_if_signal = policy.heartbeat_only_if_signal;
  profile.last_digest_at = policy.last_digest_at;
  return profile;
}

EffectiveNotificationProfile
resolve_effective_profile(const std::optional<persistence::NotificationPolicy> &policy) {
  if (!policy.has_value()) {
    return EffectiveNotificationProfile{};
  }
  return resolve_effective_profile(*policy);
}

bool is_onboarding_complete(const std::optional<persistence::NotificationPolicy> &policy) {
  if (!policy.has_value()) {
    return false;
  }
  if (policy->onboarding_completed_at.has_value()) {
    return true;
  }
  return has_text(policy->timezone) && has_text(policy->quiet_hours_start) &&
         has_text(policy->quiet_hours_end);
}

std::optional<int> parse_clock_minutes(const std::string &value) {
  static const std::regex pattern(R"(^([01]?\d|2[0-3]):([0-5]\d)$)");
  const std::string normalized = common::trim(value);
  std::smatch match;
  if (!std::regex_match(normalized, match, pattern)) {
    return std::nullopt;
  }
  return std::stoi(match[1].str()) * 60 + std::stoi(match[2].str());
}

bool is_quiet_hours_active(const EffectiveNotificationProfile &profile, const std::int64_t now) {
  const auto start = window_bound(profile.quiet_hours_start);
  const auto end = window_bound(profile.quiet_hours_end);
  if (!start.has_value() || !end.has_value() || *start == *end) {
    return false;
  }
  const auto current = common::local_minute_of_day(now, profile.timezone);
  if (!current.ok()) {
    return false;
  }
  const int minute = current.value();
  if (*start < *end) {
    return minute >= *start && minute < *end;
  }
  return minute >= *start || minute < *end;
}

GateDecision evaluate_gate(const EffectiveNotificationProfile &profile,
                           const persistence::MessagePriority priority, const std::int64_t now) {
  if (priority == persistence::MessagePriority::High) {
    return GateDecision{.deliver = true, .reason = GateReason::OverrideTier};
  }
  if (profile.mute_until.has_value() && *profile.mute_until > now) {
    return GateDecision{
        .deliver = false, .reason = GateReason::Muted, .release_at = profile.mute_until};
  }
  if (profile.quiet_mode == persistence::QuietMode::CriticalOnly &&
      is_quiet_hours_active(profile, now)) {
    GateDecision decision{.deliver = false, .reason = GateReason::QuietHours};
    const auto current = common::local_minute_of_day(now, profile.timezone);
    const auto end = window_bound(profile.quiet_hours_end);
    if (current.ok() && end.has_value()) {
      decision.release_at = quiet_release_at(current.value(), *end, now);
    }
    return decision;
  }
  return GateDecision{.deliver = true, .reason = GateReason::Allowed};
}

GateDecision evaluate_gate(const std::optional<persistence::NotificationPolicy> &policy,
                           const persistence::MessagePriority priority, const std::int64_t now) {
  if (!policy.has_value()) {
    return GateDecision{.deliver = true, .reason = GateReason::Allowed};
  }
  return evaluate_gate(resolve_effective_profile(*policy), priority, now);
}

} // namespace otto::outbound
