#include "otto/scheduler/heartbeat.hpp"

#include "otto/common/crypto.hpp"
#include "otto/common/fs.hpp"
#include "otto/common/json_util.hpp"
#include "otto/common/local_time.hpp"
#include "otto/outbound/enqueue.hpp"
#include "otto/outbound/notification_policy.hpp"
#include "otto/scheduler/schedule.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>
#include <utility>

namespace otto::scheduler {

namespace {

constexpr std::size_t kDedupeHashLength = 16;
constexpr std::size_t kSignalRunLimit = 100;
constexpr std::size_t kTopTypeCount = 3;
constexpr std::size_t kIssueCount = 2;

constexpr const char *kOnboardingText =
    "I can start friendly heartbeat updates, but your notification profile is not configured "
    "yet.\n"
    "Suggested defaults: timezone Europe/Vienna, quiet hours 20:00-08:00, and "
    "morning/midday/evening heartbeats at 08:30 / 12:30 / 19:00.\n"
    "Tell me in plain language what you prefer, for example: 'mute until tomorrow 08:00', "
    "'quiet hours 21:00-07:30', or 'only notify me when there is meaningful change'.";

std::string heartbeat_dedupe_key(const std::string &kind, const std::int64_t chat_id,
                                 const std::string &fingerprint) {
  const std::string hash = common::sha256_hex(std::to_string(chat_id) + ":" + fingerprint);
  return kind + ":" + hash.substr(0, kDedupeHashLength);
}

std::optional<std::string> due_window(const int minute_of_day,
                                      const outbound::EffectiveNotificationProfile &profile) {
  const std::pair<const char *, const std::string *> windows[] = {
      {"morning", &profile.heartbeat_morning},
      {"midday", &profile.heartbeat_midday},
      {"evening", &profile.heartbeat_evening},
  };
  for (const auto &[name, value] : windows) {
    const auto start = outbound::parse_clock_minutes(*value);
    if (!start.has_value()) {
      continue;
    }
    if (minute_of_day >= *start && minute_of_day <= *start + kHeartbeatWindowSpanMinutes) {
      return std::string(name);
    }
  }
  return std::nullopt;
}

struct CadenceSlot {
  std::string key;
  bool active = false;
};

// Active during the last minute before each cadence boundary.
CadenceSlot cadence_slot(const std::int64_t now, const std::int64_t cadence_minutes) {
  const std::int64_t cadence_ms = cadence_minutes * kMinuteMs;
  const std::int64_t bucket = now / cadence_ms;
  const std::int64_t boundary_distance = (bucket + 1) * cadence_ms - now;
  return CadenceSlot{
      .key = "cadence-" + std::to_string(cadence_minutes) + "-" + std::to_string(bucket),
      .active = boundary_distance <= kMinuteMs,
  };
}

HeartbeatResult skipped(const HeartbeatReason reason, std::string summary) {
  return HeartbeatResult{.reason = reason, .summary = std::move(summary)};
}

} // namespace

std::string_view to_string(const HeartbeatReason value) {
  switch (value) {
  case HeartbeatReason::OnboardingNeeded:
    return "onboarding_needed";
  case HeartbeatReason::OutsideCadence:
    return "outside_cadence";
  case HeartbeatReason::Dedupe:
    return "dedupe";
  case HeartbeatReason::SignalEmpty:
    return "signal_empty";
  case HeartbeatReason::QuietOrMuted:
    return "quiet_or_muted";
  case HeartbeatReason::Queued:
    return "queued";
  }
  return "signal_empty";
}

common::Result<HeartbeatPayload>
parse_heartbeat_payload(const std::optional<std::string> &payload_json) {
  HeartbeatPayload payload;
  if (!payload_json.has_value() || common::trim(*payload_json) == "null") {
    return common::Result<HeartbeatPayload>::success(payload);
  }
  const auto members = common::json_object_members(*payload_json);
  if (!members.has_value()) {
    return common::Result<HeartbeatPayload>::failure("heartbeat payload must be a JSON object");
  }
  if (const auto it = members->find("chatId"); it != members->end() && it->second != "null") {
    const auto chat_id = common::json_as_integer(it->second);
    if (!chat_id.has_value() || *chat_id <= 0) {
      return common::Result<HeartbeatPayload>::failure("chatId must be a positive integer");
    }
    payload.chat_id = *chat_id;
  }
  return common::Result<HeartbeatPayload>::success(payload);
}

std::string serialize_heartbeat_payload(const HeartbeatPayload &payload) {
  if (!payload.chat_id.has_value()) {
    return "{\"chatId\":null}";
  }
  return "{\"chatId\":" + std::to_string(*payload.chat_id) + "}";
}

std::string summarize_runs(const std::vector<persistence::RunSummary> &runs) {
  if (runs.empty()) {
    return "No task activity in the recent window.";
  }

  std::size_t success = 0;
  std::size_t failed = 0;
  std::size_t skipped_count = 0;
  std::vector<std::pair<std::string, std::size_t>> by_type;
  std::vector<std::string> issues;
  for (const auto &run : runs) {
    switch (run.status) {
    case persistence::RunStatus::Success:
      ++success;
      break;
    case persistence::RunStatus::Failed:
      ++failed;
      if (issues.size() < kIssueCount) {
        issues.push_back(run.error_message.value_or(run.error_code.value_or("Unknown failure")));
      }
      break;
    case persistence::RunStatus::Skipped:
      ++skipped_count;
      break;
    }
    const auto it = std::find_if(by_type.begin(), by_type.end(),
                                 [&](const auto &entry) { return entry.first == run.job_type; });
    if (it == by_type.end()) {
      by_type.emplace_back(run.job_type, 1);
    } else {
      ++it->second;
    }
  }
  std::stable_sort(by_type.begin(), by_type.end(),
                   [](const auto &left, const auto &right) { return left.second > right.second; });

  std::ostringstream out;
  out << "Recent task activity: " << runs.size() << " runs (" << success << " success, " << failed
      << " failed, " << skipped_count << " skipped).";
  out << "\nMost active: ";
  for (std::size_t i = 0; i < std::min(by_type.size(), kTopTypeCount); ++i) {
    out << (i == 0 ? "" : ", ") << by_type[i].first << " (" << by_type[i].second << ")";
  }
  out << ".";
  if (!issues.empty()) {
    out << "\nTop issues: " << common::join(issues, " | ") << ".";
  }
  return out.str();
}

common::Result<HeartbeatResult> execute_heartbeat(persistence::JobStore &jobs,
                                                  persistence::OutboundStore &outbound,
                                                  persistence::UserProfileStore &profiles,
                                                  const HeartbeatOptions &options,
                                                  const std::int64_t now) {
  const auto chat_id =
      options.payload.chat_id.has_value() ? options.payload.chat_id : options.default_chat_id;
  if (!chat_id.has_value()) {
    return common::Result<HeartbeatResult>::success(skipped(
        HeartbeatReason::SignalEmpty, "Heartbeat skipped because no chat id is configured."));
  }

  const auto policy = profiles.get();
  if (!policy.ok()) {
    return common::Result<HeartbeatResult>::failure("read notification policy: " +
                                                    policy.error());
  }
  const auto profile = outbound::resolve_effective_profile(policy.value());
  const auto minute_of_day = common::local_minute_of_day(now, profile.timezone);
  const auto date_key = common::local_date_key(now, profile.timezone);
  if (!minute_of_day.ok() || !date_key.ok()) {
    return common::Result<HeartbeatResult>::failure(
        "resolve local time: " + (minute_of_day.ok() ? date_key.error() : minute_of_day.error()));
  }

  if (!outbound::is_onboarding_complete(policy.value())) {
    const auto enqueued = outbound::enqueue_text(
        outbound::QueueTextInput{
            .chat_id = *chat_id,
            .content = kOnboardingText,
            .dedupe_key = heartbeat_dedupe_key("heartbeat-onboarding", *chat_id,
                                               date_key.value() + ":onboarding"),
            .priority = persistence::MessagePriority::Normal,
        },
        outbound, now);
    if (!enqueued.ok()) {
      return common::Result<HeartbeatResult>::failure("heartbeat onboarding enqueue failed: " +
                                                      enqueued.error());
    }
    const auto status = enqueued.value().status;
    return common::Result<HeartbeatResult>::success(HeartbeatResult{
        .reason = HeartbeatReason::OnboardingNeeded,
        .summary = "Heartbeat onboarding prompt " +
                   std::string(persistence::to_string(status)) + ".",
        .emitted = status == persistence::EnqueueOutcome::Enqueued,
        .onboarding_prompted = true,
    });
  }

  const auto window = due_window(minute_of_day.value(), profile);
  const auto slot = cadence_slot(now, profile.heartbeat_cadence_minutes);
  if (!window.has_value() && !slot.active) {
    return common::Result<HeartbeatResult>::success(
        skipped(HeartbeatReason::OutsideCadence,
                "Heartbeat skipped because no window or cadence slot is currently due."));
  }

  auto recent = jobs.list_recent_runs(now - profile.heartbeat_cadence_minutes * kMinuteMs,
                                      kSignalRunLimit);
  if (!recent.ok()) {
    return common::Result<HeartbeatResult>::failure(recent.error());
  }
  std::vector<persistence::RunSummary> runs;
  for (auto &run : recent.value()) {
    if (run.job_type != kHeartbeatTaskType) {
      runs.push_back(std::move(run));
    }
  }

  if (profile.heartbeat_only_if_signal && runs.empty()) {
    return common::Result<HeartbeatResult>::success(
        skipped(HeartbeatReason::SignalEmpty,
                "Heartbeat skipped because there is no new signal to report."));
  }

  const auto gate = outbound::evaluate_gate(profile, persistence::MessagePriority::Normal, now);
  if (!gate.deliver) {
    return common::Result<HeartbeatResult>::success(skipped(
        HeartbeatReason::QuietOrMuted, "Heartbeat held due to current quiet or mute policy."));
  }

  const std::string fingerprint =
      date_key.value() + ":" + (window.has_value() ? *window : slot.key);
  const std::string header =
      window.has_value()
          ? "Friendly " + *window + " heartbeat:"
          : "Friendly heartbeat (" + std::to_string(profile.heartbeat_cadence_minutes) +
                " minute cadence):";
  const auto enqueued = outbound::enqueue_text(
      outbound::QueueTextInput{
          .chat_id = *chat_id,
          .content = header + "\n" + summarize_runs(runs),
          .dedupe_key = heartbeat_dedupe_key("heartbeat", *chat_id, fingerprint),
          .priority = persistence::MessagePriority::Normal,
      },
      outbound, now);
  if (!enqueued.ok()) {
    return common::Result<HeartbeatResult>::failure("heartbeat enqueue failed: " +
                                                    enqueued.error());
  }
  if (const auto marked = profiles.set_last_digest_at(now, now); !marked.ok()) {
    return common::Result<HeartbeatResult>::failure(marked.error());
  }

  const auto status = enqueued.value().status;
  return common::Result<HeartbeatResult>::success(HeartbeatResult{
      .reason = status == persistence::EnqueueOutcome::Duplicate ? HeartbeatReason::Dedupe
                                                                 : HeartbeatReason::Queued,
      .summary = "Heartbeat " + std::string(persistence::to_string(status)) + " for " +
                 (window.has_value() ? *window + " window." : std::string("cadence window.")),
      .emitted = status == persistence::EnqueueOutcome::Enqueued,
  });
}

common::Result<EnsureHeartbeatResult> ensure_heartbeat_task(persistence::JobStore &jobs,
                                                            const EnsureHeartbeatOptions &options,
                                                            const std::int64_t now) {
  if (options.cadence_minutes < 1 || options.cadence_minutes > 60) {
    return common::Result<EnsureHeartbeatResult>::failure(
        "heartbeat cadence_minutes must be between 1 and 60");
  }

  EnsureHeartbeatResult result;
  result.task_id = kHeartbeatTaskId;
  result.cadence_minutes = options.cadence_minutes;

  auto existing = jobs.get_job(kHeartbeatTaskId);
  if (!existing.ok()) {
    return common::Result<EnsureHeartbeatResult>::failure(existing.error());
  }
  if (existing.value().has_value()) {
    return common::Result<EnsureHeartbeatResult>::success(std::move(result));
  }

  persistence::Job job;
  job.id = kHeartbeatTaskId;
  job.type = kHeartbeatTaskType;
  job.schedule_type = persistence::ScheduleType::Recurring;
  job.cadence_minutes = options.cadence_minutes;
  job.payload = serialize_heartbeat_payload(options.payload);
  job.next_run_at = now + options.cadence_minutes * kMinuteMs;
  job.status = persistence::JobStatus::Idle;
  job.created_at = now;
  job.updated_at = now;

  const auto created = jobs.create_job(job);
  if (!created.ok()) {
    return common::Result<EnsureHeartbeatResult>::failure(created.error());
  }
  std::cerr << "[heartbeat] task_created id=" << job.id
            << " cadence_minutes=" << options.cadence_minutes << "\n";

  result.created = true;
  return common::Result<EnsureHeartbeatResult>::success(std::move(result));
}

} // namespace otto::scheduler
