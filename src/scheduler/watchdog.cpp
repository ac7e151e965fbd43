#include "otto/scheduler/watchdog.hpp"

#include "otto/common/crypto.hpp"
#include "otto/common/fs.hpp"
#include "otto/common/json_util.hpp"
#include "otto/outbound/enqueue.hpp"
#include "otto/scheduler/schedule.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>

namespace otto::scheduler {

namespace {

constexpr std::size_t kDedupeFingerprintLength = 20;

common::Status read_bounded(const common::JsonRawMap &members, const std::string &key,
                            const std::int64_t min, const std::int64_t max,
                            std::int64_t &target) {
  const auto it = members.find(key);
  if (it == members.end()) {
    return common::Status::success();
  }
  const auto value = common::json_as_integer(it->second);
  if (!value.has_value()) {
    return common::Status::error(key + " must be an integer");
  }
  if (*value < min || *value > max) {
    return common::Status::error(key + " must be between " + std::to_string(min) + " and " +
                                 std::to_string(max));
  }
  target = *value;
  return common::Status::success();
}

std::string failure_reason(const persistence::RunSummary &run) {
  if (run.error_message.has_value() && !run.error_message->empty()) {
    return *run.error_message;
  }
  if (run.error_code.has_value() && !run.error_code->empty()) {
    return *run.error_code;
  }
  return "unknown error";
}

} // namespace

std::string_view to_string(const WatchdogNotificationStatus value) {
  switch (value) {
  case WatchdogNotificationStatus::NotRequested:
    return "not_requested";
  case WatchdogNotificationStatus::NoChatId:
    return "no_chat_id";
  case WatchdogNotificationStatus::Enqueued:
    return "enqueued";
  case WatchdogNotificationStatus::Duplicate:
    return "duplicate";
  }
  return "not_requested";
}

common::Result<WatchdogPayload> parse_watchdog_payload(const std::optional<std::string> &payload_json) {
  WatchdogPayload payload;
  if (!payload_json.has_value() || common::trim(*payload_json) == "null") {
    return common::Result<WatchdogPayload>::success(payload);
  }

  const auto members = common::json_object_members(*payload_json);
  if (!members.has_value()) {
    return common::Result<WatchdogPayload>::failure("watchdog payload must be a JSON object");
  }

  for (const auto &status :
       {read_bounded(*members, "lookbackMinutes", 5, 1440, payload.lookback_minutes),
        read_bounded(*members, "maxFailures", 1, 200, payload.max_failures),
        read_bounded(*members, "threshold", 1, 50, payload.threshold)}) {
    if (!status.ok()) {
      return common::Result<WatchdogPayload>::failure(status.error());
    }
  }

  if (const auto it = members->find("notify"); it != members->end()) {
    const auto notify = common::json_as_bool(it->second);
    if (!notify.has_value()) {
      return common::Result<WatchdogPayload>::failure("notify must be a boolean");
    }
    payload.notify = *notify;
  }

  if (const auto it = members->find("chatId"); it != members->end() && it->second != "null") {
    const auto chat_id = common::json_as_integer(it->second);
    if (!chat_id.has_value() || *chat_id <= 0) {
      return common::Result<WatchdogPayload>::failure("chatId must be a positive integer");
    }
    payload.chat_id = *chat_id;
  }
  return common::Result<WatchdogPayload>::success(payload);
}

std::string serialize_watchdog_payload(const WatchdogPayload &payload) {
  std::ostringstream out;
  out << "{\"lookbackMinutes\":" << payload.lookback_minutes
      << ",\"maxFailures\":" << payload.max_failures << ",\"threshold\":" << payload.threshold
      << ",\"notify\":" << (payload.notify ? "true" : "false");
  if (payload.chat_id.has_value()) {
    out << ",\"chatId\":" << *payload.chat_id;
  }
  out << "}";
  return out.str();
}

std::string watchdog_dedupe_key(const std::int64_t lookback_minutes, const std::int64_t threshold,
                                const std::vector<persistence::RunSummary> &failures) {
  std::vector<std::string> run_ids;
  run_ids.reserve(failures.size());
  for (const auto &run : failures) {
    run_ids.push_back(run.run_id);
  }
  const std::string fingerprint =
      common::sha256_hex(common::join(run_ids, "|")).substr(0, kDedupeFingerprintLength);
  return "watchdog:task-failures:" + std::to_string(lookback_minutes) + ":" +
         std::to_string(threshold) + ":" + fingerprint;
}

std::string build_watchdog_alert(const WatchdogCheckResult &result) {
  std::ostringstream out;
  out << "Watchdog alert: " << result.failed_count << " failed task runs in last "
      << result.lookback_minutes << "m (threshold " << result.threshold << ").";
  const std::size_t shown = std::min(result.failures.size(), kWatchdogAlertSampleSize);
  for (std::size_t i = 0; i < shown; ++i) {
    const auto &run = result.failures[i];
    out << "\n- " << run.job_type << " (" << run.job_id << "): " << failure_reason(run);
  }
  return out.str();
}

common::Result<WatchdogCheckResult> check_task_failures(persistence::JobStore &jobs,
                                                        persistence::OutboundStore &outbound,
                                                        const WatchdogCheckOptions &options,
                                                        const std::int64_t now) {
  const auto &payload = options.payload;
  const std::int64_t since = now - payload.lookback_minutes * kMinuteMs;
  auto failures = jobs.list_recent_failed_runs(
      since, static_cast<std::size_t>(payload.max_failures), options.exclude_task_type);
  if (!failures.ok()) {
    return common::Result<WatchdogCheckResult>::failure(failures.error());
  }

  WatchdogCheckResult result;
  result.lookback_minutes = payload.lookback_minutes;
  result.threshold = payload.threshold;
  result.failures = std::move(failures.value());
  result.failed_count = result.failures.size();
  result.should_alert = static_cast<std::int64_t>(result.failed_count) >= payload.threshold;

  if (!result.should_alert || !payload.notify) {
    result.notification_status = WatchdogNotificationStatus::NotRequested;
    return common::Result<WatchdogCheckResult>::success(std::move(result));
  }

  const auto chat_id = payload.chat_id.has_value() ? payload.chat_id : options.default_chat_id;
  if (!chat_id.has_value()) {
    result.notification_status = WatchdogNotificationStatus::NoChatId;
    return common::Result<WatchdogCheckResult>::success(std::move(result));
  }

  result.dedupe_key =
      watchdog_dedupe_key(payload.lookback_minutes, payload.threshold, result.failures);
  const auto enqueued = outbound::enqueue_text(
      outbound::QueueTextInput{
          .chat_id = *chat_id,
          .content = build_watchdog_alert(result),
          .dedupe_key = result.dedupe_key,
          .priority = persistence::MessagePriority::High,
      },
      outbound, now);
  if (!enqueued.ok()) {
    return common::Result<WatchdogCheckResult>::failure("watchdog alert enqueue failed: " +
                                                        enqueued.error());
  }
  result.notification_status = enqueued.value().status == persistence::EnqueueOutcome::Enqueued
                                   ? WatchdogNotificationStatus::Enqueued
                                   : WatchdogNotificationStatus::Duplicate;
  return common::Result<WatchdogCheckResult>::success(std::move(result));
}

common::Result<EnsureWatchdogResult> ensure_watchdog_task(persistence::JobStore &jobs,
                                                          const EnsureWatchdogOptions &options,
                                                          const std::int64_t now) {
  if (options.cadence_minutes < 1) {
    return common::Result<EnsureWatchdogResult>::failure(
        "watchdog cadence_minutes must be >= 1");
  }

  EnsureWatchdogResult result;
  result.task_id = kWatchdogTaskId;

  auto existing = jobs.get_job(kWatchdogTaskId);
  if (!existing.ok()) {
    return common::Result<EnsureWatchdogResult>::failure(existing.error());
  }
  if (existing.value().has_value()) {
    result.cadence_minutes = existing.value()->cadence_minutes.value_or(options.cadence_minutes);
    return common::Result<EnsureWatchdogResult>::success(std::move(result));
  }

  persistence::Job job;
  job.id = kWatchdogTaskId;
  job.type = kWatchdogTaskType;
  job.schedule_type = persistence::ScheduleType::Recurring;
  job.cadence_minutes = options.cadence_minutes;
  job.payload = serialize_watchdog_payload(options.payload);
  job.next_run_at = now + options.cadence_minutes * kMinuteMs;
  job.status = persistence::JobStatus::Idle;
  job.created_at = now;
  job.updated_at = now;

  const auto created = jobs.create_job(job);
  if (!created.ok()) {
    return common::Result<EnsureWatchdogResult>::failure(created.error());
  }
  std::cerr << "[watchdog] task_created id=" << job.id
            << " cadence_minutes=" << options.cadence_minutes << "\n";

  result.created = true;
  result.cadence_minutes = options.cadence_minutes;
  return common::Result<EnsureWatchdogResult>::success(std::move(result));
}

} // namespace otto::scheduler
