#include "otto/outbound/queue.hpp"

#include "otto/common/fs.hpp"
#include "otto/observability/global.hpp"
#include "otto/outbound/enqueue.hpp"
#include "otto/outbound/notification_policy.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <iostream>
#include <map>
#include <sstream>

namespace otto::outbound {

namespace {

// Clears the draining flag however the cycle ends.
class DrainGuard {
public:
  explicit DrainGuard(std::atomic<bool> &flag) : flag_(flag) {}
  ~DrainGuard() { flag_.store(false); }
  DrainGuard(const DrainGuard &) = delete;
  DrainGuard &operator=(const DrainGuard &) = delete;

private:
  std::atomic<bool> &flag_;
};

constexpr const char *kHeartbeatJobType = "heartbeat";
constexpr std::size_t kDigestIssueCount = 3;

bool is_released_suppression(const persistence::OutboundMessage &message) {
  return message.error_message.has_value() && message.error_message->rfind(kSuppressedPrefix, 0) == 0;
}

std::string normalize_error(const std::string &message) {
  return common::truncate_utf8(message, kMaxErrorMessageLength);
}

void report_status(const std::string &what, const common::Status &status) {
  if (!status.ok()) {
    observability::record_error("outbound", what + "_failed: " + status.error());
  }
}

} // namespace

std::int64_t calculate_retry_delay_ms(const std::int64_t attempt, const RetryPolicy &policy) {
  const std::int64_t exponent = std::max<std::int64_t>(0, attempt - 1);
  std::int64_t delay = policy.base_delay_ms;
  for (std::int64_t i = 0; i < exponent && delay < policy.max_delay_ms; ++i) {
    delay *= 2;
  }
  return std::min(delay, policy.max_delay_ms);
}

std::string summarize_suppressed_runs(const std::vector<persistence::RunSummary> &runs) {
  if (runs.empty()) {
    return "No task activity happened while notifications were paused.";
  }
  std::size_t success = 0;
  std::size_t failed = 0;
  std::size_t skipped = 0;
  std::vector<std::string> issues;
  for (const auto &run : runs) {
    if (run.status == persistence::RunStatus::Success) {
      ++success;
    } else if (run.status == persistence::RunStatus::Skipped) {
      ++skipped;
    } else {
      ++failed;
      if (issues.size() < kDigestIssueCount) {
        issues.push_back(run.error_message.value_or(run.error_code.value_or("unknown error")));
      }
    }
  }
  std::ostringstream out;
  out << "Summary from your muted/quiet period:\n"
      << runs.size() << " scheduled runs completed (" << success << " success, " << failed
      << " failed, " << skipped << " skipped).\n";
  if (issues.empty()) {
    out << "No major failures detected.";
  } else {
    out << "Main issues: " << common::join(issues, " | ") << ".";
  }
  return out.str();
}

OutboundQueueProcessor::OutboundQueueProcessor(persistence::OutboundStore &store,
                                               persistence::UserProfileStore &profiles,
                                               IOutboundSender &sender, RetryPolicy policy,
                                               persistence::JobStore *run_history)
    : store_(store), profiles_(profiles), sender_(sender), policy_(policy),
      run_history_(run_history) {}

common::Result<DrainReport> OutboundQueueProcessor::drain_due_messages(const std::int64_t now) {
  DrainReport report;
  bool expected = false;
  if (!draining_.compare_exchange_strong(expected, true)) {
    report.skipped = true;
    return common::Result<DrainReport>::success(report);
  }
  DrainGuard guard(draining_);

  auto due = store_.list_due(now);
  if (!due.ok()) {
    return common::Result<DrainReport>::failure("list due messages: " + due.error());
  }
  auto policy = profiles_.get();
  if (!policy.ok()) {
    return common::Result<DrainReport>::failure("read notification policy: " + policy.error());
  }

  report.due = due.value().size();
  const auto digested = send_release_digest(due.value(), policy.value(), now, report);
  for (const auto &message : due.value()) {
    if (std::find(digested.begin(), digested.end(), message.id) != digested.end()) {
      continue;
    }
    process_message(message, policy.value(), now, report);
  }

  if (const auto depth = store_.count_queued(); depth.ok()) {
    observability::record_metric(observability::QueueDepthMetric{depth.value()});
  } else {
    report_status("count_queued", depth.status());
  }
  return common::Result<DrainReport>::success(report);
}

std::vector<std::string> OutboundQueueProcessor::send_release_digest(
    const std::vector<persistence::OutboundMessage> &due,
    const std::optional<persistence::NotificationPolicy> &policy, const std::int64_t now,
    DrainReport &report) {
  std::vector<std::string> handled;
  if (run_history_ == nullptr) {
    return handled;
  }
  std::map<std::int64_t, std::vector<const persistence::OutboundMessage *>> by_chat;
  for (const auto &message : due) {
    if (is_released_suppression(message)) {
      by_chat[message.chat_id].push_back(&message);
    }
  }
  if (by_chat.empty() ||
      !evaluate_gate(policy, persistence::MessagePriority::Normal, now).deliver) {
    return handled;
  }

  const auto profile = resolve_effective_profile(policy);
  const std::int64_t since = profile.last_digest_at.value_or(now - kDefaultDigestLookbackMs);
  auto recent = run_history_->list_recent_runs(since, kDigestRunLimit);
  if (!recent.ok()) {
    report_status("list_recent_runs", recent.status());
    return handled;
  }
  std::vector<persistence::RunSummary> runs;
  for (auto &run : recent.value()) {
    if (run.job_type != kHeartbeatJobType) {
      runs.push_back(std::move(run));
    }
  }
  const std::string digest = summarize_suppressed_runs(runs);

  for (const auto &[chat_id, messages] : by_chat) {
    common::Status sent = common::Status::success();
    try {
      sent = sender_.send_text(chat_id, digest);
    } catch (const std::exception &ex) {
      sent = common::Status::error(ex.what());
    }
    // Held messages stay queued for regular delivery when the digest cannot go out.
    if (!sent.ok()) {
      report_status("send_digest", sent);
      continue;
    }
    for (const auto *message : messages) {
      report_status("mark_sent", store_.mark_sent(message->id, message->attempt_count + 1, now));
      handled.push_back(message->id);
      ++report.digested;
      observability::record_event(observability::OutboundDeliveryEvent{
          message->id, "digested", message->attempt_count + 1});
    }
  }
  if (!handled.empty()) {
    report_status("set_last_digest_at", profiles_.set_last_digest_at(now, now));
  }
  return handled;
}

void OutboundQueueProcessor::process_message(
    const persistence::OutboundMessage &message,
    const std::optional<persistence::NotificationPolicy> &policy, const std::int64_t now,
    DrainReport &report) {
  const std::int64_t next_attempt = message.attempt_count + 1;

  const auto gate = evaluate_gate(policy, message.priority, now);
  if (!gate.deliver) {
    const std::int64_t retry_at = now + calculate_retry_delay_ms(next_attempt, policy_);
    const std::string reason = std::string(kSuppressedPrefix) + std::string(to_string(gate.reason));
    report_status("mark_retry", store_.mark_retry(message.id, next_attempt, retry_at, reason, now));
    ++report.suppressed;
    std::cerr << "[outbound] suppressed id=" << message.id << " reason=" << to_string(gate.reason)
              << " retry_at=" << retry_at << "\n";
    observability::record_event(
        observability::OutboundDeliveryEvent{message.id, "suppressed", next_attempt});
    return;
  }

  common::Status delivered = common::Status::success();
  try {
    delivered = deliver(message);
  } catch (const std::exception &ex) {
    delivered = common::Status::error(ex.what());
  }

  if (!delivered.ok()) {
    record_failure(message, next_attempt, delivered.error(), now, report);
    return;
  }

  report_status("mark_sent", store_.mark_sent(message.id, next_attempt, now));
  ++report.sent;
  observability::record_event(observability::OutboundDeliveryEvent{message.id, "sent", next_attempt});
  observability::record_metric(observability::DeliveryLatencyMetric{
      std::chrono::milliseconds(std::max<std::int64_t>(0, now - message.created_at))});
}

common::Status OutboundQueueProcessor::deliver(const persistence::OutboundMessage &message) {
  if (message.kind == persistence::MessageKind::Text) {
    for (const auto &chunk : split_message(message.content)) {
      const auto status = sender_.send_text(message.chat_id, chunk);
      if (!status.ok()) {
        return status;
      }
    }
    return common::Status::success();
  }

  if (!message.media_path.has_value() || message.media_path->empty()) {
    return common::Status::error("queued " + std::string(persistence::to_string(message.kind)) +
                                 " message has no media path");
  }
  return sender_.send_file(message.chat_id, FileDelivery{
                                                .kind = message.kind,
                                                .file_path = *message.media_path,
                                                .filename = message.media_filename,
                                                .mime_type = message.media_mime_type,
                                                .caption = message.content,
                                            });
}

void OutboundQueueProcessor::record_failure(const persistence::OutboundMessage &message,
                                            const std::int64_t attempt, const std::string &error,
                                            const std::int64_t now, DrainReport &report) {
  const std::string error_message = normalize_error(error);

  if (attempt >= policy_.max_attempts) {
    report_status("mark_failed", store_.mark_failed(message.id, attempt, error_message, now));
    ++report.failed;
    std::cerr << "[outbound] failed id=" << message.id << " attempt=" << attempt
              << " max_attempts=" << policy_.max_attempts << " error=" << error_message << "\n";
    observability::record_event(observability::OutboundDeliveryEvent{message.id, "failed", attempt});
    return;
  }

  const std::int64_t delay = calculate_retry_delay_ms(attempt, policy_);
  report_status("mark_retry",
                store_.mark_retry(message.id, attempt, now + delay, error_message, now));
  ++report.retried;
  std::cerr << "[outbound] retry id=" << message.id << " attempt=" << attempt
            << " delay_ms=" << delay << " error=" << error_message << "\n";
  observability::record_event(observability::OutboundDeliveryEvent{message.id, "retry", attempt});
}

} // namespace otto::outbound
