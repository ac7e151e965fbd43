#pragma once

#include "otto/common/result.hpp"
#include "otto/persistence/job_store.hpp"
#include "otto/persistence/outbound_store.hpp"
#include "otto/persistence/user_profile_store.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace otto::outbound {

inline constexpr std::size_t kMaxErrorMessageLength = 1000;
inline constexpr const char *kSuppressedPrefix = "suppressed_by_policy:";
/// Digest lookback when no digest has been sent yet.
inline constexpr std::int64_t kDefaultDigestLookbackMs = 24 * 60 * 60 * 1000;
inline constexpr std::size_t kDigestRunLimit = 200;

struct RetryPolicy {
  std::int64_t max_attempts = 5;
  std::int64_t base_delay_ms = 5'000;
  std::int64_t max_delay_ms = 300'000;
};

/// Capped exponential backoff: base for attempt 1, doubling per attempt, never above max.
[[nodiscard]] std::int64_t calculate_retry_delay_ms(std::int64_t attempt, const RetryPolicy &policy);

/// Text sent in place of messages held during a muted or quiet period.
[[nodiscard]] std::string summarize_suppressed_runs(const std::vector<persistence::RunSummary> &runs);

struct FileDelivery {
  persistence::MessageKind kind = persistence::MessageKind::Document;
  std::string file_path;
  std::optional<std::string> filename;
  std::optional<std::string> mime_type;
  std::string caption;
};

/// Messaging transport. A failed Status or a thrown exception counts as a failed attempt.
class IOutboundSender {
public:
  virtual ~IOutboundSender() = default;

  [[nodiscard]] virtual common::Status send_text(std::int64_t chat_id, const std::string &text) = 0;
  [[nodiscard]] virtual common::Status send_file(std::int64_t chat_id,
                                                 const FileDelivery &file) = 0;
};

struct DrainReport {
  /// True when another drain cycle was already running and this call did nothing.
  bool skipped = false;
  std::size_t due = 0;
  std::size_t sent = 0;
  std::size_t retried = 0;
  std::size_t failed = 0;
  std::size_t suppressed = 0;
  /// Held messages replaced by a quiet-period digest.
  std::size_t digested = 0;
};

/// Delivers due queued messages one at a time in creation order, applying the notification
/// gate and the retry policy. Per-message failures are recorded on the row, never thrown.
/// With a run history, previously held messages that become deliverable are collapsed into
/// one digest per chat summarizing the runs since the last digest.
class OutboundQueueProcessor {
public:
  OutboundQueueProcessor(persistence::OutboundStore &store,
                         persistence::UserProfileStore &profiles, IOutboundSender &sender,
                         RetryPolicy policy, persistence::JobStore *run_history = nullptr);

  /// Store failures while listing or reading the policy end the cycle with an error.
  [[nodiscard]] common::Result<DrainReport> drain_due_messages(std::int64_t now);

private:
  /// Returns the ids of the messages the digest replaced.
  [[nodiscard]] std::vector<std::string>
  send_release_digest(const std::vector<persistence::OutboundMessage> &due,
                      const std::optional<persistence::NotificationPolicy> &policy,
                      std::int64_t now, DrainReport &report);
  void process_message(const persistence::OutboundMessage &message,
                       const std::optional<persistence::NotificationPolicy> &policy,
                       std::int64_t now, DrainReport &report);
  [[nodiscard]] common::Status deliver(const persistence::OutboundMessage &message);
  void record_failure(const persistence::OutboundMessage &message, std::int64_t attempt,
                      const std::string &error, std::int64_t now, DrainReport &report);

  persistence::OutboundStore &store_;
  persistence::UserProfileStore &profiles_;
  IOutboundSender &sender_;
  RetryPolicy policy_;
  persistence::JobStore *run_history_;
  std::atomic<bool> draining_{false};
};

} // namespace otto::outbound
