#pragma once

#include "otto/common/result.hpp"
#include "otto/persistence/sqlite_util.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace otto::persistence {

enum class MessageKind { Text, Document, Photo };
/// High is the override tier: it bypasses quiet hours and mute.
enum class MessagePriority { Low, Normal, High };
enum class OutboundStatus { Queued, Sent, Failed, Cancelled };
enum class EnqueueOutcome { Enqueued, Duplicate };

[[nodiscard]] std::string_view to_string(MessageKind value);
[[nodiscard]] std::string_view to_string(MessagePriority value);
[[nodiscard]] std::string_view to_string(OutboundStatus value);
[[nodiscard]] std::string_view to_string(EnqueueOutcome value);
[[nodiscard]] std::optional<MessageKind> parse_message_kind(std::string_view value);
[[nodiscard]] std::optional<MessagePriority> parse_message_priority(std::string_view value);
[[nodiscard]] std::optional<OutboundStatus> parse_outbound_status(std::string_view value);

struct OutboundMessage {
  std::string id;
  std::optional<std::string> dedupe_key;
  std::int64_t chat_id = 0;
  MessageKind kind = MessageKind::Text;
  /// Message text, or the caption for document/photo messages.
  std::string content;
  std::optional<std::string> media_path;
  std::optional<std::string> media_mime_type;
  std::optional<std::string> media_filename;
  MessagePriority priority = MessagePriority::Normal;
  OutboundStatus status = OutboundStatus::Queued;
  std::int64_t attempt_count = 0;
  std::optional<std::int64_t> next_attempt_at;
  std::optional<std::int64_t> sent_at;
  std::optional<std::int64_t> failed_at;
  std::optional<std::string> error_message;
  std::int64_t created_at = 0;
  std::int64_t updated_at = 0;
};

/// Durable outbound queue rows. Only `queued` rows are ever mutated; sent, failed and
/// cancelled rows are final.
class OutboundStore {
public:
  explicit OutboundStore(const std::filesystem::path &db_path);

  /// Inserts the message; a dedupe_key collision reports Duplicate instead of failing.
  [[nodiscard]] common::Result<EnqueueOutcome> enqueue_or_ignore_dedupe(const OutboundMessage &message);
  /// Queued rows whose next attempt is unset or at/before `now`, oldest first.
  [[nodiscard]] common::Result<std::vector<OutboundMessage>> list_due(std::int64_t now);
  [[nodiscard]] common::Result<std::optional<OutboundMessage>> get(const std::string &id);
  [[nodiscard]] common::Result<std::vector<OutboundMessage>> list_recent(std::size_t limit);
  [[nodiscard]] common::Result<std::size_t> count_queued();

  [[nodiscard]] common::Status mark_sent(const std::string &id, std::int64_t attempt_count,
                                         std::int64_t now);
  [[nodiscard]] common::Status mark_retry(const std::string &id, std::int64_t attempt_count,
                                          std::int64_t next_attempt_at,
                                          const std::string &error_message, std::int64_t now);
  [[nodiscard]] common::Status mark_failed(const std::string &id, std::int64_t attempt_count,
                                           const std::string &error_message, std::int64_t now);
  /// Moves a queued row to cancelled; false when the row is missing or already final.
  [[nodiscard]] common::Result<bool> cancel(const std::string &id, std::int64_t now);

private:
  [[nodiscard]] common::Status check_open() const;
  [[nodiscard]] common::Result<std::vector<OutboundMessage>> query(sqlite3_stmt *stmt);
  [[nodiscard]] common::Status apply_queued_only(sqlite3_stmt *stmt, const std::string &id);

  SqliteConnection connection_;
  std::mutex mutex_;
};

} // namespace otto::persistence
