#include "otto/persistence/outbound_store.hpp"

#include <algorithm>
#include <limits>

namespace otto::persistence {

namespace {

constexpr const char *kMessageColumns =
    "id, dedupe_key, chat_id, kind, content, media_path, media_mime_type, media_filename, "
    "priority, status, attempt_count, next_attempt_at, sent_at, failed_at, error_message, "
    "created_at, updated_at";

void bind_view(sqlite3_stmt *stmt, const int index, const std::string_view value) {
  bind_text(stmt, index, std::string(value));
}

common::Result<OutboundMessage> row_to_message(sqlite3_stmt *stmt) {
  const auto kind = parse_message_kind(get_text_column(stmt, 3));
  const auto priority = parse_message_priority(get_text_column(stmt, 8));
  const auto status = parse_outbound_status(get_text_column(stmt, 9));
  if (!kind.has_value() || !priority.has_value() || !status.has_value()) {
    return common::Result<OutboundMessage>::failure("invalid outbound row: " +
                                                    get_text_column(stmt, 0));
  }
  OutboundMessage message;
  message.id = get_text_column(stmt, 0);
  message.dedupe_key = get_optional_text(stmt, 1);
  message.chat_id = sqlite3_column_int64(stmt, 2);
  message.kind = *kind;
  message.content = get_text_column(stmt, 4);
  message.media_path = get_optional_text(stmt, 5);
  message.media_mime_type = get_optional_text(stmt, 6);
  message.media_filename = get_optional_text(stmt, 7);
  message.priority = *priority;
  message.status = *status;
  message.attempt_count = sqlite3_column_int64(stmt, 10);
  message.next_attempt_at = get_optional_int64(stmt, 11);
  message.sent_at = get_optional_int64(stmt, 12);
  message.failed_at = get_optional_int64(stmt, 13);
  message.error_message = get_optional_text(stmt, 14);
  message.created_at = sqlite3_column_int64(stmt, 15);
  message.updated_at = sqlite3_column_int64(stmt, 16);
  return common::Result<OutboundMessage>::success(std::move(message));
}

} // namespace

std::string_view to_string(const MessageKind value) {
  switch (value) {
  case MessageKind::Text:
    return "text";
  case MessageKind::Document:
    return "document";
  case MessageKind::Photo:
    return "photo";
  }
  return "text";
}

std::string_view to_string(const MessagePriority value) {
  switch (value) {
  case MessagePriority::Low:
    return "low";
  case MessagePriority::Normal:
    return "normal";
  case MessagePriority::High:
    return "high";
  }
  return "normal";
}

std::string_view to_string(const OutboundStatus value) {
  switch (value) {
  case OutboundStatus::Queued:
    return "queued";
  case OutboundStatus::Sent:
    return "sent";
  case OutboundStatus::Failed:
    return "failed";
  case OutboundStatus::Cancelled:
    return "cancelled";
  }
  return "queued";
}

std::string_view to_string(const EnqueueOutcome value) {
  return value == EnqueueOutcome::Enqueued ? "enqueued" : "duplicate";
}

std::optional<MessageKind> parse_message_kind(const std::string_view value) {
  if (value == "text") {
    return MessageKind::Text;
  }
  if (value == "document") {
    return MessageKind::Document;
  }
  if (value == "photo") {
    return MessageKind::Photo;
  }
  return std::nullopt;
}

std::optional<MessagePriority> parse_message_priority(const std::string_view value) {
  if (value == "low") {
    return MessagePriority::Low;
  }
  if (value == "normal") {
    return MessagePriority::Normal;
  }
  if (value == "high") {
    return MessagePriority::High;
  }
  return std::nullopt;
}

std::optional<OutboundStatus> parse_outbound_status(const std::string_view value) {
  if (value == "queued") {
    return OutboundStatus::Queued;
  }
  if (value == "sent") {
    return OutboundStatus::Sent;
  }
  if (value == "failed") {
    return OutboundStatus::Failed;
  }
  if (value == "cancelled") {
    return OutboundStatus::Cancelled;
  }
  return std::nullopt;
}

OutboundStore::OutboundStore(const std::filesystem::path &db_path) : connection_(db_path) {}

common::Status OutboundStore::check_open() const {
  if (!connection_.is_open()) {
    return common::Status::error("outbound store is not initialized: " +
                                 connection_.open_error());
  }
  return common::Status::success();
}

common::Result<std::vector<OutboundMessage>> OutboundStore::query(sqlite3_stmt *stmt) {
  std::vector<OutboundMessage> out;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    auto message = row_to_message(stmt);
    if (!message.ok()) {
      return common::Result<std::vector<OutboundMessage>>::failure(message.error());
    }
    out.push_back(std::move(message.value()));
  }
  if (rc != SQLITE_DONE) {
    return common::Result<std::vector<OutboundMessage>>::failure(
        sqlite3_errmsg(connection_.get()));
  }
  return common::Result<std::vector<OutboundMessage>>::success(std::move(out));
}

common::Result<EnqueueOutcome>
OutboundStore::enqueue_or_ignore_dedupe(const OutboundMessage &message) {
  using R = common::Result<EnqueueOutcome>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = check_open(); !status.ok()) {
    return R::failure(status.error());
  }
  const std::string sql = std::string("INSERT INTO messages_out(") + kMessageColumns +
                          ") VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, ?14, "
                          "?15, ?16, ?17)";
  auto stmt = prepare(connection_.get(), sql.c_str());
  if (!stmt.ok()) {
    return R::failure(stmt.error());
  }
  auto *s = stmt.value().get();
  bind_text(s, 1, message.id);
  bind_optional_text(s, 2, message.dedupe_key);
  sqlite3_bind_int64(s, 3, message.chat_id);
  bind_view(s, 4, to_string(message.kind));
  bind_text(s, 5, message.content);
  bind_optional_text(s, 6, message.media_path);
  bind_optional_text(s, 7, message.media_mime_type);
  bind_optional_text(s, 8, message.media_filename);
  bind_view(s, 9, to_string(message.priority));
  bind_view(s, 10, to_string(message.status));
  sqlite3_bind_int64(s, 11, message.attempt_count);
  bind_optional_int64(s, 12, message.next_attempt_at);
  bind_optional_int64(s, 13, message.sent_at);
  bind_optional_int64(s, 14, message.failed_at);
  bind_optional_text(s, 15, message.error_message);
  sqlite3_bind_int64(s, 16, message.created_at);
  sqlite3_bind_int64(s, 17, message.updated_at);

  if (sqlite3_step(s) == SQLITE_DONE) {
    return R::success(EnqueueOutcome::Enqueued);
  }
  if (message.dedupe_key.has_value() && is_unique_violation(connection_.get()) &&
      std::string(sqlite3_errmsg(connection_.get())).find("dedupe_key") != std::string::npos) {
    return R::success(EnqueueOutcome::Duplicate);
  }
  return R::failure(sqlite3_errmsg(connection_.get()));
}

common::Result<std::vector<OutboundMessage>> OutboundStore::list_due(const std::int64_t now) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = check_open(); !status.ok()) {
    return common::Result<std::vector<OutboundMessage>>::failure(status.error());
  }
  const std::string sql = std::string("SELECT ") + kMessageColumns +
                          " FROM messages_out WHERE status = 'queued' AND "
                          "(next_attempt_at IS NULL OR next_attempt_at <= ?1) "
                          "ORDER BY created_at ASC, rowid ASC";
  auto stmt = prepare(connection_.get(), sql.c_str());
  if (!stmt.ok()) {
    return common::Result<std::vector<OutboundMessage>>::failure(stmt.error());
  }
  sqlite3_bind_int64(stmt.value().get(), 1, now);
  return query(stmt.value().get());
}

common::Result<std::optional<OutboundMessage>> OutboundStore::get(const std::string &id) {
  using R = common::Result<std::optional<OutboundMessage>>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = check_open(); !status.ok()) {
    return R::failure(status.error());
  }
  const std::string sql =
      std::string("SELECT ") + kMessageColumns + " FROM messages_out WHERE id = ?1";
  auto stmt = prepare(connection_.get(), sql.c_str());
  if (!stmt.ok()) {
    return R::failure(stmt.error());
  }
  bind_text(stmt.value().get(), 1, id);
  auto rows = query(stmt.value().get());
  if (!rows.ok()) {
    return R::failure(rows.error());
  }
  if (rows.value().empty()) {
    return R::success(std::nullopt);
  }
  return R::success(std::move(rows.value().front()));
}

common::Result<std::vector<OutboundMessage>> OutboundStore::list_recent(const std::size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = check_open(); !status.ok()) {
    return common::Result<std::vector<OutboundMessage>>::failure(status.error());
  }
  const std::string sql = std::string("SELECT ") + kMessageColumns +
                          " FROM messages_out ORDER BY created_at DESC, rowid DESC LIMIT ?1";
  auto stmt = prepare(connection_.get(), sql.c_str());
  if (!stmt.ok()) {
    return common::Result<std::vector<OutboundMessage>>::failure(stmt.error());
  }
  sqlite3_bind_int(stmt.value().get(), 1,
                   static_cast<int>(std::min<std::size_t>(limit, std::numeric_limits<int>::max())));
  return query(stmt.value().get());
}

common::Result<std::size_t> OutboundStore::count_queued() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = check_open(); !status.ok()) {
    return common::Result<std::size_t>::failure(status.error());
  }
  auto stmt = prepare(connection_.get(), "SELECT COUNT(*) FROM messages_out WHERE status = 'queued'");
  if (!stmt.ok()) {
    return common::Result<std::size_t>::failure(stmt.error());
  }
  if (sqlite3_step(stmt.value().get()) != SQLITE_ROW) {
    return common::Result<std::size_t>::failure(sqlite3_errmsg(connection_.get()));
  }
  return common::Result<std::size_t>::success(
      static_cast<std::size_t>(sqlite3_column_int64(stmt.value().get(), 0)));
}

common::Status OutboundStore::apply_queued_only(sqlite3_stmt *stmt, const std::string &id) {
  if (auto status = step_done(connection_.get(), stmt); !status.ok()) {
    return status;
  }
  if (sqlite3_changes(connection_.get()) == 0) {
    return common::Status::error("outbound message " + id + " is not queued");
  }
  return common::Status::success();
}

common::Status OutboundStore::mark_sent(const std::string &id, const std::int64_t attempt_count,
                                        const std::int64_t now) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = check_open(); !status.ok()) {
    return status;
  }
  auto stmt = prepare(connection_.get(), R"(
UPDATE messages_out
SET status = 'sent',
    attempt_count = MAX(attempt_count, ?1),
    next_attempt_at = NULL,
    sent_at = ?2,
    failed_at = NULL,
    error_message = NULL,
    updated_at = ?2
WHERE id = ?3
  AND status = 'queued'
)");
  if (!stmt.ok()) {
    return stmt.status();
  }
  sqlite3_bind_int64(stmt.value().get(), 1, attempt_count);
  sqlite3_bind_int64(stmt.value().get(), 2, now);
  bind_text(stmt.value().get(), 3, id);
  return apply_queued_only(stmt.value().get(), id);
}

common::Status OutboundStore::mark_retry(const std::string &id, const std::int64_t attempt_count,
                                         const std::int64_t next_attempt_at,
                                         const std::string &error_message,
                                         const std::int64_t now) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = check_open(); !status.ok()) {
    return status;
  }
  auto stmt = prepare(connection_.get(), R"(
UPDATE messages_out
SET attempt_count = MAX(attempt_count, ?1),
    next_attempt_at = ?2,
    error_message = ?3,
    updated_at = ?4
WHERE id = ?5
  AND status = 'queued'
)");
  if (!stmt.ok()) {
    return stmt.status();
  }
  auto *s = stmt.value().get();
  sqlite3_bind_int64(s, 1, attempt_count);
  sqlite3_bind_int64(s, 2, next_attempt_at);
  bind_text(s, 3, error_message);
  sqlite3_bind_int64(s, 4, now);
  bind_text(s, 5, id);
  return apply_queued_only(s, id);
}

common::Status OutboundStore::mark_failed(const std::string &id, const std::int64_t attempt_count,
                                          const std::string &error_message,
                                          const std::int64_t now) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = check_open(); !status.ok()) {
    return status;
  }
  auto stmt = prepare(connection_.get(), R"(
UPDATE messages_out
SET status = 'failed',
    attempt_count = MAX(attempt_count, ?1),
    next_attempt_at = NULL,
    failed_at = ?2,
    error_message = ?3,
    updated_at = ?2
WHERE id = ?4
  AND status = 'queued'
)");
  if (!stmt.ok()) {
    return stmt.status();
  }
  auto *s = stmt.value().get();
  sqlite3_bind_int64(s, 1, attempt_count);
  sqlite3_bind_int64(s, 2, now);
  bind_text(s, 3, error_message);
  bind_text(s, 4, id);
  return apply_queued_only(s, id);
}

common::Result<bool> OutboundStore::cancel(const std::string &id, const std::int64_t now) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = check_open(); !status.ok()) {
    return common::Result<bool>::failure(status.error());
  }
  auto stmt = prepare(connection_.get(), R"(
UPDATE messages_out
SET status = 'cancelled',
    next_attempt_at = NULL,
    updated_at = ?1
WHERE id = ?2
  AND status = 'queued'
)");
  if (!stmt.ok()) {
    return common::Result<bool>::failure(stmt.error());
  }
  sqlite3_bind_int64(stmt.value().get(), 1, now);
  bind_text(stmt.value().get(), 2, id);
  if (auto status = step_done(connection_.get(), stmt.value().get()); !status.ok()) {
    return common::Result<bool>::failure(status.error());
  }
  return common::Result<bool>::success(sqlite3_changes(connection_.get()) > 0);
}

} // namespace otto::persistence
