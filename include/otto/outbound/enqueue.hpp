#pragma once

#include "otto/common/result.hpp"
#include "otto/persistence/outbound_store.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace otto::outbound {

inline constexpr std::size_t kTelegramMessageLimit = 4096;
inline constexpr std::size_t kMaxDedupeKeyLength = 512;
inline constexpr std::size_t kMaxCaptionLength = 4000;

struct QueueTextInput {
  std::int64_t chat_id = 0;
  std::string content;
  std::optional<std::string> dedupe_key;
  persistence::MessagePriority priority = persistence::MessagePriority::Normal;
};

struct QueueFileInput {
  std::int64_t chat_id = 0;
  /// Document or Photo.
  persistence::MessageKind kind = persistence::MessageKind::Document;
  std::string file_path;
  std::string mime_type;
  std::optional<std::string> file_name;
  std::optional<std::string> caption;
  std::optional<std::string> dedupe_key;
  persistence::MessagePriority priority = persistence::MessagePriority::Normal;
};

struct EnqueueResult {
  /// Enqueued when at least one row was newly inserted.
  persistence::EnqueueOutcome status = persistence::EnqueueOutcome::Duplicate;
  std::size_t queued_count = 0;
  std::size_t duplicate_count = 0;
  std::vector<std::string> message_ids;
  std::optional<std::string> dedupe_key;
};

/// Splits text into pieces of at most `limit` code points, never inside a UTF-8 sequence.
[[nodiscard]] std::vector<std::string> split_message(const std::string &text,
                                                     std::size_t limit = kTelegramMessageLimit);

/// Queues one text row per chunk. With a dedupe key, chunk i of n is keyed `<key>:<i>/<n>`.
[[nodiscard]] common::Result<EnqueueResult>
enqueue_text(const QueueTextInput &input, persistence::OutboundStore &store, std::int64_t now);

/// Queues a single document or photo row; the caption becomes the row content.
[[nodiscard]] common::Result<EnqueueResult>
enqueue_file(const QueueFileInput &input, persistence::OutboundStore &store, std::int64_t now);

} // namespace otto::outbound
