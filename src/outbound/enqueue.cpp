#include "otto/outbound/enqueue.hpp"

#include "otto/common/crypto.hpp"
#include "otto/common/fs.hpp"

namespace otto::outbound {

namespace {

bool is_continuation_byte(const unsigned char ch) { return (ch & 0xC0U) == 0x80U; }

std::size_t count_code_points(const std::string &text) {
  std::size_t count = 0;
  for (const char ch : text) {
    if (!is_continuation_byte(static_cast<unsigned char>(ch))) {
      ++count;
    }
  }
  return count;
}

common::Result<std::optional<std::string>>
normalize_dedupe_key(const std::optional<std::string> &raw) {
  if (!raw.has_value()) {
    return common::Result<std::optional<std::string>>::success(std::nullopt);
  }
  std::string key = common::trim(*raw);
  if (key.empty()) {
    return common::Result<std::optional<std::string>>::failure("dedupe_key must not be empty");
  }
  if (key.size() > kMaxDedupeKeyLength) {
    return common::Result<std::optional<std::string>>::failure(
        "dedupe_key must be at most " + std::to_string(kMaxDedupeKeyLength) + " characters");
  }
  return common::Result<std::optional<std::string>>::success(std::move(key));
}

persistence::OutboundMessage queued_row(const std::int64_t chat_id, const std::int64_t now) {
  persistence::OutboundMessage row;
  row.id = common::generate_uuid();
  row.chat_id = chat_id;
  row.status = persistence::OutboundStatus::Queued;
  row.attempt_count = 0;
  row.next_attempt_at = now;
  row.created_at = now;
  row.updated_at = now;
  return row;
}

} // namespace

std::vector<std::string> split_message(const std::string &text, const std::size_t limit) {
  if (limit == 0 || count_code_points(text) <= limit) {
    return {text};
  }

  std::vector<std::string> chunks;
  std::size_t start = 0;
  std::size_t points = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (is_continuation_byte(static_cast<unsigned char>(text[i]))) {
      continue;
    }
    if (points == limit) {
      chunks.push_back(text.substr(start, i - start));
      start = i;
      points = 0;
    }
    ++points;
  }
  if (start < text.size()) {
    chunks.push_back(text.substr(start));
  }
  return chunks;
}

common::Result<EnqueueResult> enqueue_text(const QueueTextInput &input,
                                           persistence::OutboundStore &store,
                                           const std::int64_t now) {
  if (input.chat_id <= 0) {
    return common::Result<EnqueueResult>::failure("chat_id must be a positive integer");
  }
  const std::string content = common::trim(input.content);
  if (content.empty()) {
    return common::Result<EnqueueResult>::failure("content must not be empty");
  }
  auto dedupe_key = normalize_dedupe_key(input.dedupe_key);
  if (!dedupe_key.ok()) {
    return common::Result<EnqueueResult>::failure(dedupe_key.error());
  }

  const auto chunks = split_message(content);
  EnqueueResult result;
  result.dedupe_key = dedupe_key.value();

  for (std::size_t i = 0; i < chunks.size(); ++i) {
    auto row = queued_row(input.chat_id, now);
    row.kind = persistence::MessageKind::Text;
    row.content = chunks[i];
    row.priority = input.priority;
    if (result.dedupe_key.has_value()) {
      row.dedupe_key = *result.dedupe_key + ":" + std::to_string(i + 1) + "/" +
                       std::to_string(chunks.size());
    }

    const auto outcome = store.enqueue_or_ignore_dedupe(row);
    if (!outcome.ok()) {
      return common::Result<EnqueueResult>::failure(outcome.error());
    }
    if (outcome.value() == persistence::EnqueueOutcome::Enqueued) {
      ++result.queued_count;
      result.message_ids.push_back(row.id);
    } else {
      ++result.duplicate_count;
    }
  }

  result.status = result.queued_count > 0 ? persistence::EnqueueOutcome::Enqueued
                                          : persistence::EnqueueOutcome::Duplicate;
  return common::Result<EnqueueResult>::success(std::move(result));
}

common::Result<EnqueueResult> enqueue_file(const QueueFileInput &input,
                                           persistence::OutboundStore &store,
                                           const std::int64_t now) {
  if (input.chat_id <= 0) {
    return common::Result<EnqueueResult>::failure("chat_id must be a positive integer");
  }
  if (input.kind != persistence::MessageKind::Document &&
      input.kind != persistence::MessageKind::Photo) {
    return common::Result<EnqueueResult>::failure("file kind must be document or photo");
  }
  const std::string file_path = common::trim(input.file_path);
  const std::string mime_type = common::trim(input.mime_type);
  if (file_path.empty() || mime_type.empty()) {
    return common::Result<EnqueueResult>::failure("file_path and mime_type are required");
  }
  std::optional<std::string> file_name;
  if (input.file_name.has_value()) {
    file_name = common::trim(*input.file_name);
    if (file_name->empty()) {
      return common::Result<EnqueueResult>::failure("file_name must not be empty");
    }
  }
  const std::string caption = common::trim(input.caption.value_or(""));
  if (count_code_points(caption) > kMaxCaptionLength) {
    return common::Result<EnqueueResult>::failure(
        "caption must be at most " + std::to_string(kMaxCaptionLength) + " characters");
  }
  auto dedupe_key = normalize_dedupe_key(input.dedupe_key);
  if (!dedupe_key.ok()) {
    return common::Result<EnqueueResult>::failure(dedupe_key.error());
  }

  auto row = queued_row(input.chat_id, now);
  row.dedupe_key = dedupe_key.value();
  row.kind = input.kind;
  row.content = caption;
  row.media_path = file_path;
  row.media_mime_type = mime_type;
  row.media_filename = file_name;
  row.priority = input.priority;

  const auto outcome = store.enqueue_or_ignore_dedupe(row);
  if (!outcome.ok()) {
    return common::Result<EnqueueResult>::failure(outcome.error());
  }

  EnqueueResult result;
  result.dedupe_key = dedupe_key.value();
  result.status = outcome.value();
  if (outcome.value() == persistence::EnqueueOutcome::Enqueued) {
    result.queued_count = 1;
    result.message_ids.push_back(row.id);
  } else {
    result.duplicate_count = 1;
  }
  return common::Result<EnqueueResult>::success(std::move(result));
}

} // namespace otto::outbound
