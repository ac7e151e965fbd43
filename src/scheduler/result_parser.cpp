#include "otto/scheduler/result_parser.hpp"

#include "otto/common/fs.hpp"
#include "otto/common/json_util.hpp"

#include <sstream>
#include <string_view>

namespace otto::scheduler {

namespace {

constexpr const char *kInvalidJson = "invalid_result_json";
constexpr const char *kInvalidSchema = "invalid_result_schema";
constexpr const char *kNotJsonMessage = "Task execution output must be valid JSON";

struct SchemaCheck {
  std::optional<TaskExecutionResult> result;
  std::string error;
};

SchemaCheck schema_error(std::string message) { return SchemaCheck{std::nullopt, std::move(message)}; }

std::optional<std::string> trimmed_string_member(const common::JsonRawMap &members,
                                                 const std::string &key) {
  const auto it = members.find(key);
  if (it == members.end()) {
    return std::nullopt;
  }
  const auto value = common::json_as_string(it->second);
  if (!value.has_value()) {
    return std::nullopt;
  }
  return common::trim(*value);
}

// Folds the loose shapes assistants produce into {code, message} pairs: bare strings become
// task_error entries, complete objects are kept, anything else non-null is stringified.
std::vector<TaskError> normalize_errors(const std::string &raw_errors) {
  std::vector<TaskError> errors;
  const auto elements = common::json_array_elements(raw_errors);
  if (!elements.has_value()) {
    return errors;
  }

  for (const auto &entry : *elements) {
    if (entry == "null") {
      continue;
    }
    if (const auto text = common::json_as_string(entry); text.has_value()) {
      errors.push_back(TaskError{"task_error", common::trim(*text)});
      continue;
    }
    if (const auto members = common::json_object_members(entry); members.has_value()) {
      const auto code = trimmed_string_member(*members, "code").value_or("");
      const auto message = trimmed_string_member(*members, "message").value_or("");
      if (!code.empty() && !message.empty()) {
        errors.push_back(TaskError{code, message});
        continue;
      }
    }
    errors.push_back(TaskError{"task_error", entry});
  }
  return errors;
}

SchemaCheck validate_result(const std::string &json) {
  const auto members = common::json_object_members(json);
  if (!members.has_value()) {
    return schema_error("result must be a JSON object");
  }

  const auto status_it = members->find("status");
  const auto status_text =
      status_it == members->end() ? std::nullopt : common::json_as_string(status_it->second);
  if (!status_text.has_value()) {
    return schema_error("status is required and must be a string");
  }
  const auto status = parse_task_result_status(*status_text);
  if (!status.has_value()) {
    return schema_error("status must be one of: success, failed, skipped");
  }

  const auto summary = trimmed_string_member(*members, "summary");
  if (!summary.has_value()) {
    return schema_error("summary is required and must be a string");
  }
  if (summary->empty()) {
    return schema_error("summary must not be empty");
  }

  TaskExecutionResult result{.status = *status, .summary = *summary, .errors = {}};
  if (const auto errors_it = members->find("errors"); errors_it != members->end()) {
    result.errors = normalize_errors(errors_it->second);
  }
  for (std::size_t i = 0; i < result.errors.size(); ++i) {
    if (result.errors[i].message.empty()) {
      return schema_error("errors[" + std::to_string(i) + "].message must not be empty");
    }
  }
  return SchemaCheck{std::move(result), ""};
}

// Linear scan for the first ```json fence (any case) and the next closing fence.
std::optional<std::string> fenced_json_block(const std::string &text) {
  constexpr std::string_view kOpen = "```json";
  constexpr std::string_view kClose = "```";
  const std::string lowered = common::to_lower(text);
  const auto open = lowered.find(kOpen);
  if (open == std::string::npos) {
    return std::nullopt;
  }
  const auto body_start = open + kOpen.size();
  const auto close = text.find(kClose, body_start);
  if (close == std::string::npos) {
    return std::nullopt;
  }
  std::string body = common::trim(text.substr(body_start, close - body_start));
  if (body.empty()) {
    return std::nullopt;
  }
  return body;
}

} // namespace

std::string_view to_string(const TaskResultStatus value) {
  switch (value) {
  case TaskResultStatus::Success:
    return "success";
  case TaskResultStatus::Failed:
    return "failed";
  case TaskResultStatus::Skipped:
    return "skipped";
  }
  return "failed";
}

std::optional<TaskResultStatus> parse_task_result_status(const std::string_view value) {
  if (value == "success") {
    return TaskResultStatus::Success;
  }
  if (value == "failed") {
    return TaskResultStatus::Failed;
  }
  if (value == "skipped") {
    return TaskResultStatus::Skipped;
  }
  return std::nullopt;
}

ParseOutcome parse_structured_result(const std::string &assistant_text) {
  const std::string trimmed = common::trim(assistant_text);
  if (trimmed.empty()) {
    return ParseFailed{kInvalidJson, "Task execution returned empty output", std::nullopt};
  }

  if (common::json_validate(trimmed)) {
    auto checked = validate_result(trimmed);
    if (!checked.result.has_value()) {
      return ParseFailed{kInvalidSchema, checked.error, trimmed};
    }
    return DirectParse{std::move(*checked.result)};
  }

  const auto block = fenced_json_block(trimmed);
  if (!block.has_value() || !common::json_validate(*block)) {
    return ParseFailed{kInvalidJson, kNotJsonMessage, trimmed};
  }
  auto checked = validate_result(*block);
  if (!checked.result.has_value()) {
    return ParseFailed{kInvalidSchema, checked.error, trimmed};
  }
  return FencedParse{std::move(*checked.result)};
}

TaskExecutionResult to_failure_result(const std::string &code, const std::string &message) {
  return TaskExecutionResult{
      .status = TaskResultStatus::Failed,
      .summary = message,
      .errors = {TaskError{code, message}},
  };
}

TaskExecutionResult outcome_result(const ParseOutcome &outcome) {
  if (const auto *failed = std::get_if<ParseFailed>(&outcome)) {
    return to_failure_result(failed->code, failed->message);
  }
  if (const auto *fenced = std::get_if<FencedParse>(&outcome)) {
    return fenced->result;
  }
  return std::get<DirectParse>(outcome).result;
}

std::optional<std::string> outcome_raw_output(const ParseOutcome &outcome) {
  if (const auto *failed = std::get_if<ParseFailed>(&outcome)) {
    return failed->raw_output;
  }
  return std::nullopt;
}

std::string serialize_result(const TaskExecutionResult &result,
                             const std::optional<std::string> &raw_output) {
  std::ostringstream out;
  out << "{\"status\":" << common::json_quote(std::string(to_string(result.status)))
      << ",\"summary\":" << common::json_quote(result.summary) << ",\"errors\":[";
  for (std::size_t i = 0; i < result.errors.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    out << "{\"code\":" << common::json_quote(result.errors[i].code)
        << ",\"message\":" << common::json_quote(result.errors[i].message) << "}";
  }
  out << "]";
  if (raw_output.has_value() && !raw_output->empty()) {
    out << ",\"rawOutput\":" << common::json_quote(*raw_output);
  }
  out << "}";
  return out.str();
}

RunStatusMapping map_run_status(const TaskExecutionResult &result) {
  switch (result.status) {
  case TaskResultStatus::Success:
    return RunStatusMapping{persistence::RunStatus::Success, std::nullopt, std::nullopt};
  case TaskResultStatus::Skipped:
    return RunStatusMapping{persistence::RunStatus::Skipped, std::nullopt, std::nullopt};
  case TaskResultStatus::Failed:
    break;
  }
  if (result.errors.empty()) {
    return RunStatusMapping{persistence::RunStatus::Failed, "task_failed", result.summary};
  }
  return RunStatusMapping{persistence::RunStatus::Failed, result.errors.front().code,
                          result.errors.front().message};
}

} // namespace otto::scheduler
