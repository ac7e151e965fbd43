#pragma once

#include "otto/persistence/job_store.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace otto::scheduler {

enum class TaskResultStatus { Success, Failed, Skipped };

[[nodiscard]] std::string_view to_string(TaskResultStatus value);
[[nodiscard]] std::optional<TaskResultStatus> parse_task_result_status(std::string_view value);

struct TaskError {
  std::string code;
  std::string message;
};

/// The `{status, summary, errors}` object a task execution reports.
struct TaskExecutionResult {
  TaskResultStatus status = TaskResultStatus::Failed;
  std::string summary;
  std::vector<TaskError> errors;
};

/// The assistant text was itself the JSON object.
struct DirectParse {
  TaskExecutionResult result;
};

/// The JSON object was recovered from a ```json fenced block.
struct FencedParse {
  TaskExecutionResult result;
};

struct ParseFailed {
  /// invalid_result_json or invalid_result_schema.
  std::string code;
  std::string message;
  /// Trimmed assistant text; absent when the output was empty.
  std::optional<std::string> raw_output;
};

using ParseOutcome = std::variant<DirectParse, FencedParse, ParseFailed>;

/// Reads untrusted assistant text as a task result: whole text first, then the first fenced
/// json block. Schema failures on the whole text do not fall through to the fenced block.
[[nodiscard]] ParseOutcome parse_structured_result(const std::string &assistant_text);

/// A failed result carrying a single error with the same code and message.
[[nodiscard]] TaskExecutionResult to_failure_result(const std::string &code,
                                                    const std::string &message);

/// The result a run records for an outcome; ParseFailed maps to to_failure_result.
[[nodiscard]] TaskExecutionResult outcome_result(const ParseOutcome &outcome);
[[nodiscard]] std::optional<std::string> outcome_raw_output(const ParseOutcome &outcome);

/// Compact JSON with keys status, summary, errors and, when given, rawOutput.
[[nodiscard]] std::string serialize_result(const TaskExecutionResult &result,
                                           const std::optional<std::string> &raw_output);

struct RunStatusMapping {
  persistence::RunStatus status = persistence::RunStatus::Skipped;
  std::optional<std::string> error_code;
  std::optional<std::string> error_message;
};

/// failed takes its error fields from the first reported error, falling back to
/// task_failed and the summary.
[[nodiscard]] RunStatusMapping map_run_status(const TaskExecutionResult &result);

} // namespace otto::scheduler
