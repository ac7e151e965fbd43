#include "otto/scheduler/executor.hpp"

#include "otto/common/crypto.hpp"
#include "otto/common/fs.hpp"
#include "otto/common/json_util.hpp"
#include "otto/observability/global.hpp"
#include "otto/scheduler/schedule.hpp"
#include "otto/scheduler/task_config.hpp"

#include <exception>
#include <iostream>
#include <sstream>

namespace otto::scheduler {

namespace {

constexpr const char *kDefaultAgent = "assistant";
constexpr const char *kExecutionErrorCode = "task_execution_error";

void log_job_error(const std::string &event, const std::string &job_id,
                   const std::string &message) {
  observability::record_error("scheduler", event + " " + job_id + ": " + message);
}

} // namespace

common::Result<TaskPayload> interpret_payload(const persistence::Job &job) {
  if (job.type == kWatchdogTaskType) {
    auto watchdog = parse_watchdog_payload(job.payload);
    if (!watchdog.ok()) {
      return common::Result<TaskPayload>::failure(watchdog.error());
    }
    return common::Result<TaskPayload>::success(TaskPayload{watchdog.value()});
  }
  if (job.type == kHeartbeatTaskType) {
    auto heartbeat = parse_heartbeat_payload(job.payload);
    if (!heartbeat.ok()) {
      return common::Result<TaskPayload>::failure(heartbeat.error());
    }
    return common::Result<TaskPayload>::success(TaskPayload{heartbeat.value()});
  }

  if (!job.payload.has_value()) {
    return common::Result<TaskPayload>::success(TaskPayload{AssistantTaskPayload{}});
  }
  const std::string trimmed = common::trim(*job.payload);
  if (!common::json_validate(trimmed)) {
    return common::Result<TaskPayload>::failure("Task payload is not valid JSON");
  }
  if (trimmed == "null") {
    return common::Result<TaskPayload>::success(TaskPayload{AssistantTaskPayload{}});
  }
  return common::Result<TaskPayload>::success(TaskPayload{AssistantTaskPayload{trimmed}});
}

std::string build_execution_prompt(const persistence::Job &job, const AssistantTaskPayload &payload,
                                   const std::int64_t executed_at) {
  std::ostringstream task;
  task << "{\"id\":" << common::json_quote(job.id) << ",\"type\":" << common::json_quote(job.type)
       << ",\"scheduleType\":" << common::json_quote(std::string(to_string(job.schedule_type)))
       << ",\"profileId\":" << common::json_quote_or_null(job.profile_id)
       << ",\"payload\":" << payload.json.value_or("null") << ",\"executedAt\":" << executed_at
       << "}";

  std::ostringstream prompt;
  prompt << "Execute this scheduled Otto task now.\n"
         << "Return only a JSON object with keys: status, summary, errors.\n"
         << "status must be one of: success, failed, skipped.\n"
         << "Do not ask clarifying questions and do not include markdown.\n"
         << "\n"
         << "Task:\n"
         << common::json_pretty(task.str());
  return prompt.str();
}

std::string assistant_binding_key(const std::string &job_id) {
  return "scheduler:task:" + job_id + ":assistant";
}

TaskExecutionEngine::TaskExecutionEngine(persistence::JobStore &jobs,
                                         persistence::SessionBindingStore &bindings,
                                         persistence::OutboundStore &outbound,
                                         persistence::UserProfileStore &profiles,
                                         gateway::ISessionGateway &gateway,
                                         TaskExecutionEngineOptions options, common::Clock clock)
    : jobs_(jobs), bindings_(bindings), outbound_(outbound), profiles_(profiles), gateway_(gateway),
      options_(std::move(options)), clock_(std::move(clock)) {}

common::Status TaskExecutionEngine::execute_claimed_job(const persistence::Job &job) {
  if (!job.lock_token.has_value() || job.lock_token->empty()) {
    throw common::ConfigurationError("claimed job " + job.id + " is missing lock token");
  }
  const std::string lock_token = *job.lock_token;

  const std::int64_t started_at = clock_();
  persistence::JobRun placeholder;
  placeholder.id = common::generate_uuid();
  placeholder.job_id = job.id;
  placeholder.scheduled_for = job.next_run_at;
  placeholder.started_at = started_at;
  placeholder.status = persistence::RunStatus::Skipped;
  placeholder.created_at = started_at;
  if (const auto inserted = jobs_.insert_run(placeholder); !inserted.ok()) {
    return inserted.with_context("insert run for " + job.id);
  }

  const ExecutionOutput output = run_job(job, started_at);

  const std::int64_t finished_at = clock_();
  const auto mapped = map_run_status(output.result);
  const auto finished = jobs_.mark_run_finished(
      placeholder.id, persistence::RunCompletion{
                          .finished_at = finished_at,
                          .status = mapped.status,
                          .error_code = mapped.error_code,
                          .error_message = mapped.error_message,
                          .result_json = serialize_result(output.result, output.raw_output),
                      });
  if (!finished.ok()) {
    return finished.with_context("finish run " + placeholder.id);
  }

  observability::record_event(observability::JobRunEvent{
      job.id, job.type, std::string(persistence::to_string(mapped.status)),
      mapped.error_code.value_or("")});

  apply_transition(job, lock_token, finished_at);
  return common::Status::success();
}

TaskExecutionEngine::ExecutionOutput TaskExecutionEngine::run_job(const persistence::Job &job,
                                                                  const std::int64_t started_at) {
  try {
    const auto payload = interpret_payload(job);
    if (!payload.ok()) {
      const char *code = job.type == kWatchdogTaskType    ? "invalid_watchdog_payload"
                         : job.type == kHeartbeatTaskType ? "invalid_heartbeat_payload"
                                                          : "invalid_task_payload";
      return ExecutionOutput{to_failure_result(code, payload.error()), std::nullopt};
    }

    if (const auto *watchdog = std::get_if<WatchdogPayload>(&payload.value())) {
      return run_watchdog(*watchdog, started_at);
    }
    if (const auto *heartbeat = std::get_if<HeartbeatPayload>(&payload.value())) {
      return run_heartbeat(*heartbeat, started_at);
    }
    return run_assistant(job, std::get<AssistantTaskPayload>(payload.value()), started_at);
  } catch (const std::exception &ex) {
    log_job_error("execution_failed", job.id, ex.what());
    return ExecutionOutput{to_failure_result(kExecutionErrorCode, ex.what()), std::nullopt};
  }
}

TaskExecutionEngine::ExecutionOutput
TaskExecutionEngine::run_watchdog(const WatchdogPayload &payload, const std::int64_t started_at) {
  const auto checked = check_task_failures(jobs_, outbound_,
                                           WatchdogCheckOptions{
                                               .payload = payload,
                                               .default_chat_id = options_.default_watchdog_chat_id,
                                               .exclude_task_type = std::string(kWatchdogTaskType),
                                           },
                                           started_at);
  if (!checked.ok()) {
    return ExecutionOutput{to_failure_result(kExecutionErrorCode, checked.error()), std::nullopt};
  }

  const auto &check = checked.value();
  observability::record_event(observability::WatchdogAlertEvent{
      check.failed_count, std::string(to_string(check.notification_status))});

  if (check.should_alert && check.notification_status == WatchdogNotificationStatus::NoChatId) {
    return ExecutionOutput{
        to_failure_result("watchdog_notification_unavailable",
                          "Watchdog detected failures but no Telegram chat id is configured for "
                          "alerts"),
        std::nullopt};
  }

  const std::string notification =
      check.notification_status == WatchdogNotificationStatus::NotRequested
          ? "notification skipped"
          : "notification " + std::string(to_string(check.notification_status));
  return ExecutionOutput{
      TaskExecutionResult{
          .status = TaskResultStatus::Success,
          .summary = "Watchdog checked " + std::to_string(check.failed_count) + " failed runs (" +
                     notification + ")",
          .errors = {},
      },
      std::nullopt};
}

TaskExecutionEngine::ExecutionOutput
TaskExecutionEngine::run_heartbeat(const HeartbeatPayload &payload, const std::int64_t started_at) {
  const auto executed = execute_heartbeat(jobs_, outbound_, profiles_,
                                          HeartbeatOptions{
                                              .payload = payload,
                                              .default_chat_id = options_.default_heartbeat_chat_id,
                                          },
                                          started_at);
  if (!executed.ok()) {
    return ExecutionOutput{to_failure_result(kExecutionErrorCode, executed.error()),
                           std::nullopt};
  }
  return ExecutionOutput{
      TaskExecutionResult{
          .status = TaskResultStatus::Success,
          .summary = executed.value().summary,
          .errors = {},
      },
      std::nullopt};
}

TaskExecutionEngine::ExecutionOutput
TaskExecutionEngine::run_assistant(const persistence::Job &job, const AssistantTaskPayload &payload,
                                   const std::int64_t started_at) {
  const auto base = load_task_runtime_base_config(options_.home);
  if (!base.ok()) {
    return ExecutionOutput{to_failure_result(kExecutionErrorCode, base.error()), std::nullopt};
  }
  std::optional<TaskProfile> profile;
  if (job.profile_id.has_value()) {
    auto loaded = load_task_profile(options_.home, *job.profile_id);
    if (!loaded.ok()) {
      return ExecutionOutput{to_failure_result(kExecutionErrorCode, loaded.error()), std::nullopt};
    }
    profile = std::move(loaded.value());
  }
  const auto config =
      build_effective_task_execution_config(base.value(), persistence::Lane::Scheduled, profile);

  const std::string binding_key = assistant_binding_key(job.id);
  const auto binding = bindings_.get(binding_key);
  if (!binding.ok()) {
    return ExecutionOutput{to_failure_result(kExecutionErrorCode, binding.error()), std::nullopt};
  }
  std::optional<std::string> existing_session;
  if (binding.value().has_value()) {
    existing_session = binding.value()->session_id;
  }

  const auto session = gateway_.ensure_session(existing_session);
  if (!session.ok()) {
    log_job_error("ensure_session_failed", job.id, session.error());
    return ExecutionOutput{to_failure_result(kExecutionErrorCode, session.error()), std::nullopt};
  }
  if (existing_session != session.value()) {
    const auto upserted = bindings_.upsert(binding_key, session.value(), clock_());
    if (!upserted.ok()) {
      log_job_error("binding_upsert_failed", job.id, upserted.error());
    }
  }

  const auto reply = gateway_.prompt_session(session.value(),
                                             build_execution_prompt(job, payload, started_at),
                                             gateway::PromptOptions{
                                                 .system_prompt = config.system_prompt,
                                                 .tools = config.tools,
                                                 .agent = config.agent.value_or(kDefaultAgent),
                                             });
  if (!reply.ok()) {
    log_job_error("prompt_failed", job.id, reply.error());
    return ExecutionOutput{to_failure_result(kExecutionErrorCode, reply.error()), std::nullopt};
  }

  const auto outcome = parse_structured_result(reply.value());
  if (const auto *failed = std::get_if<ParseFailed>(&outcome)) {
    std::cerr << "[scheduler] nonconforming_output job_id=" << job.id << " code=" << failed->code
              << " message=" << failed->message << "\n";
  }
  return ExecutionOutput{outcome_result(outcome), outcome_raw_output(outcome)};
}

void TaskExecutionEngine::apply_transition(const persistence::Job &job,
                                           const std::string &lock_token,
                                           const std::int64_t finished_at) {
  common::Status applied = common::Status::success();
  try {
    const auto transition = resolve_schedule_transition(job, finished_at);
    applied = apply_schedule_transition(jobs_, job, lock_token, transition, finished_at);
  } catch (const std::exception &ex) {
    applied = common::Status::error(ex.what());
  }
  if (applied.ok()) {
    return;
  }

  log_job_error("transition_failed", job.id, applied.error());
  const auto released = jobs_.release_lock(job.id, lock_token, finished_at);
  if (!released.ok()) {
    log_job_error("release_lock_failed", job.id, released.error());
  }
}

} // namespace otto::scheduler
