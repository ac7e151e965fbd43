#pragma once

#include "otto/common/clock.hpp"
#include "otto/common/result.hpp"
#include "otto/gateway/session_gateway.hpp"
#include "otto/persistence/job_store.hpp"
#include "otto/persistence/outbound_store.hpp"
#include "otto/persistence/session_binding_store.hpp"
#include "otto/persistence/user_profile_store.hpp"
#include "otto/scheduler/heartbeat.hpp"
#include "otto/scheduler/result_parser.hpp"
#include "otto/scheduler/watchdog.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace otto::scheduler {

/// Payload of every assistant job: any well-formed JSON value, or absent.
struct AssistantTaskPayload {
  std::optional<std::string> json;
};

using TaskPayload = std::variant<WatchdogPayload, HeartbeatPayload, AssistantTaskPayload>;

/// Interprets the stored payload according to the job type.
[[nodiscard]] common::Result<TaskPayload> interpret_payload(const persistence::Job &job);

/// The instruction sent to the gateway for a scheduled assistant task.
[[nodiscard]] std::string build_execution_prompt(const persistence::Job &job,
                                                 const AssistantTaskPayload &payload,
                                                 std::int64_t executed_at);

[[nodiscard]] std::string assistant_binding_key(const std::string &job_id);

/// Runs one job that the caller has already claimed. Implementations must leave the job
/// either transitioned or unlocked when they return normally.
class IClaimedJobExecutor {
public:
  virtual ~IClaimedJobExecutor() = default;

  /// A failed Status means a store-level failure; the caller releases the lock.
  [[nodiscard]] virtual common::Status execute_claimed_job(const persistence::Job &job) = 0;
};

struct TaskExecutionEngineOptions {
  /// Otto home directory; task-config/ is read from here.
  std::filesystem::path home;
  /// Alert chat for watchdog jobs whose payload names none.
  std::optional<std::int64_t> default_watchdog_chat_id;
  /// Chat for heartbeat jobs whose payload names none.
  std::optional<std::int64_t> default_heartbeat_chat_id;
};

/// Turns a claimed job into exactly one finished run row and a schedule transition.
/// Gateway and payload problems become failed runs; only store failures surface.
class TaskExecutionEngine final : public IClaimedJobExecutor {
public:
  TaskExecutionEngine(persistence::JobStore &jobs, persistence::SessionBindingStore &bindings,
                      persistence::OutboundStore &outbound,
                      persistence::UserProfileStore &profiles, gateway::ISessionGateway &gateway,
                      TaskExecutionEngineOptions options, common::Clock clock);

  /// Throws common::ConfigurationError when the job carries no lock token.
  [[nodiscard]] common::Status execute_claimed_job(const persistence::Job &job) override;

private:
  struct ExecutionOutput {
    TaskExecutionResult result;
    std::optional<std::string> raw_output;
  };

  [[nodiscard]] ExecutionOutput run_job(const persistence::Job &job, std::int64_t started_at);
  [[nodiscard]] ExecutionOutput run_watchdog(const WatchdogPayload &payload,
                                             std::int64_t started_at);
  [[nodiscard]] ExecutionOutput run_heartbeat(const HeartbeatPayload &payload,
                                              std::int64_t started_at);
  [[nodiscard]] ExecutionOutput run_assistant(const persistence::Job &job,
                                              const AssistantTaskPayload &payload,
                                              std::int64_t started_at);
  void apply_transition(const persistence::Job &job, const std::string &lock_token,
                        std::int64_t finished_at);

  persistence::JobStore &jobs_;
  persistence::SessionBindingStore &bindings_;
  persistence::OutboundStore &outbound_;
  persistence::UserProfileStore &profiles_;
  gateway::ISessionGateway &gateway_;
  TaskExecutionEngineOptions options_;
  common::Clock clock_;
};

} // namespace otto::scheduler
