#pragma once

#include "otto/common/result.hpp"
#include "otto/persistence/job_store.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace otto::scheduler {

inline constexpr std::int64_t kMinuteMs = 60'000;

struct RescheduleTransition {
  std::int64_t last_run_at = 0;
  std::int64_t next_run_at = 0;
};

struct FinalizeTransition {
  persistence::TerminalState terminal_state = persistence::TerminalState::Completed;
  std::optional<std::string> terminal_reason;
  std::int64_t last_run_at = 0;
};

using ScheduleTransition = std::variant<RescheduleTransition, FinalizeTransition>;

/// Next job state after a run completes, independent of the run's outcome. One-shot jobs
/// always finalize as completed; recurring jobs move forward by their cadence.
/// Throws common::ConfigurationError for a recurring job without a cadence >= 1.
[[nodiscard]] ScheduleTransition resolve_schedule_transition(const persistence::Job &job,
                                                             std::int64_t completed_at);

/// Writes the transition through the lock-fenced store operations.
[[nodiscard]] common::Status apply_schedule_transition(persistence::JobStore &store,
                                                       const persistence::Job &job,
                                                       const std::string &lock_token,
                                                       const ScheduleTransition &transition,
                                                       std::int64_t updated_at);

} // namespace otto::scheduler
