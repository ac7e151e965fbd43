#include "otto/scheduler/schedule.hpp"

#include <type_traits>

namespace otto::scheduler {

ScheduleTransition resolve_schedule_transition(const persistence::Job &job,
                                               const std::int64_t completed_at) {
  if (job.schedule_type == persistence::ScheduleType::Oneshot) {
    return FinalizeTransition{
        .terminal_state = persistence::TerminalState::Completed,
        .terminal_reason = std::nullopt,
        .last_run_at = completed_at,
    };
  }

  if (!job.cadence_minutes.has_value() || *job.cadence_minutes < 1) {
    throw common::ConfigurationError("recurring job " + job.id +
                                     " has no valid cadence_minutes (must be >= 1)");
  }
  return RescheduleTransition{
      .last_run_at = completed_at,
      .next_run_at = completed_at + *job.cadence_minutes * kMinuteMs,
  };
}

common::Status apply_schedule_transition(persistence::JobStore &store,
                                         const persistence::Job &job,
                                         const std::string &lock_token,
                                         const ScheduleTransition &transition,
                                         const std::int64_t updated_at) {
  return std::visit(
      [&](const auto &t) -> common::Status {
        using T = std::decay_t<decltype(t)>;
        if constexpr (std::is_same_v<T, RescheduleTransition>) {
          return store.reschedule_recurring(job.id, lock_token, t.last_run_at, t.next_run_at,
                                            updated_at);
        } else {
          return store.finalize_one_shot(job.id, lock_token, t.terminal_state, t.terminal_reason,
                                         t.last_run_at, updated_at);
        }
      },
      transition);
}

} // namespace otto::scheduler
