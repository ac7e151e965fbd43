#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "otto/scheduler/schedule.hpp"

void register_schedule_tests(std::vector<otto::tests::TestCase> &tests) {
  using otto::tests::require;
  using otto::testing::oneshot_job;
  using otto::testing::recurring_job;
  using otto::testing::TempWorkspace;
  namespace sched = otto::scheduler;
  namespace ps = otto::persistence;

  tests.push_back({"recurring_transition_advances_from_completion_time", [] {
                     const auto job = recurring_job("job", "t", 15, 1'000);
                     const auto transition = sched::resolve_schedule_transition(job, 500'000);
                     const auto *reschedule = std::get_if<sched::RescheduleTransition>(&transition);
                     require(reschedule != nullptr, "recurring jobs reschedule");
                     require(reschedule->last_run_at == 500'000, "last run is completion");
                     require(reschedule->next_run_at == 500'000 + 15 * sched::kMinuteMs,
                             "next run is completion plus cadence");
                   }});

  tests.push_back({"oneshot_transition_completes", [] {
                     const auto job = oneshot_job("once", "t", 1'000);
                     const auto transition = sched::resolve_schedule_transition(job, 2'000);
                     const auto *finalize = std::get_if<sched::FinalizeTransition>(&transition);
                     require(finalize != nullptr, "one-shot jobs finalize");
                     require(finalize->terminal_state == ps::TerminalState::Completed, "completed");
                     require(!finalize->terminal_reason.has_value(), "no reason");
                     require(finalize->last_run_at == 2'000, "last run");
                   }});

  tests.push_back({"recurring_without_cadence_throws", [] {
                     auto job = recurring_job("job", "t", 15, 1'000);
                     job.cadence_minutes.reset();
                     bool threw = false;
                     try {
                       (void)sched::resolve_schedule_transition(job, 2'000);
                     } catch (const otto::common::ConfigurationError &) {
                       threw = true;
                     }
                     require(threw, "missing cadence is a configuration error");

                     job.cadence_minutes = 0;
                     threw = false;
                     try {
                       (void)sched::resolve_schedule_transition(job, 2'000);
                     } catch (const otto::common::ConfigurationError &) {
                       threw = true;
                     }
                     require(threw, "zero cadence is a configuration error");
                   }});

  tests.push_back({"apply_transition_goes_through_fenced_store", [] {
                     TempWorkspace ws;
                     ps::JobStore store(ws.db_path());
                     require(store.create_job(oneshot_job("once", "t", 1'000)).ok(), "create");
                     const auto claimed = store.claim_due(1'000, 1, "tok", 60'000, 1'000);
                     require(claimed.ok() && claimed.value().size() == 1, "claimed");
                     const auto &job = claimed.value()[0];
                     const auto transition = sched::resolve_schedule_transition(job, 3'000);

                     require(!sched::apply_schedule_transition(store, job, "other", transition, 3'000)
                                  .ok(),
                             "foreign token rejected");
                     const auto applied =
                         sched::apply_schedule_transition(store, job, "tok", transition, 3'000);
                     require(applied.ok(), applied.error());
                     const auto stored = store.get_job("once").value();
                     require(stored->terminal_state == ps::TerminalState::Completed, "finalized");
                   }});
}
