#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "otto/persistence/job_store.hpp"
#include "otto/persistence/session_binding_store.hpp"
#include "otto/persistence/user_profile_store.hpp"

#include <set>
#include <thread>

namespace {

using otto::persistence::Job;
using otto::persistence::JobRun;
using otto::persistence::JobStore;
using otto::persistence::RunStatus;

JobRun make_run(const std::string &id, const std::string &job_id, std::int64_t started_at) {
  JobRun run;
  run.id = id;
  run.job_id = job_id;
  run.scheduled_for = started_at;
  run.started_at = started_at;
  run.created_at = started_at;
  return run;
}

void finish_run(JobStore &store, const std::string &run_id, RunStatus status,
                std::int64_t finished_at, std::optional<std::string> error_code = std::nullopt) {
  const auto finished = store.mark_run_finished(
      run_id, otto::persistence::RunCompletion{
                  .finished_at = finished_at,
                  .status = status,
                  .error_code = std::move(error_code),
                  .error_message = std::nullopt,
                  .result_json = std::nullopt,
              });
  otto::tests::require(finished.ok(), finished.error());
}

} // namespace

void register_job_store_tests(std::vector<otto::tests::TestCase> &tests) {
  using otto::tests::require;
  using otto::testing::oneshot_job;
  using otto::testing::recurring_job;
  using otto::testing::TempWorkspace;
  namespace ps = otto::persistence;

  tests.push_back({"job_store_create_and_get_round_trip", [] {
                     TempWorkspace ws;
                     JobStore store(ws.db_path());
                     auto job = recurring_job("job-1", "digest", 15, 1'000);
                     job.payload = R"({"topic":"news"})";
                     job.profile_id = "morning";
                     require(store.create_job(job).ok(), "create");

                     const auto loaded = store.get_job("job-1");
                     require(loaded.ok() && loaded.value().has_value(), "job should exist");
                     const auto &got = *loaded.value();
                     require(got.type == "digest", "type");
                     require(got.cadence_minutes.value_or(0) == 15, "cadence");
                     require(got.payload.value_or("") == R"({"topic":"news"})", "payload");
                     require(got.profile_id.value_or("") == "morning", "profile");
                     require(got.status == ps::JobStatus::Idle, "idle status");

                     const auto missing = store.get_job("nope");
                     require(missing.ok() && !missing.value().has_value(), "missing job");
                   }});

  tests.push_back({"job_store_rejects_recurring_without_cadence", [] {
                     TempWorkspace ws;
                     JobStore store(ws.db_path());
                     auto job = recurring_job("bad", "digest", 0, 1'000);
                     require(!store.create_job(job).ok(), "cadence 0 rejected");
                   }});

  tests.push_back({"claim_due_respects_due_time_order_and_limit", [] {
                     TempWorkspace ws;
                     JobStore store(ws.db_path());
                     require(store.create_job(recurring_job("late", "t", 5, 3'000)).ok(), "late");
                     require(store.create_job(recurring_job("early", "t", 5, 1'000)).ok(), "early");
                     require(store.create_job(recurring_job("mid", "t", 5, 2'000)).ok(), "mid");
                     require(store.create_job(recurring_job("future", "t", 5, 9'000)).ok(), "future");

                     const auto claimed = store.claim_due(3'000, 2, "tok", 60'000, 3'000);
                     require(claimed.ok(), claimed.error());
                     require(claimed.value().size() == 2, "limit applies");
                     require(claimed.value()[0].id == "early", "oldest due first");
                     require(claimed.value()[1].id == "mid", "second oldest next");
                     const auto &job = claimed.value()[0];
                     require(job.status == ps::JobStatus::Running, "claimed job is running");
                     require(job.lock_token.value_or("") == "tok", "lock token stored");
                     require(job.lock_expires_at.value_or(0) == 63'000, "lease from observed_at");

                     const auto again = store.claim_due(3'000, 10, "tok2", 60'000, 3'000);
                     require(again.ok(), again.error());
                     require(again.value().size() == 1 && again.value()[0].id == "late",
                             "locked jobs are not claimed twice");
                   }});

  tests.push_back({"claim_due_skips_paused_and_terminal_jobs", [] {
                     TempWorkspace ws;
                     JobStore store(ws.db_path());
                     require(store.create_job(recurring_job("paused", "t", 5, 1'000)).ok(), "p");
                     require(store.create_job(recurring_job("cancelled", "t", 5, 1'000)).ok(), "c");
                     require(store.set_paused("paused", true, 1'000).value(), "pause");
                     require(store.cancel_job("cancelled", std::string("no longer needed"), 1'000)
                                 .value(),
                             "cancel");

                     const auto claimed = store.claim_due(5'000, 10, "tok", 60'000, 5'000);
                     require(claimed.ok() && claimed.value().empty(), "nothing claimable");

                     require(store.set_paused("paused", false, 6'000).value(), "resume");
                     const auto resumed = store.claim_due(6'000, 10, "tok", 60'000, 6'000);
                     require(resumed.ok() && resumed.value().size() == 1, "resumed job due");
                   }});

  tests.push_back({"expired_lease_is_reclaimed_and_old_token_is_fenced", [] {
                     TempWorkspace ws;
                     JobStore store(ws.db_path());
                     require(store.create_job(recurring_job("job", "t", 5, 1'000)).ok(), "create");

                     const auto first = store.claim_due(1'000, 1, "old", 10'000, 1'000);
                     require(first.ok() && first.value().size() == 1, "first claim");

                     const auto before_expiry = store.claim_due(10'999, 1, "new", 10'000, 10'999);
                     require(before_expiry.ok() && before_expiry.value().empty(),
                             "lease still held");

                     const auto reclaimed = store.claim_due(11'000, 1, "new", 10'000, 11'000);
                     require(reclaimed.ok() && reclaimed.value().size() == 1,
                             "expired lease reclaimed");
                     require(reclaimed.value()[0].lock_token.value_or("") == "new", "new token");

                     const auto stale = store.reschedule_recurring("job", "old", 12'000, 99'000,
                                                                   12'000);
                     require(!stale.ok(), "stale token must not reschedule");
                     const auto unchanged = store.get_job("job");
                     require(unchanged.value()->next_run_at.value_or(0) == 1'000,
                             "schedule untouched by stale holder");

                     const auto fresh =
                         store.reschedule_recurring("job", "new", 12'000, 312'000, 12'000);
                     require(fresh.ok(), fresh.error());
                     const auto after = store.get_job("job");
                     require(after.value()->status == ps::JobStatus::Idle, "idle again");
                     require(!after.value()->lock_token.has_value(), "lock cleared");
                     require(after.value()->next_run_at.value_or(0) == 312'000, "next run");
                     require(after.value()->last_run_at.value_or(0) == 12'000, "last run");
                   }});

  tests.push_back({"finalize_one_shot_is_terminal", [] {
                     TempWorkspace ws;
                     JobStore store(ws.db_path());
                     require(store.create_job(oneshot_job("once", "t", 1'000)).ok(), "create");
                     const auto claimed = store.claim_due(1'000, 1, "tok", 60'000, 1'000);
                     require(claimed.ok() && claimed.value().size() == 1, "claimed");

                     require(!store.finalize_one_shot("once", "wrong", ps::TerminalState::Completed,
                                                      std::nullopt, 2'000, 2'000)
                                  .ok(),
                             "wrong token rejected");
                     const auto finalized = store.finalize_one_shot(
                         "once", "tok", ps::TerminalState::Completed, std::nullopt, 2'000, 2'000);
                     require(finalized.ok(), finalized.error());

                     const auto job = store.get_job("once").value();
                     require(job->terminal_state == ps::TerminalState::Completed, "completed");
                     require(!job->next_run_at.has_value(), "no next run");
                     const auto later = store.claim_due(100'000, 10, "tok2", 60'000, 100'000);
                     require(later.ok() && later.value().empty(), "never claimed again");
                   }});

  tests.push_back({"release_lock_makes_job_due_again", [] {
                     TempWorkspace ws;
                     JobStore store(ws.db_path());
                     require(store.create_job(recurring_job("job", "t", 5, 1'000)).ok(), "create");
                     require(store.claim_due(1'000, 1, "tok", 60'000, 1'000).value().size() == 1,
                             "claimed");
                     require(store.release_lock("job", "tok", 1'500).ok(), "release");
                     const auto again = store.claim_due(2'000, 1, "tok2", 60'000, 2'000);
                     require(again.ok() && again.value().size() == 1, "due again");
                   }});

  tests.push_back({"concurrent_claims_never_share_a_job", [] {
                     TempWorkspace ws;
                     {
                       JobStore setup(ws.db_path());
                       for (int i = 0; i < 40; ++i) {
                         require(setup.create_job(recurring_job("job-" + std::to_string(i), "t",
                                                                5, 1'000 + i))
                                     .ok(),
                                 "create");
                       }
                     }
                     JobStore a(ws.db_path());
                     JobStore b(ws.db_path());
                     std::vector<Job> claimed_a;
                     std::vector<Job> claimed_b;
                     std::thread ta([&] {
                       for (int i = 0; i < 10; ++i) {
                         auto r = a.claim_due(5'000, 3, "token-a", 60'000, 5'000);
                         if (r.ok()) {
                           claimed_a.insert(claimed_a.end(), r.value().begin(), r.value().end());
                         }
                       }
                     });
                     std::thread tb([&] {
                       for (int i = 0; i < 10; ++i) {
                         auto r = b.claim_due(5'000, 3, "token-b", 60'000, 5'000);
                         if (r.ok()) {
                           claimed_b.insert(claimed_b.end(), r.value().begin(), r.value().end());
                         }
                       }
                     });
                     ta.join();
                     tb.join();

                     std::set<std::string> ids;
                     for (const auto &job : claimed_a) {
                       ids.insert(job.id);
                     }
                     for (const auto &job : claimed_b) {
                       require(ids.insert(job.id).second, "job claimed twice: " + job.id);
                     }
                     require(ids.size() == claimed_a.size() + claimed_b.size(), "unique claims");
                   }});

  tests.push_back({"update_job_refuses_running_jobs", [] {
                     TempWorkspace ws;
                     JobStore store(ws.db_path());
                     require(store.create_job(recurring_job("job", "t", 5, 1'000)).ok(), "create");
                     ps::JobDefinition definition{
                         .type = "renamed",
                         .schedule_type = ps::ScheduleType::Recurring,
                         .profile_id = std::nullopt,
                         .run_at = std::nullopt,
                         .cadence_minutes = 10,
                         .payload = std::nullopt,
                         .next_run_at = 50'000,
                     };
                     require(store.claim_due(1'000, 1, "tok", 60'000, 1'000).value().size() == 1,
                             "claimed");
                     const auto refused = store.update_job("job", definition, 2'000);
                     require(refused.ok() && !refused.value(), "running job not updated");

                     require(store.release_lock("job", "tok", 2'000).ok(), "release");
                     const auto updated = store.update_job("job", definition, 3'000);
                     require(updated.ok() && updated.value(), "idle job updated");
                     const auto job = store.get_job("job").value();
                     require(job->type == "renamed" && job->cadence_minutes.value_or(0) == 10,
                             "definition applied");
                   }});

  tests.push_back({"cancel_job_is_terminal_and_only_once", [] {
                     TempWorkspace ws;
                     JobStore store(ws.db_path());
                     require(store.create_job(recurring_job("job", "t", 5, 1'000)).ok(), "create");
                     const auto first = store.cancel_job("job", std::string("user"), 2'000);
                     require(first.ok() && first.value(), "cancelled");
                     const auto job = store.get_job("job").value();
                     require(job->terminal_state == ps::TerminalState::Cancelled, "terminal state");
                     require(job->terminal_reason.value_or("") == "user", "reason");
                     require(!job->next_run_at.has_value(), "next run cleared");
                     const auto second = store.cancel_job("job", std::nullopt, 3'000);
                     require(second.ok() && !second.value(), "second cancel is a no-op");
                   }});

  tests.push_back({"runs_finish_once_and_failures_are_listed_newest_first", [] {
                     TempWorkspace ws;
                     JobStore store(ws.db_path());
                     require(store.create_job(recurring_job("a", "digest", 5, 1'000)).ok(), "a");
                     require(store.create_job(recurring_job("w", "watchdog_failures", 5, 1'000)).ok(),
                             "w");
                     require(store.insert_run(make_run("r1", "a", 1'000)).ok(), "r1");
                     require(store.insert_run(make_run("r2", "a", 2'000)).ok(), "r2");
                     require(store.insert_run(make_run("r3", "w", 3'000)).ok(), "r3");
                     require(store.insert_run(make_run("r4", "a", 500)).ok(), "r4");
                     finish_run(store, "r1", RunStatus::Failed, 1'100, "boom");
                     finish_run(store, "r2", RunStatus::Failed, 2'100, "boom");
                     finish_run(store, "r3", RunStatus::Failed, 3'100, "boom");
                     finish_run(store, "r4", RunStatus::Failed, 600, "boom");

                     require(!store.mark_run_finished("r1", ps::RunCompletion{}).ok(),
                             "finished runs are immutable");

                     const auto failures =
                         store.list_recent_failed_runs(1'000, 10, std::string("watchdog_failures"));
                     require(failures.ok(), failures.error());
                     require(failures.value().size() == 2, "window and exclusion applied");
                     require(failures.value()[0].run_id == "r2", "newest first");
                     require(failures.value()[0].job_type == "digest", "joined job type");

                     const auto all = store.list_recent_failed_runs(0, 10);
                     require(all.ok() && all.value().size() == 4, "no exclusion");

                     const auto runs = store.list_runs_for_job("a", 2);
                     require(runs.ok() && runs.value().size() == 2, "limited run history");
                     require(runs.value()[0].id == "r2", "run history newest first");
                   }});

  tests.push_back({"audit_rows_are_listed_per_task", [] {
                     TempWorkspace ws;
                     JobStore store(ws.db_path());
                     ps::TaskAuditRecord record;
                     record.id = "audit-1";
                     record.task_id = "job";
                     record.action = ps::AuditAction::Create;
                     record.lane = ps::Lane::Interactive;
                     record.actor = "cli";
                     record.after_json = R"({"id":"job"})";
                     record.created_at = 1'000;
                     require(store.insert_audit(record).ok(), "insert audit");
                     record.id = "audit-2";
                     record.action = ps::AuditAction::Delete;
                     record.created_at = 2'000;
                     require(store.insert_audit(record).ok(), "insert second audit");

                     const auto rows = store.list_audit("job", 10);
                     require(rows.ok() && rows.value().size() == 2, "two audit rows");
                     require(rows.value()[0].action == ps::AuditAction::Delete, "newest first");
                     require(rows.value()[1].after_json.value_or("") == R"({"id":"job"})",
                             "after json kept");
                   }});

  tests.push_back({"session_bindings_upsert_replaces_session", [] {
                     TempWorkspace ws;
                     ps::SessionBindingStore store(ws.db_path());
                     const auto empty = store.get("scheduler:task:a:assistant");
                     require(empty.ok() && !empty.value().has_value(), "no binding yet");
                     require(store.upsert("scheduler:task:a:assistant", "s1", 1'000).ok(), "insert");
                     require(store.upsert("scheduler:task:a:assistant", "s2", 2'000).ok(), "replace");
                     const auto bound = store.get("scheduler:task:a:assistant");
                     require(bound.ok() && bound.value()->session_id == "s2", "latest session");
                   }});

  tests.push_back({"user_profile_is_absent_until_saved", [] {
                     TempWorkspace ws;
                     ps::UserProfileStore store(ws.db_path());
                     const auto empty = store.get();
                     require(empty.ok() && !empty.value().has_value(), "no profile");

                     ps::NotificationPolicy policy;
                     policy.timezone = "Europe/Vienna";
                     policy.quiet_hours_start = "22:00";
                     policy.quiet_hours_end = "07:00";
                     policy.quiet_mode = ps::QuietMode::Off;
                     policy.updated_at = 5;
                     require(store.upsert(policy).ok(), "save");
                     policy.mute_until = 9'000;
                     require(store.upsert(policy).ok(), "save again");

                     const auto saved = store.get();
                     require(saved.ok() && saved.value().has_value(), "profile saved");
                     require(saved.value()->quiet_mode == ps::QuietMode::Off, "quiet mode");
                     require(saved.value()->mute_until.value_or(0) == 9'000, "mute until");
                     require(saved.value()->quiet_hours_end.value_or("") == "07:00", "quiet end");
                   }});
}
