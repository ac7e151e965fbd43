#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "otto/scheduler/schedule.hpp"
#include "otto/scheduler/watchdog.hpp"

namespace {

using otto::tests::require;
namespace ps = otto::persistence;
namespace sched = otto::scheduler;

constexpr std::int64_t kNow = 1'767'605'400'000;

void add_failed_run(ps::JobStore &jobs, const std::string &run_id, const std::string &job_id,
                    std::int64_t started_at, const std::string &message) {
  otto::testing::add_finished_run(jobs, run_id, job_id, started_at, ps::RunStatus::Failed, message);
}

struct WatchdogFixture {
  otto::testing::TempWorkspace ws;
  ps::JobStore jobs{ws.db_path()};
  ps::OutboundStore outbound{ws.db_path()};

  WatchdogFixture() {
    require(jobs.create_job(otto::testing::recurring_job("digest", "daily_digest", 60,
                                                         kNow + 3'600'000))
                .ok(),
            "create digest");
    require(jobs.create_job(otto::testing::recurring_job(sched::kWatchdogTaskId,
                                                         sched::kWatchdogTaskType, 30,
                                                         kNow + 1'800'000))
                .ok(),
            "create watchdog");
  }

  sched::WatchdogCheckOptions options(sched::WatchdogPayload payload = {},
                                      std::optional<std::int64_t> default_chat = 99) {
    return sched::WatchdogCheckOptions{
        .payload = payload,
        .default_chat_id = default_chat,
        .exclude_task_type = std::string(sched::kWatchdogTaskType),
    };
  }
};

} // namespace

void register_watchdog_tests(std::vector<otto::tests::TestCase> &tests) {
  tests.push_back({"watchdog_payload_defaults_and_ranges", [] {
                     const auto defaults = sched::parse_watchdog_payload(std::nullopt);
                     require(defaults.ok(), defaults.error());
                     require(defaults.value().lookback_minutes == 120, "lookback default");
                     require(defaults.value().threshold == 2, "threshold default");
                     require(defaults.value().notify, "notify default");

                     const auto custom = sched::parse_watchdog_payload(
                         std::string(R"({"lookbackMinutes":60,"threshold":1,"notify":false,"chatId":5})"));
                     require(custom.ok(), custom.error());
                     require(custom.value().lookback_minutes == 60, "lookback");
                     require(!custom.value().notify, "notify");
                     require(custom.value().chat_id.value_or(0) == 5, "chat id");

                     require(!sched::parse_watchdog_payload(std::string(R"({"lookbackMinutes":4})")).ok(),
                             "lookback below range");
                     require(!sched::parse_watchdog_payload(std::string(R"({"maxFailures":201})")).ok(),
                             "max failures above range");
                     require(!sched::parse_watchdog_payload(std::string(R"({"threshold":"2"})")).ok(),
                             "threshold must be integer");
                     require(!sched::parse_watchdog_payload(std::string("[1]")).ok(),
                             "array payload rejected");

                     const auto reparsed = sched::parse_watchdog_payload(
                         sched::serialize_watchdog_payload(custom.value()));
                     require(reparsed.ok() && reparsed.value().chat_id == custom.value().chat_id,
                             "serialized payload parses");
                   }});

  tests.push_back({"below_threshold_does_not_alert", [] {
                     WatchdogFixture f;
                     add_failed_run(f.jobs, "r1", "digest", kNow - 60'000, "boom");
                     const auto checked =
                         sched::check_task_failures(f.jobs, f.outbound, f.options(), kNow);
                     require(checked.ok(), checked.error());
                     require(checked.value().failed_count == 1, "one failure");
                     require(!checked.value().should_alert, "below threshold");
                     require(checked.value().notification_status ==
                                 sched::WatchdogNotificationStatus::NotRequested,
                             "not requested");
                     require(f.outbound.count_queued().value() == 0, "nothing queued");
                   }});

  tests.push_back({"threshold_reached_enqueues_one_high_alert", [] {
                     WatchdogFixture f;
                     add_failed_run(f.jobs, "r1", "digest", kNow - 60'000, "boom");
                     add_failed_run(f.jobs, "r2", "digest", kNow - 30'000, "");
                     add_failed_run(f.jobs, "old", "digest", kNow - 121 * sched::kMinuteMs, "old");
                     add_failed_run(f.jobs, "self", sched::kWatchdogTaskId, kNow - 10'000, "x");

                     const auto checked =
                         sched::check_task_failures(f.jobs, f.outbound, f.options(), kNow);
                     require(checked.ok(), checked.error());
                     const auto &result = checked.value();
                     require(result.failed_count == 2, "window and exclusion applied");
                     require(result.notification_status == sched::WatchdogNotificationStatus::Enqueued,
                             "enqueued");
                     require(result.dedupe_key.has_value() &&
                                 result.dedupe_key->rfind("watchdog:task-failures:120:2:", 0) == 0,
                             "dedupe key prefix");

                     const auto queued = f.outbound.list_recent(10);
                     require(queued.ok() && queued.value().size() == 1, "one alert row");
                     const auto &alert = queued.value().front();
                     require(alert.priority == ps::MessagePriority::High, "high priority");
                     require(alert.chat_id == 99, "default chat");
                     otto::tests::require_contains(alert.content, "daily_digest (digest): boom",
                                                   "failure listed");
                     otto::tests::require_contains(alert.content, "daily_digest (digest): task_failed",
                                                   "error code used when message empty");

                     const auto again =
                         sched::check_task_failures(f.jobs, f.outbound, f.options(), kNow + 1'000);
                     require(again.ok(), again.error());
                     require(again.value().notification_status ==
                                 sched::WatchdogNotificationStatus::Duplicate,
                             "same failures dedupe");
                     require(f.outbound.count_queued().value() == 1, "still one row");
                   }});

  tests.push_back({"alert_without_chat_or_notify", [] {
                     WatchdogFixture f;
                     add_failed_run(f.jobs, "r1", "digest", kNow - 60'000, "a");
                     add_failed_run(f.jobs, "r2", "digest", kNow - 50'000, "b");

                     const auto no_chat = sched::check_task_failures(
                         f.jobs, f.outbound, f.options({}, std::nullopt), kNow);
                     require(no_chat.ok() && no_chat.value().notification_status ==
                                                 sched::WatchdogNotificationStatus::NoChatId,
                             "no chat id");

                     sched::WatchdogPayload quiet;
                     quiet.notify = false;
                     const auto not_requested =
                         sched::check_task_failures(f.jobs, f.outbound, f.options(quiet), kNow);
                     require(not_requested.ok() && not_requested.value().should_alert,
                             "still above threshold");
                     require(not_requested.value().notification_status ==
                                 sched::WatchdogNotificationStatus::NotRequested,
                             "notify disabled");

                     sched::WatchdogPayload explicit_chat;
                     explicit_chat.chat_id = 7;
                     const auto routed = sched::check_task_failures(
                         f.jobs, f.outbound, f.options(explicit_chat, std::nullopt), kNow);
                     require(routed.ok(), routed.error());
                     const auto queued = f.outbound.list_recent(1);
                     require(queued.ok() && queued.value().front().chat_id == 7,
                             "payload chat wins");
                   }});

  tests.push_back({"dedupe_key_tracks_the_failure_set", [] {
                     ps::RunSummary a;
                     a.run_id = "a";
                     ps::RunSummary b;
                     b.run_id = "b";
                     const auto ab = sched::watchdog_dedupe_key(120, 2, {a, b});
                     require(ab == sched::watchdog_dedupe_key(120, 2, {a, b}), "stable");
                     require(ab != sched::watchdog_dedupe_key(120, 2, {a}), "set sensitive");
                     require(ab != sched::watchdog_dedupe_key(60, 2, {a, b}), "window sensitive");
                   }});

  tests.push_back({"ensure_watchdog_task_is_idempotent", [] {
                     otto::testing::TempWorkspace ws;
                     ps::JobStore jobs(ws.db_path());
                     const auto created = sched::ensure_watchdog_task(
                         jobs, sched::EnsureWatchdogOptions{.cadence_minutes = 15, .payload = {}},
                         kNow);
                     require(created.ok(), created.error());
                     require(created.value().created, "created");
                     const auto job = jobs.get_job(sched::kWatchdogTaskId);
                     require(job.ok() && job.value().has_value(), "job stored");
                     require(job.value()->type == sched::kWatchdogTaskType, "type");
                     require(job.value()->next_run_at.value_or(0) == kNow + 15 * sched::kMinuteMs,
                             "first run after one cadence");

                     const auto again = sched::ensure_watchdog_task(
                         jobs, sched::EnsureWatchdogOptions{.cadence_minutes = 45, .payload = {}},
                         kNow + 1);
                     require(again.ok() && !again.value().created, "not recreated");
                     require(again.value().cadence_minutes == 15, "existing cadence kept");

                     require(!sched::ensure_watchdog_task(
                                  jobs, sched::EnsureWatchdogOptions{.cadence_minutes = 0, .payload = {}},
                                  kNow)
                                  .ok(),
                             "cadence must be positive");
                   }});
}
