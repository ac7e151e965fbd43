#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "otto/cli/commands.hpp"
#include "otto/config/config.hpp"
#include "otto/daemon/daemon.hpp"
#include "otto/daemon/pid_file.hpp"
#include "otto/observability/global.hpp"
#include "otto/persistence/job_store.hpp"
#include "otto/persistence/user_profile_store.hpp"
#include "otto/scheduler/heartbeat.hpp"
#include "otto/scheduler/watchdog.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

#include <unistd.h>

namespace {

using otto::testing::EnvGuard;
using otto::testing::TempWorkspace;
using otto::tests::require;
namespace ps = otto::persistence;

/// A workspace with its own config file and a clean environment for the CLI.
class CliFixture {
public:
  CliFixture()
      : home_env_("HOME", ws.path().string()), otto_home_("OTTO_HOME", std::nullopt),
        env_file_("OTTO_ENV_FILE", std::nullopt), config_env_("OTTO_CONFIG_PATH", std::nullopt),
        token_("TELEGRAM_BOT_TOKEN", std::nullopt), user_("TELEGRAM_ALLOWED_USER_ID", std::nullopt),
        enabled_("OTTO_SCHEDULER_ENABLED", std::nullopt) {
    ws.create_file("config.toml", "home = \"" + home().string() +
                                      "\"\n\n[observability]\nbackend = \"none\"\n");
  }

  ~CliFixture() { otto::config::set_config_path_override(std::nullopt); }

  CliFixture(const CliFixture &) = delete;
  CliFixture &operator=(const CliFixture &) = delete;

  [[nodiscard]] std::filesystem::path home() const { return ws.path() / "home"; }
  [[nodiscard]] std::filesystem::path db_path() const { return home() / "otto.db"; }

  /// Runs `otto --config <file> args...` and captures stdout.
  int run(std::vector<std::string> args) {
    std::vector<std::string> argv_storage{"otto", "--config", (ws.path() / "config.toml").string()};
    argv_storage.insert(argv_storage.end(), args.begin(), args.end());
    std::vector<char *> argv;
    for (auto &arg : argv_storage) {
      argv.push_back(arg.data());
    }

    std::ostringstream captured;
    auto *previous = std::cout.rdbuf(captured.rdbuf());
    const int code = otto::cli::run_cli(static_cast<int>(argv.size()), argv.data());
    std::cout.rdbuf(previous);
    output = captured.str();
    return code;
  }

  TempWorkspace ws;
  std::string output;

private:
  EnvGuard home_env_;
  EnvGuard otto_home_;
  EnvGuard env_file_;
  EnvGuard config_env_;
  EnvGuard token_;
  EnvGuard user_;
  EnvGuard enabled_;
};

ps::Job load_job(const std::filesystem::path &db_path, const std::string &id) {
  ps::JobStore store(db_path);
  const auto job = store.get_job(id);
  require(job.ok() && job.value().has_value(), "job " + id + " should exist");
  return *job.value();
}

} // namespace

void register_cli_daemon_tests(std::vector<otto::tests::TestCase> &tests) {
  tests.push_back({"cli_version_and_unknown_command", [] {
                     CliFixture f;
                     require(f.run({"version"}) == 0, "version exits 0");
                     require(f.output.rfind("otto ", 0) == 0, "version output");
                     require(f.run({"frobnicate"}) == 1, "unknown command fails");
                     require(f.run({"config-path"}) == 0, "config-path");
                     otto::tests::require_contains(f.output, "config.toml", "override reported");
                   }});

  tests.push_back({"cli_task_lifecycle_writes_audit_rows", [] {
                     CliFixture f;
                     require(f.run({"task", "add", "--type", "digest", "--every", "30", "--id",
                                    "digest-1", "--payload", R"({"topic":"news"})"}) == 0,
                             "add");
                     otto::tests::require_contains(f.output, "Created task digest-1",
                                                   "created message");
                     auto job = load_job(f.db_path(), "digest-1");
                     require(job.cadence_minutes.value_or(0) == 30, "cadence");
                     require(job.payload.value_or("") == R"({"topic":"news"})", "payload");

                     require(f.run({"task", "list"}) == 0, "list");
                     require(f.output.find("digest-1 | digest | recurring | every 30m") !=
                                 std::string::npos,
                             "list row: " + f.output);

                     require(f.run({"task", "update", "digest-1", "--at", "1900000000000"}) == 0,
                             "update to one-shot");
                     job = load_job(f.db_path(), "digest-1");
                     require(job.schedule_type == ps::ScheduleType::Oneshot, "one-shot");
                     require(job.next_run_at.value_or(0) == 1'900'000'000'000, "next run");
                     require(!job.cadence_minutes.has_value(), "cadence cleared");

                     require(f.run({"task", "pause", "digest-1"}) == 0, "pause");
                     require(load_job(f.db_path(), "digest-1").status == ps::JobStatus::Paused,
                             "paused");
                     require(f.run({"task", "pause", "digest-1"}) == 1, "pause twice fails");
                     require(f.run({"task", "resume", "digest-1"}) == 0, "resume");

                     require(f.run({"task", "cancel", "digest-1", "--reason", "no longer needed"}) ==
                                 0,
                             "cancel");
                     job = load_job(f.db_path(), "digest-1");
                     require(job.terminal_state == ps::TerminalState::Cancelled, "cancelled");
                     require(job.terminal_reason.value_or("") == "no longer needed", "reason");
                     require(f.run({"task", "cancel", "digest-1"}) == 1, "cancel twice fails");

                     ps::JobStore store(f.db_path());
                     const auto audit = store.list_audit("digest-1", 10);
                     require(audit.ok(), audit.error());
                     require(audit.value().size() == 3, "create, update and delete audited");
                     for (const auto &record : audit.value()) {
                       require(record.lane == ps::Lane::Interactive, "interactive lane");
                       require(record.actor.value_or("") == "cli", "cli actor");
                     }
                   }});

  tests.push_back({"cli_task_add_validates_input", [] {
                     CliFixture f;
                     require(f.run({"task", "add", "--every", "5"}) == 1, "type required");
                     require(f.run({"task", "add", "--type", "t"}) == 1, "schedule required");
                     require(f.run({"task", "add", "--type", "t", "--every", "5", "--at", "10"}) == 1,
                             "exclusive schedule");
                     require(f.run({"task", "add", "--type", "t", "--every", "0"}) == 1,
                             "positive cadence");
                     require(f.run({"task", "add", "--type", "t", "--every", "5", "--payload",
                                    "{oops"}) == 1,
                             "payload json");
                     require(f.run({"task", "add", "--type", "t", "--every", "5", "--profile",
                                    "missing"}) == 1,
                             "profile must exist");
                     require(f.run({"task", "update", "nope", "--every", "5"}) == 1,
                             "update unknown task");
                     ps::JobStore store(f.db_path());
                     require(store.list_jobs().value().empty(), "nothing created");
                   }});

  tests.push_back({"cli_profile_set_persists_policy", [] {
                     CliFixture f;
                     require(f.run({"profile", "set", "--timezone", "Europe/Berlin", "--quiet",
                                    "22:00", "07:30", "--quiet-mode", "off"}) == 0,
                             "profile set");
                     ps::UserProfileStore store(f.db_path());
                     auto policy = store.get();
                     require(policy.ok() && policy.value().has_value(), "policy stored");
                     require(policy.value()->timezone.value_or("") == "Europe/Berlin", "timezone");
                     require(policy.value()->quiet_hours_start.value_or("") == "22:00", "start");
                     require(policy.value()->quiet_hours_end.value_or("") == "07:30", "end");
                     require(policy.value()->quiet_mode == ps::QuietMode::Off, "mode");

                     require(f.run({"profile", "set", "--mute-until", "1900000000000"}) == 0,
                             "mute");
                     policy = store.get();
                     require(policy.value()->mute_until.value_or(0) == 1'900'000'000'000, "mute");
                     require(policy.value()->timezone.value_or("") == "Europe/Berlin",
                             "earlier fields kept");

                     require(f.run({"profile", "set", "--quiet", "25:00", "07:00"}) == 1,
                             "invalid clock");
                     require(f.run({"profile", "set", "--quiet-mode", "loud"}) == 1, "invalid mode");
                   }});

  tests.push_back({"cli_profile_set_configures_heartbeat", [] {
                     CliFixture f;
                     require(f.run({"profile", "set", "--heartbeat-morning", "07:45",
                                    "--heartbeat-cadence", "60", "--heartbeat-only-if-signal",
                                    "false", "--onboarded"}) == 0,
                             "heartbeat options");
                     ps::UserProfileStore store(f.db_path());
                     const auto policy = store.get();
                     require(policy.ok() && policy.value().has_value(), "policy stored");
                     require(policy.value()->heartbeat_morning.value_or("") == "07:45", "morning");
                     require(!policy.value()->heartbeat_midday.has_value(), "midday untouched");
                     require(policy.value()->heartbeat_cadence_minutes.value_or(0) == 60,
                             "cadence");
                     require(!policy.value()->heartbeat_only_if_signal, "signal flag");
                     require(policy.value()->onboarding_completed_at.has_value(), "onboarded");

                     require(f.run({"profile", "set", "--heartbeat-cadence", "10"}) == 1,
                             "cadence below minimum");
                     require(f.run({"profile", "set", "--heartbeat-evening", "7pm"}) == 1,
                             "invalid slot");
                   }});

  tests.push_back({"cli_watchdog_check_reports_without_notifying", [] {
                     CliFixture f;
                     require(f.run({"watchdog", "check", "--no-notify"}) == 0, "check");
                     otto::tests::require_contains(f.output, "failed_runs=0", "no failures");
                     otto::tests::require_contains(f.output, "notification=not_requested",
                                                   "not requested");
                     require(f.run({"outbound", "list"}) == 0, "outbound list");
                     require(f.output.empty(), "queue empty");
                   }});

  tests.push_back({"pid_file_guards_single_instance", [] {
                     TempWorkspace ws;
                     const auto path = ws.path() / "daemon.pid";
                     {
                       otto::daemon::PidFile pid(path);
                       require(pid.acquire().ok(), "fresh acquire");
                       require(std::filesystem::exists(path), "file written");
                     }
                     require(!std::filesystem::exists(path), "released on destruction");

                     // A pid that cannot exist is a stale file and gets taken over.
                     ws.create_file("daemon.pid", "2147483000\n");
                     otto::daemon::PidFile stale(path);
                     require(stale.acquire().ok(), "stale pid taken over");
                     stale.release();

                     // pid 1 always exists.
                     ws.create_file("daemon.pid", "1\n");
                     otto::daemon::PidFile blocked(path);
                     const auto status = blocked.acquire();
                     require(!status.ok(), "live pid blocks");
                     otto::tests::require_contains(status.error(), "already running", "message");
                     require(otto::daemon::PidFile::is_process_running(static_cast<int>(getpid())),
                             "own process is running");
                   }});

  tests.push_back({"daemon_start_stop_creates_system_tasks", [] {
                     TempWorkspace ws;
                     auto config = otto::testing::temp_config(ws);
                     config.scheduler.enabled = false;
                     config.watchdog.cadence_minutes = 15;
                     config.heartbeat.enabled = true;
                     config.heartbeat.cadence_minutes = 2;

                     otto::daemon::Daemon daemon(config);
                     const auto started = daemon.start();
                     require(started.ok(), started.error());
                     require(daemon.is_running(), "running");
                     require(std::filesystem::exists(ws.path() / "daemon.pid"), "pid file");
                     require(!daemon.start().ok(), "double start rejected");

                     {
                       ps::JobStore jobs(ws.db_path());
                       const auto watchdog = jobs.get_job(otto::scheduler::kWatchdogTaskId);
                       require(watchdog.ok() && watchdog.value().has_value(), "watchdog created");
                       require(watchdog.value()->cadence_minutes.value_or(0) == 15, "cadence");
                       const auto heartbeat = jobs.get_job(otto::scheduler::kHeartbeatTaskId);
                       require(heartbeat.ok() && heartbeat.value().has_value(),
                               "heartbeat created");
                       require(heartbeat.value()->cadence_minutes.value_or(0) == 2,
                               "heartbeat cadence");
                     }

                     daemon.stop();
                     require(!daemon.is_running(), "stopped");
                     require(!std::filesystem::exists(ws.path() / "daemon.pid"), "pid released");
                     otto::observability::set_global_observer(nullptr);
                   }});

  tests.push_back({"daemon_rejects_invalid_config", [] {
                     TempWorkspace ws;
                     auto config = otto::testing::temp_config(ws);
                     config.scheduler.tick_ms = 10;
                     otto::daemon::Daemon daemon(config);
                     require(!daemon.start().ok(), "invalid tick");
                     require(!daemon.is_running(), "not running");
                     require(!std::filesystem::exists(ws.path() / "daemon.pid"), "no pid file");
                   }});
}
