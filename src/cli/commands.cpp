#include "otto/cli/commands.hpp"

#include "otto/common/clock.hpp"
#include "otto/common/crypto.hpp"
#include "otto/common/fs.hpp"
#include "otto/common/json_util.hpp"
#include "otto/config/config.hpp"
#include "otto/daemon/daemon.hpp"
#include "otto/outbound/notification_policy.hpp"
#include "otto/persistence/job_store.hpp"
#include "otto/persistence/outbound_store.hpp"
#include "otto/persistence/user_profile_store.hpp"
#include "otto/scheduler/schedule.hpp"
#include "otto/scheduler/task_config.hpp"
#include "otto/scheduler/watchdog.hpp"

#include <algorithm>
#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace otto::cli {

namespace {

using persistence::Job;

std::atomic<bool> g_stop_requested{false};

void handle_stop_signal(int) { g_stop_requested = true; }

std::string version_string() {
#ifdef OTTO_VERSION
  return std::string("otto ") + OTTO_VERSION;
#else
  return "otto 0.1.0";
#endif
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::optional<std::int64_t> parse_int64(const std::string &text) {
  std::int64_t value = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::string optional_number(const std::optional<std::int64_t> &value) {
  return value.has_value() ? std::to_string(*value) : "-";
}

std::string job_to_json(const Job &job) {
  const auto number_or_null = [](const std::optional<std::int64_t> &value) {
    return value.has_value() ? std::to_string(*value) : std::string("null");
  };
  std::ostringstream out;
  out << "{\"id\":" << common::json_quote(job.id) << ",\"type\":" << common::json_quote(job.type)
      << ",\"scheduleType\":"
      << common::json_quote(std::string(persistence::to_string(job.schedule_type)))
      << ",\"profileId\":" << common::json_quote_or_null(job.profile_id)
      << ",\"runAt\":" << number_or_null(job.run_at)
      << ",\"cadenceMinutes\":" << number_or_null(job.cadence_minutes)
      << ",\"payload\":" << job.payload.value_or("null")
      << ",\"nextRunAt\":" << number_or_null(job.next_run_at)
      << ",\"status\":" << common::json_quote(std::string(persistence::to_string(job.status)))
      << ",\"terminalState\":"
      << (job.terminal_state.has_value()
              ? common::json_quote(std::string(persistence::to_string(*job.terminal_state)))
              : std::string("null"))
      << "}";
  return out.str();
}

/// Config plus runtime home, shared by every command that touches the database.
struct Runtime {
  config::Config config;
  std::filesystem::path home;
  std::filesystem::path db_path;
};

common::Result<Runtime> load_runtime() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return common::Result<Runtime>::failure(loaded.error());
  }
  auto home = config::resolve_home(loaded.value());
  if (!home.ok()) {
    return common::Result<Runtime>::failure(home.error());
  }
  Runtime runtime{loaded.value(), home.value(), config::database_path(home.value())};
  return common::Result<Runtime>::success(std::move(runtime));
}

common::Status write_audit(persistence::JobStore &store, const std::string &task_id,
                           const persistence::AuditAction action,
                           const std::optional<Job> &before, const std::optional<Job> &after,
                           const std::int64_t now) {
  persistence::TaskAuditRecord record;
  record.id = common::generate_uuid();
  record.task_id = task_id;
  record.action = action;
  record.lane = persistence::Lane::Interactive;
  record.actor = "cli";
  if (before.has_value()) {
    record.before_json = job_to_json(*before);
  }
  if (after.has_value()) {
    record.after_json = job_to_json(*after);
  }
  record.created_at = now;
  return store.insert_audit(record);
}

/// Reads `--every MIN` / `--at EPOCH_MS` into the definition. Returns false with `error` set on
/// bad input; leaves the definition untouched when neither option is present.
bool take_schedule(std::vector<std::string> &args, persistence::JobDefinition &definition,
                   const std::int64_t now, bool &changed, std::string &error) {
  std::string every_raw;
  std::string at_raw;
  const bool has_every = take_option(args, "--every", every_raw);
  const bool has_at = take_option(args, "--at", at_raw);
  changed = has_every || has_at;
  if (has_every && has_at) {
    error = "--every and --at are mutually exclusive";
    return false;
  }
  if (has_every) {
    const auto cadence = parse_int64(every_raw);
    if (!cadence.has_value() || *cadence <= 0) {
      error = "--every must be a positive number of minutes";
      return false;
    }
    definition.schedule_type = persistence::ScheduleType::Recurring;
    definition.cadence_minutes = *cadence;
    definition.run_at.reset();
    definition.next_run_at = now + *cadence * scheduler::kMinuteMs;
  } else if (has_at) {
    const auto run_at = parse_int64(at_raw);
    if (!run_at.has_value() || *run_at <= 0) {
      error = "--at must be an epoch milliseconds timestamp";
      return false;
    }
    definition.schedule_type = persistence::ScheduleType::Oneshot;
    definition.run_at = *run_at;
    definition.cadence_minutes.reset();
    definition.next_run_at = *run_at;
  }
  return true;
}

bool take_payload_and_profile(std::vector<std::string> &args, const Runtime &runtime,
                              persistence::JobDefinition &definition, std::string &error) {
  std::string payload;
  if (take_option(args, "--payload", payload)) {
    if (!common::json_validate(payload)) {
      error = "--payload must be valid JSON";
      return false;
    }
    definition.payload = common::trim(payload);
  }
  std::string profile;
  if (take_option(args, "--profile", profile)) {
    const auto loaded = scheduler::load_task_profile(runtime.home, profile);
    if (!loaded.ok()) {
      error = loaded.error();
      return false;
    }
    definition.profile_id = profile;
  }
  return true;
}

void print_job(const Job &job) {
  std::cout << job.id << " | " << job.type << " | " << persistence::to_string(job.schedule_type)
            << " | "
            << (job.schedule_type == persistence::ScheduleType::Recurring
                    ? "every " + optional_number(job.cadence_minutes) + "m"
                    : "at " + optional_number(job.run_at))
            << " | " << persistence::to_string(job.status) << " | next="
            << (job.next_run_at.has_value() ? common::format_iso8601(*job.next_run_at) : "-");
  if (job.terminal_state.has_value()) {
    std::cout << " | " << persistence::to_string(*job.terminal_state);
    if (job.terminal_reason.has_value()) {
      std::cout << " (" << *job.terminal_reason << ")";
    }
  }
  std::cout << "\n";
}

int run_task_add(std::vector<std::string> args, const Runtime &runtime) {
  persistence::JobStore store(runtime.db_path);
  const std::int64_t now = common::system_now_ms();

  std::string type;
  std::string id;
  (void)take_option(args, "--type", type);
  (void)take_option(args, "--id", id);
  if (type.empty()) {
    std::cerr << "usage: otto task add --type T (--every MIN | --at EPOCH_MS) [--payload JSON] "
                 "[--profile ID] [--id ID]\n";
    return 1;
  }

  persistence::JobDefinition definition;
  definition.type = type;
  bool schedule_given = false;
  std::string error;
  if (!take_schedule(args, definition, now, schedule_given, error) ||
      !take_payload_and_profile(args, runtime, definition, error)) {
    std::cerr << error << "\n";
    return 1;
  }
  if (!schedule_given) {
    std::cerr << "one of --every or --at is required\n";
    return 1;
  }

  Job job;
  job.id = id.empty() ? common::generate_uuid() : id;
  job.type = definition.type;
  job.schedule_type = definition.schedule_type;
  job.profile_id = definition.profile_id;
  job.run_at = definition.run_at;
  job.cadence_minutes = definition.cadence_minutes;
  job.payload = definition.payload;
  job.next_run_at = definition.next_run_at;
  job.created_at = now;
  job.updated_at = now;

  if (auto created = store.create_job(job); !created.ok()) {
    std::cerr << created.error() << "\n";
    return 1;
  }
  if (auto audited = write_audit(store, job.id, persistence::AuditAction::Create, std::nullopt,
                                 job, now);
      !audited.ok()) {
    std::cerr << "audit failed: " << audited.error() << "\n";
  }
  std::cout << "Created task " << job.id << "\n";
  return 0;
}

int run_task_update(std::vector<std::string> args, const Runtime &runtime) {
  if (args.empty()) {
    std::cerr << "usage: otto task update <id> [--type T] [--every MIN | --at EPOCH_MS] "
                 "[--payload JSON] [--profile ID]\n";
    return 1;
  }
  const std::string id = args[0];
  args.erase(args.begin());

  persistence::JobStore store(runtime.db_path);
  const std::int64_t now = common::system_now_ms();
  auto existing = store.get_job(id);
  if (!existing.ok()) {
    std::cerr << existing.error() << "\n";
    return 1;
  }
  if (!existing.value().has_value()) {
    std::cerr << "task not found: " << id << "\n";
    return 1;
  }
  const Job before = *existing.value();

  persistence::JobDefinition definition{
      .type = before.type,
      .schedule_type = before.schedule_type,
      .profile_id = before.profile_id,
      .run_at = before.run_at,
      .cadence_minutes = before.cadence_minutes,
      .payload = before.payload,
      .next_run_at = before.next_run_at,
  };
  std::string type;
  if (take_option(args, "--type", type)) {
    definition.type = type;
  }
  bool schedule_changed = false;
  std::string error;
  if (!take_schedule(args, definition, now, schedule_changed, error) ||
      !take_payload_and_profile(args, runtime, definition, error)) {
    std::cerr << error << "\n";
    return 1;
  }

  auto updated = store.update_job(id, definition, now);
  if (!updated.ok()) {
    std::cerr << updated.error() << "\n";
    return 1;
  }
  if (!updated.value()) {
    std::cerr << "task " << id << " is running; try again after the run finishes\n";
    return 1;
  }

  const auto after = store.get_job(id);
  if (after.ok()) {
    if (auto audited = write_audit(store, id, persistence::AuditAction::Update, before,
                                   after.value(), now);
        !audited.ok()) {
      std::cerr << "audit failed: " << audited.error() << "\n";
    }
  }
  std::cout << "Updated task " << id << "\n";
  return 0;
}

int run_task_cancel(std::vector<std::string> args, const Runtime &runtime) {
  std::string reason;
  const bool has_reason = take_option(args, "--reason", reason);
  if (args.empty()) {
    std::cerr << "usage: otto task cancel <id> [--reason R]\n";
    return 1;
  }
  const std::string id = args[0];

  persistence::JobStore store(runtime.db_path);
  const std::int64_t now = common::system_now_ms();
  const auto before = store.get_job(id);
  if (!before.ok()) {
    std::cerr << before.error() << "\n";
    return 1;
  }
  auto cancelled =
      store.cancel_job(id, has_reason ? std::optional<std::string>(reason) : std::nullopt, now);
  if (!cancelled.ok()) {
    std::cerr << cancelled.error() << "\n";
    return 1;
  }
  if (!cancelled.value()) {
    std::cerr << "task not found or already finished: " << id << "\n";
    return 1;
  }
  const auto after = store.get_job(id);
  if (auto audited = write_audit(store, id, persistence::AuditAction::Delete, before.value(),
                                 after.ok() ? after.value() : std::nullopt, now);
      !audited.ok()) {
    std::cerr << "audit failed: " << audited.error() << "\n";
  }
  std::cout << "Cancelled task " << id << "\n";
  return 0;
}

int run_task(std::vector<std::string> args) {
  auto runtime = load_runtime();
  if (!runtime.ok()) {
    std::cerr << runtime.error() << "\n";
    return 1;
  }

  if (args.empty() || args[0] == "list") {
    persistence::JobStore store(runtime.value().db_path);
    auto jobs = store.list_jobs();
    if (!jobs.ok()) {
      std::cerr << jobs.error() << "\n";
      return 1;
    }
    for (const auto &job : jobs.value()) {
      print_job(job);
    }
    return 0;
  }

  const std::string action = args[0];
  args.erase(args.begin());
  if (action == "add") {
    return run_task_add(std::move(args), runtime.value());
  }
  if (action == "update") {
    return run_task_update(std::move(args), runtime.value());
  }
  if (action == "cancel") {
    return run_task_cancel(std::move(args), runtime.value());
  }
  if (action == "pause" || action == "resume") {
    if (args.empty()) {
      std::cerr << "usage: otto task " << action << " <id>\n";
      return 1;
    }
    persistence::JobStore store(runtime.value().db_path);
    auto changed = store.set_paused(args[0], action == "pause", common::system_now_ms());
    if (!changed.ok()) {
      std::cerr << changed.error() << "\n";
      return 1;
    }
    if (!changed.value()) {
      std::cerr << "task " << args[0] << " cannot be " << (action == "pause" ? "paused" : "resumed")
                << " in its current state\n";
      return 1;
    }
    std::cout << (action == "pause" ? "Paused" : "Resumed") << " task " << args[0] << "\n";
    return 0;
  }

  std::cerr << "unknown task subcommand: " << action << "\n";
  return 1;
}

int run_runs(std::vector<std::string> args) {
  std::string limit_raw;
  std::size_t limit = 20;
  if (take_option(args, "--limit", limit_raw)) {
    const auto parsed = parse_int64(limit_raw);
    if (!parsed.has_value() || *parsed <= 0) {
      std::cerr << "--limit must be a positive number\n";
      return 1;
    }
    limit = static_cast<std::size_t>(*parsed);
  }
  if (args.empty()) {
    std::cerr << "usage: otto runs <job-id> [--limit N]\n";
    return 1;
  }
  auto runtime = load_runtime();
  if (!runtime.ok()) {
    std::cerr << runtime.error() << "\n";
    return 1;
  }
  persistence::JobStore store(runtime.value().db_path);
  auto runs = store.list_runs_for_job(args[0], limit);
  if (!runs.ok()) {
    std::cerr << runs.error() << "\n";
    return 1;
  }
  for (const auto &run : runs.value()) {
    std::cout << run.id << " | " << common::format_iso8601(run.started_at) << " | "
              << persistence::to_string(run.status);
    if (run.error_code.has_value()) {
      std::cout << " | " << *run.error_code;
    }
    if (run.error_message.has_value()) {
      std::cout << ": " << *run.error_message;
    }
    std::cout << "\n";
  }
  return 0;
}

int run_watchdog(std::vector<std::string> args) {
  if (args.empty() || args[0] != "check") {
    std::cerr << "usage: otto watchdog check [--no-notify]\n";
    return 1;
  }
  const bool no_notify = take_flag(args, "--no-notify");
  auto runtime = load_runtime();
  if (!runtime.ok()) {
    std::cerr << runtime.error() << "\n";
    return 1;
  }
  const auto &watchdog = runtime.value().config.watchdog;
  persistence::JobStore jobs(runtime.value().db_path);
  persistence::OutboundStore outbound(runtime.value().db_path);

  scheduler::WatchdogCheckOptions options;
  options.payload.lookback_minutes = watchdog.lookback_minutes;
  options.payload.threshold = watchdog.threshold;
  options.payload.max_failures = watchdog.max_failures;
  options.payload.notify = !no_notify;
  options.default_chat_id = runtime.value().config.telegram.allowed_user_id;
  options.exclude_task_type = std::string(scheduler::kWatchdogTaskType);

  auto checked = scheduler::check_task_failures(jobs, outbound, options, common::system_now_ms());
  if (!checked.ok()) {
    std::cerr << checked.error() << "\n";
    return 1;
  }
  const auto &result = checked.value();
  std::cout << "failed_runs=" << result.failed_count << " threshold=" << result.threshold
            << " lookback_minutes=" << result.lookback_minutes
            << " alert=" << (result.should_alert ? "yes" : "no")
            << " notification=" << scheduler::to_string(result.notification_status) << "\n";
  for (const auto &failure : result.failures) {
    std::cout << "- " << failure.job_type << " (" << failure.job_id << "): "
              << failure.error_message.value_or(failure.error_code.value_or("unknown error"))
              << "\n";
  }
  return 0;
}

int run_outbound(std::vector<std::string> args) {
  if (!args.empty() && args[0] != "list") {
    std::cerr << "usage: otto outbound list\n";
    return 1;
  }
  auto runtime = load_runtime();
  if (!runtime.ok()) {
    std::cerr << runtime.error() << "\n";
    return 1;
  }
  persistence::OutboundStore store(runtime.value().db_path);
  auto messages = store.list_recent(50);
  if (!messages.ok()) {
    std::cerr << messages.error() << "\n";
    return 1;
  }
  for (const auto &message : messages.value()) {
    std::cout << message.id << " | " << persistence::to_string(message.status) << " | "
              << persistence::to_string(message.kind) << " | "
              << persistence::to_string(message.priority) << " | chat=" << message.chat_id
              << " | attempts=" << message.attempt_count;
    if (message.error_message.has_value()) {
      std::cout << " | " << *message.error_message;
    }
    std::cout << "\n";
  }
  return 0;
}

int run_profile(std::vector<std::string> args) {
  if (args.empty() || args[0] != "set") {
    std::cerr << "usage: otto profile set [--timezone TZ] [--quiet START END] "
                 "[--quiet-mode critical_only|off] [--mute-until EPOCH_MS] "
                 "[--heartbeat-morning|--heartbeat-midday|--heartbeat-evening HH:MM] "
                 "[--heartbeat-cadence MIN] [--heartbeat-only-if-signal true|false] "
                 "[--onboarded]\n";
    return 1;
  }
  args.erase(args.begin());

  auto runtime = load_runtime();
  if (!runtime.ok()) {
    std::cerr << runtime.error() << "\n";
    return 1;
  }
  persistence::UserProfileStore store(runtime.value().db_path);
  auto existing = store.get();
  if (!existing.ok()) {
    std::cerr << existing.error() << "\n";
    return 1;
  }
  persistence::NotificationPolicy policy = existing.value().value_or(persistence::NotificationPolicy{});

  std::string timezone;
  if (take_option(args, "--timezone", timezone)) {
    policy.timezone = timezone;
  }
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] != "--quiet") {
      continue;
    }
    if (i + 2 >= args.size()) {
      std::cerr << "--quiet needs START and END (HH:MM)\n";
      return 1;
    }
    if (!outbound::parse_clock_minutes(args[i + 1]).has_value() ||
        !outbound::parse_clock_minutes(args[i + 2]).has_value()) {
      std::cerr << "quiet hours must be HH:MM\n";
      return 1;
    }
    policy.quiet_hours_start = args[i + 1];
    policy.quiet_hours_end = args[i + 2];
    args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 3));
    break;
  }
  std::string mode;
  if (take_option(args, "--quiet-mode", mode)) {
    const auto parsed = persistence::parse_quiet_mode(mode);
    if (!parsed.has_value()) {
      std::cerr << "--quiet-mode must be critical_only or off\n";
      return 1;
    }
    policy.quiet_mode = *parsed;
  }
  std::string mute_raw;
  if (take_option(args, "--mute-until", mute_raw)) {
    const auto mute_until = parse_int64(mute_raw);
    if (!mute_until.has_value()) {
      std::cerr << "--mute-until must be an epoch milliseconds timestamp\n";
      return 1;
    }
    policy.mute_until = *mute_until;
  }
  for (auto [flag, target] : {std::pair{"--heartbeat-morning", &policy.heartbeat_morning},
                              std::pair{"--heartbeat-midday", &policy.heartbeat_midday},
                              std::pair{"--heartbeat-evening", &policy.heartbeat_evening}}) {
    std::string slot;
    if (!take_option(args, flag, slot)) {
      continue;
    }
    if (!outbound::parse_clock_minutes(slot).has_value()) {
      std::cerr << flag << " must be HH:MM\n";
      return 1;
    }
    *target = slot;
  }
  std::string cadence_raw;
  if (take_option(args, "--heartbeat-cadence", cadence_raw)) {
    const auto cadence = parse_int64(cadence_raw);
    if (!cadence.has_value() || *cadence < outbound::kMinHeartbeatCadenceMinutes) {
      std::cerr << "--heartbeat-cadence must be at least "
                << outbound::kMinHeartbeatCadenceMinutes << " minutes\n";
      return 1;
    }
    policy.heartbeat_cadence_minutes = *cadence;
  }
  std::string signal_raw;
  if (take_option(args, "--heartbeat-only-if-signal", signal_raw)) {
    if (signal_raw != "true" && signal_raw != "false") {
      std::cerr << "--heartbeat-only-if-signal must be true or false\n";
      return 1;
    }
    policy.heartbeat_only_if_signal = signal_raw == "true";
  }
  const std::int64_t now = common::system_now_ms();
  if (const auto flag = std::find(args.begin(), args.end(), "--onboarded"); flag != args.end()) {
    args.erase(flag);
    policy.onboarding_completed_at = now;
  }
  if (!args.empty()) {
    std::cerr << "unexpected argument: " << args[0] << "\n";
    return 1;
  }

  policy.updated_at = now;
  if (auto saved = store.upsert(policy); !saved.ok()) {
    std::cerr << saved.error() << "\n";
    return 1;
  }
  std::cout << "Notification profile saved\n";
  return 0;
}

int run_daemon(std::vector<std::string> args) {
  std::string duration_raw;
  (void)take_option(args, "--duration-secs", duration_raw);

  auto loaded = config::load_config();
  if (!loaded.ok()) {
    std::cerr << loaded.error() << "\n";
    return 1;
  }

  daemon::Daemon daemon(loaded.value());
  auto started = daemon.start();
  if (!started.ok()) {
    std::cerr << started.error() << "\n";
    return 1;
  }
  std::cout << "Daemon started\n";

  std::int64_t duration_secs = 0;
  if (!duration_raw.empty()) {
    duration_secs = parse_int64(duration_raw).value_or(0);
  }

  g_stop_requested = false;
  std::signal(SIGINT, handle_stop_signal);
  std::signal(SIGTERM, handle_stop_signal);
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(duration_secs);
  while (!g_stop_requested) {
    if (duration_secs > 0 && std::chrono::steady_clock::now() >= deadline) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }
  daemon.stop();
  return 0;
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "Usage: otto [--config PATH] <command> [options]\n\n";
  std::cout << "Commands:\n";
  std::cout << "  daemon [--duration-secs N]     Run the scheduler and outbound worker\n";
  std::cout << "  task list                      List scheduled tasks\n";
  std::cout << "  task add --type T (--every MIN | --at EPOCH_MS) [--payload JSON] "
               "[--profile ID] [--id ID]\n";
  std::cout << "  task update <id> [--type T] [--every MIN | --at EPOCH_MS] [--payload JSON] "
               "[--profile ID]\n";
  std::cout << "  task cancel <id> [--reason R]\n";
  std::cout << "  task pause|resume <id>\n";
  std::cout << "  runs <job-id> [--limit N]      Show run history for a task\n";
  std::cout << "  watchdog check [--no-notify]   Check recent task failures now\n";
  std::cout << "  outbound list                  Show recent outbound messages\n";
  std::cout << "  profile set [--timezone TZ] [--quiet START END] [--quiet-mode M] "
               "[--mute-until EPOCH_MS]\n";
  std::cout << "              [--heartbeat-morning|--heartbeat-midday|--heartbeat-evening HH:MM] "
               "[--heartbeat-cadence MIN]\n";
  std::cout << "              [--heartbeat-only-if-signal true|false] [--onboarded]\n";
  std::cout << "  config-path                    Print the config file location\n";
  std::cout << "  version                        Show version\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help();
    return 0;
  }

  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }
  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "daemon") {
    return run_daemon(std::move(args));
  }
  if (subcommand == "task") {
    return run_task(std::move(args));
  }
  if (subcommand == "runs") {
    return run_runs(std::move(args));
  }
  if (subcommand == "watchdog") {
    return run_watchdog(std::move(args));
  }
  if (subcommand == "outbound") {
    return run_outbound(std::move(args));
  }
  if (subcommand == "profile") {
    return run_profile(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace otto::cli
