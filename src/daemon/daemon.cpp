#include "otto/daemon/daemon.hpp"

#include "otto/common/clock.hpp"
#include "otto/config/config.hpp"
#include "otto/daemon/pid_file.hpp"
#include "otto/gateway/session_gateway.hpp"
#include "otto/http/http_client.hpp"
#include "otto/observability/factory.hpp"
#include "otto/observability/global.hpp"
#include "otto/outbound/queue.hpp"
#include "otto/outbound/telegram_sender.hpp"
#include "otto/outbound/worker.hpp"
#include "otto/persistence/job_store.hpp"
#include "otto/persistence/outbound_store.hpp"
#include "otto/persistence/session_binding_store.hpp"
#include "otto/persistence/user_profile_store.hpp"
#include "otto/scheduler/executor.hpp"
#include "otto/scheduler/kernel.hpp"
#include "otto/scheduler/heartbeat.hpp"
#include "otto/scheduler/watchdog.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>

namespace otto::daemon {

namespace {

std::optional<std::string> env_token(const char *name) {
  if (const char *value = std::getenv(name); value != nullptr && *value != '\0') {
    return std::string(value);
  }
  return std::nullopt;
}

} // namespace

Daemon::Daemon(const config::Config &config) : config_(config) {}

Daemon::~Daemon() { stop(); }

common::Status Daemon::start() {
  if (running_) {
    return common::Status::error("daemon already running");
  }

  const auto validated = config::validate_config(config_);
  if (!validated.ok()) {
    return common::Status::error("invalid configuration: " + validated.error());
  }
  for (const auto &warning : validated.value()) {
    std::cerr << "[daemon] config_warning " << warning << "\n";
  }

  observability::set_global_observer(observability::create_observer(config_.observability));

  const auto home = config::resolve_home(config_);
  if (!home.ok()) {
    return common::Status::error(home.error());
  }

  pid_file_ = std::make_unique<PidFile>(home.value() / "daemon.pid");
  if (auto acquired = pid_file_->acquire(); !acquired.ok()) {
    pid_file_.reset();
    return acquired;
  }

  if (auto built = build_components(); !built.ok()) {
    teardown();
    return built;
  }

  ensure_watchdog();
  ensure_heartbeat();

  running_ = true;
  kernel_->start();
  if (worker_) {
    worker_->start();
  } else {
    std::cerr << "[daemon] outbound_disabled reason=missing_bot_token\n";
  }
  std::cerr << "[daemon] started home=" << home.value().string() << "\n";
  return common::Status::success();
}

common::Status Daemon::build_components() {
  const auto home = config::resolve_home(config_);
  if (!home.ok()) {
    return common::Status::error(home.error());
  }
  const auto db_path = config::database_path(home.value());

  jobs_ = std::make_unique<persistence::JobStore>(db_path);
  outbound_ = std::make_unique<persistence::OutboundStore>(db_path);
  bindings_ = std::make_unique<persistence::SessionBindingStore>(db_path);
  profiles_ = std::make_unique<persistence::UserProfileStore>(db_path);

  // Surfaces an unopenable database before any thread starts.
  if (const auto opened = jobs_->list_jobs(); !opened.ok()) {
    return common::Status::error("open database " + db_path.string() + ": " + opened.error());
  }

  http_ = std::make_shared<http::CurlHttpClient>();

  gateway::OpencodeGatewayOptions gateway_options;
  gateway_options.base_url = config_.gateway.base_url;
  gateway_options.prompt_timeout_ms = static_cast<std::uint64_t>(config_.gateway.prompt_timeout_ms);
  if (!config_.gateway.model.empty()) {
    gateway_options.model = config_.gateway.model;
  }
  gateway_options.auth_token = env_token("OPENCODE_AUTH_TOKEN");
  gateway_ = std::make_unique<gateway::OpencodeSessionGateway>(gateway_options, http_);

  engine_ = std::make_unique<scheduler::TaskExecutionEngine>(
      *jobs_, *bindings_, *outbound_, *profiles_, *gateway_,
      scheduler::TaskExecutionEngineOptions{
          .home = home.value(),
          .default_watchdog_chat_id = config_.telegram.allowed_user_id,
          .default_heartbeat_chat_id = config_.telegram.allowed_user_id,
      },
      common::system_clock());
  kernel_ = std::make_unique<scheduler::SchedulerKernel>(*jobs_, *engine_, config_.scheduler,
                                                         common::system_clock());

  if (!config_.telegram.bot_token.empty()) {
    sender_ = std::make_unique<outbound::TelegramSender>(
        outbound::TelegramSenderOptions{
            .bot_token = config_.telegram.bot_token,
            .api_base_url = config_.telegram.api_base_url,
        },
        http_);
    processor_ = std::make_unique<outbound::OutboundQueueProcessor>(
        *outbound_, *profiles_, *sender_,
        outbound::RetryPolicy{
            .max_attempts = config_.outbound.max_attempts,
            .base_delay_ms = config_.outbound.retry_base_ms,
            .max_delay_ms = config_.outbound.retry_max_ms,
        },
        jobs_.get());
    worker_ = std::make_unique<outbound::OutboundWorker>(
        *processor_, std::chrono::milliseconds(config_.outbound.poll_ms), common::system_clock());
  }
  return common::Status::success();
}

void Daemon::ensure_watchdog() {
  if (!config_.watchdog.enabled) {
    return;
  }
  scheduler::EnsureWatchdogOptions options;
  options.cadence_minutes = config_.watchdog.cadence_minutes;
  options.payload.lookback_minutes = config_.watchdog.lookback_minutes;
  options.payload.threshold = config_.watchdog.threshold;
  options.payload.max_failures = config_.watchdog.max_failures;
  const auto ensured = scheduler::ensure_watchdog_task(*jobs_, options, common::system_now_ms());
  if (!ensured.ok()) {
    // The daemon still runs; the next start retries.
    observability::record_error("daemon", "watchdog setup: " + ensured.error());
  }
}

void Daemon::ensure_heartbeat() {
  if (!config_.heartbeat.enabled) {
    return;
  }
  scheduler::EnsureHeartbeatOptions options;
  options.cadence_minutes = config_.heartbeat.cadence_minutes;
  const auto ensured = scheduler::ensure_heartbeat_task(*jobs_, options, common::system_now_ms());
  if (!ensured.ok()) {
    observability::record_error("daemon", "heartbeat setup: " + ensured.error());
  }
}

void Daemon::stop() {
  const bool was_running = running_.exchange(false);
  teardown();
  if (was_running) {
    std::cerr << "[daemon] stopped\n";
  }
}

bool Daemon::is_running() const { return running_; }

void Daemon::teardown() {
  if (worker_) {
    worker_->stop();
  }
  if (kernel_) {
    kernel_->stop();
  }
  worker_.reset();
  processor_.reset();
  sender_.reset();
  kernel_.reset();
  engine_.reset();
  gateway_.reset();
  http_.reset();
  profiles_.reset();
  bindings_.reset();
  outbound_.reset();
  jobs_.reset();
  if (pid_file_) {
    pid_file_->release();
    pid_file_.reset();
  }
}

} // namespace otto::daemon
