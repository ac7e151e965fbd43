#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace otto::config {

struct SchedulerConfig {
  bool enabled = true;
  std::int64_t tick_ms = 60'000;
  std::int64_t batch_size = 20;
  std::int64_t lock_lease_ms = 90'000;
};

struct OutboundConfig {
  std::int64_t poll_ms = 2'000;
  std::int64_t max_attempts = 5;
  std::int64_t retry_base_ms = 5'000;
  std::int64_t retry_max_ms = 300'000;
};

struct TelegramConfig {
  std::string bot_token;
  /// Default recipient for system notifications (watchdog alerts).
  std::optional<std::int64_t> allowed_user_id;
  std::string api_base_url = "https://api.telegram.org";
};

struct GatewayConfig {
  std::string base_url = "http://127.0.0.1:4096";
  std::int64_t prompt_timeout_ms = 300'000;
  /// `provider/model`; empty means ask the gateway for its configured default.
  std::string model;
};

struct WatchdogConfig {
  bool enabled = true;
  std::int64_t cadence_minutes = 30;
  std::int64_t lookback_minutes = 120;
  std::int64_t threshold = 2;
  std::int64_t max_failures = 20;
};

/// Friendly status heartbeat; off unless enabled.
struct HeartbeatConfig {
  bool enabled = false;
  std::int64_t cadence_minutes = 1;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  std::string home = "~/.otto";
  SchedulerConfig scheduler;
  OutboundConfig outbound;
  TelegramConfig telegram;
  GatewayConfig gateway;
  WatchdogConfig watchdog;
  HeartbeatConfig heartbeat;
  ObservabilityConfig observability;
};

} // namespace otto::config
