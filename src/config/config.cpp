#include "otto/config/config.hpp"

#include "otto/common/fs.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>

namespace otto::config {

namespace {

constexpr const char *kConfigFolder = ".otto";
constexpr const char *kConfigFilename = "config.toml";
constexpr const char *kDatabaseFilename = "otto.db";

std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::string> env_value(const char *name) {
  if (const char *value = std::getenv(name); value != nullptr && *value != '\0') {
    return std::string(value);
  }
  return std::nullopt;
}

std::optional<std::int64_t> parse_i64(const std::string &raw) {
  const std::string value = common::trim(raw);
  std::int64_t parsed = 0;
  const auto *first = value.data();
  const auto *last = first + value.size();
  const auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last || first == last) {
    return std::nullopt;
  }
  return parsed;
}

void override_i64(const char *name, std::int64_t &target) {
  if (const auto raw = env_value(name); raw.has_value()) {
    if (const auto parsed = parse_i64(*raw); parsed.has_value()) {
      target = *parsed;
    }
  }
}

std::string strip_env_quotes(const std::string &raw) {
  const std::string value = common::trim(raw);
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
      value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty() ||
      !(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    if (!(std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

// KEY=VALUE lines; variables already present in the environment win.
void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }
  std::ifstream file(path);
  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }
    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    const std::string key = common::trim(trimmed.substr(0, eq));
    if (!is_valid_env_name(key)) {
      continue;
    }
    setenv(key.c_str(), strip_env_quotes(trimmed.substr(eq + 1)).c_str(), 0);
  }
}

void load_dotenv_files() {
  if (const auto env_file = env_value("OTTO_ENV_FILE"); env_file.has_value()) {
    load_dotenv_file(common::expand_path(*env_file));
  }
  if (const auto home = common::home_dir(); home.ok()) {
    load_dotenv_file(home.value() / kConfigFolder / ".env");
  }
}

} // namespace

common::Result<std::filesystem::path> config_path() {
  if (g_config_path_override.has_value()) {
    return common::Result<std::filesystem::path>::success(*g_config_path_override);
  }
  if (const auto env = env_value("OTTO_CONFIG_PATH"); env.has_value()) {
    return common::Result<std::filesystem::path>::success(common::expand_path(*env));
  }
  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / kConfigFolder /
                                                        kConfigFilename);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

Config config_from_toml(const common::TomlDocument &doc) {
  Config config;
  config.home = doc.get_string("home", config.home);

  auto &scheduler = config.scheduler;
  scheduler.enabled = doc.get_bool("scheduler.enabled", scheduler.enabled);
  scheduler.tick_ms = doc.get_i64("scheduler.tick_ms", scheduler.tick_ms);
  scheduler.batch_size = doc.get_i64("scheduler.batch_size", scheduler.batch_size);
  scheduler.lock_lease_ms = doc.get_i64("scheduler.lock_lease_ms", scheduler.lock_lease_ms);

  auto &outbound = config.outbound;
  outbound.poll_ms = doc.get_i64("outbound.poll_ms", outbound.poll_ms);
  outbound.max_attempts = doc.get_i64("outbound.max_attempts", outbound.max_attempts);
  outbound.retry_base_ms = doc.get_i64("outbound.retry_base_ms", outbound.retry_base_ms);
  outbound.retry_max_ms = doc.get_i64("outbound.retry_max_ms", outbound.retry_max_ms);

  auto &telegram = config.telegram;
  telegram.bot_token = doc.get_string("telegram.bot_token");
  telegram.api_base_url = doc.get_string("telegram.api_base_url", telegram.api_base_url);
  if (const auto user_id = doc.find_i64("telegram.allowed_user_id"); user_id.has_value()) {
    telegram.allowed_user_id = *user_id;
  } else if (const auto text = doc.find_string("telegram.allowed_user_id"); text.has_value()) {
    telegram.allowed_user_id = parse_i64(*text);
  }

  auto &gateway = config.gateway;
  gateway.base_url = doc.get_string("gateway.base_url", gateway.base_url);
  gateway.prompt_timeout_ms = doc.get_i64("gateway.prompt_timeout_ms", gateway.prompt_timeout_ms);
  gateway.model = doc.get_string("gateway.model", gateway.model);

  auto &watchdog = config.watchdog;
  watchdog.enabled = doc.get_bool("watchdog.enabled", watchdog.enabled);
  watchdog.cadence_minutes = doc.get_i64("watchdog.cadence_minutes", watchdog.cadence_minutes);
  watchdog.lookback_minutes = doc.get_i64("watchdog.lookback_minutes", watchdog.lookback_minutes);
  watchdog.threshold = doc.get_i64("watchdog.threshold", watchdog.threshold);
  watchdog.max_failures = doc.get_i64("watchdog.max_failures", watchdog.max_failures);

  auto &heartbeat = config.heartbeat;
  heartbeat.enabled = doc.get_bool("heartbeat.enabled", heartbeat.enabled);
  heartbeat.cadence_minutes = doc.get_i64("heartbeat.cadence_minutes", heartbeat.cadence_minutes);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
  return config;
}

void apply_env_overrides(Config &config) {
  load_dotenv_files();

  if (const auto home = env_value("OTTO_HOME"); home.has_value()) {
    config.home = *home;
  }
  if (const auto enabled = env_value("OTTO_SCHEDULER_ENABLED"); enabled.has_value()) {
    config.scheduler.enabled = common::trim(*enabled) != "0";
  }
  override_i64("OTTO_SCHEDULER_TICK_MS", config.scheduler.tick_ms);
  override_i64("OTTO_SCHEDULER_BATCH_SIZE", config.scheduler.batch_size);
  override_i64("OTTO_SCHEDULER_LOCK_LEASE_MS", config.scheduler.lock_lease_ms);
  override_i64("OTTO_OUTBOUND_MAX_ATTEMPTS", config.outbound.max_attempts);

  if (const auto token = env_value("TELEGRAM_BOT_TOKEN"); token.has_value()) {
    config.telegram.bot_token = *token;
  }
  if (const auto user_id = env_value("TELEGRAM_ALLOWED_USER_ID"); user_id.has_value()) {
    config.telegram.allowed_user_id = parse_i64(*user_id);
  }
  if (const auto url = env_value("OTTO_GATEWAY_URL"); url.has_value()) {
    config.gateway.base_url = *url;
  }
}

common::Result<Config> load_config_file(const std::filesystem::path &path) {
  const auto doc = common::load_toml_file(path);
  if (!doc.ok()) {
    return common::Result<Config>::failure(doc.error());
  }
  return common::Result<Config>::success(config_from_toml(doc.value()));
}

common::Result<Config> load_config() {
  const auto path = config_path();
  if (!path.ok()) {
    return common::Result<Config>::failure(path.error());
  }
  auto loaded = load_config_file(path.value());
  if (!loaded.ok()) {
    return loaded;
  }
  Config config = std::move(loaded.value());
  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using Failure = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  const auto &scheduler = config.scheduler;
  if (scheduler.tick_ms < 1'000) {
    return Failure::failure("scheduler.tick_ms must be >= 1000");
  }
  if (scheduler.batch_size < 1) {
    return Failure::failure("scheduler.batch_size must be >= 1");
  }
  if (scheduler.lock_lease_ms < scheduler.tick_ms) {
    return Failure::failure("scheduler.lock_lease_ms must be >= scheduler.tick_ms");
  }

  const auto &outbound = config.outbound;
  if (outbound.poll_ms < 100) {
    return Failure::failure("outbound.poll_ms must be >= 100");
  }
  if (outbound.max_attempts < 1) {
    return Failure::failure("outbound.max_attempts must be >= 1");
  }
  if (outbound.retry_base_ms < 1 || outbound.retry_max_ms < outbound.retry_base_ms) {
    return Failure::failure("outbound.retry_max_ms must be >= outbound.retry_base_ms >= 1");
  }

  const auto &watchdog = config.watchdog;
  const auto in_range = [](std::int64_t value, std::int64_t lo, std::int64_t hi) {
    return value >= lo && value <= hi;
  };
  if (!in_range(watchdog.cadence_minutes, 5, 1440)) {
    return Failure::failure("watchdog.cadence_minutes must be 5-1440");
  }
  if (!in_range(watchdog.lookback_minutes, 5, 1440)) {
    return Failure::failure("watchdog.lookback_minutes must be 5-1440");
  }
  if (!in_range(watchdog.threshold, 1, 50)) {
    return Failure::failure("watchdog.threshold must be 1-50");
  }
  if (!in_range(watchdog.max_failures, 1, 200)) {
    return Failure::failure("watchdog.max_failures must be 1-200");
  }
  if (!in_range(config.heartbeat.cadence_minutes, 1, 60)) {
    return Failure::failure("heartbeat.cadence_minutes must be 1-60");
  }

  if (config.gateway.base_url.empty()) {
    return Failure::failure("gateway.base_url must not be empty");
  }
  if (config.gateway.prompt_timeout_ms < 1'000) {
    return Failure::failure("gateway.prompt_timeout_ms must be >= 1000");
  }
  if (!config.gateway.model.empty() && config.gateway.model.find('/') == std::string::npos) {
    return Failure::failure("gateway.model must look like provider/model");
  }

  if (common::trim(config.telegram.bot_token).empty()) {
    warnings.push_back("telegram.bot_token is not set; outbound messages will stay queued");
  }
  if (!config.telegram.allowed_user_id.has_value() ||
      *config.telegram.allowed_user_id <= 0) {
    warnings.push_back("telegram.allowed_user_id is not set; watchdog alerts cannot be delivered");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

common::Result<std::filesystem::path> resolve_home(const Config &config) {
  const std::string expanded = common::expand_path(config.home);
  if (expanded.empty()) {
    return common::Result<std::filesystem::path>::failure("home must not be empty");
  }
  return common::ensure_dir(expanded);
}

std::filesystem::path database_path(const std::filesystem::path &home) {
  return home / kDatabaseFilename;
}

} // namespace otto::config
