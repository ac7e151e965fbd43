#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "otto/config/config.hpp"

#include <filesystem>

namespace {

struct ConfigOverrideGuard {
  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next) {
    otto::config::set_config_path_override(std::move(next));
  }
  ~ConfigOverrideGuard() { otto::config::set_config_path_override(std::nullopt); }
};

} // namespace

void register_config_tests(std::vector<otto::tests::TestCase> &tests) {
  using otto::tests::require;
  namespace cfg = otto::config;
  using otto::testing::EnvGuard;
  using otto::testing::TempWorkspace;

  tests.push_back({"config_missing_file_yields_defaults", [] {
                     TempWorkspace ws;
                     const auto loaded = cfg::load_config_file(ws.path() / "absent.toml");
                     require(loaded.ok(), loaded.error());
                     const auto &config = loaded.value();
                     require(config.scheduler.enabled, "scheduler enabled by default");
                     require(config.scheduler.tick_ms == 60'000, "tick default");
                     require(config.scheduler.batch_size == 20, "batch default");
                     require(config.scheduler.lock_lease_ms == 90'000, "lease default");
                     require(config.outbound.max_attempts == 5, "attempts default");
                     require(config.watchdog.cadence_minutes == 30, "cadence default");
                     require(!config.heartbeat.enabled, "heartbeat off by default");
                     require(config.gateway.model.empty(), "model unset by default");
                   }});

  tests.push_back({"config_reads_sections_from_toml", [] {
                     TempWorkspace ws;
                     ws.create_file("config.toml", R"(
home = "/srv/otto"

[scheduler]
tick_ms = 5000
batch_size = 3
lock_lease_ms = 15000

[telegram]
bot_token = "123:abc"
allowed_user_id = 4242

[gateway]
model = "anthropic/claude"

[watchdog]
enabled = false
threshold = 4

[heartbeat]
enabled = true
cadence_minutes = 5
)");
                     const auto loaded = cfg::load_config_file(ws.path() / "config.toml");
                     require(loaded.ok(), loaded.error());
                     const auto &config = loaded.value();
                     require(config.home == "/srv/otto", "home");
                     require(config.scheduler.tick_ms == 5000, "tick_ms");
                     require(config.scheduler.batch_size == 3, "batch_size");
                     require(config.telegram.bot_token == "123:abc", "bot token");
                     require(config.telegram.allowed_user_id.value_or(0) == 4242, "user id");
                     require(config.gateway.model == "anthropic/claude", "model");
                     require(!config.watchdog.enabled, "watchdog disabled");
                     require(config.watchdog.threshold == 4, "threshold");
                     require(config.heartbeat.enabled, "heartbeat enabled");
                     require(config.heartbeat.cadence_minutes == 5, "heartbeat cadence");
                   }});

  tests.push_back({"config_env_overrides_win_over_file", [] {
                     TempWorkspace ws;
                     ws.create_file("config.toml", "[scheduler]\ntick_ms = 5000\n");
                     const EnvGuard home("HOME", ws.path().string());
                     const EnvGuard env_file("OTTO_ENV_FILE", std::nullopt);
                     const EnvGuard tick("OTTO_SCHEDULER_TICK_MS", "2000");
                     const EnvGuard enabled("OTTO_SCHEDULER_ENABLED", "0");
                     const EnvGuard token("TELEGRAM_BOT_TOKEN", "env-token");
                     const EnvGuard user("TELEGRAM_ALLOWED_USER_ID", "77");
                     const EnvGuard otto_home("OTTO_HOME", (ws.path() / "runtime").string());
                     const ConfigOverrideGuard guard(ws.path() / "config.toml");

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &config = loaded.value();
                     require(config.scheduler.tick_ms == 2000, "env tick wins");
                     require(!config.scheduler.enabled, "OTTO_SCHEDULER_ENABLED=0 disables");
                     require(config.telegram.bot_token == "env-token", "env token");
                     require(config.telegram.allowed_user_id.value_or(0) == 77, "env user id");
                     require(config.home == (ws.path() / "runtime").string(), "env home");
                   }});

  tests.push_back({"config_dotenv_does_not_override_environment", [] {
                     TempWorkspace ws;
                     ws.create_file(".env", "TELEGRAM_BOT_TOKEN=from-dotenv\n"
                                            "export OTTO_GATEWAY_URL=\"http://gateway:9\"\n");
                     const EnvGuard home("HOME", ws.path().string());
                     const EnvGuard env_file("OTTO_ENV_FILE", (ws.path() / ".env").string());
                     const EnvGuard token("TELEGRAM_BOT_TOKEN", "from-env");
                     const EnvGuard url("OTTO_GATEWAY_URL", std::nullopt);

                     cfg::Config config;
                     cfg::apply_env_overrides(config);
                     require(config.telegram.bot_token == "from-env", "environment wins");
                     require(config.gateway.base_url == "http://gateway:9", "dotenv fills gaps");
                   }});

  tests.push_back({"validate_config_rejects_out_of_range_values", [] {
                     cfg::Config config;
                     config.telegram.bot_token = "token";
                     config.telegram.allowed_user_id = 1;
                     const auto ok = cfg::validate_config(config);
                     require(ok.ok(), ok.error());
                     require(ok.value().empty(), "no warnings expected");

                     auto bad_tick = config;
                     bad_tick.scheduler.tick_ms = 500;
                     require(!cfg::validate_config(bad_tick).ok(), "tick below 1000");

                     auto bad_lease = config;
                     bad_lease.scheduler.lock_lease_ms = config.scheduler.tick_ms - 1;
                     require(!cfg::validate_config(bad_lease).ok(), "lease shorter than tick");

                     auto bad_cadence = config;
                     bad_cadence.watchdog.cadence_minutes = 2;
                     require(!cfg::validate_config(bad_cadence).ok(), "cadence below 5");

                     auto bad_heartbeat = config;
                     bad_heartbeat.heartbeat.cadence_minutes = 61;
                     require(!cfg::validate_config(bad_heartbeat).ok(), "heartbeat above 60");

                     auto bad_model = config;
                     bad_model.gateway.model = "no-slash";
                     require(!cfg::validate_config(bad_model).ok(), "model without provider");
                   }});

  tests.push_back({"validate_config_warns_without_telegram", [] {
                     cfg::Config config;
                     const auto validated = cfg::validate_config(config);
                     require(validated.ok(), validated.error());
                     require(validated.value().size() == 2, "token and user id warnings");
                   }});

  tests.push_back({"resolve_home_creates_directory", [] {
                     TempWorkspace ws;
                     cfg::Config config;
                     config.home = (ws.path() / "nested" / "home").string();
                     const auto home = cfg::resolve_home(config);
                     require(home.ok(), home.error());
                     require(std::filesystem::is_directory(home.value()), "home created");
                     require(cfg::database_path(home.value()).filename() == "otto.db",
                             "database file name");
                   }});
}
