#pragma once

#include "otto/common/result.hpp"
#include "otto/persistence/sqlite_util.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace otto::persistence {

enum class QuietMode { CriticalOnly, Off };

[[nodiscard]] std::string_view to_string(QuietMode value);
[[nodiscard]] std::optional<QuietMode> parse_quiet_mode(std::string_view value);

/// The single notification profile row. Quiet hours are local `HH:MM` wall-clock strings
/// interpreted in `timezone`.
struct NotificationPolicy {
  std::optional<std::string> timezone;
  std::optional<std::string> quiet_hours_start;
  std::optional<std::string> quiet_hours_end;
  QuietMode quiet_mode = QuietMode::CriticalOnly;
  std::optional<std::int64_t> mute_until;
  /// Local `HH:MM` slots for the friendly heartbeat.
  std::optional<std::string> heartbeat_morning;
  std::optional<std::string> heartbeat_midday;
  std::optional<std::string> heartbeat_evening;
  std::optional<std::int64_t> heartbeat_cadence_minutes;
  bool heartbeat_only_if_signal = true;
  std::optional<std::int64_t> onboarding_completed_at;
  /// When the last heartbeat or quiet-period digest went out.
  std::optional<std::int64_t> last_digest_at;
  std::int64_t updated_at = 0;
};

class UserProfileStore {
public:
  explicit UserProfileStore(const std::filesystem::path &db_path);

  /// nullopt when no profile has been configured.
  [[nodiscard]] common::Result<std::optional<NotificationPolicy>> get();
  [[nodiscard]] common::Status upsert(const NotificationPolicy &policy);
  /// No-op when no profile row exists yet.
  [[nodiscard]] common::Status set_last_digest_at(std::int64_t last_digest_at,
                                                  std::int64_t updated_at);

private:
  SqliteConnection connection_;
  std::mutex mutex_;
};

} // namespace otto::persistence
