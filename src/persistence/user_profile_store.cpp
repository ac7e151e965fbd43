#include "otto/persistence/user_profile_store.hpp"

namespace otto::persistence {

std::string_view to_string(const QuietMode value) {
  return value == QuietMode::Off ? "off" : "critical_only";
}

std::optional<QuietMode> parse_quiet_mode(const std::string_view value) {
  if (value == "off") {
    return QuietMode::Off;
  }
  if (value == "critical_only") {
    return QuietMode::CriticalOnly;
  }
  return std::nullopt;
}

UserProfileStore::UserProfileStore(const std::filesystem::path &db_path) : connection_(db_path) {}

common::Result<std::optional<NotificationPolicy>> UserProfileStore::get() {
  using R = common::Result<std::optional<NotificationPolicy>>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (!connection_.is_open()) {
    return R::failure("user profile store is not initialized: " + connection_.open_error());
  }
  auto stmt = prepare(connection_.get(), R"(
SELECT timezone, quiet_hours_start, quiet_hours_end, quiet_mode, mute_until,
       heartbeat_morning, heartbeat_midday, heartbeat_evening, heartbeat_cadence_minutes,
       heartbeat_only_if_signal, onboarding_completed_at, last_digest_at, updated_at
FROM user_profile
WHERE id = 1
)");
  if (!stmt.ok()) {
    return R::failure(stmt.error());
  }
  auto *s = stmt.value().get();
  const int rc = sqlite3_step(s);
  if (rc == SQLITE_DONE) {
    return R::success(std::nullopt);
  }
  if (rc != SQLITE_ROW) {
    return R::failure(sqlite3_errmsg(connection_.get()));
  }
  return R::success(NotificationPolicy{
      .timezone = get_optional_text(s, 0),
      .quiet_hours_start = get_optional_text(s, 1),
      .quiet_hours_end = get_optional_text(s, 2),
      .quiet_mode = parse_quiet_mode(get_text_column(s, 3)).value_or(QuietMode::CriticalOnly),
      .mute_until = get_optional_int64(s, 4),
      .heartbeat_morning = get_optional_text(s, 5),
      .heartbeat_midday = get_optional_text(s, 6),
      .heartbeat_evening = get_optional_text(s, 7),
      .heartbeat_cadence_minutes = get_optional_int64(s, 8),
      .heartbeat_only_if_signal = get_optional_int64(s, 9).value_or(1) != 0,
      .onboarding_completed_at = get_optional_int64(s, 10),
      .last_digest_at = get_optional_int64(s, 11),
      .updated_at = sqlite3_column_int64(s, 12),
  });
}

common::Status UserProfileStore::upsert(const NotificationPolicy &policy) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!connection_.is_open()) {
    return common::Status::error("user profile store is not initialized: " +
                                 connection_.open_error());
  }
  auto stmt = prepare(connection_.get(), R"(
INSERT INTO user_profile(id, timezone, quiet_hours_start, quiet_hours_end, quiet_mode,
                         mute_until, heartbeat_morning, heartbeat_midday, heartbeat_evening,
                         heartbeat_cadence_minutes, heartbeat_only_if_signal,
                         onboarding_completed_at, last_digest_at, updated_at)
VALUES(1, ?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13)
ON CONFLICT(id) DO UPDATE SET
  timezone = excluded.timezone,
  quiet_hours_start = excluded.quiet_hours_start,
  quiet_hours_end = excluded.quiet_hours_end,
  quiet_mode = excluded.quiet_mode,
  mute_until = excluded.mute_until,
  heartbeat_morning = excluded.heartbeat_morning,
  heartbeat_midday = excluded.heartbeat_midday,
  heartbeat_evening = excluded.heartbeat_evening,
  heartbeat_cadence_minutes = excluded.heartbeat_cadence_minutes,
  heartbeat_only_if_signal = excluded.heartbeat_only_if_signal,
  onboarding_completed_at = excluded.onboarding_completed_at,
  last_digest_at = excluded.last_digest_at,
  updated_at = excluded.updated_at
)");
  if (!stmt.ok()) {
    return stmt.status();
  }
  auto *s = stmt.value().get();
  bind_optional_text(s, 1, policy.timezone);
  bind_optional_text(s, 2, policy.quiet_hours_start);
  bind_optional_text(s, 3, policy.quiet_hours_end);
  bind_text(s, 4, std::string(to_string(policy.quiet_mode)));
  bind_optional_int64(s, 5, policy.mute_until);
  bind_optional_text(s, 6, policy.heartbeat_morning);
  bind_optional_text(s, 7, policy.heartbeat_midday);
  bind_optional_text(s, 8, policy.heartbeat_evening);
  bind_optional_int64(s, 9, policy.heartbeat_cadence_minutes);
  sqlite3_bind_int(s, 10, policy.heartbeat_only_if_signal ? 1 : 0);
  bind_optional_int64(s, 11, policy.onboarding_completed_at);
  bind_optional_int64(s, 12, policy.last_digest_at);
  sqlite3_bind_int64(s, 13, policy.updated_at);
  return step_done(connection_.get(), s);
}

common::Status UserProfileStore::set_last_digest_at(const std::int64_t last_digest_at,
                                                    const std::int64_t updated_at) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!connection_.is_open()) {
    return common::Status::error("user profile store is not initialized: " +
                                 connection_.open_error());
  }
  auto stmt = prepare(connection_.get(),
                      "UPDATE user_profile SET last_digest_at = ?1, updated_at = ?2 WHERE id = 1");
  if (!stmt.ok()) {
    return stmt.status();
  }
  sqlite3_bind_int64(stmt.value().get(), 1, last_digest_at);
  sqlite3_bind_int64(stmt.value().get(), 2, updated_at);
  return step_done(connection_.get(), stmt.value().get());
}

} // namespace otto::persistence
