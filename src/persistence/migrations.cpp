#include "otto/persistence/migrations.hpp"

#include "otto/common/clock.hpp"
#include "otto/persistence/sqlite_util.hpp"

namespace otto::persistence {

namespace {

common::Result<bool> is_applied(sqlite3 *db, const std::string &id) {
  auto stmt = prepare(db, "SELECT 1 FROM schema_migrations WHERE id = ?1");
  if (!stmt.ok()) {
    return common::Result<bool>::failure(stmt.error());
  }
  bind_text(stmt.value().get(), 1, id);
  const int rc = sqlite3_step(stmt.value().get());
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    return common::Result<bool>::failure(sqlite3_errmsg(db));
  }
  return common::Result<bool>::success(rc == SQLITE_ROW);
}

common::Status apply(sqlite3 *db, const Migration &migration) {
  ImmediateTransaction tx(db);
  if (!tx.begin_status().ok()) {
    return tx.begin_status();
  }
  // Another connection may have applied it between the check and BEGIN IMMEDIATE.
  const auto applied = is_applied(db, migration.id);
  if (!applied.ok()) {
    return applied.status();
  }
  if (applied.value()) {
    return tx.commit();
  }

  for (const auto &statement : migration.statements) {
    if (auto status = exec_sql(db, statement); !status.ok()) {
      return status.with_context("migration " + migration.id);
    }
  }

  auto record = prepare(db, "INSERT INTO schema_migrations(id, applied_at) VALUES(?1, ?2)");
  if (!record.ok()) {
    return record.status();
  }
  bind_text(record.value().get(), 1, migration.id);
  sqlite3_bind_int64(record.value().get(), 2, common::system_now_ms());
  if (auto status = step_done(db, record.value().get()); !status.ok()) {
    return status;
  }
  return tx.commit();
}

} // namespace

const std::vector<Migration> &migrations() {
  static const std::vector<Migration> kMigrations = {
      {"001_jobs",
       {R"(CREATE TABLE IF NOT EXISTS jobs (
  id TEXT PRIMARY KEY,
  type TEXT NOT NULL,
  status TEXT NOT NULL,
  schedule_type TEXT NOT NULL,
  profile_id TEXT,
  run_at INTEGER,
  cadence_minutes INTEGER,
  payload TEXT,
  last_run_at INTEGER,
  next_run_at INTEGER,
  terminal_state TEXT,
  terminal_reason TEXT,
  lock_token TEXT,
  lock_expires_at INTEGER,
  created_at INTEGER NOT NULL,
  updated_at INTEGER NOT NULL
))",
        "CREATE INDEX IF NOT EXISTS idx_jobs_schedule_due ON jobs (status, next_run_at)"}},
      {"002_job_runs",
       {R"(CREATE TABLE IF NOT EXISTS job_runs (
  id TEXT PRIMARY KEY,
  job_id TEXT NOT NULL REFERENCES jobs(id),
  scheduled_for INTEGER,
  started_at INTEGER NOT NULL,
  finished_at INTEGER,
  status TEXT NOT NULL,
  error_code TEXT,
  error_message TEXT,
  result_json TEXT,
  created_at INTEGER NOT NULL
))",
        "CREATE INDEX IF NOT EXISTS idx_job_runs_job_started ON job_runs (job_id, started_at DESC)",
        "CREATE INDEX IF NOT EXISTS idx_job_runs_status_started ON job_runs (status, started_at)"}},
      {"003_messages_out",
       {R"(CREATE TABLE IF NOT EXISTS messages_out (
  id TEXT PRIMARY KEY,
  dedupe_key TEXT UNIQUE,
  chat_id INTEGER NOT NULL,
  kind TEXT NOT NULL DEFAULT 'text',
  content TEXT NOT NULL,
  media_path TEXT,
  media_mime_type TEXT,
  media_filename TEXT,
  priority TEXT NOT NULL,
  status TEXT NOT NULL,
  attempt_count INTEGER NOT NULL DEFAULT 0,
  next_attempt_at INTEGER,
  sent_at INTEGER,
  failed_at INTEGER,
  error_message TEXT,
  created_at INTEGER NOT NULL,
  updated_at INTEGER NOT NULL
))",
        "CREATE INDEX IF NOT EXISTS idx_messages_out_status_next_attempt "
        "ON messages_out (status, next_attempt_at)"}},
      {"004_session_bindings",
       {R"(CREATE TABLE IF NOT EXISTS session_bindings (
  binding_key TEXT PRIMARY KEY,
  session_id TEXT NOT NULL,
  updated_at INTEGER NOT NULL
))"}},
      {"005_user_profile",
       {R"(CREATE TABLE IF NOT EXISTS user_profile (
  id INTEGER PRIMARY KEY CHECK (id = 1),
  timezone TEXT,
  quiet_hours_start TEXT,
  quiet_hours_end TEXT,
  quiet_mode TEXT NOT NULL DEFAULT 'critical_only',
  mute_until INTEGER,
  heartbeat_cadence_minutes INTEGER,
  updated_at INTEGER NOT NULL
))"}},
      {"006_task_audit_log",
       {R"(CREATE TABLE IF NOT EXISTS task_audit_log (
  id TEXT PRIMARY KEY,
  task_id TEXT NOT NULL,
  action TEXT NOT NULL,
  lane TEXT NOT NULL,
  actor TEXT,
  before_json TEXT,
  after_json TEXT,
  metadata_json TEXT,
  created_at INTEGER NOT NULL
))",
        "CREATE INDEX IF NOT EXISTS idx_task_audit_task_created "
        "ON task_audit_log (task_id, created_at DESC)"}},
      {"007_user_profile_heartbeat",
       {"ALTER TABLE user_profile ADD COLUMN heartbeat_morning TEXT",
        "ALTER TABLE user_profile ADD COLUMN heartbeat_midday TEXT",
        "ALTER TABLE user_profile ADD COLUMN heartbeat_evening TEXT",
        "ALTER TABLE user_profile ADD COLUMN heartbeat_only_if_signal INTEGER NOT NULL DEFAULT 1",
        "ALTER TABLE user_profile ADD COLUMN onboarding_completed_at INTEGER",
        "ALTER TABLE user_profile ADD COLUMN last_digest_at INTEGER"}},
  };
  return kMigrations;
}

common::Status run_migrations(sqlite3 *db) {
  auto status = exec_sql(db, R"(CREATE TABLE IF NOT EXISTS schema_migrations (
  id TEXT PRIMARY KEY,
  applied_at INTEGER NOT NULL
))");
  if (!status.ok()) {
    return status;
  }

  for (const auto &migration : migrations()) {
    const auto applied = is_applied(db, migration.id);
    if (!applied.ok()) {
      return applied.status();
    }
    if (applied.value()) {
      continue;
    }
    if (status = apply(db, migration); !status.ok()) {
      return status;
    }
  }
  return common::Status::success();
}

} // namespace otto::persistence
