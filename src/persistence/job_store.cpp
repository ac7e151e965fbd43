#include "otto/persistence/job_store.hpp"

#include <algorithm>
#include <array>
#include <limits>

namespace otto::persistence {

namespace {

constexpr const char *kJobColumns =
    "id, type, status, schedule_type, profile_id, run_at, cadence_minutes, payload, "
    "last_run_at, next_run_at, terminal_state, terminal_reason, lock_token, lock_expires_at, "
    "created_at, updated_at";

constexpr const char *kRunColumns = "id, job_id, scheduled_for, started_at, finished_at, status, "
                                    "error_code, error_message, result_json, created_at";

template <typename Enum, std::size_t N>
std::optional<Enum> parse_enum(std::string_view value,
                               const std::array<std::pair<std::string_view, Enum>, N> &table) {
  for (const auto &[name, parsed] : table) {
    if (name == value) {
      return parsed;
    }
  }
  return std::nullopt;
}

constexpr std::array<std::pair<std::string_view, ScheduleType>, 2> kScheduleTypes{
    {{"recurring", ScheduleType::Recurring}, {"oneshot", ScheduleType::Oneshot}}};
constexpr std::array<std::pair<std::string_view, JobStatus>, 3> kJobStatuses{
    {{"idle", JobStatus::Idle}, {"running", JobStatus::Running}, {"paused", JobStatus::Paused}}};
constexpr std::array<std::pair<std::string_view, TerminalState>, 3> kTerminalStates{
    {{"completed", TerminalState::Completed},
     {"expired", TerminalState::Expired},
     {"cancelled", TerminalState::Cancelled}}};
constexpr std::array<std::pair<std::string_view, RunStatus>, 3> kRunStatuses{
    {{"success", RunStatus::Success}, {"failed", RunStatus::Failed}, {"skipped", RunStatus::Skipped}}};
constexpr std::array<std::pair<std::string_view, AuditAction>, 3> kAuditActions{
    {{"create", AuditAction::Create}, {"update", AuditAction::Update}, {"delete", AuditAction::Delete}}};
constexpr std::array<std::pair<std::string_view, Lane>, 2> kLanes{
    {{"interactive", Lane::Interactive}, {"scheduled", Lane::Scheduled}}};

template <typename Enum, std::size_t N>
std::string_view enum_name(Enum value,
                           const std::array<std::pair<std::string_view, Enum>, N> &table) {
  for (const auto &[name, candidate] : table) {
    if (candidate == value) {
      return name;
    }
  }
  return "unknown";
}

void bind_view(sqlite3_stmt *stmt, const int index, const std::string_view value) {
  bind_text(stmt, index, std::string(value));
}

int clamp_limit(const std::size_t limit) {
  return static_cast<int>(std::min<std::size_t>(limit, std::numeric_limits<int>::max()));
}

common::Result<Job> row_to_job(sqlite3_stmt *stmt) {
  const auto status = parse_job_status(get_text_column(stmt, 2));
  const auto schedule_type = parse_schedule_type(get_text_column(stmt, 3));
  if (!status.has_value() || !schedule_type.has_value()) {
    return common::Result<Job>::failure("invalid job row: " + get_text_column(stmt, 0));
  }
  Job job;
  job.id = get_text_column(stmt, 0);
  job.type = get_text_column(stmt, 1);
  job.status = *status;
  job.schedule_type = *schedule_type;
  job.profile_id = get_optional_text(stmt, 4);
  job.run_at = get_optional_int64(stmt, 5);
  job.cadence_minutes = get_optional_int64(stmt, 6);
  job.payload = get_optional_text(stmt, 7);
  job.last_run_at = get_optional_int64(stmt, 8);
  job.next_run_at = get_optional_int64(stmt, 9);
  if (const auto terminal = get_optional_text(stmt, 10); terminal.has_value()) {
    job.terminal_state = parse_terminal_state(*terminal);
  }
  job.terminal_reason = get_optional_text(stmt, 11);
  job.lock_token = get_optional_text(stmt, 12);
  job.lock_expires_at = get_optional_int64(stmt, 13);
  job.created_at = sqlite3_column_int64(stmt, 14);
  job.updated_at = sqlite3_column_int64(stmt, 15);
  return common::Result<Job>::success(std::move(job));
}

JobRun row_to_run(sqlite3_stmt *stmt) {
  JobRun run;
  run.id = get_text_column(stmt, 0);
  run.job_id = get_text_column(stmt, 1);
  run.scheduled_for = get_optional_int64(stmt, 2);
  run.started_at = sqlite3_column_int64(stmt, 3);
  run.finished_at = get_optional_int64(stmt, 4);
  run.status = parse_run_status(get_text_column(stmt, 5)).value_or(RunStatus::Skipped);
  run.error_code = get_optional_text(stmt, 6);
  run.error_message = get_optional_text(stmt, 7);
  run.result_json = get_optional_text(stmt, 8);
  run.created_at = sqlite3_column_int64(stmt, 9);
  return run;
}

} // namespace

std::string_view to_string(const ScheduleType value) { return enum_name(value, kScheduleTypes); }
std::string_view to_string(const JobStatus value) { return enum_name(value, kJobStatuses); }
std::string_view to_string(const TerminalState value) { return enum_name(value, kTerminalStates); }
std::string_view to_string(const RunStatus value) { return enum_name(value, kRunStatuses); }
std::string_view to_string(const AuditAction value) { return enum_name(value, kAuditActions); }
std::string_view to_string(const Lane value) { return enum_name(value, kLanes); }

std::optional<ScheduleType> parse_schedule_type(const std::string_view value) {
  return parse_enum(value, kScheduleTypes);
}
std::optional<JobStatus> parse_job_status(const std::string_view value) {
  return parse_enum(value, kJobStatuses);
}
std::optional<TerminalState> parse_terminal_state(const std::string_view value) {
  return parse_enum(value, kTerminalStates);
}
std::optional<RunStatus> parse_run_status(const std::string_view value) {
  return parse_enum(value, kRunStatuses);
}

JobStore::JobStore(const std::filesystem::path &db_path) : connection_(db_path) {}

common::Status JobStore::check_open() const {
  if (!connection_.is_open()) {
    return common::Status::error("job store is not initialized: " + connection_.open_error());
  }
  return common::Status::success();
}

common::Result<std::vector<Job>> JobStore::query_jobs(sqlite3_stmt *stmt) {
  std::vector<Job> out;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    auto job = row_to_job(stmt);
    if (!job.ok()) {
      return common::Result<std::vector<Job>>::failure(job.error());
    }
    out.push_back(std::move(job.value()));
  }
  if (rc != SQLITE_DONE) {
    return common::Result<std::vector<Job>>::failure(sqlite3_errmsg(connection_.get()));
  }
  return common::Result<std::vector<Job>>::success(std::move(out));
}

common::Status JobStore::create_job(const Job &job) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = check_open(); !status.ok()) {
    return status;
  }
  if (job.id.empty() || job.type.empty()) {
    return common::Status::error("job id and type are required");
  }
  if (job.schedule_type == ScheduleType::Recurring &&
      (!job.cadence_minutes.has_value() || *job.cadence_minutes < 1)) {
    return common::Status::error("recurring job " + job.id + " requires cadence_minutes >= 1");
  }

  const std::string sql = std::string("INSERT INTO jobs(") + kJobColumns +
                          ") VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, ?14, "
                          "?15, ?16)";
  auto stmt = prepare(connection_.get(), sql.c_str());
  if (!stmt.ok()) {
    return stmt.status();
  }
  auto *s = stmt.value().get();
  bind_text(s, 1, job.id);
  bind_text(s, 2, job.type);
  bind_view(s, 3, to_string(job.status));
  bind_view(s, 4, to_string(job.schedule_type));
  bind_optional_text(s, 5, job.profile_id);
  bind_optional_int64(s, 6, job.run_at);
  bind_optional_int64(s, 7, job.cadence_minutes);
  bind_optional_text(s, 8, job.payload);
  bind_optional_int64(s, 9, job.last_run_at);
  bind_optional_int64(s, 10, job.next_run_at);
  if (job.terminal_state.has_value()) {
    bind_view(s, 11, to_string(*job.terminal_state));
  } else {
    sqlite3_bind_null(s, 11);
  }
  bind_optional_text(s, 12, job.terminal_reason);
  bind_optional_text(s, 13, job.lock_token);
  bind_optional_int64(s, 14, job.lock_expires_at);
  sqlite3_bind_int64(s, 15, job.created_at);
  sqlite3_bind_int64(s, 16, job.updated_at);
  return step_done(connection_.get(), s);
}

common::Result<std::optional<Job>> JobStore::get_job(const std::string &id) {
  using R = common::Result<std::optional<Job>>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = check_open(); !status.ok()) {
    return R::failure(status.error());
  }
  const std::string sql = std::string("SELECT ") + kJobColumns + " FROM jobs WHERE id = ?1";
  auto stmt = prepare(connection_.get(), sql.c_str());
  if (!stmt.ok()) {
    return R::failure(stmt.error());
  }
  bind_text(stmt.value().get(), 1, id);
  auto jobs = query_jobs(stmt.value().get());
  if (!jobs.ok()) {
    return R::failure(jobs.error());
  }
  if (jobs.value().empty()) {
    return R::success(std::nullopt);
  }
  return R::success(std::move(jobs.value().front()));
}

common::Result<std::vector<Job>> JobStore::list_jobs() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = check_open(); !status.ok()) {
    return common::Result<std::vector<Job>>::failure(status.error());
  }
  const std::string sql =
      std::string("SELECT ") + kJobColumns + " FROM jobs ORDER BY updated_at DESC, id ASC";
  auto stmt = prepare(connection_.get(), sql.c_str());
  if (!stmt.ok()) {
    return common::Result<std::vector<Job>>::failure(stmt.error());
  }
  return query_jobs(stmt.value().get());
}

common::Result<bool> JobStore::update_job(const std::string &id, const JobDefinition &definition,
                                          const std::int64_t updated_at) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = check_open(); !status.ok()) {
    return common::Result<bool>::failure(status.error());
  }
  if (definition.schedule_type == ScheduleType::Recurring &&
      (!definition.cadence_minutes.has_value() || *definition.cadence_minutes < 1)) {
    return common::Result<bool>::failure("recurring job " + id +
                                         " requires cadence_minutes >= 1");
  }
  // Rescheduling a finished job reopens it.
  auto stmt = prepare(connection_.get(), R"(
UPDATE jobs
SET type = ?1,
    schedule_type = ?2,
    profile_id = ?3,
    run_at = ?4,
    cadence_minutes = ?5,
    payload = ?6,
    next_run_at = ?7,
    terminal_state = CASE WHEN ?7 IS NULL THEN terminal_state ELSE NULL END,
    terminal_reason = CASE WHEN ?7 IS NULL THEN terminal_reason ELSE NULL END,
    updated_at = ?8
WHERE id = ?9
  AND status != 'running'
)");
  if (!stmt.ok()) {
    return common::Result<bool>::failure(stmt.error());
  }
  auto *s = stmt.value().get();
  bind_text(s, 1, definition.type);
  bind_view(s, 2, to_string(definition.schedule_type));
  bind_optional_text(s, 3, definition.profile_id);
  bind_optional_int64(s, 4, definition.run_at);
  bind_optional_int64(s, 5, definition.cadence_minutes);
  bind_optional_text(s, 6, definition.payload);
  bind_optional_int64(s, 7, definition.next_run_at);
  sqlite3_bind_int64(s, 8, updated_at);
  bind_text(s, 9, id);
  if (auto status = step_done(connection_.get(), s); !status.ok()) {
    return common::Result<bool>::failure(status.error());
  }
  return common::Result<bool>::success(sqlite3_changes(connection_.get()) > 0);
}

common::Result<bool> JobStore::cancel_job(const std::string &id,
                                          const std::optional<std::string> &reason,
                                          const std::int64_t updated_at) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = check_open(); !status.ok()) {
    return common::Result<bool>::failure(status.error());
  }
  auto stmt = prepare(connection_.get(), R"(
UPDATE jobs
SET status = 'idle',
    next_run_at = NULL,
    terminal_state = 'cancelled',
    terminal_reason = ?1,
    lock_token = NULL,
    lock_expires_at = NULL,
    updated_at = ?2
WHERE id = ?3
  AND terminal_state IS NULL
)");
  if (!stmt.ok()) {
    return common::Result<bool>::failure(stmt.error());
  }
  auto *s = stmt.value().get();
  bind_optional_text(s, 1, reason);
  sqlite3_bind_int64(s, 2, updated_at);
  bind_text(s, 3, id);
  if (auto status = step_done(connection_.get(), s); !status.ok()) {
    return common::Result<bool>::failure(status.error());
  }
  return common::Result<bool>::success(sqlite3_changes(connection_.get()) > 0);
}

common::Result<bool> JobStore::set_paused(const std::string &id, const bool paused,
                                          const std::int64_t updated_at) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = check_open(); !status.ok()) {
    return common::Result<bool>::failure(status.error());
  }
  const char *sql = paused
                        ? "UPDATE jobs SET status = 'paused', updated_at = ?1 "
                          "WHERE id = ?2 AND status = 'idle'"
                        : "UPDATE jobs SET status = 'idle', updated_at = ?1 "
                          "WHERE id = ?2 AND status = 'paused'";
  auto stmt = prepare(connection_.get(), sql);
  if (!stmt.ok()) {
    return common::Result<bool>::failure(stmt.error());
  }
  sqlite3_bind_int64(stmt.value().get(), 1, updated_at);
  bind_text(stmt.value().get(), 2, id);
  if (auto status = step_done(connection_.get(), stmt.value().get()); !status.ok()) {
    return common::Result<bool>::failure(status.error());
  }
  return common::Result<bool>::success(sqlite3_changes(connection_.get()) > 0);
}

common::Result<std::vector<Job>> JobStore::claim_due(const std::int64_t now,
                                                     const std::size_t limit,
                                                     const std::string &lock_token,
                                                     const std::int64_t lease_ms,
                                                     const std::int64_t observed_at) {
  using R = common::Result<std::vector<Job>>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = check_open(); !status.ok()) {
    return R::failure(status.error());
  }
  if (lock_token.empty()) {
    return R::failure("claim requires a lock token");
  }
  if (limit == 0) {
    return R::success({});
  }
  sqlite3 *db = connection_.get();

  ImmediateTransaction tx(db);
  if (!tx.begin_status().ok()) {
    return R::failure(tx.begin_status().error());
  }

  auto select = prepare(db, R"(
SELECT id
FROM jobs
WHERE status != 'paused'
  AND next_run_at IS NOT NULL
  AND next_run_at <= ?1
  AND (lock_token IS NULL OR lock_expires_at IS NULL OR lock_expires_at <= ?1)
ORDER BY next_run_at ASC, id ASC
LIMIT ?2
)");
  if (!select.ok()) {
    return R::failure(select.error());
  }
  sqlite3_bind_int64(select.value().get(), 1, now);
  sqlite3_bind_int(select.value().get(), 2, clamp_limit(limit));
  std::vector<std::string> candidates;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(select.value().get())) == SQLITE_ROW) {
    candidates.push_back(get_text_column(select.value().get(), 0));
  }
  if (rc != SQLITE_DONE) {
    return R::failure(sqlite3_errmsg(db));
  }

  auto claim = prepare(db, R"(
UPDATE jobs
SET status = 'running',
    lock_token = ?1,
    lock_expires_at = ?2,
    updated_at = ?3
WHERE id = ?4
  AND status != 'paused'
  AND (lock_token IS NULL OR lock_expires_at IS NULL OR lock_expires_at <= ?5)
)");
  if (!claim.ok()) {
    return R::failure(claim.error());
  }
  const std::string fetch_sql = std::string("SELECT ") + kJobColumns + " FROM jobs WHERE id = ?1";
  auto fetch = prepare(db, fetch_sql.c_str());
  if (!fetch.ok()) {
    return R::failure(fetch.error());
  }

  std::vector<Job> claimed;
  for (const auto &id : candidates) {
    auto *s = claim.value().get();
    sqlite3_reset(s);
    bind_text(s, 1, lock_token);
    sqlite3_bind_int64(s, 2, observed_at + lease_ms);
    sqlite3_bind_int64(s, 3, observed_at);
    bind_text(s, 4, id);
    sqlite3_bind_int64(s, 5, now);
    if (auto status = step_done(db, s); !status.ok()) {
      return R::failure(status.error());
    }
    if (sqlite3_changes(db) == 0) {
      continue;
    }

    auto *f = fetch.value().get();
    sqlite3_reset(f);
    bind_text(f, 1, id);
    auto rows = query_jobs(f);
    if (!rows.ok()) {
      return R::failure(rows.error());
    }
    for (auto &job : rows.value()) {
      claimed.push_back(std::move(job));
    }
  }

  if (auto status = tx.commit(); !status.ok()) {
    return R::failure(status.error());
  }
  return R::success(std::move(claimed));
}

common::Status JobStore::apply_fenced(sqlite3_stmt *stmt, const std::string &what,
                                      const std::string &job_id) {
  if (auto status = step_done(connection_.get(), stmt); !status.ok()) {
    return status.with_context(what);
  }
  if (sqlite3_changes(connection_.get()) == 0) {
    return common::Status::error(what + ": lock token mismatch for job " + job_id);
  }
  return common::Status::success();
}

common::Status JobStore::reschedule_recurring(const std::string &job_id,
                                              const std::string &lock_token,
                                              const std::int64_t last_run_at,
                                              const std::int64_t next_run_at,
                                              const std::int64_t updated_at) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = check_open(); !status.ok()) {
    return status;
  }
  auto stmt = prepare(connection_.get(), R"(
UPDATE jobs
SET status = 'idle',
    last_run_at = ?1,
    next_run_at = ?2,
    terminal_state = NULL,
    terminal_reason = NULL,
    lock_token = NULL,
    lock_expires_at = NULL,
    updated_at = ?3
WHERE id = ?4
  AND lock_token = ?5
)");
  if (!stmt.ok()) {
    return stmt.status();
  }
  auto *s = stmt.value().get();
  sqlite3_bind_int64(s, 1, last_run_at);
  sqlite3_bind_int64(s, 2, next_run_at);
  sqlite3_bind_int64(s, 3, updated_at);
  bind_text(s, 4, job_id);
  bind_text(s, 5, lock_token);
  return apply_fenced(s, "reschedule", job_id);
}

common::Status JobStore::finalize_one_shot(const std::string &job_id,
                                           const std::string &lock_token,
                                           const TerminalState terminal_state,
                                           const std::optional<std::string> &terminal_reason,
                                           const std::int64_t last_run_at,
                                           const std::int64_t updated_at) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = check_open(); !status.ok()) {
    return status;
  }
  auto stmt = prepare(connection_.get(), R"(
UPDATE jobs
SET status = 'idle',
    last_run_at = ?1,
    next_run_at = NULL,
    terminal_state = ?2,
    terminal_reason = ?3,
    lock_token = NULL,
    lock_expires_at = NULL,
    updated_at = ?4
WHERE id = ?5
  AND lock_token = ?6
)");
  if (!stmt.ok()) {
    return stmt.status();
  }
  auto *s = stmt.value().get();
  sqlite3_bind_int64(s, 1, last_run_at);
  bind_view(s, 2, to_string(terminal_state));
  bind_optional_text(s, 3, terminal_reason);
  sqlite3_bind_int64(s, 4, updated_at);
  bind_text(s, 5, job_id);
  bind_text(s, 6, lock_token);
  return apply_fenced(s, "finalize", job_id);
}

common::Status JobStore::release_lock(const std::string &job_id, const std::string &lock_token,
                                      const std::int64_t updated_at) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = check_open(); !status.ok()) {
    return status;
  }
  auto stmt = prepare(connection_.get(), R"(
UPDATE jobs
SET status = 'idle',
    lock_token = NULL,
    lock_expires_at = NULL,
    updated_at = ?1
WHERE id = ?2
  AND lock_token = ?3
)");
  if (!stmt.ok()) {
    return stmt.status();
  }
  auto *s = stmt.value().get();
  sqlite3_bind_int64(s, 1, updated_at);
  bind_text(s, 2, job_id);
  bind_text(s, 3, lock_token);
  return apply_fenced(s, "release_lock", job_id);
}

common::Status JobStore::insert_run(const JobRun &run) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = check_open(); !status.ok()) {
    return status;
  }
  const std::string sql = std::string("INSERT INTO job_runs(") + kRunColumns +
                          ") VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10)";
  auto stmt = prepare(connection_.get(), sql.c_str());
  if (!stmt.ok()) {
    return stmt.status();
  }
  auto *s = stmt.value().get();
  bind_text(s, 1, run.id);
  bind_text(s, 2, run.job_id);
  bind_optional_int64(s, 3, run.scheduled_for);
  sqlite3_bind_int64(s, 4, run.started_at);
  bind_optional_int64(s, 5, run.finished_at);
  bind_view(s, 6, to_string(run.status));
  bind_optional_text(s, 7, run.error_code);
  bind_optional_text(s, 8, run.error_message);
  bind_optional_text(s, 9, run.result_json);
  sqlite3_bind_int64(s, 10, run.created_at);
  return step_done(connection_.get(), s);
}

common::Status JobStore::mark_run_finished(const std::string &run_id,
                                           const RunCompletion &completion) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = check_open(); !status.ok()) {
    return status;
  }
  auto stmt = prepare(connection_.get(), R"(
UPDATE job_runs
SET finished_at = ?1,
    status = ?2,
    error_code = ?3,
    error_message = ?4,
    result_json = ?5
WHERE id = ?6
  AND finished_at IS NULL
)");
  if (!stmt.ok()) {
    return stmt.status();
  }
  auto *s = stmt.value().get();
  sqlite3_bind_int64(s, 1, completion.finished_at);
  bind_view(s, 2, to_string(completion.status));
  bind_optional_text(s, 3, completion.error_code);
  bind_optional_text(s, 4, completion.error_message);
  bind_optional_text(s, 5, completion.result_json);
  bind_text(s, 6, run_id);
  if (auto status = step_done(connection_.get(), s); !status.ok()) {
    return status;
  }
  if (sqlite3_changes(connection_.get()) == 0) {
    return common::Status::error("run " + run_id + " is missing or already finished");
  }
  return common::Status::success();
}

common::Result<std::vector<JobRun>> JobStore::list_runs_for_job(const std::string &job_id,
                                                                const std::size_t limit) {
  using R = common::Result<std::vector<JobRun>>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = check_open(); !status.ok()) {
    return R::failure(status.error());
  }
  const std::string sql = std::string("SELECT ") + kRunColumns +
                          " FROM job_runs WHERE job_id = ?1 ORDER BY started_at DESC, "
                          "created_at DESC LIMIT ?2";
  auto stmt = prepare(connection_.get(), sql.c_str());
  if (!stmt.ok()) {
    return R::failure(stmt.error());
  }
  bind_text(stmt.value().get(), 1, job_id);
  sqlite3_bind_int(stmt.value().get(), 2, clamp_limit(limit));

  std::vector<JobRun> out;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt.value().get())) == SQLITE_ROW) {
    out.push_back(row_to_run(stmt.value().get()));
  }
  if (rc != SQLITE_DONE) {
    return R::failure(sqlite3_errmsg(connection_.get()));
  }
  return R::success(std::move(out));
}

common::Result<std::vector<RunSummary>> JobStore::query_summaries(sqlite3_stmt *stmt) {
  std::vector<RunSummary> out;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    out.push_back(RunSummary{
        .run_id = get_text_column(stmt, 0),
        .job_id = get_text_column(stmt, 1),
        .job_type = get_text_column(stmt, 2),
        .started_at = sqlite3_column_int64(stmt, 3),
        .finished_at = get_optional_int64(stmt, 4),
        .status = parse_run_status(get_text_column(stmt, 5)).value_or(RunStatus::Skipped),
        .error_code = get_optional_text(stmt, 6),
        .error_message = get_optional_text(stmt, 7),
    });
  }
  if (rc != SQLITE_DONE) {
    return common::Result<std::vector<RunSummary>>::failure(sqlite3_errmsg(connection_.get()));
  }
  return common::Result<std::vector<RunSummary>>::success(std::move(out));
}

common::Result<std::vector<RunSummary>>
JobStore::list_recent_failed_runs(const std::int64_t since, const std::size_t limit,
                                  const std::optional<std::string> &exclude_job_type) {
  using R = common::Result<std::vector<RunSummary>>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = check_open(); !status.ok()) {
    return R::failure(status.error());
  }
  auto stmt = prepare(connection_.get(), R"(
SELECT r.id, r.job_id, j.type, r.started_at, r.finished_at, r.status, r.error_code,
       r.error_message
FROM job_runs r
JOIN jobs j ON j.id = r.job_id
WHERE r.status = 'failed'
  AND r.started_at >= ?1
  AND (?3 IS NULL OR j.type != ?3)
ORDER BY r.started_at DESC, r.id ASC
LIMIT ?2
)");
  if (!stmt.ok()) {
    return R::failure(stmt.error());
  }
  sqlite3_bind_int64(stmt.value().get(), 1, since);
  sqlite3_bind_int(stmt.value().get(), 2, clamp_limit(limit));
  bind_optional_text(stmt.value().get(), 3, exclude_job_type);
  return query_summaries(stmt.value().get());
}

common::Result<std::vector<RunSummary>> JobStore::list_recent_runs(const std::int64_t since,
                                                                   const std::size_t limit) {
  using R = common::Result<std::vector<RunSummary>>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = check_open(); !status.ok()) {
    return R::failure(status.error());
  }
  auto stmt = prepare(connection_.get(), R"(
SELECT r.id, r.job_id, j.type, r.started_at, r.finished_at, r.status, r.error_code,
       r.error_message
FROM job_runs r
JOIN jobs j ON j.id = r.job_id
WHERE r.started_at >= ?1
ORDER BY r.started_at DESC, r.id ASC
LIMIT ?2
)");
  if (!stmt.ok()) {
    return R::failure(stmt.error());
  }
  sqlite3_bind_int64(stmt.value().get(), 1, since);
  sqlite3_bind_int(stmt.value().get(), 2, clamp_limit(limit));
  return query_summaries(stmt.value().get());
}

common::Status JobStore::insert_audit(const TaskAuditRecord &record) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = check_open(); !status.ok()) {
    return status;
  }
  auto stmt = prepare(connection_.get(), R"(
INSERT INTO task_audit_log(id, task_id, action, lane, actor, before_json, after_json,
                           metadata_json, created_at)
VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9)
)");
  if (!stmt.ok()) {
    return stmt.status();
  }
  auto *s = stmt.value().get();
  bind_text(s, 1, record.id);
  bind_text(s, 2, record.task_id);
  bind_view(s, 3, to_string(record.action));
  bind_view(s, 4, to_string(record.lane));
  bind_optional_text(s, 5, record.actor);
  bind_optional_text(s, 6, record.before_json);
  bind_optional_text(s, 7, record.after_json);
  bind_optional_text(s, 8, record.metadata_json);
  sqlite3_bind_int64(s, 9, record.created_at);
  return step_done(connection_.get(), s);
}

common::Result<std::vector<TaskAuditRecord>> JobStore::list_audit(const std::string &task_id,
                                                                  const std::size_t limit) {
  using R = common::Result<std::vector<TaskAuditRecord>>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = check_open(); !status.ok()) {
    return R::failure(status.error());
  }
  auto stmt = prepare(connection_.get(), R"(
SELECT id, task_id, action, lane, actor, before_json, after_json, metadata_json, created_at
FROM task_audit_log
WHERE task_id = ?1
ORDER BY created_at DESC, rowid DESC
LIMIT ?2
)");
  if (!stmt.ok()) {
    return R::failure(stmt.error());
  }
  bind_text(stmt.value().get(), 1, task_id);
  sqlite3_bind_int(stmt.value().get(), 2, clamp_limit(limit));

  std::vector<TaskAuditRecord> out;
  auto *s = stmt.value().get();
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(s)) == SQLITE_ROW) {
    out.push_back(TaskAuditRecord{
        .id = get_text_column(s, 0),
        .task_id = get_text_column(s, 1),
        .action = parse_enum(get_text_column(s, 2), kAuditActions).value_or(AuditAction::Update),
        .lane = parse_enum(get_text_column(s, 3), kLanes).value_or(Lane::Interactive),
        .actor = get_optional_text(s, 4),
        .before_json = get_optional_text(s, 5),
        .after_json = get_optional_text(s, 6),
        .metadata_json = get_optional_text(s, 7),
        .created_at = sqlite3_column_int64(s, 8),
    });
  }
  if (rc != SQLITE_DONE) {
    return R::failure(sqlite3_errmsg(connection_.get()));
  }
  return R::success(std::move(out));
}

} // namespace otto::persistence
