#pragma once

#include "otto/common/result.hpp"
#include "otto/persistence/sqlite_util.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace otto::persistence {

enum class ScheduleType { Recurring, Oneshot };
enum class JobStatus { Idle, Running, Paused };
enum class TerminalState { Completed, Expired, Cancelled };
enum class RunStatus { Success, Failed, Skipped };
enum class AuditAction { Create, Update, Delete };
enum class Lane { Interactive, Scheduled };

[[nodiscard]] std::string_view to_string(ScheduleType value);
[[nodiscard]] std::string_view to_string(JobStatus value);
[[nodiscard]] std::string_view to_string(TerminalState value);
[[nodiscard]] std::string_view to_string(RunStatus value);
[[nodiscard]] std::string_view to_string(AuditAction value);
[[nodiscard]] std::string_view to_string(Lane value);

[[nodiscard]] std::optional<ScheduleType> parse_schedule_type(std::string_view value);
[[nodiscard]] std::optional<JobStatus> parse_job_status(std::string_view value);
[[nodiscard]] std::optional<TerminalState> parse_terminal_state(std::string_view value);
[[nodiscard]] std::optional<RunStatus> parse_run_status(std::string_view value);

struct Job {
  std::string id;
  std::string type;
  ScheduleType schedule_type = ScheduleType::Recurring;
  std::optional<std::string> profile_id;
  std::optional<std::int64_t> run_at;
  std::optional<std::int64_t> cadence_minutes;
  /// Serialized payload; only the executor interprets it.
  std::optional<std::string> payload;
  std::optional<std::int64_t> last_run_at;
  std::optional<std::int64_t> next_run_at;
  JobStatus status = JobStatus::Idle;
  std::optional<TerminalState> terminal_state;
  std::optional<std::string> terminal_reason;
  std::optional<std::string> lock_token;
  std::optional<std::int64_t> lock_expires_at;
  std::int64_t created_at = 0;
  std::int64_t updated_at = 0;
};

/// The mutable definition of a job, as written by update_job.
struct JobDefinition {
  std::string type;
  ScheduleType schedule_type = ScheduleType::Recurring;
  std::optional<std::string> profile_id;
  std::optional<std::int64_t> run_at;
  std::optional<std::int64_t> cadence_minutes;
  std::optional<std::string> payload;
  std::optional<std::int64_t> next_run_at;
};

struct JobRun {
  std::string id;
  std::string job_id;
  std::optional<std::int64_t> scheduled_for;
  std::int64_t started_at = 0;
  std::optional<std::int64_t> finished_at;
  RunStatus status = RunStatus::Skipped;
  std::optional<std::string> error_code;
  std::optional<std::string> error_message;
  std::optional<std::string> result_json;
  std::int64_t created_at = 0;
};

struct RunCompletion {
  std::int64_t finished_at = 0;
  RunStatus status = RunStatus::Skipped;
  std::optional<std::string> error_code;
  std::optional<std::string> error_message;
  std::optional<std::string> result_json;
};

/// A run joined with the type of the job it belongs to.
struct RunSummary {
  std::string run_id;
  std::string job_id;
  std::string job_type;
  std::int64_t started_at = 0;
  std::optional<std::int64_t> finished_at;
  RunStatus status = RunStatus::Skipped;
  std::optional<std::string> error_code;
  std::optional<std::string> error_message;
};

struct TaskAuditRecord {
  std::string id;
  std::string task_id;
  AuditAction action = AuditAction::Create;
  Lane lane = Lane::Interactive;
  std::optional<std::string> actor;
  std::optional<std::string> before_json;
  std::optional<std::string> after_json;
  std::optional<std::string> metadata_json;
  std::int64_t created_at = 0;
};

/// Durable job definitions, run history and task audit trail. All schedule mutations
/// after a claim are fenced by the lock token handed out by claim_due.
class JobStore {
public:
  explicit JobStore(const std::filesystem::path &db_path);

  [[nodiscard]] common::Status create_job(const Job &job);
  [[nodiscard]] common::Result<std::optional<Job>> get_job(const std::string &id);
  [[nodiscard]] common::Result<std::vector<Job>> list_jobs();
  /// Returns false when the job does not exist or is currently running.
  [[nodiscard]] common::Result<bool> update_job(const std::string &id,
                                                const JobDefinition &definition,
                                                std::int64_t updated_at);
  /// Returns false when the job does not exist or already reached a terminal state.
  [[nodiscard]] common::Result<bool> cancel_job(const std::string &id,
                                                const std::optional<std::string> &reason,
                                                std::int64_t updated_at);
  /// Pausing only applies to idle jobs, resuming only to paused ones.
  [[nodiscard]] common::Result<bool> set_paused(const std::string &id, bool paused,
                                                std::int64_t updated_at);

  /// Atomically claims up to `limit` due jobs: not paused, `next_run_at <= now`, and either
  /// unlocked or holding a lease that expired at or before `now`.
  [[nodiscard]] common::Result<std::vector<Job>> claim_due(std::int64_t now, std::size_t limit,
                                                           const std::string &lock_token,
                                                           std::int64_t lease_ms,
                                                           std::int64_t observed_at);
  [[nodiscard]] common::Status reschedule_recurring(const std::string &job_id,
                                                    const std::string &lock_token,
                                                    std::int64_t last_run_at,
                                                    std::int64_t next_run_at,
                                                    std::int64_t updated_at);
  [[nodiscard]] common::Status finalize_one_shot(const std::string &job_id,
                                                 const std::string &lock_token,
                                                 TerminalState terminal_state,
                                                 const std::optional<std::string> &terminal_reason,
                                                 std::int64_t last_run_at,
                                                 std::int64_t updated_at);
  /// Clears the lock without touching the schedule, so the job is due again next tick.
  [[nodiscard]] common::Status release_lock(const std::string &job_id,
                                            const std::string &lock_token,
                                            std::int64_t updated_at);

  [[nodiscard]] common::Status insert_run(const JobRun &run);
  [[nodiscard]] common::Status mark_run_finished(const std::string &run_id,
                                                 const RunCompletion &completion);
  [[nodiscard]] common::Result<std::vector<JobRun>> list_runs_for_job(const std::string &job_id,
                                                                      std::size_t limit);
  /// Failed runs started at or after `since`, newest first.
  [[nodiscard]] common::Result<std::vector<RunSummary>>
  list_recent_failed_runs(std::int64_t since, std::size_t limit,
                          const std::optional<std::string> &exclude_job_type = std::nullopt);
  [[nodiscard]] common::Result<std::vector<RunSummary>> list_recent_runs(std::int64_t since,
                                                                         std::size_t limit);

  [[nodiscard]] common::Status insert_audit(const TaskAuditRecord &record);
  [[nodiscard]] common::Result<std::vector<TaskAuditRecord>>
  list_audit(const std::string &task_id, std::size_t limit);

private:
  [[nodiscard]] common::Status check_open() const;
  [[nodiscard]] common::Result<std::vector<Job>> query_jobs(sqlite3_stmt *stmt);
  [[nodiscard]] common::Result<std::vector<RunSummary>> query_summaries(sqlite3_stmt *stmt);
  [[nodiscard]] common::Status apply_fenced(sqlite3_stmt *stmt, const std::string &what,
                                            const std::string &job_id);

  SqliteConnection connection_;
  std::mutex mutex_;
};

} // namespace otto::persistence
