#include "otto/persistence/sqlite_util.hpp"

#include "otto/persistence/migrations.hpp"

namespace otto::persistence {

namespace {

constexpr int kBusyTimeoutMs = 5'000;

} // namespace

SqliteConnection::SqliteConnection(const std::filesystem::path &db_path) {
  std::error_code ec;
  if (db_path.has_parent_path()) {
    std::filesystem::create_directories(db_path.parent_path(), ec);
  }
  if (sqlite3_open(db_path.string().c_str(), &db_) != SQLITE_OK) {
    open_error_ = db_ == nullptr ? "sqlite3_open failed" : sqlite3_errmsg(db_);
    sqlite3_close(db_);
    db_ = nullptr;
    return;
  }
  sqlite3_busy_timeout(db_, kBusyTimeoutMs);

  auto status = exec_sql(db_, "PRAGMA journal_mode=WAL;");
  if (status.ok()) {
    status = exec_sql(db_, "PRAGMA foreign_keys=ON;");
  }
  if (status.ok()) {
    status = run_migrations(db_);
  }
  if (!status.ok()) {
    open_error_ = status.error();
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

SqliteConnection::~SqliteConnection() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string message = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(message);
  }
  return common::Status::success();
}

common::Result<StatementPtr> prepare(sqlite3 *db, const char *sql) {
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    sqlite3_finalize(stmt);
    return common::Result<StatementPtr>::failure(sqlite3_errmsg(db));
  }
  return common::Result<StatementPtr>::success(StatementPtr(stmt));
}

common::Status step_done(sqlite3 *db, sqlite3_stmt *stmt) {
  if (sqlite3_step(stmt) != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db));
  }
  return common::Status::success();
}

void bind_text(sqlite3_stmt *stmt, const int index, const std::string &value) {
  sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void bind_optional_text(sqlite3_stmt *stmt, const int index,
                        const std::optional<std::string> &value) {
  if (value.has_value()) {
    bind_text(stmt, index, *value);
  } else {
    sqlite3_bind_null(stmt, index);
  }
}

void bind_optional_int64(sqlite3_stmt *stmt, const int index,
                         const std::optional<std::int64_t> &value) {
  if (value.has_value()) {
    sqlite3_bind_int64(stmt, index, *value);
  } else {
    sqlite3_bind_null(stmt, index);
  }
}

std::string get_text_column(sqlite3_stmt *stmt, const int column) {
  const auto *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, column));
  return text == nullptr ? std::string() : std::string(text);
}

std::optional<std::string> get_optional_text(sqlite3_stmt *stmt, const int column) {
  if (sqlite3_column_type(stmt, column) == SQLITE_NULL) {
    return std::nullopt;
  }
  return get_text_column(stmt, column);
}

std::optional<std::int64_t> get_optional_int64(sqlite3_stmt *stmt, const int column) {
  if (sqlite3_column_type(stmt, column) == SQLITE_NULL) {
    return std::nullopt;
  }
  return static_cast<std::int64_t>(sqlite3_column_int64(stmt, column));
}

bool is_unique_violation(sqlite3 *db) {
  const int extended = sqlite3_extended_errcode(db);
  return extended == SQLITE_CONSTRAINT_UNIQUE || extended == SQLITE_CONSTRAINT_PRIMARYKEY;
}

ImmediateTransaction::ImmediateTransaction(sqlite3 *db)
    : db_(db), begin_status_(exec_sql(db, "BEGIN IMMEDIATE")) {
  finished_ = !begin_status_.ok();
}

ImmediateTransaction::~ImmediateTransaction() {
  if (!finished_) {
    (void)exec_sql(db_, "ROLLBACK");
  }
}

common::Status ImmediateTransaction::commit() {
  if (finished_) {
    return common::Status::error("transaction is not active");
  }
  auto status = exec_sql(db_, "COMMIT");
  if (status.ok()) {
    finished_ = true;
  }
  return status;
}

} // namespace otto::persistence
