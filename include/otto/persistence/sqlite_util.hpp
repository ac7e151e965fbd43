#pragma once

#include "otto/common/result.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <sqlite3.h>
#include <string>

namespace otto::persistence {

struct StatementDeleter {
  void operator()(sqlite3_stmt *stmt) const { sqlite3_finalize(stmt); }
};
using StatementPtr = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

/// Owns one SQLite connection configured for concurrent use of the shared database file
/// (WAL journal, 5s busy timeout, foreign keys) with all migrations applied.
class SqliteConnection {
public:
  explicit SqliteConnection(const std::filesystem::path &db_path);
  ~SqliteConnection();

  SqliteConnection(const SqliteConnection &) = delete;
  SqliteConnection &operator=(const SqliteConnection &) = delete;

  [[nodiscard]] sqlite3 *get() const { return db_; }
  [[nodiscard]] bool is_open() const { return db_ != nullptr; }
  /// Why the connection is unusable; empty when open.
  [[nodiscard]] const std::string &open_error() const { return open_error_; }

private:
  sqlite3 *db_ = nullptr;
  std::string open_error_;
};

[[nodiscard]] common::Status exec_sql(sqlite3 *db, const std::string &sql);
[[nodiscard]] common::Result<StatementPtr> prepare(sqlite3 *db, const char *sql);

/// Steps a statement that returns no rows.
[[nodiscard]] common::Status step_done(sqlite3 *db, sqlite3_stmt *stmt);

void bind_text(sqlite3_stmt *stmt, int index, const std::string &value);
void bind_optional_text(sqlite3_stmt *stmt, int index, const std::optional<std::string> &value);
void bind_optional_int64(sqlite3_stmt *stmt, int index, const std::optional<std::int64_t> &value);

[[nodiscard]] std::string get_text_column(sqlite3_stmt *stmt, int column);
[[nodiscard]] std::optional<std::string> get_optional_text(sqlite3_stmt *stmt, int column);
[[nodiscard]] std::optional<std::int64_t> get_optional_int64(sqlite3_stmt *stmt, int column);

/// True for UNIQUE/PRIMARY KEY violations reported by the last step.
[[nodiscard]] bool is_unique_violation(sqlite3 *db);

/// BEGIN IMMEDIATE ... COMMIT scope that rolls back unless commit() succeeded.
class ImmediateTransaction {
public:
  explicit ImmediateTransaction(sqlite3 *db);
  ~ImmediateTransaction();

  ImmediateTransaction(const ImmediateTransaction &) = delete;
  ImmediateTransaction &operator=(const ImmediateTransaction &) = delete;

  [[nodiscard]] const common::Status &begin_status() const { return begin_status_; }
  [[nodiscard]] common::Status commit();

private:
  sqlite3 *db_;
  common::Status begin_status_;
  bool finished_ = false;
};

} // namespace otto::persistence
