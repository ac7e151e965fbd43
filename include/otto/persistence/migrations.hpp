#pragma once

#include "otto/common/result.hpp"

#include <sqlite3.h>
#include <string>
#include <vector>

namespace otto::persistence {

struct Migration {
  std::string id;
  std::vector<std::string> statements;
};

/// Append-only schema history. Never edit an entry once released; add a new one.
[[nodiscard]] const std::vector<Migration> &migrations();

/// Applies every migration not yet recorded in schema_migrations, each in its own
/// transaction. Safe to call from several connections to the same file.
[[nodiscard]] common::Status run_migrations(sqlite3 *db);

} // namespace otto::persistence
