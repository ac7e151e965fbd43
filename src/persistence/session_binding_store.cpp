#include "otto/persistence/session_binding_store.hpp"

namespace otto::persistence {

SessionBindingStore::SessionBindingStore(const std::filesystem::path &db_path)
    : connection_(db_path) {}

common::Result<std::optional<SessionBinding>>
SessionBindingStore::get(const std::string &binding_key) {
  using R = common::Result<std::optional<SessionBinding>>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (!connection_.is_open()) {
    return R::failure("session binding store is not initialized: " + connection_.open_error());
  }
  auto stmt = prepare(connection_.get(),
                      "SELECT binding_key, session_id, updated_at FROM session_bindings "
                      "WHERE binding_key = ?1");
  if (!stmt.ok()) {
    return R::failure(stmt.error());
  }
  auto *s = stmt.value().get();
  bind_text(s, 1, binding_key);
  const int rc = sqlite3_step(s);
  if (rc == SQLITE_DONE) {
    return R::success(std::nullopt);
  }
  if (rc != SQLITE_ROW) {
    return R::failure(sqlite3_errmsg(connection_.get()));
  }
  return R::success(SessionBinding{
      .binding_key = get_text_column(s, 0),
      .session_id = get_text_column(s, 1),
      .updated_at = sqlite3_column_int64(s, 2),
  });
}

common::Status SessionBindingStore::upsert(const std::string &binding_key,
                                           const std::string &session_id,
                                           const std::int64_t updated_at) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!connection_.is_open()) {
    return common::Status::error("session binding store is not initialized: " +
                                 connection_.open_error());
  }
  auto stmt = prepare(connection_.get(), R"(
INSERT INTO session_bindings(binding_key, session_id, updated_at)
VALUES(?1, ?2, ?3)
ON CONFLICT(binding_key) DO UPDATE SET
  session_id = excluded.session_id,
  updated_at = excluded.updated_at
)");
  if (!stmt.ok()) {
    return stmt.status();
  }
  auto *s = stmt.value().get();
  bind_text(s, 1, binding_key);
  bind_text(s, 2, session_id);
  sqlite3_bind_int64(s, 3, updated_at);
  return step_done(connection_.get(), s);
}

} // namespace otto::persistence
