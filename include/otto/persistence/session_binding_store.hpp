#pragma once

#include "otto/common/result.hpp"
#include "otto/persistence/sqlite_util.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

namespace otto::persistence {

struct SessionBinding {
  std::string binding_key;
  std::string session_id;
  std::int64_t updated_at = 0;
};

/// Maps a stable binding key (e.g. `scheduler:task:<id>:assistant`) to the gateway session
/// that carries its conversation.
class SessionBindingStore {
public:
  explicit SessionBindingStore(const std::filesystem::path &db_path);

  [[nodiscard]] common::Result<std::optional<SessionBinding>> get(const std::string &binding_key);
  [[nodiscard]] common::Status upsert(const std::string &binding_key, const std::string &session_id,
                                      std::int64_t updated_at);

private:
  SqliteConnection connection_;
  std::mutex mutex_;
};

} // namespace otto::persistence
