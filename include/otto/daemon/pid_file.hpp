#pragma once

#include "otto/common/result.hpp"

#include <filesystem>

namespace otto::daemon {

/// Single-instance guard: holds `<home>/daemon.pid` while the daemon runs. A file left behind
/// by a process that no longer exists is taken over.
class PidFile {
public:
  explicit PidFile(std::filesystem::path path);
  ~PidFile();

  PidFile(const PidFile &) = delete;
  PidFile &operator=(const PidFile &) = delete;

  [[nodiscard]] common::Status acquire();
  void release();

  [[nodiscard]] static bool is_process_running(int pid);

private:
  std::filesystem::path path_;
  bool acquired_ = false;
};

} // namespace otto::daemon
