#include "otto/daemon/pid_file.hpp"

#include "otto/common/fs.hpp"

#include <cerrno>
#include <charconv>
#include <fstream>

#include <signal.h>
#include <unistd.h>

namespace otto::daemon {

namespace {

int read_pid(const std::filesystem::path &path) {
  const auto content = common::read_text_file(path);
  if (!content.ok()) {
    return 0;
  }
  const std::string text = common::trim(content.value());
  int pid = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), pid);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return 0;
  }
  return pid;
}

} // namespace

PidFile::PidFile(std::filesystem::path path) : path_(std::move(path)) {}

PidFile::~PidFile() { release(); }

common::Status PidFile::acquire() {
  if (acquired_) {
    return common::Status::success();
  }

  const auto dir = common::ensure_dir(path_.parent_path());
  if (!dir.ok()) {
    return common::Status::error("failed to create pid directory: " + dir.error());
  }

  std::error_code ec;
  if (std::filesystem::exists(path_, ec)) {
    const int existing_pid = read_pid(path_);
    if (existing_pid > 0 && existing_pid != static_cast<int>(getpid()) &&
        is_process_running(existing_pid)) {
      return common::Status::error("otto daemon already running with pid " +
                                   std::to_string(existing_pid));
    }
    std::filesystem::remove(path_, ec);
  }

  std::ofstream out(path_, std::ios::trunc);
  if (!out) {
    return common::Status::error("failed to write pid file " + path_.string());
  }
  out << getpid() << "\n";
  acquired_ = true;
  return common::Status::success();
}

void PidFile::release() {
  if (!acquired_) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  acquired_ = false;
}

bool PidFile::is_process_running(const int pid) {
  if (pid <= 0) {
    return false;
  }
  // EPERM still means the process exists.
  return kill(pid, 0) == 0 || errno == EPERM;
}

} // namespace otto::daemon
