#pragma once

#include "otto/common/clock.hpp"
#include "otto/config/schema.hpp"
#include "otto/persistence/job_store.hpp"
#include "otto/scheduler/executor.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <string>
#include <thread>

namespace otto::scheduler {

struct TickReport {
  /// True when another tick was still running and this one did nothing.
  bool skipped = false;
  std::size_t claimed = 0;
  std::size_t failed = 0;
};

/// Periodically claims due jobs under a fresh lease and runs them one after another.
class SchedulerKernel {
public:
  using TokenFactory = std::function<std::string()>;

  SchedulerKernel(persistence::JobStore &jobs, IClaimedJobExecutor &executor,
                  config::SchedulerConfig config, common::Clock clock,
                  TokenFactory make_token = {});
  ~SchedulerKernel();

  /// One claim-and-execute pass. A failing job is logged and unlocked; the rest still run.
  [[nodiscard]] common::Result<TickReport> tick();

  /// Ticks immediately, then every tick_ms on a background thread. No-op when disabled.
  void start();
  void stop();
  [[nodiscard]] bool is_running() const;

private:
  void run_loop();
  void release(const persistence::Job &job, const std::string &lock_token);

  persistence::JobStore &jobs_;
  IClaimedJobExecutor &executor_;
  config::SchedulerConfig config_;
  common::Clock clock_;
  TokenFactory make_token_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<bool> ticking_{false};
};

} // namespace otto::scheduler
