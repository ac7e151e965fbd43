#include "otto/scheduler/kernel.hpp"

#include "otto/common/crypto.hpp"
#include "otto/observability/global.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <iostream>

namespace otto::scheduler {

namespace {

class TickGuard {
public:
  explicit TickGuard(std::atomic<bool> &flag) : flag_(flag) {}
  ~TickGuard() { flag_.store(false); }
  TickGuard(const TickGuard &) = delete;
  TickGuard &operator=(const TickGuard &) = delete;

private:
  std::atomic<bool> &flag_;
};

} // namespace

SchedulerKernel::SchedulerKernel(persistence::JobStore &jobs, IClaimedJobExecutor &executor,
                                 config::SchedulerConfig config, common::Clock clock,
                                 TokenFactory make_token)
    : jobs_(jobs), executor_(executor), config_(config), clock_(std::move(clock)),
      make_token_(std::move(make_token)) {
  if (!make_token_) {
    make_token_ = []() { return common::generate_uuid(); };
  }
}

SchedulerKernel::~SchedulerKernel() { stop(); }

common::Result<TickReport> SchedulerKernel::tick() {
  TickReport report;
  bool expected = false;
  if (!ticking_.compare_exchange_strong(expected, true)) {
    report.skipped = true;
    return common::Result<TickReport>::success(report);
  }
  TickGuard guard(ticking_);

  const std::int64_t now = clock_();
  const std::string lock_token = make_token_();
  auto claimed = jobs_.claim_due(now, static_cast<std::size_t>(config_.batch_size), lock_token,
                                 config_.lock_lease_ms, now);
  if (!claimed.ok()) {
    return common::Result<TickReport>::failure("claim due jobs: " + claimed.error());
  }

  report.claimed = claimed.value().size();
  observability::record_event(observability::SchedulerTickEvent{report.claimed});
  observability::record_metric(observability::ClaimedJobsMetric{report.claimed});

  for (const auto &job : claimed.value()) {
    common::Status executed = common::Status::success();
    try {
      executed = executor_.execute_claimed_job(job);
    } catch (const std::exception &ex) {
      executed = common::Status::error(ex.what());
    }
    if (executed.ok()) {
      continue;
    }
    ++report.failed;
    observability::record_error("scheduler", "job_failed " + job.id + ": " + executed.error());
    release(job, lock_token);
  }
  return common::Result<TickReport>::success(report);
}

void SchedulerKernel::release(const persistence::Job &job, const std::string &lock_token) {
  const auto released = jobs_.release_lock(job.id, lock_token, clock_());
  if (!released.ok()) {
    std::cerr << "[scheduler] release_lock_failed job_id=" << job.id
              << " error=" << released.error() << "\n";
  }
}

void SchedulerKernel::start() {
  if (!config_.enabled) {
    std::cerr << "[scheduler] disabled\n";
    return;
  }
  if (running_) {
    return;
  }
  running_ = true;
  std::cerr << "[scheduler] started tick_ms=" << config_.tick_ms
            << " batch_size=" << config_.batch_size << " lock_lease_ms=" << config_.lock_lease_ms
            << "\n";
  thread_ = std::thread([this]() { run_loop(); });
}

void SchedulerKernel::stop() {
  const bool was_running = running_.exchange(false);
  if (thread_.joinable()) {
    thread_.join();
  }
  if (was_running) {
    std::cerr << "[scheduler] stopped\n";
  }
}

bool SchedulerKernel::is_running() const { return running_; }

void SchedulerKernel::run_loop() {
  while (running_) {
    try {
      const auto ticked = tick();
      if (!ticked.ok()) {
        observability::record_error("scheduler", "tick_failed: " + ticked.error());
      }
    } catch (const std::exception &ex) {
      observability::record_error("scheduler", std::string("tick_failed: ") + ex.what());
    }
    const auto wait_steps = std::max<long long>(1, config_.tick_ms / 100);
    for (long long i = 0; i < wait_steps && running_; ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  }
}

} // namespace otto::scheduler
