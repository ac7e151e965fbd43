#include "otto/outbound/worker.hpp"

#include "otto/observability/global.hpp"

#include <algorithm>
#include <exception>

namespace otto::outbound {

OutboundWorker::OutboundWorker(OutboundQueueProcessor &processor,
                               const std::chrono::milliseconds poll_interval, common::Clock clock)
    : processor_(processor), poll_interval_(poll_interval), clock_(std::move(clock)) {}

OutboundWorker::~OutboundWorker() { stop(); }

void OutboundWorker::start() {
  if (running_) {
    return;
  }
  running_ = true;
  thread_ = std::thread([this]() { run_loop(); });
}

void OutboundWorker::stop() {
  running_ = false;
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool OutboundWorker::is_running() const { return running_; }

void OutboundWorker::run_loop() {
  while (running_) {
    try {
      const auto drained = processor_.drain_due_messages(clock_());
      if (!drained.ok()) {
        observability::record_error("outbound", "drain_failed: " + drained.error());
      }
    } catch (const std::exception &ex) {
      observability::record_error("outbound", std::string("drain_failed: ") + ex.what());
    }
    const auto wait_steps = std::max<long long>(1, poll_interval_.count() / 100);
    for (long long i = 0; i < wait_steps && running_; ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  }
}

} // namespace otto::outbound
