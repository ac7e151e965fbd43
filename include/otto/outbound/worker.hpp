#pragma once

#include "otto/common/clock.hpp"
#include "otto/outbound/queue.hpp"

#include <atomic>
#include <chrono>
#include <thread>

namespace otto::outbound {

/// Drains the outbound queue on its own thread every poll interval.
class OutboundWorker {
public:
  OutboundWorker(OutboundQueueProcessor &processor, std::chrono::milliseconds poll_interval,
                 common::Clock clock);
  ~OutboundWorker();

  void start();
  void stop();
  [[nodiscard]] bool is_running() const;

private:
  void run_loop();

  OutboundQueueProcessor &processor_;
  std::chrono::milliseconds poll_interval_;
  common::Clock clock_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

} // namespace otto::outbound
