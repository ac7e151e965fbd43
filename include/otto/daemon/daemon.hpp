#pragma once

#include "otto/common/result.hpp"
#include "otto/config/schema.hpp"

#include <atomic>
#include <memory>

namespace otto::persistence {
class JobStore;
class OutboundStore;
class SessionBindingStore;
class UserProfileStore;
} // namespace otto::persistence

namespace otto::http {
class HttpClient;
}

namespace otto::gateway {
class ISessionGateway;
}

namespace otto::outbound {
class TelegramSender;
class OutboundQueueProcessor;
class OutboundWorker;
} // namespace otto::outbound

namespace otto::scheduler {
class TaskExecutionEngine;
class SchedulerKernel;
} // namespace otto::scheduler

namespace otto::daemon {

class PidFile;

/// Wires the stores, the scheduler kernel and the outbound worker over one runtime home and
/// runs them until stop().
class Daemon {
public:
  explicit Daemon(const config::Config &config);
  ~Daemon();

  Daemon(const Daemon &) = delete;
  Daemon &operator=(const Daemon &) = delete;

  [[nodiscard]] common::Status start();
  void stop();
  [[nodiscard]] bool is_running() const;

private:
  [[nodiscard]] common::Status build_components();
  void ensure_watchdog();
  void ensure_heartbeat();
  void teardown();

  config::Config config_;
  std::atomic<bool> running_{false};

  std::unique_ptr<PidFile> pid_file_;
  std::unique_ptr<persistence::JobStore> jobs_;
  std::unique_ptr<persistence::OutboundStore> outbound_;
  std::unique_ptr<persistence::SessionBindingStore> bindings_;
  std::unique_ptr<persistence::UserProfileStore> profiles_;
  std::shared_ptr<http::HttpClient> http_;
  std::unique_ptr<gateway::ISessionGateway> gateway_;
  std::unique_ptr<outbound::TelegramSender> sender_;
  std::unique_ptr<outbound::OutboundQueueProcessor> processor_;
  std::unique_ptr<outbound::OutboundWorker> worker_;
  std::unique_ptr<scheduler::TaskExecutionEngine> engine_;
  std::unique_ptr<scheduler::SchedulerKernel> kernel_;
};

} // namespace otto::daemon
