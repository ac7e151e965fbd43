#include "otto/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace otto::observability {

namespace {

void log_line(const std::string &level, const std::string &message) {
  std::cerr << "[" << level << "] " << message << "\n";
}

} // namespace

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, SchedulerTickEvent>) {
          log_line("DEBUG", "scheduler.tick claimed=" + std::to_string(evt.claimed));
        } else if constexpr (std::is_same_v<T, JobRunEvent>) {
          std::string line = "job.run id=" + evt.job_id + " type=" + evt.job_type +
                             " status=" + evt.status;
          if (!evt.error_code.empty()) {
            line += " error_code=" + evt.error_code;
          }
          log_line(evt.status == "failed" ? "WARN" : "INFO", line);
        } else if constexpr (std::is_same_v<T, OutboundDeliveryEvent>) {
          log_line(evt.outcome == "failed" ? "WARN" : "INFO",
                   "outbound.delivery id=" + evt.message_id + " outcome=" + evt.outcome +
                       " attempt=" + std::to_string(evt.attempt));
        } else if constexpr (std::is_same_v<T, WatchdogAlertEvent>) {
          log_line("WARN", "watchdog.alert failed_count=" + std::to_string(evt.failed_count) +
                               " notification=" + evt.notification);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ClaimedJobsMetric>) {
          log_line("DEBUG", "metric.claimed_jobs=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, QueueDepthMetric>) {
          log_line("DEBUG", "metric.queue_depth=" + std::to_string(m.depth));
        } else if constexpr (std::is_same_v<T, DeliveryLatencyMetric>) {
          log_line("DEBUG", "metric.delivery_latency_ms=" + std::to_string(m.latency.count()));
        }
      },
      metric);
}

} // namespace otto::observability
