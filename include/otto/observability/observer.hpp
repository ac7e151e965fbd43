#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace otto::observability {

struct SchedulerTickEvent {
  std::size_t claimed = 0;
};

struct JobRunEvent {
  std::string job_id;
  std::string job_type;
  std::string status;
  std::string error_code;
};

struct OutboundDeliveryEvent {
  std::string message_id;
  /// sent, retry, failed or suppressed.
  std::string outcome;
  std::int64_t attempt = 0;
};

struct WatchdogAlertEvent {
  std::size_t failed_count = 0;
  std::string notification;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<SchedulerTickEvent, JobRunEvent, OutboundDeliveryEvent,
                                   WatchdogAlertEvent, ErrorEvent>;

struct ClaimedJobsMetric {
  std::uint64_t count = 0;
};

struct QueueDepthMetric {
  std::uint64_t depth = 0;
};

struct DeliveryLatencyMetric {
  std::chrono::milliseconds latency{0};
};

using ObserverMetric = std::variant<ClaimedJobsMetric, QueueDepthMetric, DeliveryLatencyMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace otto::observability
