#pragma once

#include "otto/observability/observer.hpp"

namespace otto::observability {

/// One `[LEVEL] key=value` line per event on stderr.
class LogObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "log"; }
};

} // namespace otto::observability
