#include "otto/observability/multi_observer.hpp"

#include <exception>
#include <iostream>

namespace otto::observability {

namespace {

void report_failure(const IObserver &observer, const char *operation, const std::exception &ex) {
  std::cerr << "[observability] observer_failed name=" << observer.name()
            << " operation=" << operation << " error=" << ex.what() << "\n";
}

} // namespace

void MultiObserver::add(std::unique_ptr<IObserver> observer) {
  if (observer != nullptr) {
    observers_.push_back(std::move(observer));
  }
}

// A throwing backend is reported and skipped; the remaining backends still see the event.
void MultiObserver::record_event(const ObserverEvent &event) {
  for (auto &observer : observers_) {
    try {
      observer->record_event(event);
    } catch (const std::exception &ex) {
      report_failure(*observer, "record_event", ex);
    }
  }
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  for (auto &observer : observers_) {
    try {
      observer->record_metric(metric);
    } catch (const std::exception &ex) {
      report_failure(*observer, "record_metric", ex);
    }
  }
}

void MultiObserver::flush() {
  for (auto &observer : observers_) {
    try {
      observer->flush();
    } catch (const std::exception &ex) {
      report_failure(*observer, "flush", ex);
    }
  }
}

} // namespace otto::observability
