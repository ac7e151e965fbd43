#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "otto/observability/factory.hpp"
#include "otto/observability/global.hpp"
#include "otto/observability/multi_observer.hpp"
#include "otto/outbound/enqueue.hpp"
#include "otto/outbound/queue.hpp"
#include "otto/persistence/user_profile_store.hpp"
#include "otto/scheduler/kernel.hpp"

#include <stdexcept>

namespace {

using otto::testing::ObserverGuard;
using otto::testing::RecordingObserver;
using otto::tests::require;
namespace obs = otto::observability;

template <typename T> std::size_t count_events(const RecordingObserver &recorder) {
  std::size_t count = 0;
  for (const auto &event : recorder.events()) {
    if (std::holds_alternative<T>(event)) {
      ++count;
    }
  }
  return count;
}

class ThrowingObserver final : public obs::IObserver {
public:
  void record_event(const obs::ObserverEvent &) override { throw std::runtime_error("sink down"); }
  void record_metric(const obs::ObserverMetric &) override {
    throw std::runtime_error("sink down");
  }
  [[nodiscard]] std::string_view name() const override { return "throwing"; }
};

class NullExecutor final : public otto::scheduler::IClaimedJobExecutor {
public:
  otto::common::Status execute_claimed_job(const otto::persistence::Job &) override {
    return otto::common::Status::error("not wired");
  }
};

} // namespace

void register_observability_tests(std::vector<otto::tests::TestCase> &tests) {
  tests.push_back({"factory_selects_backends", [] {
                     otto::config::ObservabilityConfig config;
                     config.backend = "none";
                     require(obs::create_observer(config)->name() == "noop", "none");
                     config.backend = " LOG ";
                     require(obs::create_observer(config)->name() == "log", "log");
                     config.backend = "statsd";
                     require(obs::create_observer(config)->name() == "log", "unknown falls back");
                     config.backend = "log, noop";
                     const auto multi = obs::create_observer(config);
                     require(multi->name() == "multi", "comma list");
                     require(dynamic_cast<obs::MultiObserver &>(*multi).size() == 2, "two children");
                   }});

  tests.push_back({"multi_observer_isolates_failing_backends", [] {
                     obs::MultiObserver multi;
                     multi.add(std::make_unique<ThrowingObserver>());
                     auto recorder = std::make_unique<RecordingObserver>();
                     const auto *recording = recorder.get();
                     multi.add(std::move(recorder));
                     multi.add(nullptr);
                     require(multi.size() == 2, "null backends ignored");

                     multi.record_event(obs::SchedulerTickEvent{2});
                     multi.record_metric(obs::QueueDepthMetric{4});
                     multi.flush();
                     require(recording->events().size() == 1, "event reached healthy backend");
                     require(recording->metrics().size() == 1, "metric reached healthy backend");
                   }});

  tests.push_back({"global_helpers_are_safe_without_observer", [] {
                     obs::set_global_observer(nullptr);
                     obs::record_event(obs::SchedulerTickEvent{3});
                     obs::record_metric(obs::QueueDepthMetric{1});
                     obs::record_error("test", "nobody listening");
                     require(obs::get_global_observer() == nullptr, "still unset");
                   }});

  tests.push_back({"record_error_wraps_component", [] {
                     ObserverGuard guard;
                     obs::record_error("outbound", "disk full");
                     const auto events = guard.recorder().events();
                     require(events.size() == 1, "one event");
                     const auto *error = std::get_if<obs::ErrorEvent>(&events[0]);
                     require(error != nullptr, "error event");
                     require(error->component == "outbound" && error->message == "disk full",
                             "fields");
                   }});

  tests.push_back({"scheduler_tick_reports_claims_and_failures", [] {
                     ObserverGuard guard;
                     otto::testing::TempWorkspace ws;
                     otto::persistence::JobStore jobs(ws.db_path());
                     require(jobs.create_job(otto::testing::recurring_job("j", "t", 5, 1'000)).ok(),
                             "create");
                     NullExecutor executor;
                     otto::scheduler::SchedulerKernel kernel(jobs, executor, {},
                                                             otto::testing::ManualClock(2'000).clock());
                     const auto report = kernel.tick();
                     require(report.ok() && report.value().failed == 1, "executor failure counted");

                     require(count_events<obs::SchedulerTickEvent>(guard.recorder()) == 1, "tick");
                     require(count_events<obs::ErrorEvent>(guard.recorder()) == 1, "error");
                     const auto metrics = guard.recorder().metrics();
                     require(metrics.size() == 1, "claimed metric");
                     require(std::get<obs::ClaimedJobsMetric>(metrics[0]).count == 1, "count");
                   }});

  tests.push_back({"outbound_drain_reports_delivery_and_depth", [] {
                     ObserverGuard guard;
                     otto::testing::TempWorkspace ws;
                     otto::persistence::OutboundStore store(ws.db_path());
                     otto::persistence::UserProfileStore profiles(ws.db_path());
                     otto::testing::RecordingSender sender;
                     const auto queued = otto::outbound::enqueue_text(
                         otto::outbound::QueueTextInput{.chat_id = 1, .content = "hi"}, store, 10);
                     require(queued.ok(), queued.error());
                     otto::outbound::OutboundQueueProcessor processor(store, profiles, sender, {});
                     require(processor.drain_due_messages(20).ok(), "drain");

                     const auto events = guard.recorder().events();
                     require(events.size() == 1, "one delivery event");
                     const auto &delivery = std::get<obs::OutboundDeliveryEvent>(events[0]);
                     require(delivery.outcome == "sent" && delivery.attempt == 1, "sent event");

                     bool saw_depth = false;
                     bool saw_latency = false;
                     for (const auto &metric : guard.recorder().metrics()) {
                       if (const auto *depth = std::get_if<obs::QueueDepthMetric>(&metric)) {
                         saw_depth = depth->depth == 0;
                       }
                       if (const auto *latency = std::get_if<obs::DeliveryLatencyMetric>(&metric)) {
                         saw_latency = latency->latency.count() == 10;
                       }
                     }
                     require(saw_depth, "queue depth after drain");
                     require(saw_latency, "delivery latency");
                   }});
}
