#include "otto/observability/factory.hpp"

#include "otto/common/fs.hpp"
#include "otto/observability/log_observer.hpp"
#include "otto/observability/multi_observer.hpp"
#include "otto/observability/noop_observer.hpp"

#include <iostream>
#include <sstream>

namespace otto::observability {

namespace {

std::unique_ptr<IObserver> create_single(const std::string &backend) {
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }
  if (backend != "log") {
    std::cerr << "[observability] unknown_backend name=" << backend << " fallback=log\n";
  }
  return std::make_unique<LogObserver>();
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::ObservabilityConfig &config) {
  const std::string backend = common::to_lower(common::trim(config.backend));
  if (backend.find(',') == std::string::npos) {
    return create_single(backend);
  }

  auto multi = std::make_unique<MultiObserver>();
  std::stringstream stream(backend);
  std::string part;
  while (std::getline(stream, part, ',')) {
    const std::string name = common::trim(part);
    if (!name.empty()) {
      multi->add(create_single(name));
    }
  }
  return multi;
}

} // namespace otto::observability
