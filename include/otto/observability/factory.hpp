#pragma once

#include "otto/config/schema.hpp"
#include "otto/observability/observer.hpp"

#include <memory>

namespace otto::observability {

/// Backend from `observability.backend`: log, none/noop, or a comma-separated list.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::ObservabilityConfig &config);

} // namespace otto::observability
