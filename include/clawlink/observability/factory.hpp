#pragma once

#include "clawlink/config/schema.hpp"
#include "clawlink/observability/observer.hpp"

#include <memory>

namespace clawlink::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace clawlink::observability
