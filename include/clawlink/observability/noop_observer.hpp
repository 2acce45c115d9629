#pragma once

#include "clawlink/observability/observer.hpp"

namespace clawlink::observability {

/// Backend for `observability.backend = "none"`: drops everything.
class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent & /*event*/) override {}
  void record_metric(const ObserverMetric & /*metric*/) override {}
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

} // namespace clawlink::observability
