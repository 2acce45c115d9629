#pragma once

#include "clawlink/observability/observer.hpp"

#include <memory>
#include <string>
#include <vector>

namespace clawlink::observability {

/// Fans every event and metric out to each backend in insertion order.
class MultiObserver final : public IObserver {
public:
  MultiObserver() = default;
  explicit MultiObserver(std::vector<std::unique_ptr<IObserver>> backends);

  void add(std::unique_ptr<IObserver> backend);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }

  [[nodiscard]] std::size_t size() const { return backends_.size(); }
  /// Backend names joined with ",", e.g. "log,noop".
  [[nodiscard]] std::string backend_names() const;

private:
  std::vector<std::unique_ptr<IObserver>> backends_;
  // Backends that do something with an event; noop members are skipped.
  std::vector<IObserver *> active_;
};

/// Names the backends behind `observer` for status output.
[[nodiscard]] std::string describe_observer(const IObserver &observer);

} // namespace clawlink::observability
