#pragma once

#include "clawlink/observability/observer.hpp"

#include <iostream>
#include <mutex>

namespace clawlink::observability {

/// Writes `[LEVEL] message` lines. The stream must outlive the observer.
class LogObserver final : public IObserver {
public:
  explicit LogObserver(std::ostream &out = std::cerr) : out_(out) {}

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void write(const char *level, const std::string &message);

  std::ostream &out_;
  std::mutex mutex_;
};

} // namespace clawlink::observability
