#include "clawlink/observability/multi_observer.hpp"

namespace clawlink::observability {

MultiObserver::MultiObserver(std::vector<std::unique_ptr<IObserver>> backends) {
  for (auto &backend : backends) {
    add(std::move(backend));
  }
}

void MultiObserver::add(std::unique_ptr<IObserver> backend) {
  if (backend == nullptr) {
    return;
  }
  if (backend->name() != "noop") {
    active_.push_back(backend.get());
  }
  backends_.push_back(std::move(backend));
}

void MultiObserver::record_event(const ObserverEvent &event) {
  for (IObserver *backend : active_) {
    backend->record_event(event);
  }
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  for (IObserver *backend : active_) {
    backend->record_metric(metric);
  }
}

void MultiObserver::flush() {
  for (IObserver *backend : active_) {
    backend->flush();
  }
}

std::string MultiObserver::backend_names() const {
  std::string names;
  for (const auto &backend : backends_) {
    if (!names.empty()) {
      names += ',';
    }
    names += backend->name();
  }
  return names;
}

std::string describe_observer(const IObserver &observer) {
  if (const auto *multi = dynamic_cast<const MultiObserver *>(&observer); multi != nullptr) {
    return multi->backend_names();
  }
  return std::string(observer.name());
}

} // namespace clawlink::observability
