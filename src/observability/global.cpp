#include "clawlink/observability/global.hpp"

#include <mutex>

namespace clawlink::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_connection_state(const std::string &state) {
  record_event(ConnectionStateEvent{.state = state});
}

void record_pairing_state(const std::string &state) {
  record_event(PairingStateEvent{.state = state});
}

void record_rpc_call(const std::string &method, std::chrono::milliseconds duration,
                     const bool success) {
  record_event(RpcCallEvent{.method = method, .duration = duration, .success = success});
  record_metric(RpcLatencyMetric{.latency = duration});
}

void record_gateway_error(const std::string &code, const std::string &message) {
  record_event(GatewayErrorEvent{.code = code, .message = message});
}

void record_reconnect_scheduled(const std::uint32_t attempt, std::chrono::seconds delay) {
  record_event(ReconnectScheduledEvent{.attempt = attempt, .delay = delay});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace clawlink::observability
