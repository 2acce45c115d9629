#include "clawlink/observability/log_observer.hpp"

#include <type_traits>

namespace clawlink::observability {

void LogObserver::write(const char *level, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_.flush();
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ConnectionStateEvent>) {
          write("INFO", "connection.state " + evt.state);
        } else if constexpr (std::is_same_v<T, PairingStateEvent>) {
          write("INFO", "pairing.state " + evt.state);
        } else if constexpr (std::is_same_v<T, RpcCallEvent>) {
          write("DEBUG", "rpc.call method=" + evt.method +
                                " duration_ms=" + std::to_string(evt.duration.count()) +
                                " success=" + (evt.success ? std::string("true") : std::string("false")));
        } else if constexpr (std::is_same_v<T, GatewayErrorEvent>) {
          write("WARN", "gateway.error code=" + evt.code + " message=" + evt.message);
        } else if constexpr (std::is_same_v<T, ReconnectScheduledEvent>) {
          write("INFO", "reconnect.scheduled attempt=" + std::to_string(evt.attempt) +
                               " delay_s=" + std::to_string(evt.delay.count()));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          write("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, RpcLatencyMetric>) {
          write("DEBUG", "metric.rpc_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, PendingRequestsMetric>) {
          write("DEBUG", "metric.pending_requests=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, ConversationCountMetric>) {
          write("DEBUG", "metric.conversations=" + std::to_string(m.count));
        }
      },
      metric);
}

} // namespace clawlink::observability
