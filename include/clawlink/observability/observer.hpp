#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace clawlink::observability {

struct ConnectionStateEvent {
  std::string state;
};

struct PairingStateEvent {
  std::string state;
};

struct RpcCallEvent {
  std::string method;
  std::chrono::milliseconds duration{0};
  bool success = false;
};

struct GatewayErrorEvent {
  std::string code;
  std::string message;
};

struct ReconnectScheduledEvent {
  std::uint32_t attempt = 0;
  std::chrono::seconds delay{0};
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<ConnectionStateEvent, PairingStateEvent, RpcCallEvent,
                                   GatewayErrorEvent, ReconnectScheduledEvent, ErrorEvent>;

struct RpcLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct PendingRequestsMetric {
  std::uint64_t count = 0;
};

struct ConversationCountMetric {
  std::uint64_t count = 0;
};

using ObserverMetric =
    std::variant<RpcLatencyMetric, PendingRequestsMetric, ConversationCountMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace clawlink::observability
