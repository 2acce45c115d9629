#pragma once

#include "clawlink/observability/observer.hpp"

#include <memory>

namespace clawlink::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_connection_state(const std::string &state);
void record_pairing_state(const std::string &state);
void record_rpc_call(const std::string &method, std::chrono::milliseconds duration, bool success);
void record_gateway_error(const std::string &code, const std::string &message);
void record_reconnect_scheduled(std::uint32_t attempt, std::chrono::seconds delay);
void record_error(const std::string &component, const std::string &message);

} // namespace clawlink::observability
