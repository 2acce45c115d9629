#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "clawlink/gateway/controller.hpp"
#include "clawlink/observability/factory.hpp"
#include "clawlink/observability/global.hpp"
#include "clawlink/observability/log_observer.hpp"
#include "clawlink/observability/multi_observer.hpp"
#include "clawlink/observability/noop_observer.hpp"
#include "clawlink/storage/identity_store.hpp"
#include "clawlink/storage/secret_store.hpp"

#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

namespace obs = clawlink::observability;

struct Recorded {
  std::vector<obs::ObserverEvent> events;
  std::vector<obs::ObserverMetric> metrics;
  std::size_t flushes = 0;
};

class CapturingObserver final : public obs::IObserver {
public:
  explicit CapturingObserver(std::shared_ptr<Recorded> recorded) : recorded_(std::move(recorded)) {}

  void record_event(const obs::ObserverEvent &event) override { recorded_->events.push_back(event); }
  void record_metric(const obs::ObserverMetric &metric) override {
    recorded_->metrics.push_back(metric);
  }
  void flush() override { ++recorded_->flushes; }
  [[nodiscard]] std::string_view name() const override { return "capture"; }

private:
  std::shared_ptr<Recorded> recorded_;
};

struct GlobalObserverGuard {
  std::shared_ptr<Recorded> recorded = std::make_shared<Recorded>();

  GlobalObserverGuard() { obs::set_global_observer(std::make_unique<CapturingObserver>(recorded)); }
  ~GlobalObserverGuard() { obs::set_global_observer(nullptr); }

  template <typename T> std::vector<T> events_of() const {
    std::vector<T> out;
    for (const auto &event : recorded->events) {
      if (const auto *typed = std::get_if<T>(&event); typed != nullptr) {
        out.push_back(*typed);
      }
    }
    return out;
  }
};

} // namespace

void register_observability_tests(std::vector<clawlink::tests::TestCase> &tests) {
  using clawlink::tests::require;

  tests.push_back({"observer_factory_selects_backend", [] {
                     auto config = clawlink::testing::mock_config();
                     config.observability.backend = "none";
                     require(obs::create_observer(config)->name() == "noop", "none is noop");
                     config.observability.backend = " LOG ";
                     require(obs::create_observer(config)->name() == "log", "log backend");
                     config.observability.backend = "something-else";
                     require(obs::create_observer(config)->name() == "log",
                             "unknown backends fall back to log");

                     config.observability.backend = "log,none";
                     auto multi = obs::create_observer(config);
                     require(multi->name() == "multi", "comma list builds a multi observer");
                     const auto *typed = dynamic_cast<obs::MultiObserver *>(multi.get());
                     require(typed != nullptr && typed->size() == 2, "two children expected");
                     require(obs::describe_observer(*multi) == "log,noop",
                             "status lists every backend");
                     config.observability.backend = "none";
                     require(obs::describe_observer(*obs::create_observer(config)) == "noop",
                             "single backend describes itself");
                   }});

  tests.push_back({"log_observer_formats_lines", [] {
                     std::ostringstream out;
                     obs::LogObserver log(out);
                     log.record_event(obs::ConnectionStateEvent{.state = "connected"});
                     log.record_event(obs::GatewayErrorEvent{.code = "rate", .message = "slow"});
                     log.record_event(obs::ErrorEvent{.component = "transport", .message = "reset"});
                     log.record_metric(obs::PendingRequestsMetric{.count = 2});
                     log.flush();
                     require(out.str() == "[INFO] connection.state connected\n"
                                          "[WARN] gateway.error code=rate message=slow\n"
                                          "[ERROR] transport: reset\n"
                                          "[DEBUG] metric.pending_requests=2\n",
                             "unexpected log output: " + out.str());
                   }});

  tests.push_back({"multi_observer_fans_out", [] {
                     auto first = std::make_shared<Recorded>();
                     auto second = std::make_shared<Recorded>();
                     obs::MultiObserver multi;
                     multi.add(std::make_unique<CapturingObserver>(first));
                     multi.add(std::make_unique<CapturingObserver>(second));
                     multi.add(std::make_unique<obs::NoopObserver>());

                     multi.record_event(obs::ErrorEvent{.component = "x", .message = "y"});
                     multi.record_metric(obs::PendingRequestsMetric{.count = 3});
                     multi.flush();
                     for (const auto &recorded : {first, second}) {
                       require(recorded->events.size() == 1, "event forwarded");
                       require(recorded->metrics.size() == 1, "metric forwarded");
                       require(recorded->flushes == 1, "flush forwarded");
                     }
                   }});

  tests.push_back({"record_helpers_reach_global_observer", [] {
                     GlobalObserverGuard guard;
                     obs::record_rpc_call("chat.send", std::chrono::milliseconds(42), true);
                     obs::record_gateway_error("rate", "slow down");
                     obs::record_reconnect_scheduled(2, std::chrono::seconds(4));

                     const auto calls = guard.events_of<obs::RpcCallEvent>();
                     require(calls.size() == 1 && calls.front().method == "chat.send" &&
                                 calls.front().success,
                             "rpc call event");
                     require(guard.recorded->metrics.size() == 1 &&
                                 std::get<obs::RpcLatencyMetric>(guard.recorded->metrics.front())
                                         .latency == std::chrono::milliseconds(42),
                             "latency metric");
                     const auto errors = guard.events_of<obs::GatewayErrorEvent>();
                     require(errors.size() == 1 && errors.front().code == "rate", "gateway error");
                     const auto reconnects = guard.events_of<obs::ReconnectScheduledEvent>();
                     require(reconnects.size() == 1 && reconnects.front().attempt == 2 &&
                                 reconnects.front().delay == std::chrono::seconds(4),
                             "reconnect event");

                     obs::set_global_observer(nullptr);
                     obs::record_error("test", "dropped without an observer");
                     require(guard.recorded->events.size() == 3, "no observer means no recording");
                   }});

  tests.push_back({"controller_reports_lifecycle_to_observer", [] {
                     GlobalObserverGuard guard;
                     clawlink::testing::ManualExecutor executor;
                     auto wire = std::make_shared<clawlink::testing::FakeTransportState>();
                     clawlink::storage::InMemorySecretStore secrets;
                     clawlink::storage::InMemoryIdentityStore identities;
                     clawlink::gateway::ControllerOptions options;
                     options.url = "ws://gateway.test";
                     clawlink::gateway::Controller controller(
                         executor, std::make_unique<clawlink::testing::FakeTransport>(wire), secrets,
                         identities,
                         clawlink::gateway::DeviceIdentity{.node_id = "node-1", .display_name = "x"},
                         options);
                     controller.connect();
                     executor.run_ready();
                     wire->complete_open(clawlink::common::Status::error("refused"));
                     executor.run_ready();

                     std::vector<std::string> states;
                     for (const auto &event : guard.events_of<obs::ConnectionStateEvent>()) {
                       states.push_back(event.state);
                     }
                     require(states == std::vector<std::string>{"connecting", "failed: refused",
                                                                "reconnecting (attempt 1)"},
                             "connection states should be recorded in order");
                     const auto reconnects = guard.events_of<obs::ReconnectScheduledEvent>();
                     require(reconnects.size() == 1 && reconnects.front().delay == std::chrono::seconds(2),
                             "reconnect scheduling recorded");
                     const auto errors = guard.events_of<obs::ErrorEvent>();
                     require(!errors.empty() && errors.back().component == "transport",
                             "transport failure recorded");
                   }});
}
