#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "clawlink/gateway/protocol.hpp"
#include "clawlink/gateway/rpc.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

using clawlink::common::JsonValue;
using clawlink::gateway::ResponseFrame;
using clawlink::gateway::RpcCorrelator;
using clawlink::gateway::RpcError;
using clawlink::gateway::RpcResult;

struct Outcome {
  std::size_t calls = 0;
  std::optional<RpcResult<JsonValue>> last;
};

clawlink::gateway::RpcCallback capture(std::shared_ptr<Outcome> outcome) {
  return [outcome](RpcResult<JsonValue> result) {
    ++outcome->calls;
    outcome->last = std::move(result);
  };
}

RpcCorrelator::IdGenerator sequential_ids() {
  auto counter = std::make_shared<int>(0);
  return [counter]() { return "req-" + std::to_string(++*counter); };
}

ResponseFrame ok_response(const std::string &id, JsonValue result) {
  return ResponseFrame{.id = id, .result = std::move(result)};
}

} // namespace

void register_rpc_tests(std::vector<clawlink::tests::TestCase> &tests) {
  using clawlink::tests::require;
  using clawlink::testing::ManualExecutor;

  tests.push_back({"rpc_responses_match_by_id_in_any_order", [] {
                     ManualExecutor executor;
                     RpcCorrelator rpc(executor, std::chrono::seconds(30), sequential_ids());
                     std::vector<std::string> frames;
                     const auto sender = [&frames](const std::string &frame) {
                       frames.push_back(frame);
                       return clawlink::common::Status::success();
                     };

                     std::vector<std::shared_ptr<Outcome>> outcomes;
                     std::vector<std::string> ids;
                     for (int i = 0; i < 5; ++i) {
                       outcomes.push_back(std::make_shared<Outcome>());
                       ids.push_back(rpc.call("echo", JsonValue::object({{"n", i}}), sender,
                                              capture(outcomes.back())));
                     }
                     require(rpc.pending_count() == 5, "five calls should be pending");
                     require(frames.size() == 5, "every call should be sent");

                     for (const int i : {3, 0, 4, 1, 2}) {
                       require(rpc.handle_response(ok_response(ids[i], JsonValue(i))),
                               "response should match a pending call");
                     }
                     for (int i = 0; i < 5; ++i) {
                       require(outcomes[i]->calls == 1, "each call completes exactly once");
                       require(outcomes[i]->last->ok(), "call should succeed");
                       require(outcomes[i]->last->value().as_int() == i,
                               "response delivered to the wrong call");
                     }
                     require(rpc.pending_count() == 0, "pending map should be empty");
                     require(executor.pending_timers() == 0, "timeouts should be cancelled");
                   }});

  tests.push_back({"rpc_request_frame_shape", [] {
                     ManualExecutor executor;
                     RpcCorrelator rpc(executor, std::chrono::seconds(30), sequential_ids());
                     std::string sent;
                     rpc.call("node.pair.status", JsonValue::object({{"requestId", "r1"}}),
                              [&sent](const std::string &frame) {
                                sent = frame;
                                return clawlink::common::Status::success();
                              },
                              {});
                     const auto parsed = clawlink::common::parse_json(sent);
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().string_field("id") == "req-1", "id mismatch");
                     require(parsed.value().string_field("method") == "node.pair.status",
                             "method mismatch");
                     const auto *params = parsed.value().find("params");
                     require(params != nullptr && params->string_field("requestId") == "r1",
                             "params mismatch");
                   }});

  tests.push_back({"rpc_unknown_response_id_is_ignored", [] {
                     ManualExecutor executor;
                     RpcCorrelator rpc(executor, std::chrono::seconds(30), sequential_ids());
                     auto outcome = std::make_shared<Outcome>();
                     rpc.call("x", JsonValue(), [](const std::string &) {
                       return clawlink::common::Status::success();
                     }, capture(outcome));
                     require(!rpc.handle_response(ok_response("nope", JsonValue(1))),
                             "unknown id should not match");
                     require(outcome->calls == 0, "pending call must not complete");
                     require(rpc.pending_count() == 1, "call should remain pending");
                   }});

  tests.push_back({"rpc_protocol_error_carries_code_and_message", [] {
                     ManualExecutor executor;
                     RpcCorrelator rpc(executor, std::chrono::seconds(30), sequential_ids());
                     auto outcome = std::make_shared<Outcome>();
                     const auto id = rpc.call("chat.send", JsonValue(), [](const std::string &) {
                       return clawlink::common::Status::success();
                     }, capture(outcome));
                     rpc.handle_response(ResponseFrame{
                         .id = id,
                         .error = clawlink::gateway::ResponseError{.code = 403, .message = "denied"}});
                     require(outcome->calls == 1, "callback should run once");
                     require(!outcome->last->ok(), "call should fail");
                     require(outcome->last->error().kind == RpcError::Kind::Protocol,
                             "error should be a protocol error");
                     require(outcome->last->error().code == 403, "code mismatch");
                     require(outcome->last->error().message == "denied", "message mismatch");
                   }});

  tests.push_back({"rpc_timeout_wins_and_late_response_is_noop", [] {
                     ManualExecutor executor;
                     RpcCorrelator rpc(executor, std::chrono::seconds(30), sequential_ids());
                     auto outcome = std::make_shared<Outcome>();
                     const auto id = rpc.call("slow", JsonValue(), [](const std::string &) {
                       return clawlink::common::Status::success();
                     }, capture(outcome));

                     executor.advance(std::chrono::milliseconds(29999));
                     require(outcome->calls == 0, "call should not time out early");
                     executor.advance(std::chrono::milliseconds(1));
                     require(outcome->calls == 1, "call should time out at 30s");
                     require(outcome->last->error().kind == RpcError::Kind::Timeout,
                             "expected a timeout");
                     require(outcome->last->error().message == "Request timed out",
                             "timeout message mismatch");
                     require(rpc.pending_count() == 0, "timed out call should be removed");

                     require(!rpc.handle_response(ok_response(id, JsonValue(true))),
                             "late response should not match");
                     require(outcome->calls == 1, "caller must observe exactly one outcome");
                   }});

  tests.push_back({"rpc_response_cancels_timeout", [] {
                     ManualExecutor executor;
                     RpcCorrelator rpc(executor, std::chrono::seconds(30), sequential_ids());
                     auto outcome = std::make_shared<Outcome>();
                     const auto id = rpc.call("fast", JsonValue(), [](const std::string &) {
                       return clawlink::common::Status::success();
                     }, capture(outcome));
                     rpc.handle_response(ok_response(id, JsonValue("done")));
                     executor.advance(std::chrono::seconds(60));
                     require(outcome->calls == 1, "timer must not fire after the response");
                     require(outcome->last->ok(), "call should have succeeded");
                   }});

  tests.push_back({"rpc_reject_all_drains_pending", [] {
                     ManualExecutor executor;
                     RpcCorrelator rpc(executor, std::chrono::seconds(30), sequential_ids());
                     std::vector<std::shared_ptr<Outcome>> outcomes;
                     for (int i = 0; i < 3; ++i) {
                       outcomes.push_back(std::make_shared<Outcome>());
                       rpc.call("x", JsonValue(), [](const std::string &) {
                         return clawlink::common::Status::success();
                       }, capture(outcomes.back()));
                     }
                     rpc.reject_all(RpcError::connection_closed());
                     require(rpc.pending_count() == 0, "pending map should be empty");
                     require(executor.pending_timers() == 0, "timers should be cancelled");
                     for (const auto &outcome : outcomes) {
                       require(outcome->calls == 1, "each call should be rejected once");
                       require(outcome->last->error().kind == RpcError::Kind::ConnectionClosed,
                               "expected connection closed");
                       require(outcome->last->error().message == "Connection closed",
                               "message mismatch");
                     }
                   }});

  tests.push_back({"rpc_send_failure_completes_with_transport_error", [] {
                     ManualExecutor executor;
                     RpcCorrelator rpc(executor, std::chrono::seconds(30), sequential_ids());
                     auto outcome = std::make_shared<Outcome>();
                     rpc.call("x", JsonValue(), [](const std::string &) {
                       return clawlink::common::Status::error("socket not open");
                     }, capture(outcome));
                     require(outcome->calls == 1, "send failure should complete the call");
                     require(outcome->last->error().kind == RpcError::Kind::Transport,
                             "expected a transport error");
                     require(rpc.pending_count() == 0, "failed call should not stay pending");
                     require(executor.pending_timers() == 0, "timer should be cancelled");
                   }});

  tests.push_back({"rpc_fast_response_during_send_is_not_dropped", [] {
                     ManualExecutor executor;
                     RpcCorrelator rpc(executor, std::chrono::seconds(30), sequential_ids());
                     auto outcome = std::make_shared<Outcome>();
                     rpc.call("x", JsonValue(), [&rpc](const std::string &frame) {
                       const auto parsed = clawlink::common::parse_json(frame);
                       const auto id = parsed.value().string_field("id").value_or("");
                       rpc.handle_response(ResponseFrame{.id = id, .result = JsonValue(7)});
                       return clawlink::common::Status::success();
                     }, capture(outcome));
                     require(outcome->calls == 1, "response during send should resolve the call");
                     require(outcome->last->ok() && outcome->last->value().as_int() == 7,
                             "value mismatch");
                   }});

  tests.push_back({"decode_response_distinguishes_events", [] {
                     using clawlink::gateway::decode_response;
                     const auto event = clawlink::common::parse_json(
                         R"({"id":"1","event":"stream:start","result":null})");
                     require(!decode_response(event.value()).has_value(),
                             "frames with an event member are not responses");

                     const auto ok = clawlink::common::parse_json(
                         R"({"id":"1","result":{"a":1},"error":null})");
                     const auto decoded = decode_response(ok.value());
                     require(decoded.has_value() && !decoded->error.has_value(),
                             "null error means success");
                     require(decoded->result.int_field("a") == 1, "result mismatch");

                     const auto failed = clawlink::common::parse_json(
                         R"({"id":"2","result":null,"error":{"code":5}})");
                     const auto decoded_error = decode_response(failed.value());
                     require(decoded_error.has_value() && decoded_error->error.has_value(),
                             "error should be decoded");
                     require(decoded_error->error->message == "Unknown error",
                             "missing message should default");

                     const auto no_id = clawlink::common::parse_json(R"({"result":1})");
                     require(!decode_response(no_id.value()).has_value(),
                             "responses need a string id");
                   }});
}
