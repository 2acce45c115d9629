#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "clawlink/gateway/controller.hpp"
#include "clawlink/storage/identity_store.hpp"
#include "clawlink/storage/secret_store.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

using clawlink::common::JsonValue;
using namespace clawlink::gateway;
using clawlink::testing::FakeTransport;
using clawlink::testing::FakeTransportState;

struct ControllerHarness {
  clawlink::testing::ManualExecutor executor;
  std::shared_ptr<FakeTransportState> wire = std::make_shared<FakeTransportState>();
  clawlink::storage::InMemorySecretStore secrets;
  clawlink::storage::InMemoryIdentityStore identities;
  std::vector<ConnectionState> connection_states;
  std::vector<PairingState> pairing_states;
  std::vector<std::string> updated_conversations;
  std::vector<GatewayError> gateway_errors;
  std::unique_ptr<Controller> controller;

  explicit ControllerHarness(std::optional<std::string> stored_token = std::nullopt) {
    if (stored_token.has_value()) {
      clawlink::tests::require(secrets
                                   .set_string(clawlink::storage::NODE_TOKEN_SERVICE,
                                               clawlink::storage::node_token_account("node-1"),
                                               *stored_token)
                                   .ok(),
                               "seed token");
    }
    ControllerOptions options;
    options.url = "ws://gateway.test:18789";
    controller = std::make_unique<Controller>(
        executor, std::make_unique<FakeTransport>(wire), secrets, identities,
        DeviceIdentity{.node_id = "node-1", .display_name = "Phone"}, options,
        ControllerHooks{
            .on_connection_state = [this](const ConnectionState &s) { connection_states.push_back(s); },
            .on_pairing_state = [this](const PairingState &s) { pairing_states.push_back(s); },
            .on_conversation_updated =
                [this](const Conversation &c) { updated_conversations.push_back(c.session_key); },
            .on_gateway_error = [this](const GatewayError &e) { gateway_errors.push_back(e); },
        });
  }

  void connect_and_open() {
    controller->connect();
    executor.run_ready();
    wire->complete_open();
    executor.run_ready();
  }

  std::string request_id(const std::string &method) {
    const auto requests = wire->requests(method);
    clawlink::tests::require(!requests.empty(), "no " + method + " request was sent");
    return requests.back().string_field("id").value_or("");
  }

  void respond(const std::string &method, const JsonValue &result) {
    clawlink::tests::require(wire->deliver(clawlink::testing::response_frame(request_id(method), result)),
                             "no receive outstanding for " + method);
    executor.run_ready();
  }

  void push(const std::string &frame) {
    clawlink::tests::require(wire->deliver(frame), "no receive outstanding");
    executor.run_ready();
  }

  /// Connects a paired device and confirms its token.
  void connect_verified() {
    connect_and_open();
    respond("node.pair.verify", JsonValue::object({{"valid", true}}));
  }
};

std::optional<std::string> header(const clawlink::transport::TransportRequest &request,
                                  const std::string &name) {
  for (const auto &[key, value] : request.headers) {
    if (key == name) {
      return value;
    }
  }
  return std::nullopt;
}

struct Captured {
  std::size_t calls = 0;
  std::optional<RpcResult<JsonValue>> result;
};

RpcCallback capture(std::shared_ptr<Captured> captured) {
  return [captured](RpcResult<JsonValue> result) {
    ++captured->calls;
    captured->result = std::move(result);
  };
}

} // namespace

void register_controller_tests(std::vector<clawlink::tests::TestCase> &tests) {
  using namespace clawlink::gateway;
  using clawlink::tests::require;

  tests.push_back({"controller_connect_sends_identity_headers", [] {
                     ControllerHarness h;
                     h.controller->connect();
                     h.executor.run_ready();
                     require(h.controller->connection_state().kind ==
                                 ConnectionState::Kind::Connecting,
                             "should be connecting");
                     require(h.wire->opens.size() == 1, "one open expected");
                     const auto &request = h.wire->opens.front();
                     require(request.url == "ws://gateway.test:18789", "url mismatch");
                     require(header(request, "X-Client-Type") == std::optional<std::string>("node"),
                             "client type header");
                     require(header(request, "X-Node-Id") == std::optional<std::string>("node-1"),
                             "node id header");
                     require(!header(request, "Authorization").has_value(),
                             "no bearer token while unpaired");

                     h.controller->connect();
                     h.executor.run_ready();
                     require(h.wire->opens.size() == 1, "connect while connecting is a no-op");
                   }});

  tests.push_back({"controller_paired_connect_carries_bearer_and_verifies", [] {
                     ControllerHarness h("tok-1");
                     require(h.controller->pairing_state() == PairingState::paired("tok-1"),
                             "cold start should restore the token");
                     h.connect_and_open();
                     require(h.controller->connection_state().is_connected(), "should be connected");
                     require(header(h.wire->opens.front(), "Authorization") ==
                                 std::optional<std::string>("Bearer tok-1"),
                             "bearer header expected");
                     require(h.wire->requests("node.pair.verify").size() == 1, "verify expected");
                     require(h.wire->requests("node.pair.request").empty(), "no pairing request");

                     h.respond("node.pair.verify", JsonValue::object({{"valid", true}}));
                     require(h.wire->requests("agents.current").size() == 1,
                             "verified device fetches agent info");
                     h.respond("agents.current",
                               JsonValue::object({{"id", "ops"}, {"name", "Ops"}}));
                     require(h.controller->agent_id() == "ops", "agent id should be stored");
                     require(h.controller->agent().has_value() &&
                                 h.controller->agent()->name == std::optional<std::string>("Ops"),
                             "agent name should be stored");
                   }});

  tests.push_back({"controller_pairing_flow_reconnects_with_token", [] {
                     ControllerHarness h;
                     h.connect_and_open();
                     require(h.wire->requests("node.pair.request").size() == 1,
                             "unpaired connect requests pairing");
                     h.respond("node.pair.request",
                               JsonValue::object({{"requestId", "r1"}, {"code", "ABC123"}}));
                     require(h.controller->pairing_state() ==
                                 PairingState::pending_approval("ABC123", "r1"),
                             "should be pending approval");

                     h.executor.advance(std::chrono::seconds(2));
                     h.respond("node.pair.status",
                               JsonValue::object({{"status", "approved"}, {"token", "tok-xyz"}}));
                     require(h.controller->pairing_state() == PairingState::paired("tok-xyz"),
                             "should be paired");
                     const auto stored = h.secrets.get_string(
                         clawlink::storage::NODE_TOKEN_SERVICE,
                         clawlink::storage::node_token_account("node-1"));
                     require(stored.ok() && stored.value() == std::optional<std::string>("tok-xyz"),
                             "token should be stored");

                     require(!h.wire->closes.empty() &&
                                 h.wire->closes.back() == clawlink::transport::CloseCode::Normal,
                             "transport should be closed normally");
                     require(h.wire->opens.size() == 2, "transport should reopen");
                     require(header(h.wire->opens.back(), "Authorization") ==
                                 std::optional<std::string>("Bearer tok-xyz"),
                             "reconnect should authenticate with the new token");
                     h.wire->complete_open();
                     h.executor.run_ready();
                     require(h.wire->requests("node.pair.verify").size() == 1,
                             "reconnected device verifies the token");
                   }});

  tests.push_back({"controller_pushed_approval_completes_pairing", [] {
                     ControllerHarness h;
                     h.connect_and_open();
                     h.respond("node.pair.request",
                               JsonValue::object({{"requestId", "r1"}, {"code", "C"}}));
                     h.push(clawlink::testing::event_frame("pairing:approved", "main",
                                                           JsonValue::object({{"token", "pushed"}})));
                     require(h.controller->pairing_state() == PairingState::paired("pushed"),
                             "pushed approval should pair");
                     require(h.wire->opens.size() == 2, "pushed approval reconnects");
                   }});

  tests.push_back({"controller_disconnect_rejects_pending_calls", [] {
                     ControllerHarness h("tok");
                     h.connect_verified();
                     std::vector<std::shared_ptr<Captured>> outcomes;
                     for (int i = 0; i < 3; ++i) {
                       outcomes.push_back(std::make_shared<Captured>());
                       h.controller->send_message("msg " + std::to_string(i), std::nullopt,
                                                  capture(outcomes.back()));
                     }
                     h.executor.run_ready();
                     require(h.controller->pending_requests() >= 3, "sends should be pending");

                     h.controller->disconnect();
                     h.executor.run_ready();
                     require(h.controller->pending_requests() == 0, "pending map should be empty");
                     require(h.controller->connection_state() == ConnectionState::disconnected(),
                             "should be disconnected");
                     for (const auto &outcome : outcomes) {
                       require(outcome->calls == 1, "each call observes one outcome");
                       require(outcome->result->error().kind == RpcError::Kind::ConnectionClosed,
                               "expected connection closed");
                     }
                     h.executor.advance(std::chrono::seconds(60));
                     for (const auto &outcome : outcomes) {
                       require(outcome->calls == 1, "no timeout after rejection");
                     }
                   }});

  tests.push_back({"controller_send_requires_pairing_and_connection", [] {
                     ControllerHarness unpaired;
                     unpaired.connect_and_open();
                     auto not_paired = std::make_shared<Captured>();
                     unpaired.controller->send_message("hi", std::nullopt, capture(not_paired));
                     unpaired.executor.run_ready();
                     require(not_paired->calls == 1 && !not_paired->result->ok(), "send should fail");
                     require(not_paired->result->error().message == "Not paired", "Not paired expected");
                     require(unpaired.controller->conversations().conversations.empty(),
                             "no message appended when not paired");

                     ControllerHarness offline("tok");
                     auto not_connected = std::make_shared<Captured>();
                     offline.controller->send_message("hi", std::nullopt, capture(not_connected));
                     offline.executor.run_ready();
                     require(not_connected->result->error().message == "Not connected",
                             "Not connected expected");
                     require(not_connected->result->error().kind == RpcError::Kind::NotReady,
                             "not ready kind");
                   }});

  tests.push_back({"controller_send_appends_user_message_first", [] {
                     ControllerHarness h("tok");
                     h.connect_verified();
                     auto outcome = std::make_shared<Captured>();
                     h.controller->send_message("hello there", std::nullopt, capture(outcome));
                     h.executor.run_ready();

                     const std::string key = default_session_key("main", "node-1");
                     const auto &conversations = h.controller->conversations().conversations;
                     require(conversations.count(key) == 1, "default session conversation expected");
                     const auto &message = conversations.at(key).messages.back();
                     require(message.role == MessageRole::User, "user message expected");
                     require(message.content == "hello there", "content mismatch");

                     const auto sends = h.wire->requests("chat.send");
                     require(sends.size() == 1, "chat.send expected");
                     const auto *params = sends.front().find("params");
                     require(params->string_field("sessionKey") == key, "session key mismatch");
                     require(params->string_field("agentId") == "main", "agent id mismatch");
                     const auto *auth = params->find("auth");
                     require(auth != nullptr && auth->string_field("token") == "tok", "auth token");
                     const auto *content = params->find("content");
                     require(content != nullptr && content->as_array() != nullptr &&
                                 content->as_array()->front().string_field("text") == "hello there",
                             "text content mismatch");

                     require(h.wire->deliver(clawlink::testing::error_frame(
                                 sends.front().string_field("id").value_or(""), 500, "agent busy")),
                             "deliver error");
                     h.executor.run_ready();
                     require(outcome->calls == 1 && !outcome->result->ok(), "send should fail");
                     require(outcome->result->error().code == 500, "code propagated");
                     require(conversations.at(key).messages.size() == 1,
                             "failed send keeps the local message");
                   }});

  tests.push_back({"controller_send_location_attaches_share", [] {
                     ControllerHarness h("tok");
                     h.connect_verified();
                     LocationShare share;
                     share.latitude = 37.77;
                     share.longitude = -122.42;
                     share.timestamp = Clock::now();
                     share.ttl = std::chrono::seconds(600);
                     h.controller->send_location(share, std::string("agent:main:custom"));
                     h.executor.run_ready();

                     const auto &conversation =
                         h.controller->conversations().conversations.at("agent:main:custom");
                     require(conversation.messages.back().location.has_value(),
                             "location should be attached to the message");
                     const auto sends = h.wire->requests("chat.send");
                     require(sends.size() == 1, "chat.send expected");
                     const auto &part = sends.front().find("params")->find("content")->as_array()->front();
                     require(part.string_field("type") == "location", "location part");
                     require(part.number_field("latitude") == 37.77, "latitude");
                     require(part.number_field("accuracy") == 0.0, "missing accuracy sent as 0");
                     require(part.int_field("ttl") == 600, "ttl in seconds");
                   }});

  tests.push_back({"controller_events_flow_through_reducer", [] {
                     ControllerHarness h("tok");
                     h.connect_verified();
                     h.push(clawlink::testing::event_frame(
                         "assistant:delta", "s1", JsonValue::object({{"messageId", "m1"}, {"text", "Hel"}})));
                     h.push("not json at all");
                     h.push(clawlink::testing::event_frame(
                         "assistant:delta", "s1", JsonValue::object({{"messageId", "m1"}, {"text", "lo"}})));
                     h.push(clawlink::testing::event_frame("stream:end", "s1", JsonValue::object({})));
                     h.push(clawlink::testing::event_frame(
                         "error", "s1", JsonValue::object({{"code", "rate"}, {"message", "slow"}})));

                     const auto &conversation = h.controller->conversations().conversations.at("s1");
                     require(conversation.messages.back().content == "Hello", "content mismatch");
                     require(!conversation.messages.back().is_streaming, "stream should be closed");
                     require(h.updated_conversations.size() == 3, "three conversation updates");
                     require(h.gateway_errors.size() == 1 && h.gateway_errors.front().code == "rate",
                             "gateway error forwarded");
                     require(h.wire->pending_receive.has_value(), "receive loop stays armed");
                   }});

  tests.push_back({"controller_stale_receive_is_ignored_after_disconnect", [] {
                     ControllerHarness h("tok");
                     h.connect_verified();
                     auto stale = *h.wire->pending_receive;
                     const auto receives = h.wire->receive_calls;
                     h.controller->disconnect();
                     h.executor.run_ready();

                     stale(clawlink::common::Result<std::string>::success(clawlink::testing::event_frame(
                         "assistant:delta", "s1", JsonValue::object({{"messageId", "m"}, {"text", "x"}}))));
                     h.executor.run_ready();
                     require(h.controller->conversations().conversations.empty(),
                             "stale frames must not be reduced");
                     require(h.wire->receive_calls == receives, "receive must not re-arm");
                   }});

  tests.push_back({"controller_receive_error_schedules_reconnect", [] {
                     ControllerHarness h("tok");
                     h.connect_verified();
                     require(h.wire->fail_receive("connection reset"), "fail receive");
                     h.executor.run_ready();
                     require(h.controller->connection_state() == ConnectionState::reconnecting(1),
                             "should be reconnecting");
                     require(h.connection_states.size() >= 2 &&
                                 h.connection_states[h.connection_states.size() - 2] ==
                                     ConnectionState::failed("connection reset"),
                             "failure should be reported before reconnecting");
                     require(h.controller->pairing_state().is_paired(),
                             "transport errors leave pairing alone");
                     h.executor.advance(std::chrono::seconds(2));
                     require(h.wire->opens.size() == 2, "reconnect after 2s");
                   }});

  tests.push_back({"controller_link_drop_during_pairing_request_keeps_pairing_state", [] {
                     ControllerHarness h;
                     h.connect_and_open();
                     require(h.wire->requests("node.pair.request").size() == 1,
                             "pairing request in flight");
                     require(h.wire->fail_receive("connection reset"), "fail receive");
                     h.executor.run_ready();
                     require(h.controller->connection_state() == ConnectionState::reconnecting(1),
                             "should be reconnecting");
                     require(h.controller->pairing_state() == PairingState::unpaired(),
                             "a dropped link is not a pairing failure");
                     for (const auto &state : h.pairing_states) {
                       require(state.kind != PairingState::Kind::Failed,
                               "no failed pairing state should be published");
                     }

                     h.executor.advance(std::chrono::seconds(2));
                     require(h.wire->opens.size() == 2, "reconnect after 2s");
                     h.wire->complete_open();
                     h.executor.run_ready();
                     require(h.wire->requests("node.pair.request").size() == 2,
                             "the reopened link asks for pairing again");
                   }});

  tests.push_back({"controller_reconnect_backoff_then_gives_up", [] {
                     ControllerHarness h;
                     h.controller->connect();
                     h.executor.run_ready();
                     h.wire->complete_open(clawlink::common::Status::error("refused"));
                     h.executor.run_ready();

                     const std::vector<std::chrono::milliseconds> expected{
                         std::chrono::seconds(2), std::chrono::seconds(4), std::chrono::seconds(8),
                         std::chrono::seconds(16), std::chrono::seconds(30)};
                     for (std::size_t i = 0; i < expected.size(); ++i) {
                       require(h.executor.scheduled_delays().size() == i + 1,
                               "one reconnect should be scheduled per failure");
                       require(h.executor.scheduled_delays().back() == expected[i],
                               "unexpected backoff delay");
                       require(h.controller->connection_state() ==
                                   ConnectionState::reconnecting(static_cast<std::uint32_t>(i + 1)),
                               "reconnect attempt mismatch");
                       h.executor.advance(expected[i]);
                       h.wire->complete_open(clawlink::common::Status::error("refused"));
                       h.executor.run_ready();
                     }
                     require(h.controller->connection_state() ==
                                 ConnectionState::failed("Max reconnection attempts exceeded"),
                             "sixth failure should be terminal");
                     require(h.executor.pending_timers() == 0, "nothing further scheduled");
                     require(h.executor.scheduled_delays().size() == 5, "exactly five delays");

                     h.controller->connect();
                     h.executor.run_ready();
                     require(h.controller->connection_state().kind ==
                                 ConnectionState::Kind::Connecting,
                             "user connect escapes the terminal state");
                     h.wire->complete_open();
                     h.executor.run_ready();
                     require(h.controller->reconnect_attempts() == 0, "attempts reset on success");
                   }});

  tests.push_back({"controller_verify_error_is_a_connection_failure", [] {
                     ControllerHarness h("tok");
                     h.connect_and_open();
                     require(h.wire->deliver(clawlink::testing::error_frame(
                                 h.request_id("node.pair.verify"), 503, "unavailable")),
                             "deliver");
                     h.executor.run_ready();
                     require(h.controller->connection_state().kind ==
                                 ConnectionState::Kind::Reconnecting,
                             "verify failure should reconnect");
                     require(h.controller->pairing_state() == PairingState::paired("tok"),
                             "pairing state untouched");
                   }});

  tests.push_back({"controller_reset_pairing_forgets_token", [] {
                     ControllerHarness h("tok");
                     h.connect_verified();
                     h.controller->reset_pairing();
                     h.executor.run_ready();
                     require(h.controller->pairing_state() == PairingState::unpaired(), "unpaired");
                     require(h.controller->connection_state() == ConnectionState::disconnected(),
                             "reset disconnects");
                     const auto stored = h.secrets.get_string(
                         clawlink::storage::NODE_TOKEN_SERVICE,
                         clawlink::storage::node_token_account("node-1"));
                     require(stored.ok() && !stored.value().has_value(), "token removed");
                     require(!h.controller->identity().pairing_token.has_value(),
                             "identity token cleared");
                   }});

  tests.push_back({"controller_history_maps_and_drops_records", [] {
                     ControllerHarness h("tok");
                     h.connect_verified();
                     std::optional<RpcResult<std::vector<Message>>> received;
                     h.controller->fetch_history("s1", 10, [&received](RpcResult<std::vector<Message>> r) {
                       received = std::move(r);
                     });
                     h.executor.run_ready();
                     const auto requests = h.wire->requests("chat.history");
                     require(requests.size() == 1, "chat.history expected");
                     require(requests.front().find("params")->int_field("limit") == 10, "limit");

                     const auto result = clawlink::common::parse_json(R"({"messages":[
                       {"id":"a","role":"user","content":"hi","timestamp":1700000000000},
                       {"role":"assistant","content":[{"type":"text","text":"he"},{"type":"text","text":"llo"}]},
                       {"id":"c","role":"system","content":"dropped"},
                       {"id":"d","role":"user"},
                       42
                     ]})");
                     h.respond("chat.history", result.value());
                     require(received.has_value() && received->ok(), "history should succeed");
                     const auto &messages = received->value();
                     require(messages.size() == 2, "malformed records are dropped");
                     require(messages[0].id == "a" && messages[0].content == "hi", "first record");
                     require(to_epoch_ms(messages[0].timestamp) == 1700000000000LL, "timestamp");
                     require(messages[1].role == MessageRole::Assistant, "second role");
                     require(messages[1].content == "hello", "text parts are joined");
                     require(!messages[1].id.empty(), "missing id is generated");
                     require(h.controller->conversations().conversations.count("s1") == 0,
                             "history is not merged");
                   }});
}
