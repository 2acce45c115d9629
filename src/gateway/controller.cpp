#include "clawlink/gateway/controller.hpp"

#include "clawlink/common/uuid.hpp"
#include "clawlink/gateway/protocol.hpp"
#include "clawlink/observability/global.hpp"

#include <algorithm>

namespace clawlink::gateway {

namespace {

common::JsonValue text_content(const std::string &text) {
  return common::JsonValue::array({common::JsonValue::object({
      {"type", "text"},
      {"text", text},
  })});
}

common::JsonValue location_content(const LocationShare &location) {
  return common::JsonValue::array({common::JsonValue::object({
      {"type", "location"},
      {"latitude", location.latitude},
      {"longitude", location.longitude},
      {"accuracy", location.accuracy.value_or(0.0)},
      {"ttl", static_cast<std::int64_t>(location.ttl.count())},
  })});
}

std::optional<std::string> history_content(const common::JsonValue &content) {
  if (content.is_string()) {
    return content.as_string();
  }
  const auto *parts = content.as_array();
  if (parts == nullptr) {
    return std::nullopt;
  }
  std::string text;
  for (const auto &part : *parts) {
    if (part.string_field("type").value_or("text") != "text") {
      continue;
    }
    if (const auto fragment = part.string_field("text"); fragment.has_value()) {
      text += *fragment;
    }
  }
  return text;
}

void complete(const RpcCallback &callback, RpcResult<common::JsonValue> result) {
  if (callback) {
    callback(std::move(result));
  }
}

} // namespace

std::optional<Message> history_record_to_message(const common::JsonValue &record,
                                                 const std::string &session_key,
                                                 const Timestamp now) {
  if (!record.is_object()) {
    return std::nullopt;
  }
  const auto role_name = record.string_field("role");
  if (!role_name.has_value()) {
    return std::nullopt;
  }
  const auto role = parse_message_role(*role_name);
  if (!role.has_value()) {
    return std::nullopt;
  }
  const auto *content_value = record.find("content");
  if (content_value == nullptr) {
    return std::nullopt;
  }
  auto content = history_content(*content_value);
  if (!content.has_value()) {
    return std::nullopt;
  }

  Message message;
  message.id = record.string_field("id").value_or("");
  if (message.id.empty()) {
    message.id = common::generate_uuid();
  }
  message.conversation_id = session_key;
  message.role = *role;
  message.content = std::move(*content);
  const auto timestamp = record.int_field("timestamp");
  message.timestamp = timestamp.has_value() ? from_epoch_ms(*timestamp) : now;
  return message;
}

Controller::Controller(runtime::IExecutor &executor,
                       std::unique_ptr<transport::ITransport> transport,
                       storage::ISecretStore &secrets, storage::IIdentityStore &identities,
                       DeviceIdentity identity, ControllerOptions options, ControllerHooks hooks)
    : executor_(executor), transport_(std::move(transport)),
      identity_(std::move(identity)), options_(std::move(options)), hooks_(std::move(hooks)),
      rpc_(executor, options_.request_timeout),
      pairing_(executor, secrets, identities, identity_, options_.pairing,
               [this](const std::string &method, const common::JsonValue &params,
                      RpcCallback callback) { invoke(method, params, std::move(callback)); },
               PairingCoordinator::Hooks{
                   .on_state_changed =
                       [this](const PairingState &state) {
                         if (hooks_.on_pairing_state) {
                           hooks_.on_pairing_state(state);
                         }
                       },
                   .on_approved =
                       [this]() {
                         // Reconnect so the transport carries the new bearer token.
                         post_guarded([this]() {
                           do_disconnect();
                           do_connect(false);
                         });
                       },
                   .on_verified = [this]() { fetch_agent_info(); },
                   .on_verify_error =
                       [this](const RpcError &error) {
                         if (error.kind == RpcError::Kind::ConnectionClosed) {
                           return;
                         }
                         const std::uint64_t epoch = epoch_;
                         post_guarded([this, epoch, message = error.message]() {
                           if (epoch == epoch_ && connection_.is_connected()) {
                             handle_transport_failure("Pairing verification failed: " + message);
                           }
                         });
                       },
               }),
      reconnect_(options_.reconnect_max_attempts, options_.reconnect_max_delay) {
  pairing_.restore();
}

Controller::~Controller() {
  cancel_reconnect();
  pairing_.stop_polling();
  // Joins the transport's I/O thread, so no callback can reach `this` afterwards.
  transport_->close(transport::CloseCode::GoingAway, "Client shutting down");
  alive_.reset();
}

runtime::Task Controller::guarded(runtime::Task task) {
  return [alive = std::weak_ptr<bool>(alive_), task = std::move(task)]() {
    if (alive.lock()) {
      task();
    }
  };
}

void Controller::post_guarded(runtime::Task task) { executor_.post(guarded(std::move(task))); }

void Controller::connect() {
  post_guarded([this]() { do_connect(true); });
}

void Controller::disconnect() {
  post_guarded([this]() { do_disconnect(); });
}

void Controller::reset_pairing() {
  post_guarded([this]() {
    if (const auto status = pairing_.reset(); !status.ok()) {
      observability::record_error("controller", status.error());
    }
    do_disconnect();
  });
}

void Controller::do_connect(const bool user_initiated) {
  if (connection_.kind == ConnectionState::Kind::Connecting || connection_.is_connected()) {
    return;
  }
  if (user_initiated) {
    cancel_reconnect();
    reconnect_.reset();
  }

  ++epoch_;
  receiving_ = false;
  set_connection_state(ConnectionState::connecting());

  const std::uint64_t epoch = epoch_;
  transport_->open(build_request(),
                   [this, epoch, alive = std::weak_ptr<bool>(alive_)](common::Status status) {
                     executor_.post([this, epoch, alive, status = std::move(status)]() {
                       if (alive.lock()) {
                         on_open(epoch, status);
                       }
                     });
                   });
}

void Controller::do_disconnect() {
  ++epoch_;
  receiving_ = false;
  cancel_reconnect();
  pairing_.stop_polling();
  rpc_.reject_all(RpcError::connection_closed());
  transport_->close(transport::CloseCode::Normal, "Client disconnect");
  set_connection_state(ConnectionState::disconnected());
}

void Controller::on_open(const std::uint64_t epoch, const common::Status &status) {
  if (epoch != epoch_ || connection_.kind != ConnectionState::Kind::Connecting) {
    return;
  }
  if (!status.ok()) {
    handle_transport_failure(status.error());
    return;
  }

  // Connected means the stream is open, not that the device is authenticated.
  set_connection_state(ConnectionState::connected());
  reconnect_.reset();
  arm_receive();

  post_guarded([this, epoch]() {
    if (epoch != epoch_ || !connection_.is_connected()) {
      return;
    }
    if (pairing_.state().is_paired()) {
      pairing_.verify_pairing();
    } else {
      pairing_.request_pairing();
    }
  });
}

void Controller::arm_receive() {
  if (receiving_ || !connection_.is_connected()) {
    return;
  }
  receiving_ = true;
  const std::uint64_t epoch = epoch_;
  transport_->receive([this, epoch, alive = std::weak_ptr<bool>(alive_)](
                          common::Result<std::string> frame) {
    executor_.post([this, epoch, alive, frame = std::move(frame)]() {
      if (alive.lock()) {
        on_frame(epoch, frame);
      }
    });
  });
}

void Controller::on_frame(const std::uint64_t epoch, const common::Result<std::string> &frame) {
  if (epoch != epoch_) {
    return;
  }
  receiving_ = false;
  if (!frame.ok()) {
    if (connection_.is_connected()) {
      handle_transport_failure(frame.error());
    }
    return;
  }

  dispatch_frame(frame.value());
  // The frame may have led to a disconnect; arm_receive() checks the state.
  if (epoch == epoch_) {
    arm_receive();
  }
}

void Controller::dispatch_frame(const std::string &text) {
  const auto parsed = common::parse_json(text);
  if (!parsed.ok() || !parsed.value().is_object()) {
    observability::record_error("controller", "Dropping unreadable frame");
    return;
  }
  const auto &json = parsed.value();

  if (const auto response = decode_response(json); response.has_value()) {
    rpc_.handle_response(*response);
    return;
  }
  if (const auto event = decode_event(json); event.has_value()) {
    handle_event(*event);
  }
}

void Controller::handle_event(const GatewayEvent &event) {
  if (const auto *approved = std::get_if<PairingApproved>(&event); approved != nullptr) {
    pairing_.complete_approval(approved->token);
    return;
  }
  if (const auto *error = std::get_if<GatewayError>(&event); error != nullptr) {
    observability::record_gateway_error(error->code, error->message);
    if (hooks_.on_gateway_error) {
      hooks_.on_gateway_error(*error);
    }
    return;
  }
  notify(apply_event(conversations_, event, reducer_context()));
}

void Controller::handle_transport_failure(const std::string &reason) {
  ++epoch_;
  receiving_ = false;
  pairing_.stop_polling();
  rpc_.reject_all(RpcError::connection_closed());
  transport_->close(transport::CloseCode::GoingAway, reason);
  observability::record_error("transport", reason);
  set_connection_state(ConnectionState::failed(reason));
  schedule_reconnect();
}

void Controller::schedule_reconnect() {
  cancel_reconnect();
  const auto decision = reconnect_.next();
  if (decision.give_up) {
    set_connection_state(ConnectionState::failed(MAX_RECONNECT_MESSAGE));
    return;
  }

  observability::record_reconnect_scheduled(decision.attempt, decision.delay);
  set_connection_state(ConnectionState::reconnecting(decision.attempt));
  reconnect_timer_ = executor_.post_after(
      std::chrono::duration_cast<std::chrono::milliseconds>(decision.delay), guarded([this]() {
        reconnect_timer_.reset();
        do_connect(false);
      }));
}

void Controller::cancel_reconnect() {
  if (reconnect_timer_.has_value()) {
    executor_.cancel(*reconnect_timer_);
    reconnect_timer_.reset();
  }
}

void Controller::set_connection_state(ConnectionState state) {
  if (state == connection_) {
    return;
  }
  connection_ = std::move(state);
  observability::record_connection_state(connection_.describe());
  if (hooks_.on_connection_state) {
    hooks_.on_connection_state(connection_);
  }
}

void Controller::fetch_agent_info() {
  invoke("agents.current", common::JsonValue::object({{"nodeId", identity_.node_id}}),
         [this](const RpcResult<common::JsonValue> &result) {
           if (!result.ok()) {
             observability::record_error("controller",
                                         "agents.current failed: " + result.error().message);
             return;
           }
           const common::JsonValue *payload = result.value().find("agent");
           if (payload == nullptr || !payload->is_object()) {
             payload = &result.value();
           }
           const auto id = payload->string_field("id");
           if (!id.has_value() || id->empty()) {
             observability::record_error("controller", "agents.current returned no agent id");
             return;
           }
           agent_ = AgentInfo{.id = *id,
                              .name = payload->string_field("name"),
                              .workspace = payload->string_field("workspace")};
           agent_id_ = *id;
         });
}

void Controller::notify(const ReduceOutcome &outcome) {
  if (outcome.conversation.has_value()) {
    const auto it = conversations_.conversations.find(*outcome.conversation);
    if (it != conversations_.conversations.end() && hooks_.on_conversation_updated) {
      hooks_.on_conversation_updated(it->second);
    }
    observability::record_metric(observability::ConversationCountMetric{
        .count = static_cast<std::uint64_t>(conversations_.conversations.size())});
  }
  for (const auto &key : outcome.sub_agents) {
    const auto it = std::find_if(conversations_.sub_agents.begin(), conversations_.sub_agents.end(),
                                 [&](const SubAgentInfo &info) { return info.session_key == key; });
    if (it != conversations_.sub_agents.end() && hooks_.on_sub_agent_updated) {
      hooks_.on_sub_agent_updated(*it);
    }
  }
}

void Controller::invoke(const std::string &method, const common::JsonValue &params,
                        RpcCallback callback) {
  if (!callback) {
    callback = [](const RpcResult<common::JsonValue> &) {};
  }
  rpc_.call(
      method, params, [this](const std::string &frame) { return transport_->send_text(frame); },
      std::move(callback));
}

bool Controller::ready_to_chat(const RpcCallback &callback) const {
  if (!pairing_.state().is_paired()) {
    complete(callback,
             RpcResult<common::JsonValue>::failure(RpcError::not_ready(NOT_PAIRED_MESSAGE)));
    return false;
  }
  if (!connection_.is_connected()) {
    complete(callback,
             RpcResult<common::JsonValue>::failure(RpcError::not_ready(NOT_CONNECTED_MESSAGE)));
    return false;
  }
  return true;
}

void Controller::send_chat(const std::string &session_key, common::JsonValue content,
                           RpcCallback callback) {
  auto params = common::JsonValue::object({
      {"auth", common::JsonValue::object({
                   {"nodeId", identity_.node_id},
                   {"token", pairing_.state().token},
               })},
      {"agentId", agent_id_},
      {"sessionKey", session_key},
      {"content", std::move(content)},
  });
  invoke("chat.send", params, std::move(callback));
}

void Controller::send_message(std::string text, std::optional<std::string> session_key,
                              RpcCallback callback) {
  post_guarded([this, text = std::move(text), session_key = std::move(session_key),
                callback = std::move(callback)]() {
    if (!ready_to_chat(callback)) {
      return;
    }
    const std::string key = resolve_session_key(session_key);
    const auto context = reducer_context();
    append_message(conversations_, key,
                   Message{.id = common::generate_uuid(),
                           .role = MessageRole::User,
                           .content = text,
                           .timestamp = context.now},
                   context);
    notify(ReduceOutcome{.conversation = key});
    send_chat(key, text_content(text), callback);
  });
}

void Controller::send_location(LocationShare location, std::optional<std::string> session_key,
                               RpcCallback callback) {
  post_guarded([this, location = std::move(location), session_key = std::move(session_key),
                callback = std::move(callback)]() {
    if (!ready_to_chat(callback)) {
      return;
    }
    const std::string key = resolve_session_key(session_key);
    const auto context = reducer_context();
    append_message(conversations_, key,
                   Message{.id = common::generate_uuid(),
                           .role = MessageRole::User,
                           .timestamp = context.now,
                           .location = location},
                   context);
    notify(ReduceOutcome{.conversation = key});
    send_chat(key, location_content(location), callback);
  });
}

void Controller::fetch_history(std::string session_key, const std::uint32_t limit,
                               HistoryCallback callback) {
  post_guarded([this, session_key = std::move(session_key), limit,
                callback = std::move(callback)]() {
    const auto fail = [&callback](RpcError error) {
      if (callback) {
        callback(RpcResult<std::vector<Message>>::failure(std::move(error)));
      }
    };
    if (!pairing_.state().is_paired()) {
      fail(RpcError::not_ready(NOT_PAIRED_MESSAGE));
      return;
    }
    if (!connection_.is_connected()) {
      fail(RpcError::not_ready(NOT_CONNECTED_MESSAGE));
      return;
    }

    auto params = common::JsonValue::object({
        {"auth", common::JsonValue::object({
                     {"nodeId", identity_.node_id},
                     {"token", pairing_.state().token},
                 })},
        {"sessionKey", session_key},
        {"limit", static_cast<std::int64_t>(limit)},
    });
    invoke("chat.history", params,
           [session_key, callback](const RpcResult<common::JsonValue> &result) {
             if (!callback) {
               return;
             }
             if (!result.ok()) {
               callback(RpcResult<std::vector<Message>>::failure(result.error()));
               return;
             }
             const common::JsonValue::Array *records = result.value().as_array();
             if (records == nullptr) {
               if (const auto *messages = result.value().find("messages"); messages != nullptr) {
                 records = messages->as_array();
               }
             }
             if (records == nullptr) {
               callback(RpcResult<std::vector<Message>>::failure(
                   RpcError::malformed("chat.history returned no message list")));
               return;
             }

             const auto now = Clock::now();
             std::vector<Message> messages;
             messages.reserve(records->size());
             for (const auto &record : *records) {
               if (auto message = history_record_to_message(record, session_key, now);
                   message.has_value()) {
                 messages.push_back(std::move(*message));
               }
             }
             callback(RpcResult<std::vector<Message>>::success(std::move(messages)));
           });
  });
}

std::string Controller::resolve_session_key(const std::optional<std::string> &key) const {
  if (key.has_value() && !key->empty()) {
    return *key;
  }
  return default_session_key(agent_id_, identity_.node_id);
}

transport::TransportRequest Controller::build_request() const {
  transport::TransportRequest request;
  request.url = options_.url;
  request.tls_verify = options_.tls_verify;
  request.headers.emplace_back("X-Client-Type", options_.client_type);
  request.headers.emplace_back("X-Node-Id", identity_.node_id);
  if (pairing_.state().is_paired()) {
    request.headers.emplace_back("Authorization", "Bearer " + pairing_.state().token);
  }
  return request;
}

ReducerContext Controller::reducer_context() const {
  return ReducerContext{.agent_id = agent_id_, .now = Clock::now()};
}

} // namespace clawlink::gateway
