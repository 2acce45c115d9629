#pragma once

#include "clawlink/common/json.hpp"
#include "clawlink/gateway/events.hpp"
#include "clawlink/gateway/pairing.hpp"
#include "clawlink/gateway/reconnect.hpp"
#include "clawlink/gateway/reducer.hpp"
#include "clawlink/gateway/rpc.hpp"
#include "clawlink/gateway/types.hpp"
#include "clawlink/runtime/executor.hpp"
#include "clawlink/storage/identity_store.hpp"
#include "clawlink/storage/secret_store.hpp"
#include "clawlink/transport/transport.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace clawlink::gateway {

struct ControllerOptions {
  std::string url;
  std::string client_type = "node";
  bool tls_verify = true;
  std::chrono::milliseconds request_timeout{30000};
  PairingOptions pairing;
  std::uint32_t reconnect_max_attempts = 5;
  std::chrono::seconds reconnect_max_delay{30};
};

/// Optional observers, always invoked on the executor.
struct ControllerHooks {
  std::function<void(const ConnectionState &)> on_connection_state;
  std::function<void(const PairingState &)> on_pairing_state;
  std::function<void(const Conversation &)> on_conversation_updated;
  std::function<void(const SubAgentInfo &)> on_sub_agent_updated;
  std::function<void(const GatewayError &)> on_gateway_error;
};

using HistoryCallback = std::function<void(RpcResult<std::vector<Message>>)>;

/// Owns one gateway connection: transport lifecycle, pairing, RPC correlation,
/// event reduction and reconnection.
///
/// Public operations may be called from any thread; they only post work to the
/// executor, where every piece of state lives. The state accessors must be
/// called on the executor. The executor must outlive the controller, and the
/// controller must not be destroyed while one of its tasks runs.
class Controller {
public:
  Controller(runtime::IExecutor &executor, std::unique_ptr<transport::ITransport> transport,
             storage::ISecretStore &secrets, storage::IIdentityStore &identities,
             DeviceIdentity identity, ControllerOptions options, ControllerHooks hooks = {});
  ~Controller();

  Controller(const Controller &) = delete;
  Controller &operator=(const Controller &) = delete;

  /// No-op while connecting or connected. Escapes a terminal failure and
  /// restarts the reconnect budget.
  void connect();
  void disconnect();
  /// Forgets the pairing token and disconnects.
  void reset_pairing();

  /// Appends the user message locally, then issues `chat.send`. The message is
  /// kept when the call fails.
  void send_message(std::string text, std::optional<std::string> session_key = std::nullopt,
                    RpcCallback callback = {});
  void send_location(LocationShare location,
                     std::optional<std::string> session_key = std::nullopt,
                     RpcCallback callback = {});
  /// Maps `chat.history` records to messages, dropping malformed ones. The
  /// result is handed back and not merged into the conversation.
  void fetch_history(std::string session_key, std::uint32_t limit, HistoryCallback callback);

  [[nodiscard]] const ConnectionState &connection_state() const { return connection_; }
  [[nodiscard]] const PairingState &pairing_state() const { return pairing_.state(); }
  [[nodiscard]] const DeviceIdentity &identity() const { return identity_; }
  [[nodiscard]] const ConversationState &conversations() const { return conversations_; }
  [[nodiscard]] const std::optional<AgentInfo> &agent() const { return agent_; }
  [[nodiscard]] const std::string &agent_id() const { return agent_id_; }
  [[nodiscard]] std::size_t pending_requests() const { return rpc_.pending_count(); }
  [[nodiscard]] std::uint32_t reconnect_attempts() const { return reconnect_.attempts(); }
  [[nodiscard]] std::string resolve_session_key(const std::optional<std::string> &key) const;

private:
  runtime::Task guarded(runtime::Task task);
  void post_guarded(runtime::Task task);

  void do_connect(bool user_initiated);
  void do_disconnect();
  void on_open(std::uint64_t epoch, const common::Status &status);
  void arm_receive();
  void on_frame(std::uint64_t epoch, const common::Result<std::string> &frame);
  void dispatch_frame(const std::string &text);
  void handle_event(const GatewayEvent &event);
  void handle_transport_failure(const std::string &reason);
  void schedule_reconnect();
  void cancel_reconnect();
  void set_connection_state(ConnectionState state);
  void fetch_agent_info();
  void notify(const ReduceOutcome &outcome);

  void invoke(const std::string &method, const common::JsonValue &params, RpcCallback callback);
  /// Fails `callback` with a not-ready error unless paired and connected.
  [[nodiscard]] bool ready_to_chat(const RpcCallback &callback) const;
  void send_chat(const std::string &session_key, common::JsonValue content, RpcCallback callback);

  [[nodiscard]] transport::TransportRequest build_request() const;
  [[nodiscard]] ReducerContext reducer_context() const;

  runtime::IExecutor &executor_;
  std::unique_ptr<transport::ITransport> transport_;
  DeviceIdentity identity_;
  ControllerOptions options_;
  ControllerHooks hooks_;

  // Tasks hold a weak reference so they become no-ops once the controller is gone.
  std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);

  ConnectionState connection_;
  RpcCorrelator rpc_;
  PairingCoordinator pairing_;
  ReconnectPolicy reconnect_;
  ConversationState conversations_;
  std::optional<AgentInfo> agent_;
  std::string agent_id_ = DEFAULT_AGENT_ID;

  // Bumped whenever the current stream is abandoned; stale transport callbacks
  // compare against it.
  std::uint64_t epoch_ = 0;
  bool receiving_ = false;
  std::optional<runtime::TimerId> reconnect_timer_;
};

/// Maps one `chat.history` record to a message; nullopt when malformed.
[[nodiscard]] std::optional<Message> history_record_to_message(const common::JsonValue &record,
                                                               const std::string &session_key,
                                                               Timestamp now);

} // namespace clawlink::gateway
