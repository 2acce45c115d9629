#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace clawlink::gateway {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

constexpr const char *DEFAULT_AGENT_ID = "main";

struct ConnectionState {
  enum class Kind { Disconnected, Connecting, Connected, Reconnecting, Failed };

  Kind kind = Kind::Disconnected;
  std::uint32_t attempt = 0;
  std::string reason;

  static ConnectionState disconnected() { return {}; }
  static ConnectionState connecting() { return {.kind = Kind::Connecting}; }
  static ConnectionState connected() { return {.kind = Kind::Connected}; }
  static ConnectionState reconnecting(std::uint32_t attempt) {
    return {.kind = Kind::Reconnecting, .attempt = attempt};
  }
  static ConnectionState failed(std::string reason) {
    return {.kind = Kind::Failed, .reason = std::move(reason)};
  }

  [[nodiscard]] bool is_connected() const { return kind == Kind::Connected; }
  [[nodiscard]] std::string describe() const;

  bool operator==(const ConnectionState &) const = default;
};

struct PairingState {
  enum class Kind { Unpaired, PendingApproval, Paired, Failed };

  Kind kind = Kind::Unpaired;
  std::string code;
  std::string request_id;
  std::string token;
  std::string reason;

  static PairingState unpaired() { return {}; }
  static PairingState pending_approval(std::string code, std::string request_id) {
    return {.kind = Kind::PendingApproval, .code = std::move(code),
            .request_id = std::move(request_id)};
  }
  static PairingState paired(std::string token) {
    return {.kind = Kind::Paired, .token = std::move(token)};
  }
  static PairingState failed(std::string reason) {
    return {.kind = Kind::Failed, .reason = std::move(reason)};
  }

  [[nodiscard]] bool is_paired() const { return kind == Kind::Paired; }
  [[nodiscard]] bool is_pending() const { return kind == Kind::PendingApproval; }
  [[nodiscard]] std::string describe() const;

  bool operator==(const PairingState &) const = default;
};

struct DeviceIdentity {
  std::string node_id;
  std::string display_name;
  std::optional<std::string> pairing_token;
  std::optional<Timestamp> paired_at;
};

enum class MessageRole { User, Assistant };
enum class ToolCallStatus { Running, Completed, Failed };
enum class ConversationStatus { Active, Streaming, Completed, Error };
enum class SubAgentStatus { Running, Completed, Failed };

struct LocationShare {
  double latitude = 0.0;
  double longitude = 0.0;
  std::optional<double> accuracy;
  Timestamp timestamp{};
  std::chrono::seconds ttl{3600};

  [[nodiscard]] bool is_expired(Timestamp now) const { return now > timestamp + ttl; }
};

struct ToolCall {
  std::string id;
  std::string name;
  ToolCallStatus status = ToolCallStatus::Running;
  std::optional<std::string> result;
  std::optional<std::string> spawned_session_key;
  std::optional<std::string> spawned_label;
};

struct Message {
  std::string id;
  std::string conversation_id;
  MessageRole role = MessageRole::User;
  std::string content;
  Timestamp timestamp{};
  bool is_streaming = false;
  std::optional<std::vector<ToolCall>> tool_calls;
  std::optional<LocationShare> location;
};

struct Conversation {
  std::string id;
  std::string session_key;
  std::string agent_id;
  std::optional<std::string> label;
  bool is_sub_agent = false;
  std::optional<std::string> parent_session_key;
  std::vector<Message> messages;
  Timestamp created_at{};
  Timestamp updated_at{};
  ConversationStatus status = ConversationStatus::Active;
};

struct AnnounceResult {
  std::string status;
  std::optional<std::string> result;
  std::optional<std::string> notes;
  std::optional<double> runtime;
  std::optional<std::int64_t> tokens;
  std::optional<double> cost;
};

struct SubAgentInfo {
  std::string id;
  std::string session_key;
  std::string parent_session_key;
  std::string label;
  std::string task;
  Timestamp spawned_at{};
  SubAgentStatus status = SubAgentStatus::Running;
  std::optional<AnnounceResult> announce_result;
};

struct AgentInfo {
  std::string id;
  std::optional<std::string> name;
  std::optional<std::string> workspace;
};

[[nodiscard]] std::string to_string(MessageRole role);
[[nodiscard]] std::string to_string(ToolCallStatus status);
[[nodiscard]] std::string to_string(ConversationStatus status);
[[nodiscard]] std::string to_string(SubAgentStatus status);
[[nodiscard]] std::optional<MessageRole> parse_message_role(const std::string &value);

[[nodiscard]] bool is_sub_agent_session(const std::string &session_key);

/// Direct-message session key used when a caller does not name a session.
[[nodiscard]] std::string default_session_key(const std::string &agent_id,
                                              const std::string &node_id);

[[nodiscard]] std::int64_t to_epoch_ms(Timestamp value);
[[nodiscard]] Timestamp from_epoch_ms(std::int64_t value);

} // namespace clawlink::gateway
