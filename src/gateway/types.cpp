#include "clawlink/gateway/types.hpp"

namespace clawlink::gateway {

std::string ConnectionState::describe() const {
  switch (kind) {
  case Kind::Disconnected:
    return "disconnected";
  case Kind::Connecting:
    return "connecting";
  case Kind::Connected:
    return "connected";
  case Kind::Reconnecting:
    return "reconnecting (attempt " + std::to_string(attempt) + ")";
  case Kind::Failed:
    return "failed: " + reason;
  }
  return "unknown";
}

std::string PairingState::describe() const {
  switch (kind) {
  case Kind::Unpaired:
    return "unpaired";
  case Kind::PendingApproval:
    return "pending approval (code " + code + ")";
  case Kind::Paired:
    return "paired";
  case Kind::Failed:
    return "failed: " + reason;
  }
  return "unknown";
}

std::string to_string(const MessageRole role) {
  return role == MessageRole::User ? "user" : "assistant";
}

std::string to_string(const ToolCallStatus status) {
  switch (status) {
  case ToolCallStatus::Running:
    return "running";
  case ToolCallStatus::Completed:
    return "completed";
  case ToolCallStatus::Failed:
    return "failed";
  }
  return "unknown";
}

std::string to_string(const ConversationStatus status) {
  switch (status) {
  case ConversationStatus::Active:
    return "active";
  case ConversationStatus::Streaming:
    return "streaming";
  case ConversationStatus::Completed:
    return "completed";
  case ConversationStatus::Error:
    return "error";
  }
  return "unknown";
}

std::string to_string(const SubAgentStatus status) {
  switch (status) {
  case SubAgentStatus::Running:
    return "running";
  case SubAgentStatus::Completed:
    return "completed";
  case SubAgentStatus::Failed:
    return "failed";
  }
  return "unknown";
}

std::optional<MessageRole> parse_message_role(const std::string &value) {
  if (value == "user") {
    return MessageRole::User;
  }
  if (value == "assistant") {
    return MessageRole::Assistant;
  }
  return std::nullopt;
}

bool is_sub_agent_session(const std::string &session_key) {
  return session_key.find(":subagent:") != std::string::npos;
}

std::string default_session_key(const std::string &agent_id, const std::string &node_id) {
  return "agent:" + agent_id + ":node:dm:" + node_id;
}

std::int64_t to_epoch_ms(const Timestamp value) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(value.time_since_epoch()).count();
}

Timestamp from_epoch_ms(const std::int64_t value) {
  return Timestamp(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(value)));
}

} // namespace clawlink::gateway
