#pragma once

#include "clawlink/common/json.hpp"
#include "clawlink/gateway/types.hpp"

#include <optional>
#include <string>
#include <variant>

namespace clawlink::gateway {

constexpr const char *DEFAULT_SESSION_ID = "main";

struct AssistantDelta {
  std::string session_id;
  std::string message_id;
  std::string text;
};

struct ToolStart {
  std::string session_id;
  std::string tool_id;
  std::string tool_name;
};

struct ToolEnd {
  std::string session_id;
  std::string tool_id;
  std::optional<std::string> result;
};

struct StreamStart {
  std::string session_id;
};

struct StreamEnd {
  std::string session_id;
};

struct PairingApproved {
  std::string token;
};

struct SubAgentAnnounce {
  std::string session_key;
  AnnounceResult result;
};

struct GatewayError {
  std::string code;
  std::string message;
};

using GatewayEvent = std::variant<AssistantDelta, ToolStart, ToolEnd, StreamStart, StreamEnd,
                                  PairingApproved, SubAgentAnnounce, GatewayError>;

/// Maps an `{event, sessionId?, data?}` frame onto the closed event set.
/// Unknown event names and events missing a required field yield nullopt.
[[nodiscard]] std::optional<GatewayEvent> decode_event(const common::JsonValue &frame);

} // namespace clawlink::gateway
