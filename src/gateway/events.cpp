#include "clawlink/gateway/events.hpp"

namespace clawlink::gateway {

namespace {

const common::JsonValue &empty_object() {
  static const common::JsonValue value = common::JsonValue::object({});
  return value;
}

std::string session_of(const common::JsonValue &frame, const common::JsonValue &data) {
  if (auto id = frame.string_field("sessionId"); id.has_value()) {
    return *id;
  }
  return data.string_field("sessionId").value_or(DEFAULT_SESSION_ID);
}

std::optional<std::string> tool_result_of(const common::JsonValue &data) {
  const auto *result = data.find("result");
  if (result == nullptr || result->is_null()) {
    return std::nullopt;
  }
  if (auto text = result->as_string(); text.has_value()) {
    return text;
  }
  return result->dump();
}

AnnounceResult announce_of(const common::JsonValue &data) {
  AnnounceResult out;
  out.status = data.string_field("status").value_or("");
  out.result = data.string_field("result");
  out.notes = data.string_field("notes");
  out.runtime = data.number_field("runtime");
  out.tokens = data.int_field("tokens");
  out.cost = data.number_field("cost");
  return out;
}

std::string error_code_of(const common::JsonValue &data) {
  if (auto code = data.string_field("code"); code.has_value()) {
    return *code;
  }
  if (auto code = data.int_field("code"); code.has_value()) {
    return std::to_string(*code);
  }
  return "unknown";
}

} // namespace

std::optional<GatewayEvent> decode_event(const common::JsonValue &frame) {
  const auto name = frame.string_field("event");
  if (!name.has_value()) {
    return std::nullopt;
  }
  const common::JsonValue *data_ptr = frame.find("data");
  const common::JsonValue &data =
      (data_ptr != nullptr && data_ptr->is_object()) ? *data_ptr : empty_object();

  if (*name == "assistant:delta" || *name == "assistant") {
    auto text = data.string_field("text");
    auto message_id = data.string_field("messageId");
    if (!text.has_value() || !message_id.has_value()) {
      return std::nullopt;
    }
    return AssistantDelta{.session_id = session_of(frame, data),
                          .message_id = std::move(*message_id),
                          .text = std::move(*text)};
  }

  if (*name == "tool:start") {
    auto tool_id = data.string_field("toolCallId");
    auto tool_name = data.string_field("toolName");
    if (!tool_id.has_value() || !tool_name.has_value()) {
      return std::nullopt;
    }
    return ToolStart{.session_id = session_of(frame, data),
                     .tool_id = std::move(*tool_id),
                     .tool_name = std::move(*tool_name)};
  }

  if (*name == "tool:end") {
    auto tool_id = data.string_field("toolCallId");
    if (!tool_id.has_value()) {
      return std::nullopt;
    }
    return ToolEnd{.session_id = session_of(frame, data),
                   .tool_id = std::move(*tool_id),
                   .result = tool_result_of(data)};
  }

  if (*name == "stream:start") {
    return StreamStart{.session_id = session_of(frame, data)};
  }

  if (*name == "stream:end") {
    return StreamEnd{.session_id = session_of(frame, data)};
  }

  if (*name == "pairing:approved") {
    auto token = data.string_field("token");
    if (!token.has_value() || token->empty()) {
      return std::nullopt;
    }
    return PairingApproved{.token = std::move(*token)};
  }

  if (*name == "subagent:announce") {
    auto session_key = data.string_field("sessionKey");
    if (!session_key.has_value()) {
      return std::nullopt;
    }
    return SubAgentAnnounce{.session_key = std::move(*session_key), .result = announce_of(data)};
  }

  if (*name == "error") {
    return GatewayError{.code = error_code_of(data),
                        .message = data.string_field("message").value_or("Unknown error")};
  }

  return std::nullopt;
}

} // namespace clawlink::gateway
