#include "clawlink/gateway/reducer.hpp"

#include "clawlink/common/json.hpp"

#include <algorithm>
#include <sstream>
#include <type_traits>

namespace clawlink::gateway {

namespace {

std::vector<std::string> split_colon(const std::string &value) {
  std::vector<std::string> parts;
  std::stringstream stream(value);
  std::string part;
  while (std::getline(stream, part, ':')) {
    parts.push_back(part);
  }
  return parts;
}

Conversation *find_conversation(ConversationState &state, const std::string &session_key) {
  const auto it = state.conversations.find(session_key);
  return it == state.conversations.end() ? nullptr : &it->second;
}

SubAgentInfo *find_sub_agent(ConversationState &state, const std::string &session_key) {
  const auto it = std::find_if(state.sub_agents.begin(), state.sub_agents.end(),
                               [&](const SubAgentInfo &info) { return info.session_key == session_key; });
  return it == state.sub_agents.end() ? nullptr : &*it;
}

ToolCall *find_tool_call(Message &message, const std::string &tool_id) {
  if (!message.tool_calls.has_value()) {
    return nullptr;
  }
  auto &calls = *message.tool_calls;
  const auto it = std::find_if(calls.begin(), calls.end(),
                               [&](const ToolCall &call) { return call.id == tool_id; });
  return it == calls.end() ? nullptr : &*it;
}

ReduceOutcome on_delta(ConversationState &state, const AssistantDelta &event,
                       const ReducerContext &context) {
  const bool created = find_conversation(state, event.session_id) == nullptr;
  Conversation &conversation = ensure_conversation(state, event.session_id, context);
  if (created) {
    conversation.status = ConversationStatus::Streaming;
  }

  auto existing = std::find_if(conversation.messages.begin(), conversation.messages.end(),
                               [&](const Message &m) { return m.id == event.message_id; });
  if (existing != conversation.messages.end()) {
    existing->content += event.text;
    conversation.updated_at = context.now;
  } else {
    append_message(state, event.session_id,
                   Message{.id = event.message_id,
                           .conversation_id = conversation.id,
                           .role = MessageRole::Assistant,
                           .content = event.text,
                           .timestamp = context.now,
                           .is_streaming = true},
                   context);
  }
  return ReduceOutcome{.conversation = event.session_id};
}

ReduceOutcome on_tool_start(ConversationState &state, const ToolStart &event,
                            const ReducerContext &context) {
  Conversation *conversation = find_conversation(state, event.session_id);
  if (conversation == nullptr || conversation->messages.empty()) {
    return {};
  }
  Message &last = conversation->messages.back();
  if (last.role != MessageRole::Assistant || find_tool_call(last, event.tool_id) != nullptr) {
    return {};
  }
  if (!last.tool_calls.has_value()) {
    last.tool_calls.emplace();
  }
  last.tool_calls->push_back(ToolCall{.id = event.tool_id, .name = event.tool_name});
  conversation->updated_at = context.now;
  return ReduceOutcome{.conversation = event.session_id};
}

ReduceOutcome on_tool_end(ConversationState &state, const ToolEnd &event,
                          const ReducerContext &context) {
  Conversation *conversation = find_conversation(state, event.session_id);
  if (conversation == nullptr || conversation->messages.empty()) {
    return {};
  }
  ToolCall *call = find_tool_call(conversation->messages.back(), event.tool_id);
  if (call == nullptr) {
    return {};
  }
  call->status = ToolCallStatus::Completed;
  call->result = event.result;
  conversation->updated_at = context.now;

  ReduceOutcome outcome{.conversation = event.session_id};
  if (!event.result.has_value()) {
    return outcome;
  }
  const auto spawned = parse_spawned_subagent(*event.result);
  if (!spawned.has_value()) {
    return outcome;
  }
  call->spawned_session_key = spawned->session_key;
  call->spawned_label = spawned->label;

  if (find_sub_agent(state, spawned->session_key) == nullptr) {
    state.sub_agents.push_back(SubAgentInfo{.id = spawned->id,
                                            .session_key = spawned->session_key,
                                            .parent_session_key = conversation->session_key,
                                            .label = spawned->label,
                                            .task = spawned->task,
                                            .spawned_at = context.now,
                                            .status = SubAgentStatus::Running});
    outcome.sub_agents.push_back(spawned->session_key);
  }
  return outcome;
}

ReduceOutcome on_stream_start(ConversationState &state, const StreamStart &event,
                              const ReducerContext &context) {
  Conversation *conversation = find_conversation(state, event.session_id);
  if (conversation == nullptr) {
    return {};
  }
  conversation->status = ConversationStatus::Streaming;
  conversation->updated_at = context.now;
  return ReduceOutcome{.conversation = event.session_id};
}

ReduceOutcome on_stream_end(ConversationState &state, const StreamEnd &event,
                            const ReducerContext &context) {
  Conversation *conversation = find_conversation(state, event.session_id);
  if (conversation == nullptr) {
    return {};
  }
  conversation->status = ConversationStatus::Active;
  if (!conversation->messages.empty()) {
    conversation->messages.back().is_streaming = false;
  }
  conversation->updated_at = context.now;
  return ReduceOutcome{.conversation = event.session_id};
}

ReduceOutcome on_announce(ConversationState &state, const SubAgentAnnounce &event) {
  SubAgentInfo *info = find_sub_agent(state, event.session_key);
  if (info == nullptr) {
    return {};
  }
  info->status =
      event.result.status == "success" ? SubAgentStatus::Completed : SubAgentStatus::Failed;
  info->announce_result = event.result;
  return ReduceOutcome{.sub_agents = {event.session_key}};
}

} // namespace

std::optional<SpawnedSubAgent> parse_spawned_subagent(const std::string &result) {
  const auto parsed = common::parse_json(result);
  if (!parsed.ok() || !parsed.value().is_object()) {
    return std::nullopt;
  }
  const auto &payload = parsed.value();
  const auto child_key = payload.string_field("childSessionKey");
  if (!child_key.has_value()) {
    return std::nullopt;
  }

  const auto parts = split_colon(*child_key);
  if (parts.size() < 4 || parts[2] != "subagent") {
    return std::nullopt;
  }
  // The id is everything after the third segment, colons included.
  std::size_t offset = 0;
  for (int i = 0; i < 3; ++i) {
    offset = child_key->find(':', offset) + 1;
  }
  std::string id = child_key->substr(offset);
  if (id.empty()) {
    return std::nullopt;
  }

  SpawnedSubAgent spawned;
  spawned.session_key = *child_key;
  spawned.label = payload.string_field("label").value_or(id);
  spawned.task = payload.string_field("task").value_or("");
  spawned.id = std::move(id);
  return spawned;
}

Conversation &ensure_conversation(ConversationState &state, const std::string &session_key,
                                  const ReducerContext &context) {
  if (Conversation *existing = find_conversation(state, session_key); existing != nullptr) {
    return *existing;
  }

  Conversation conversation;
  conversation.id = session_key;
  conversation.session_key = session_key;
  conversation.agent_id = context.agent_id;
  conversation.is_sub_agent = is_sub_agent_session(session_key);
  if (const SubAgentInfo *info = find_sub_agent(state, session_key); info != nullptr) {
    conversation.label = info->label;
    conversation.parent_session_key = info->parent_session_key;
  }
  conversation.created_at = context.now;
  conversation.updated_at = context.now;
  return state.conversations.emplace(session_key, std::move(conversation)).first->second;
}

void append_message(ConversationState &state, const std::string &session_key, Message message,
                    const ReducerContext &context) {
  Conversation &conversation = ensure_conversation(state, session_key, context);
  if (!conversation.messages.empty()) {
    conversation.messages.back().is_streaming = false;
  }
  message.conversation_id = conversation.id;
  conversation.messages.push_back(std::move(message));
  conversation.updated_at = context.now;
}

ReduceOutcome apply_event(ConversationState &state, const GatewayEvent &event,
                          const ReducerContext &context) {
  return std::visit(
      [&](const auto &evt) -> ReduceOutcome {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, AssistantDelta>) {
          return on_delta(state, evt, context);
        } else if constexpr (std::is_same_v<T, ToolStart>) {
          return on_tool_start(state, evt, context);
        } else if constexpr (std::is_same_v<T, ToolEnd>) {
          return on_tool_end(state, evt, context);
        } else if constexpr (std::is_same_v<T, StreamStart>) {
          return on_stream_start(state, evt, context);
        } else if constexpr (std::is_same_v<T, StreamEnd>) {
          return on_stream_end(state, evt, context);
        } else if constexpr (std::is_same_v<T, SubAgentAnnounce>) {
          return on_announce(state, evt);
        } else {
          // Pairing approvals and error events are handled by the controller.
          return {};
        }
      },
      event);
}

} // namespace clawlink::gateway
