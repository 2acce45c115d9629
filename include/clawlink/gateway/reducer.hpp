#pragma once

#include "clawlink/gateway/events.hpp"
#include "clawlink/gateway/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace clawlink::gateway {

struct ConversationState {
  /// Keyed by session key.
  std::map<std::string, Conversation> conversations;
  std::vector<SubAgentInfo> sub_agents;
};

struct ReducerContext {
  std::string agent_id = DEFAULT_AGENT_ID;
  Timestamp now{};
};

/// What an applied event touched, so callers can notify observers.
struct ReduceOutcome {
  std::optional<std::string> conversation;
  std::vector<std::string> sub_agents;

  [[nodiscard]] bool changed() const { return conversation.has_value() || !sub_agents.empty(); }
};

struct SpawnedSubAgent {
  std::string id;
  std::string session_key;
  std::string label;
  std::string task;
};

/// Recognizes a sub-agent spawn in a tool result: a JSON object whose
/// `childSessionKey` has "subagent" as its third colon-separated segment.
[[nodiscard]] std::optional<SpawnedSubAgent> parse_spawned_subagent(const std::string &result);

/// Returns the conversation for `session_key`, creating it when absent.
Conversation &ensure_conversation(ConversationState &state, const std::string &session_key,
                                  const ReducerContext &context);

/// Appends `message` to its conversation. Any earlier streaming message is
/// closed so that only the last message can be streaming.
void append_message(ConversationState &state, const std::string &session_key, Message message,
                    const ReducerContext &context);

ReduceOutcome apply_event(ConversationState &state, const GatewayEvent &event,
                          const ReducerContext &context);

} // namespace clawlink::gateway
