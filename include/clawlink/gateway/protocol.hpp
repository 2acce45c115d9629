#pragma once

#include "clawlink/common/json.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace clawlink::gateway {

struct ResponseError {
  std::int64_t code = 0;
  std::string message;
};

struct ResponseFrame {
  std::string id;
  common::JsonValue result;
  std::optional<ResponseError> error;
};

/// `{"id": ..., "method": ..., "params": ...}`
[[nodiscard]] std::string encode_request(const std::string &id, const std::string &method,
                                         const common::JsonValue &params);

/// A frame is a response when it carries a string `id`, a `result` or `error`
/// member, and no `event` member. A null `error` counts as success.
[[nodiscard]] std::optional<ResponseFrame> decode_response(const common::JsonValue &frame);

} // namespace clawlink::gateway
