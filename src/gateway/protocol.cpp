#include "clawlink/gateway/protocol.hpp"

namespace clawlink::gateway {

std::string encode_request(const std::string &id, const std::string &method,
                           const common::JsonValue &params) {
  return common::JsonValue::object({{"id", id}, {"method", method}, {"params", params}}).dump();
}

std::optional<ResponseFrame> decode_response(const common::JsonValue &frame) {
  if (!frame.is_object() || frame.contains("event")) {
    return std::nullopt;
  }
  const auto id = frame.string_field("id");
  if (!id.has_value()) {
    return std::nullopt;
  }
  const auto *result = frame.find("result");
  const auto *error = frame.find("error");
  if (result == nullptr && error == nullptr) {
    return std::nullopt;
  }

  ResponseFrame response;
  response.id = *id;
  if (result != nullptr) {
    response.result = *result;
  }
  if (error != nullptr && !error->is_null()) {
    ResponseError decoded;
    if (error->is_object()) {
      decoded.code = error->int_field("code").value_or(0);
      decoded.message = error->string_field("message").value_or("Unknown error");
    } else if (const auto text = error->as_string(); text.has_value()) {
      decoded.message = *text;
    } else {
      decoded.message = "Unknown error";
    }
    response.error = std::move(decoded);
  }
  return response;
}

} // namespace clawlink::gateway
