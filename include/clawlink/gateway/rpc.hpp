#pragma once

#include "clawlink/common/json.hpp"
#include "clawlink/common/result.hpp"
#include "clawlink/gateway/protocol.hpp"
#include "clawlink/runtime/executor.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

namespace clawlink::gateway {

constexpr const char *TIMEOUT_MESSAGE = "Request timed out";
constexpr const char *CONNECTION_CLOSED_MESSAGE = "Connection closed";
constexpr const char *NOT_PAIRED_MESSAGE = "Not paired";
constexpr const char *NOT_CONNECTED_MESSAGE = "Not connected";

struct RpcError {
  enum class Kind { Protocol, Timeout, ConnectionClosed, Transport, NotReady, Malformed };

  Kind kind = Kind::Protocol;
  std::int64_t code = 0;
  std::string message;

  static RpcError protocol(std::int64_t code, std::string message) {
    return {.kind = Kind::Protocol, .code = code, .message = std::move(message)};
  }
  static RpcError timeout() { return {.kind = Kind::Timeout, .message = TIMEOUT_MESSAGE}; }
  static RpcError connection_closed() {
    return {.kind = Kind::ConnectionClosed, .message = CONNECTION_CLOSED_MESSAGE};
  }
  static RpcError transport(std::string message) {
    return {.kind = Kind::Transport, .message = std::move(message)};
  }
  static RpcError not_ready(std::string message) {
    return {.kind = Kind::NotReady, .message = std::move(message)};
  }
  static RpcError malformed(std::string message) {
    return {.kind = Kind::Malformed, .message = std::move(message)};
  }
};

/// Like common::Result, but failures carry a typed RpcError.
template <typename T> class RpcResult {
public:
  static RpcResult success(T value) { return RpcResult(std::move(value), std::nullopt); }
  static RpcResult failure(RpcError error) { return RpcResult(std::nullopt, std::move(error)); }

  [[nodiscard]] bool ok() const { return !error_.has_value(); }

  [[nodiscard]] const T &value() const {
    if (!ok()) {
      throw std::logic_error("RpcResult has no value: " + error_->message);
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!ok()) {
      throw std::logic_error("RpcResult has no value: " + error_->message);
    }
    return *value_;
  }

  [[nodiscard]] const RpcError &error() const {
    if (ok()) {
      throw std::logic_error("RpcResult has no error");
    }
    return *error_;
  }

private:
  RpcResult(std::optional<T> value, std::optional<RpcError> error)
      : value_(std::move(value)), error_(std::move(error)) {}

  std::optional<T> value_;
  std::optional<RpcError> error_;
};

using RpcCallback = std::function<void(RpcResult<common::JsonValue>)>;

/// Matches responses to in-flight calls by id and enforces a per-call timeout.
/// Not thread-safe: every member must be called on the owning executor, which
/// is also where timeouts fire.
class RpcCorrelator {
public:
  using Sender = std::function<common::Status(const std::string &frame)>;
  using IdGenerator = std::function<std::string()>;

  RpcCorrelator(runtime::IExecutor &executor, std::chrono::milliseconds timeout,
                IdGenerator next_id = {});
  ~RpcCorrelator();

  RpcCorrelator(const RpcCorrelator &) = delete;
  RpcCorrelator &operator=(const RpcCorrelator &) = delete;

  /// Registers the call, then sends it. The callback runs exactly once: with
  /// the response, a timeout, a send failure, or a reject_all() error.
  /// Returns the request id.
  std::string call(const std::string &method, const common::JsonValue &params,
                   const Sender &sender, RpcCallback callback);

  /// Completes the matching call. Unknown ids (late or duplicate responses)
  /// are ignored and yield false.
  bool handle_response(const ResponseFrame &response);

  void reject_all(const RpcError &error);

  [[nodiscard]] std::size_t pending_count() const { return pending_.size(); }
  [[nodiscard]] std::chrono::milliseconds timeout() const { return timeout_; }

private:
  struct PendingRequest {
    std::string method;
    RpcCallback callback;
    runtime::TimerId timer = 0;
    std::chrono::steady_clock::time_point started_at;
  };

  void finish(PendingRequest request, RpcResult<common::JsonValue> outcome);
  void on_timeout(const std::string &id);

  runtime::IExecutor &executor_;
  std::chrono::milliseconds timeout_;
  IdGenerator next_id_;
  std::unordered_map<std::string, PendingRequest> pending_;
};

} // namespace clawlink::gateway
