#include "clawlink/gateway/rpc.hpp"

#include "clawlink/common/uuid.hpp"
#include "clawlink/observability/global.hpp"

namespace clawlink::gateway {

RpcCorrelator::RpcCorrelator(runtime::IExecutor &executor, const std::chrono::milliseconds timeout,
                             IdGenerator next_id)
    : executor_(executor), timeout_(timeout), next_id_(std::move(next_id)) {
  if (!next_id_) {
    next_id_ = [] { return common::generate_uuid(); };
  }
}

RpcCorrelator::~RpcCorrelator() {
  for (auto &[id, request] : pending_) {
    executor_.cancel(request.timer);
  }
}

std::string RpcCorrelator::call(const std::string &method, const common::JsonValue &params,
                                const Sender &sender, RpcCallback callback) {
  std::string id = next_id_();
  while (pending_.contains(id)) {
    id = next_id_();
  }

  // Register before sending so a fast response always finds its entry.
  PendingRequest request{.method = method,
                         .callback = std::move(callback),
                         .timer = executor_.post_after(timeout_, [this, id]() { on_timeout(id); }),
                         .started_at = std::chrono::steady_clock::now()};
  pending_.emplace(id, std::move(request));
  observability::record_metric(
      observability::PendingRequestsMetric{.count = static_cast<std::uint64_t>(pending_.size())});

  const auto sent = sender(encode_request(id, method, params));
  if (!sent.ok()) {
    const auto it = pending_.find(id);
    if (it != pending_.end()) {
      PendingRequest failed = std::move(it->second);
      pending_.erase(it);
      executor_.cancel(failed.timer);
      finish(std::move(failed),
             RpcResult<common::JsonValue>::failure(RpcError::transport(sent.error())));
    }
  }
  return id;
}

bool RpcCorrelator::handle_response(const ResponseFrame &response) {
  const auto it = pending_.find(response.id);
  if (it == pending_.end()) {
    return false;
  }
  PendingRequest request = std::move(it->second);
  pending_.erase(it);
  executor_.cancel(request.timer);

  if (response.error.has_value()) {
    finish(std::move(request), RpcResult<common::JsonValue>::failure(RpcError::protocol(
                                   response.error->code, response.error->message)));
  } else {
    finish(std::move(request), RpcResult<common::JsonValue>::success(response.result));
  }
  return true;
}

void RpcCorrelator::reject_all(const RpcError &error) {
  auto drained = std::move(pending_);
  pending_.clear();
  for (auto &[id, request] : drained) {
    executor_.cancel(request.timer);
  }
  for (auto &[id, request] : drained) {
    finish(std::move(request), RpcResult<common::JsonValue>::failure(error));
  }
}

void RpcCorrelator::on_timeout(const std::string &id) {
  const auto it = pending_.find(id);
  if (it == pending_.end()) {
    return;
  }
  PendingRequest request = std::move(it->second);
  pending_.erase(it);
  finish(std::move(request), RpcResult<common::JsonValue>::failure(RpcError::timeout()));
}

void RpcCorrelator::finish(PendingRequest request, RpcResult<common::JsonValue> outcome) {
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - request.started_at);
  observability::record_rpc_call(request.method, elapsed, outcome.ok());
  observability::record_metric(
      observability::PendingRequestsMetric{.count = static_cast<std::uint64_t>(pending_.size())});
  if (request.callback) {
    request.callback(std::move(outcome));
  }
}

} // namespace clawlink::gateway
