#include "clawlink/gateway/pairing.hpp"

#include "clawlink/observability/global.hpp"

namespace clawlink::gateway {

namespace {

common::JsonValue string_array(const std::vector<std::string> &values) {
  common::JsonValue::Array out;
  out.reserve(values.size());
  for (const auto &value : values) {
    out.emplace_back(value);
  }
  return common::JsonValue(std::move(out));
}

} // namespace

PairingCoordinator::PairingCoordinator(runtime::IExecutor &executor,
                                       storage::ISecretStore &secrets,
                                       storage::IIdentityStore &identities,
                                       DeviceIdentity &identity, PairingOptions options,
                                       RpcInvoker invoke, Hooks hooks)
    : executor_(executor), secrets_(secrets), identities_(identities), identity_(identity),
      options_(std::move(options)), invoke_(std::move(invoke)), hooks_(std::move(hooks)) {}

PairingCoordinator::~PairingCoordinator() {
  if (poll_timer_.has_value()) {
    executor_.cancel(*poll_timer_);
  }
}

void PairingCoordinator::restore() {
  std::optional<std::string> token;
  const auto stored =
      secrets_.get_string(storage::NODE_TOKEN_SERVICE, storage::node_token_account(identity_.node_id));
  if (stored.ok()) {
    token = stored.value();
  } else {
    observability::record_error("pairing", "Secure store read failed: " + stored.error());
  }
  if (!token.has_value() || token->empty()) {
    token = identity_.pairing_token;
  }

  if (token.has_value() && !token->empty()) {
    identity_.pairing_token = token;
    set_state(PairingState::paired(*token));
  } else {
    set_state(PairingState::unpaired());
  }
}

void PairingCoordinator::request_pairing() {
  stop_polling();

  auto params = common::JsonValue::object({
      {"nodeId", identity_.node_id},
      {"displayName", identity_.display_name},
      {"caps", string_array(options_.caps)},
      {"commands", string_array(options_.commands)},
  });

  const std::uint64_t generation = generation_;
  invoke_("node.pair.request", params,
          [this, generation](const RpcResult<common::JsonValue> &result) {
            if (generation != generation_) {
              return;
            }
            if (!result.ok()) {
              // A dropped link belongs to the connection state; the next open asks again.
              if (result.error().kind == RpcError::Kind::ConnectionClosed ||
                  result.error().kind == RpcError::Kind::Transport) {
                return;
              }
              set_state(PairingState::failed(result.error().message));
              return;
            }
            const auto request_id = result.value().string_field("requestId");
            if (!request_id.has_value() || request_id->empty()) {
              set_state(PairingState::failed("node.pair.request returned no requestId"));
              return;
            }
            const std::string code = result.value().string_field("code").value_or("");
            set_state(PairingState::pending_approval(code, *request_id));
            poll_attempts_ = 0;
            schedule_poll();
          });
}

void PairingCoordinator::schedule_poll() {
  const std::uint64_t epoch = poll_epoch_;
  poll_timer_ = executor_.post_after(options_.poll_interval, [this, epoch]() {
    poll_timer_.reset();
    poll_once(epoch);
  });
}

void PairingCoordinator::poll_once(const std::uint64_t epoch) {
  if (epoch != poll_epoch_ || !state_.is_pending()) {
    return;
  }
  ++poll_attempts_;
  poll_in_flight_ = true;

  auto params = common::JsonValue::object({
      {"nodeId", identity_.node_id},
      {"requestId", state_.request_id},
  });
  invoke_("node.pair.status", params, [this, epoch](const RpcResult<common::JsonValue> &result) {
    on_poll_result(epoch, result);
  });
}

void PairingCoordinator::on_poll_result(const std::uint64_t epoch,
                                        const RpcResult<common::JsonValue> &result) {
  if (epoch != poll_epoch_) {
    return;
  }
  poll_in_flight_ = false;
  if (!state_.is_pending()) {
    return;
  }

  // A failed status call still spends an attempt.
  if (!result.ok()) {
    continue_polling();
    return;
  }

  const std::string status = result.value().string_field("status").value_or("");
  if (status == "approved") {
    const auto token = result.value().string_field("token");
    if (token.has_value() && !token->empty()) {
      complete_approval(*token);
      return;
    }
  } else if (status == "rejected") {
    stop_polling();
    set_state(PairingState::failed(PAIRING_REJECTED_MESSAGE));
    return;
  } else if (status == "expired") {
    stop_polling();
    set_state(PairingState::failed(PAIRING_EXPIRED_MESSAGE));
    return;
  }
  continue_polling();
}

void PairingCoordinator::continue_polling() {
  if (poll_attempts_ >= options_.max_poll_attempts) {
    stop_polling();
    set_state(PairingState::failed(PAIRING_TIMED_OUT_MESSAGE));
    return;
  }
  schedule_poll();
}

void PairingCoordinator::stop_polling() {
  ++poll_epoch_;
  poll_in_flight_ = false;
  if (poll_timer_.has_value()) {
    executor_.cancel(*poll_timer_);
    poll_timer_.reset();
  }
}

void PairingCoordinator::complete_approval(const std::string &token) {
  if (!state_.is_pending() || token.empty()) {
    return;
  }
  stop_polling();

  const auto stored = secrets_.set_string(storage::NODE_TOKEN_SERVICE,
                                          storage::node_token_account(identity_.node_id), token);
  if (!stored.ok()) {
    observability::record_error("pairing", "Failed to store pairing token: " + stored.error());
    set_state(PairingState::failed("Failed to store pairing token: " + stored.error()));
    return;
  }

  identity_.pairing_token = token;
  identity_.paired_at = Clock::now();
  if (const auto saved = identities_.save(identity_); !saved.ok()) {
    observability::record_error("pairing", "Failed to save device identity: " + saved.error());
  }

  set_state(PairingState::paired(token));
  if (hooks_.on_approved) {
    hooks_.on_approved();
  }
}

void PairingCoordinator::verify_pairing() {
  if (!state_.is_paired()) {
    return;
  }
  const std::string token = state_.token;
  auto params = common::JsonValue::object({
      {"nodeId", identity_.node_id},
      {"token", token},
  });

  const std::uint64_t generation = generation_;
  invoke_("node.pair.verify", params,
          [this, generation, token](const RpcResult<common::JsonValue> &result) {
            if (generation != generation_ || !state_.is_paired() || state_.token != token) {
              return;
            }
            if (!result.ok()) {
              if (hooks_.on_verify_error) {
                hooks_.on_verify_error(result.error());
              }
              return;
            }

            auto valid = result.value().bool_field("valid");
            if (!valid.has_value()) {
              valid = result.value().bool_field("ok");
            }
            if (!valid.has_value()) {
              if (hooks_.on_verify_error) {
                hooks_.on_verify_error(
                    RpcError::malformed("node.pair.verify returned no verdict"));
              }
              return;
            }

            if (*valid) {
              if (hooks_.on_verified) {
                hooks_.on_verified();
              }
              return;
            }

            observability::record_error("pairing", "Stored token rejected, pairing again");
            if (const auto cleared = forget_token(); !cleared.ok()) {
              observability::record_error("pairing", cleared.error());
            }
            set_state(PairingState::unpaired());
            request_pairing();
          });
}

common::Status PairingCoordinator::reset() {
  stop_polling();
  ++generation_;
  const auto cleared = forget_token();
  set_state(PairingState::unpaired());
  return cleared;
}

common::Status PairingCoordinator::forget_token() {
  common::Status status = common::Status::success();
  if (const auto removed = secrets_.remove(storage::NODE_TOKEN_SERVICE,
                                           storage::node_token_account(identity_.node_id));
      !removed.ok()) {
    status = common::Status::error("Failed to remove pairing token: " + removed.error());
  }

  identity_.pairing_token.reset();
  identity_.paired_at.reset();
  if (const auto saved = identities_.save(identity_); !saved.ok() && status.ok()) {
    status = common::Status::error("Failed to save device identity: " + saved.error());
  }
  return status;
}

void PairingCoordinator::set_state(PairingState state) {
  state_ = std::move(state);
  observability::record_pairing_state(state_.describe());
  if (hooks_.on_state_changed) {
    hooks_.on_state_changed(state_);
  }
}

} // namespace clawlink::gateway
