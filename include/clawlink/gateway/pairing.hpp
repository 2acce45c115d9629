#pragma once

#include "clawlink/common/json.hpp"
#include "clawlink/common/result.hpp"
#include "clawlink/gateway/rpc.hpp"
#include "clawlink/gateway/types.hpp"
#include "clawlink/runtime/executor.hpp"
#include "clawlink/storage/identity_store.hpp"
#include "clawlink/storage/secret_store.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace clawlink::gateway {

constexpr const char *PAIRING_REJECTED_MESSAGE = "Pairing rejected";
constexpr const char *PAIRING_EXPIRED_MESSAGE = "Pairing request expired";
constexpr const char *PAIRING_TIMED_OUT_MESSAGE = "Pairing timed out";

struct PairingOptions {
  std::chrono::milliseconds poll_interval{2000};
  std::uint32_t max_poll_attempts = 150;
  std::vector<std::string> caps{"chat", "location"};
  std::vector<std::string> commands{"location.get"};
};

/// Issues an RPC on the owning connection.
using RpcInvoker = std::function<void(const std::string &method, const common::JsonValue &params,
                                      RpcCallback callback)>;

/// Drives the device pairing handshake: request, poll for approval, verify a
/// held token. Runs entirely on the executor it is given.
class PairingCoordinator {
public:
  struct Hooks {
    std::function<void(const PairingState &)> on_state_changed;
    /// A token was approved and persisted; the transport must re-authenticate.
    std::function<void()> on_approved;
    /// The held token was confirmed valid.
    std::function<void()> on_verified;
    /// Verification could not get an answer. Pairing state is left untouched.
    std::function<void(const RpcError &)> on_verify_error;
  };

  PairingCoordinator(runtime::IExecutor &executor, storage::ISecretStore &secrets,
                     storage::IIdentityStore &identities, DeviceIdentity &identity,
                     PairingOptions options, RpcInvoker invoke, Hooks hooks);
  ~PairingCoordinator();

  PairingCoordinator(const PairingCoordinator &) = delete;
  PairingCoordinator &operator=(const PairingCoordinator &) = delete;

  /// Cold-start state: paired when a token is held, the secure store being
  /// checked before the identity copy.
  void restore();

  void request_pairing();
  void verify_pairing();

  /// Persists `token` and moves to paired. Ignored unless approval is pending.
  void complete_approval(const std::string &token);

  /// Forgets any token and returns to unpaired, stopping the poll loop.
  [[nodiscard]] common::Status reset();
  void stop_polling();

  [[nodiscard]] const PairingState &state() const { return state_; }
  [[nodiscard]] std::uint32_t poll_attempts() const { return poll_attempts_; }
  [[nodiscard]] bool polling() const { return poll_timer_.has_value() || poll_in_flight_; }

private:
  void set_state(PairingState state);
  void schedule_poll();
  void poll_once(std::uint64_t epoch);
  void on_poll_result(std::uint64_t epoch, const RpcResult<common::JsonValue> &result);
  void continue_polling();
  [[nodiscard]] common::Status forget_token();

  runtime::IExecutor &executor_;
  storage::ISecretStore &secrets_;
  storage::IIdentityStore &identities_;
  DeviceIdentity &identity_;
  PairingOptions options_;
  RpcInvoker invoke_;
  Hooks hooks_;

  PairingState state_;
  // Bumped by reset() so replies to superseded requests are dropped.
  std::uint64_t generation_ = 0;
  std::uint64_t poll_epoch_ = 0;
  std::uint32_t poll_attempts_ = 0;
  std::optional<runtime::TimerId> poll_timer_;
  bool poll_in_flight_ = false;
};

} // namespace clawlink::gateway
