#pragma once

#include <chrono>
#include <cstdint>

namespace clawlink::gateway {

constexpr const char *MAX_RECONNECT_MESSAGE = "Max reconnection attempts exceeded";

/// Exponential backoff: attempt n waits min(max_delay, 2^n seconds).
class ReconnectPolicy {
public:
  struct Decision {
    bool give_up = false;
    std::uint32_t attempt = 0;
    std::chrono::seconds delay{0};
  };

  explicit ReconnectPolicy(std::uint32_t max_attempts = 5,
                           std::chrono::seconds max_delay = std::chrono::seconds(30));

  /// Counts one more attempt and returns its delay, or give_up once the budget
  /// is spent.
  Decision next();
  void reset() { attempts_ = 0; }

  [[nodiscard]] std::uint32_t attempts() const { return attempts_; }
  [[nodiscard]] std::uint32_t max_attempts() const { return max_attempts_; }

private:
  std::uint32_t max_attempts_;
  std::chrono::seconds max_delay_;
  std::uint32_t attempts_ = 0;
};

} // namespace clawlink::gateway
