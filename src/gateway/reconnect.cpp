#include "clawlink/gateway/reconnect.hpp"

#include <algorithm>

namespace clawlink::gateway {

ReconnectPolicy::ReconnectPolicy(const std::uint32_t max_attempts,
                                 const std::chrono::seconds max_delay)
    : max_attempts_(max_attempts), max_delay_(max_delay) {}

ReconnectPolicy::Decision ReconnectPolicy::next() {
  if (attempts_ >= max_attempts_) {
    return Decision{.give_up = true, .attempt = attempts_};
  }
  ++attempts_;
  // Shift clamped so large attempt budgets stay well-defined.
  const std::uint32_t shift = std::min<std::uint32_t>(attempts_, 31);
  const auto backoff = std::chrono::seconds(std::int64_t{1} << shift);
  return Decision{.attempt = attempts_, .delay = std::min(backoff, max_delay_)};
}

} // namespace clawlink::gateway
