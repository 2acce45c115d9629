#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace clawlink::runtime {

using Task = std::function<void()>;
using TimerId = std::uint64_t;

/// Serial execution context. Tasks run one at a time, in the order they become
/// ready; a task is never run concurrently with another task of the same executor.
class IExecutor {
public:
  virtual ~IExecutor() = default;

  virtual void post(Task task) = 0;

  /// Schedules `task` after `delay`. The returned id can be passed to cancel().
  virtual TimerId post_after(std::chrono::milliseconds delay, Task task) = 0;

  /// Returns false when the timer already fired or was never scheduled.
  virtual bool cancel(TimerId id) = 0;
};

} // namespace clawlink::runtime
