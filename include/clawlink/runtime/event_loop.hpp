#pragma once

#include "clawlink/runtime/executor.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <thread>
#include <utility>

namespace clawlink::runtime {

/// Single worker thread draining an ordered task queue and a deadline-ordered
/// timer set.
class EventLoop final : public IExecutor {
public:
  EventLoop() = default;
  ~EventLoop() override;

  EventLoop(const EventLoop &) = delete;
  EventLoop &operator=(const EventLoop &) = delete;

  void start();
  /// Stops the worker after the task currently running. Queued tasks and timers
  /// are discarded.
  void stop();
  [[nodiscard]] bool running() const { return running_.load(); }

  void post(Task task) override;
  TimerId post_after(std::chrono::milliseconds delay, Task task) override;
  bool cancel(TimerId id) override;

private:
  using Clock = std::chrono::steady_clock;
  // Keyed by (deadline, id) so equal deadlines keep scheduling order.
  using TimerKey = std::pair<Clock::time_point, TimerId>;

  void run();

  std::atomic<bool> running_{false};
  std::thread worker_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Task> ready_;
  std::map<TimerKey, Task> timers_;
  TimerId next_timer_id_ = 1;
};

} // namespace clawlink::runtime
