#include "clawlink/runtime/event_loop.hpp"

#include "clawlink/observability/global.hpp"

#include <exception>

namespace clawlink::runtime {

EventLoop::~EventLoop() { stop(); }

void EventLoop::start() {
  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true)) {
    return;
  }
  worker_ = std::thread([this]() { run(); });
}

void EventLoop::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
    worker_.join();
  } else if (worker_.joinable()) {
    worker_.detach();
  }

  std::lock_guard<std::mutex> lock(mutex_);
  ready_.clear();
  timers_.clear();
}

void EventLoop::post(Task task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ready_.push_back(std::move(task));
  }
  cv_.notify_one();
}

TimerId EventLoop::post_after(const std::chrono::milliseconds delay, Task task) {
  TimerId id = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    id = next_timer_id_++;
    timers_.emplace(TimerKey{Clock::now() + delay, id}, std::move(task));
  }
  cv_.notify_one();
  return id;
}

bool EventLoop::cancel(const TimerId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto it = timers_.begin(); it != timers_.end(); ++it) {
    if (it->first.second == id) {
      timers_.erase(it);
      return true;
    }
  }
  return false;
}

void EventLoop::run() {
  while (true) {
    Task task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      while (running_) {
        const auto now = Clock::now();
        while (!timers_.empty() && timers_.begin()->first.first <= now) {
          ready_.push_back(std::move(timers_.begin()->second));
          timers_.erase(timers_.begin());
        }
        if (!ready_.empty()) {
          break;
        }
        if (timers_.empty()) {
          cv_.wait(lock);
        } else {
          cv_.wait_until(lock, timers_.begin()->first.first);
        }
      }
      if (!running_) {
        return;
      }
      task = std::move(ready_.front());
      ready_.pop_front();
    }

    try {
      task();
    } catch (const std::exception &ex) {
      observability::record_error("event_loop", ex.what());
    }
  }
}

} // namespace clawlink::runtime
