#include "timer_service.hpp"

#include "internal/observability/logging.hpp"

namespace actions::timer {

TimerService::~TimerService() {
  Stop();
}

void TimerService::Start() {
  if (running_.exchange(true)) return;
  {
    std::lock_guard lock(mutex_);
    shutdown_ = false;
  }
  thread_ = std::thread(&TimerService::Run, this);
}

void TimerService::Stop() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
  running_ = false;

  std::size_t dropped = 0;
  {
    std::lock_guard lock(mutex_);
    dropped = queue_.size();
    queue_  = {};
  }
  if (dropped > 0) {
    ACTIONS_LOG_WARN("Timer service stopped with pending tasks", {observability::IntField("dropped", static_cast<int64_t>(dropped))});
  }
}

void TimerService::ScheduleAfter(std::chrono::milliseconds delay, Task task) {
  {
    std::lock_guard lock(mutex_);
    const auto      delay_or_zero = delay.count() > 0 ? delay : std::chrono::milliseconds::zero();
    queue_.push(Entry{Clock::now() + delay_or_zero, next_seq_++, std::move(task)});
  }
  cv_.notify_one();
}

void TimerService::Post(Task task) {
  ScheduleAfter(std::chrono::milliseconds::zero(), std::move(task));
}

std::size_t TimerService::Pending() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

void TimerService::Run() {
  std::unique_lock lock(mutex_);

  while (!shutdown_) {
    if (queue_.empty()) {
      cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });
      continue;
    }

    // re-evaluated after every wake: an earlier entry may have arrived
    const auto due = queue_.top().due;
    if (Clock::now() < due) {
      cv_.wait_until(lock, due);
      continue;
    }

    Task task = queue_.top().task;
    queue_.pop();

    lock.unlock();
    try {
      task();
    } catch (const std::exception& e) {
      ACTIONS_LOG_ERROR("Timer task failed", {observability::StringField("error", e.what())});
    }
    lock.lock();
  }
}

} // namespace actions::timer
