#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace actions::timer {

/*
  One background thread running one-off delayed tasks.

  Tasks run in deadline order (ties in submission order) on the timer
  thread, outside the internal lock, so a task may schedule further tasks.
  Tasks still pending at Stop() are dropped.
*/
class TimerService {
 public:
  using Clock = std::chrono::steady_clock;
  using Task  = std::function<void()>;

  TimerService() = default;
  ~TimerService();

  TimerService(const TimerService&)            = delete;
  TimerService& operator=(const TimerService&) = delete;

  void Start();
  void Stop();

  // Non-positive delays run as soon as the thread gets to them.
  void ScheduleAfter(std::chrono::milliseconds delay, Task task);
  void Post(Task task);

  std::size_t Pending() const;

 private:
  struct Entry {
    Clock::time_point due;
    uint64_t          seq = 0;
    Task              task;
  };

  struct Later {
    bool operator()(const Entry& a, const Entry& b) const {
      if (a.due != b.due) return a.due > b.due;
      return a.seq > b.seq;
    }
  };

  void Run();

  mutable std::mutex                                   mutex_;
  std::condition_variable                              cv_;
  std::priority_queue<Entry, std::vector<Entry>, Later> queue_;
  uint64_t                                             next_seq_ = 0;
  bool                                                 shutdown_ = false;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace actions::timer
