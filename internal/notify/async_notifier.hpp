#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <vector>

#include "internal/notify/notifier.hpp"

namespace actions::notify {

/*
  Hands fired actions to a pool of delivery threads.

  Notify() only enqueues, so the dispatcher and timer threads never run
  handler code. A slow handler occupies one delivery thread; the others
  keep delivering. Handler exceptions are logged on the delivery thread.

  Stop() delivers what is already queued before joining.
*/
class AsyncNotifier final : public Notifier {
 public:
  static constexpr std::size_t kDefaultThreads = 4;

  explicit AsyncNotifier(std::shared_ptr<Notifier> downstream, std::size_t threads = kDefaultThreads);
  ~AsyncNotifier() override;

  AsyncNotifier(const AsyncNotifier&)            = delete;
  AsyncNotifier& operator=(const AsyncNotifier&) = delete;

  void Start();
  void Stop();

  void Notify(const model::Action& action) override;

  std::size_t Queued() const;

 private:
  // blocking wait; empty once shut down and drained
  std::optional<model::Action> Dequeue();
  void                         Run();

  std::shared_ptr<Notifier> downstream_;
  std::size_t               thread_count_;

  mutable std::mutex        mutex_;
  std::condition_variable   cv_;
  std::queue<model::Action> queue_;
  bool                      shutdown_ = false;

  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};
};

} // namespace actions::notify
