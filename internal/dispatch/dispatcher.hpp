#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <thread>
#include <vector>

#include "internal/model/action.hpp"
#include "internal/notify/async_notifier.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/store/action_store.hpp"
#include "internal/timer/timer_service.hpp"

namespace actions::dispatch {

enum class RunLoopState : uint8_t {
  kFetching,
  kWaitingForSignal,
  kSleeping,
  kFiring,
  kBackoff,
  kStopped,
};

std::string_view RunLoopStateName(RunLoopState state);

struct DispatcherOptions {
  // Actions due within this window skip the store and fire from a timer.
  std::chrono::milliseconds short_horizon{std::chrono::seconds(60)};
  std::chrono::milliseconds store_retry_backoff{std::chrono::seconds(5)};
  // Threads handing fired actions to the notifier.
  std::size_t delivery_threads = notify::AsyncNotifier::kDefaultThreads;
};

/*
  Single-flight delayed-action dispatcher.

  Exactly one stored action is active at a time: the run-loop fetches the
  soonest one, sleeps until it is due, deletes it and hands it to the
  notifier, then fetches again. Reschedule() cancels the current wait by
  bumping a generation counter; the loop re-reads the store and picks the
  new soonest action.

  Actions due within the short horizon never reach the store; a one-off
  timer delivers them directly.

  Fired actions are queued to delivery threads; neither the run-loop nor
  the timer thread waits on the notifier.
*/
class Dispatcher {
 public:
  Dispatcher(std::shared_ptr<store::ActionStore> store, std::shared_ptr<notify::Notifier> notifier,
             DispatcherOptions options = {});
  ~Dispatcher();

  Dispatcher(const Dispatcher&)            = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  void Start();
  void Stop();

  // Abandons the current wait and re-evaluates from the store.
  void Reschedule();

  // Returns the action unchanged (no id) when it took the fast path.
  model::Action CreateAction(const model::Action& action);

  // Idempotent. Fast-path actions cannot be cancelled.
  void CancelAction(model::ActionId id);

  std::vector<model::Action> PendingActions();

  std::optional<model::Action> Active() const;
  RunLoopState                 State() const;

 private:
  void Run();
  void Deliver(const model::Action& action);
  void Backoff(std::unique_lock<std::mutex>& lock, uint64_t generation, std::string_view operation,
               const std::exception& error);

  std::shared_ptr<store::ActionStore> store_;
  DispatcherOptions                   options_;

  mutable std::mutex           mutex_;
  std::condition_variable      cv_;
  std::optional<model::Action> active_;
  uint64_t                     generation_ = 0;
  RunLoopState                 state_      = RunLoopState::kStopped;
  bool                         stopping_   = false;

  std::thread       thread_;
  std::atomic<bool> running_{false};

  // declared before timers_: timer tasks enqueue deliveries
  notify::AsyncNotifier delivery_;
  timer::TimerService   timers_;
};

} // namespace actions::dispatch
