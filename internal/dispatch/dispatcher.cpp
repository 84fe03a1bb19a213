#include "dispatcher.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace actions::dispatch {

using observability::IntField;
using observability::StringField;

std::string_view RunLoopStateName(RunLoopState state) {
  switch (state) {
    case RunLoopState::kFetching:
      return "fetching";
    case RunLoopState::kWaitingForSignal:
      return "waiting_for_signal";
    case RunLoopState::kSleeping:
      return "sleeping";
    case RunLoopState::kFiring:
      return "firing";
    case RunLoopState::kBackoff:
      return "backoff";
    case RunLoopState::kStopped:
      return "stopped";
  }
  return "unknown";
}

Dispatcher::Dispatcher(std::shared_ptr<store::ActionStore> store, std::shared_ptr<notify::Notifier> notifier,
                       DispatcherOptions options)
    : store_(std::move(store)), options_(options), delivery_(std::move(notifier), options.delivery_threads) {
  if (!store_) throw std::invalid_argument("Dispatcher: store is required");
}

Dispatcher::~Dispatcher() {
  Stop();
}

void Dispatcher::Start() {
  if (running_.exchange(true)) return;

  {
    std::lock_guard lock(mutex_);
    stopping_ = false;
    state_    = RunLoopState::kFetching;
  }

  delivery_.Start();
  timers_.Start();
  thread_ = std::thread(&Dispatcher::Run, this);

  ACTIONS_LOG_INFO("Dispatcher started", {IntField("short_horizon_ms", options_.short_horizon.count()),
                                          IntField("store_retry_backoff_ms", options_.store_retry_backoff.count()),
                                          IntField("delivery_threads", static_cast<int64_t>(options_.delivery_threads))});
}

void Dispatcher::Stop() {
  if (!running_.exchange(false)) return;

  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();

  if (thread_.joinable()) thread_.join();
  timers_.Stop();
  delivery_.Stop();

  ACTIONS_LOG_INFO("Dispatcher stopped");
}

void Dispatcher::Reschedule() {
  {
    std::lock_guard lock(mutex_);
    ++generation_;
  }
  cv_.notify_all();
  ACTIONS_LOG_DEBUG("Dispatcher rescheduled");
}

model::Action Dispatcher::CreateAction(const model::Action& action) {
  if (action.Id()) {
    throw util::InvalidArgument("create_action: action already has id " + std::to_string(*action.Id()));
  }

  const auto delta = std::chrono::duration_cast<std::chrono::milliseconds>(action.TriggerAt() - util::Now());

  if (delta <= options_.short_horizon) {
    timers_.ScheduleAfter(delta, [this, action] { Deliver(action); });
    ACTIONS_LOG_DEBUG("Action scheduled on fast path", {StringField("kind", action.KindName()), IntField("delay_ms", delta.count())});
    return action;
  }

  auto stored = store_->Insert(action);

  bool         preempts = false;
  RunLoopState state    = RunLoopState::kStopped;
  {
    std::lock_guard lock(mutex_);
    preempts = !active_ || active_->TriggerAt() >= stored.TriggerAt();
    state    = state_;
  }

  if (preempts) {
    timers_.Post([this] { Reschedule(); });
  }

  ACTIONS_LOG_DEBUG("Action stored", {IntField("action_id", stored.Id().value_or(0)), StringField("kind", stored.KindName()),
                                      IntField("trigger_at_ms", util::ToUnixMillis(stored.TriggerAt())),
                                      observability::BoolField("reschedule", preempts), StringField("run_loop", RunLoopStateName(state))});
  return stored;
}

void Dispatcher::CancelAction(model::ActionId id) {
  // under the run-loop lock so a cancel cannot interleave with a firing
  bool was_active = false;
  {
    std::lock_guard lock(mutex_);
    store_->Delete(id);
    if (active_ && active_->Id() == id) {
      was_active = true;
      ++generation_;
    }
  }

  if (was_active) cv_.notify_all();
  ACTIONS_LOG_DEBUG("Action cancelled", {IntField("action_id", id), observability::BoolField("was_active", was_active)});
}

std::vector<model::Action> Dispatcher::PendingActions() {
  return store_->List();
}

std::optional<model::Action> Dispatcher::Active() const {
  std::lock_guard lock(mutex_);
  return active_;
}

RunLoopState Dispatcher::State() const {
  std::lock_guard lock(mutex_);
  return state_;
}

void Dispatcher::Run() {
  std::unique_lock lock(mutex_);

  while (!stopping_) {
    const uint64_t generation = generation_;
    const auto     cancelled  = [&] { return stopping_ || generation_ != generation; };

    state_ = RunLoopState::kFetching;
    try {
      active_ = store_->FetchSoonest();
    } catch (const std::exception& e) {
      Backoff(lock, generation, "fetch", e);
      continue;
    }

    if (!active_) {
      state_ = RunLoopState::kWaitingForSignal;
      cv_.wait(lock, cancelled);
      continue;
    }

    state_ = RunLoopState::kSleeping;
    ACTIONS_LOG_DEBUG("Action armed", {IntField("action_id", active_->Id().value_or(0)),
                                       IntField("trigger_at_ms", util::ToUnixMillis(active_->TriggerAt()))});

    if (cv_.wait_until(lock, active_->TriggerAt(), cancelled)) continue;

    state_ = RunLoopState::kFiring;
    const model::Action fired = *active_;
    try {
      store_->Delete(fired.Id().value());
    } catch (const std::exception& e) {
      Backoff(lock, generation, "delete", e);
      continue;
    }

    active_.reset();
    ++generation_;

    lock.unlock();
    Deliver(fired);
    lock.lock();
  }

  active_.reset();
  state_ = RunLoopState::kStopped;
}

void Dispatcher::Deliver(const model::Action& action) {
  ACTIONS_LOG_DEBUG("Action fired", {IntField("action_id", action.Id().value_or(0)), StringField("kind", action.KindName())});
  delivery_.Notify(action);
}

void Dispatcher::Backoff(std::unique_lock<std::mutex>& lock, uint64_t generation, std::string_view operation,
                         const std::exception& error) {
  const auto interrupted = state_;
  state_                 = RunLoopState::kBackoff;
  ACTIONS_LOG_WARN("Action store failure, backing off",
                   {StringField("operation", operation), StringField("state", RunLoopStateName(interrupted)),
                    StringField("error", error.what()),
                    IntField("backoff_ms", options_.store_retry_backoff.count())});

  cv_.wait_for(lock, options_.store_retry_backoff, [&] { return stopping_ || generation_ != generation; });
}

} // namespace actions::dispatch
