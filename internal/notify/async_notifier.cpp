#include "async_notifier.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace actions::notify {

using observability::IntField;
using observability::StringField;

AsyncNotifier::AsyncNotifier(std::shared_ptr<Notifier> downstream, std::size_t threads)
    : downstream_(std::move(downstream)), thread_count_(threads == 0 ? 1 : threads) {
  if (!downstream_) throw std::invalid_argument("AsyncNotifier: downstream notifier is required");
}

AsyncNotifier::~AsyncNotifier() {
  Stop();
}

void AsyncNotifier::Start() {
  if (running_.exchange(true)) return;
  {
    std::lock_guard lock(mutex_);
    shutdown_ = false;
  }
  for (std::size_t i = 0; i < thread_count_; ++i) {
    threads_.emplace_back(&AsyncNotifier::Run, this);
  }
}

void AsyncNotifier::Stop() {
  if (!running_.exchange(false)) return;

  const auto queued = Queued();
  if (queued > 0) {
    ACTIONS_LOG_INFO("Delivering queued actions before shutdown", {IntField("queued", static_cast<int64_t>(queued))});
  }

  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();

  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

void AsyncNotifier::Notify(const model::Action& action) {
  {
    std::lock_guard lock(mutex_);
    queue_.push(action);
  }
  cv_.notify_one();
}

std::size_t AsyncNotifier::Queued() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

std::optional<model::Action> AsyncNotifier::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  model::Action action = queue_.front();
  queue_.pop();
  return action;
}

void AsyncNotifier::Run() {
  for (;;) {
    auto action = Dequeue();
    if (!action) break;

    try {
      downstream_->Notify(*action);
    } catch (const std::exception& e) {
      ACTIONS_LOG_ERROR("Notifier failed", {IntField("action_id", action->Id().value_or(0)), StringField("kind", action->KindName()),
                                            StringField("error", e.what())});
    }
  }
}

} // namespace actions::notify
