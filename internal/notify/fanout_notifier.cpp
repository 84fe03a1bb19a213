#include "fanout_notifier.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"

namespace actions::notify {

FanoutNotifier::SubscriberId FanoutNotifier::Subscribe(Handler handler) {
  std::lock_guard lock(mutex_);
  const auto      id = next_id_++;
  handlers_.emplace_back(id, std::move(handler));
  return id;
}

void FanoutNotifier::Unsubscribe(SubscriberId id) {
  std::lock_guard lock(mutex_);
  handlers_.erase(std::remove_if(handlers_.begin(), handlers_.end(), [id](const auto& entry) { return entry.first == id; }),
                  handlers_.end());
}

void FanoutNotifier::Notify(const model::Action& action) {
  // handlers may subscribe or create actions from inside the callback
  std::vector<std::pair<SubscriberId, Handler>> snapshot;
  {
    std::lock_guard lock(mutex_);
    snapshot = handlers_;
  }

  for (const auto& [id, handler] : snapshot) {
    try {
      handler(action);
    } catch (const std::exception& e) {
      ACTIONS_LOG_ERROR("Action handler failed", {observability::IntField("subscriber", static_cast<int64_t>(id)),
                                                  observability::IntField("action_id", action.Id().value_or(0)),
                                                  observability::StringField("error", e.what())});
    }
  }
}

} // namespace actions::notify
