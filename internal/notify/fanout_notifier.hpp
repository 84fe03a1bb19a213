#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

#include "internal/notify/notifier.hpp"

namespace actions::notify {

/*
  Delivers each fired action to every subscribed handler, in subscription
  order. A throwing handler is logged and skipped; the others still run.
*/
class FanoutNotifier final : public Notifier {
 public:
  using Handler      = std::function<void(const model::Action&)>;
  using SubscriberId = uint64_t;

  SubscriberId Subscribe(Handler handler);
  void         Unsubscribe(SubscriberId id);

  void Notify(const model::Action& action) override;

 private:
  std::mutex                                      mutex_;
  std::vector<std::pair<SubscriberId, Handler>>   handlers_;
  SubscriberId                                    next_id_ = 1;
};

} // namespace actions::notify
