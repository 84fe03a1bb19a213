#pragma once

#include "internal/model/action.hpp"

namespace actions::notify {

/*
  Receives fired actions.

  Called once per fired action from the dispatcher's delivery threads,
  never from the run-loop or timer thread, so implementations must accept
  concurrent calls. Delivery is fire-and-forget and is not retried.
*/
class Notifier {
 public:
  virtual ~Notifier() = default;

  virtual void Notify(const model::Action& action) = 0;
};

} // namespace actions::notify
