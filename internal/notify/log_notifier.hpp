#pragma once

#include "internal/notify/notifier.hpp"

namespace actions::notify {

// Emits one structured log line per fired action.
class LogNotifier final : public Notifier {
 public:
  void Notify(const model::Action& action) override;
};

} // namespace actions::notify
