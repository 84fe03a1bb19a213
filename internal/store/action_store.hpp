#pragma once

#include <optional>
#include <vector>

#include "internal/model/action.hpp"

namespace actions::store {

/*
  Durable storage of pending actions, as seen by the dispatcher.

  Failures surface as exceptions (util::StoreUnavailable for backend
  trouble).
*/
class ActionStore {
 public:
  virtual ~ActionStore() = default;

  // Soonest action due within the fetch horizon, if any.
  virtual std::optional<model::Action> FetchSoonest() = 0;

  // Persists `action` (id must be unset) and returns it with its id.
  virtual model::Action Insert(const model::Action& action) = 0;

  // No-op when the id is absent.
  virtual void Delete(model::ActionId id) = 0;

  // Every stored action ordered by trigger time.
  virtual std::vector<model::Action> List() = 0;
};

} // namespace actions::store
