#pragma once

#include <chrono>
#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/store/action_store.hpp"

namespace actions::store {

/*
  ActionStore over a db::Repository.

  Each call runs in its own transaction. The fetch horizon bounds the
  soonest-row query so far-future rows never become the candidate.
*/
class RepositoryActionStore final : public ActionStore {
 public:
  static constexpr std::chrono::hours kDefaultFetchHorizon{24 * 28};

  explicit RepositoryActionStore(std::shared_ptr<db::Repository> repository,
                                 std::chrono::milliseconds fetch_horizon = kDefaultFetchHorizon);

  std::optional<model::Action> FetchSoonest() override;
  model::Action                Insert(const model::Action& action) override;
  void                         Delete(model::ActionId id) override;
  std::vector<model::Action>   List() override;

 private:
  std::shared_ptr<db::Repository> repository_;
  std::chrono::milliseconds       fetch_horizon_;
};

} // namespace actions::store
