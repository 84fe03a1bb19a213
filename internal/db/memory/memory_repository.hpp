#pragma once

#include <map>
#include <mutex>

#include "internal/db/api/repository.hpp"

namespace actions::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertAction(Transaction&, model::ActionRecord&) override;
  std::optional<model::ActionRecord> GetAction(Transaction&, int64_t id) override;
  std::optional<model::ActionRecord> GetSoonestAction(Transaction&, int64_t before_ms) override;
  std::vector<model::ActionRecord> ListActions(Transaction&) override;
  Result DeleteAction(Transaction&, int64_t id) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::map<int64_t, model::ActionRecord> actions;
    int64_t next_action_id = 1;
  };

  std::mutex mutex_;
  State committed_;
};

}
