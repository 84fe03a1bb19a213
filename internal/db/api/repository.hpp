#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/action_record.hpp"

namespace actions::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes run inside a Transaction
  - Reads inside a transaction see its writes
  - InsertAction assigns a unique, positive id
  - DeleteAction of a missing id is not an error

  The DB is the source of truth for pending actions; the dispatcher only
  caches the soonest one.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Actions
  // ---------------------------------------------------------------------

  // Writes the row and stores the assigned id back into `record`.
  virtual Result InsertAction(Transaction&, model::ActionRecord& record) = 0;

  virtual std::optional<model::ActionRecord> GetAction(Transaction&, int64_t id) = 0;

  // Soonest row with trigger_at_ms < before_ms, ties broken by id.
  virtual std::optional<model::ActionRecord> GetSoonestAction(Transaction&, int64_t before_ms) = 0;

  // All rows ordered by trigger_at_ms, id.
  virtual std::vector<model::ActionRecord> ListActions(Transaction&) = 0;

  virtual Result DeleteAction(Transaction&, int64_t id) = 0;
};

} // namespace actions::db
