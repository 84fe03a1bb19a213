#pragma once

#include <exception>
#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace actions::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertAction(Transaction&, model::ActionRecord&) override;
  std::optional<model::ActionRecord> GetAction(Transaction&, int64_t id) override;
  std::optional<model::ActionRecord> GetSoonestAction(Transaction&, int64_t before_ms) override;
  std::vector<model::ActionRecord> ListActions(Transaction&) override;
  Result DeleteAction(Transaction&, int64_t id) override;

private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception& e);
};

}
