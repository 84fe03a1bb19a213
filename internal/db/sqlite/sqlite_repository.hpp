#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace actions::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertAction(Transaction&, model::ActionRecord&) override;
  std::optional<model::ActionRecord> GetAction(Transaction&, int64_t id) override;
  std::optional<model::ActionRecord> GetSoonestAction(Transaction&, int64_t before_ms) override;
  std::vector<model::ActionRecord> ListActions(Transaction&) override;
  Result DeleteAction(Transaction&, int64_t id) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
