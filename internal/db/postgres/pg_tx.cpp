#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace actions::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool)
{
  conn_ = pool->Acquire();
  tx_ = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (!committed_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      ACTIONS_LOG_WARN("postgres abort failed", {observability::StringField("error", e.what())});
    }
  }
  // the work must close before its connection goes back to the pool
  tx_.reset();
}

void PgTransaction::Commit() {
  tx_->commit();
  committed_ = true;
}

void PgTransaction::Rollback() {
  committed_ = true;
  tx_->abort();
}

}
