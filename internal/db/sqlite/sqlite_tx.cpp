#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace actions::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->WriteMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!committed_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      ACTIONS_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  lock_.unlock();
}

void SqliteTransaction::Rollback() {
  committed_ = true;
  db_->Exec("ROLLBACK;");
  lock_.unlock();
}

} // namespace actions::db::sqlite
