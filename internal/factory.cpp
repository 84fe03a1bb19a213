#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/notify/log_notifier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/repository_action_store.hpp"
#if ACTIONS_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if ACTIONS_DB_POSTGRES
#include <pqxx/pqxx>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace actions::factory {

using observability::StringField;

namespace {

#if ACTIONS_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS actions (id INTEGER PRIMARY KEY AUTOINCREMENT, kind TEXT NOT NULL, author_id INTEGER NOT NULL, guild_id INTEGER, channel_id INTEGER NOT NULL, message_id INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, trigger_at_ms INTEGER NOT NULL, extra TEXT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS actions_trigger_at_idx ON actions(trigger_at_ms);"};

  for (const auto& sql : kBootstrapSql) {
    sqlite_db->Exec(sql);
  }

  sqlite_db->Exec("SELECT id,kind,author_id,guild_id,channel_id,message_id,created_at_ms,trigger_at_ms,extra FROM actions LIMIT 1;");
}
#endif

#if ACTIONS_DB_POSTGRES
// Runs on a plain connection: pooled connections prepare statements against the table.
void BootstrapPostgresSchema(const std::string& connection_uri) {
  pqxx::connection conn(connection_uri);
  pqxx::work       tx(conn);

  tx.exec("CREATE TABLE IF NOT EXISTS actions (id BIGSERIAL PRIMARY KEY, kind TEXT NOT NULL, author_id BIGINT NOT NULL, guild_id BIGINT, channel_id BIGINT NOT NULL, message_id BIGINT NOT NULL, created_at_ms BIGINT NOT NULL, trigger_at_ms BIGINT NOT NULL, extra JSONB NOT NULL);");
  tx.exec("CREATE INDEX IF NOT EXISTS actions_trigger_at_idx ON actions(trigger_at_ms);");

  tx.exec("SELECT id,kind,author_id,guild_id,channel_id,message_id,created_at_ms,trigger_at_ms,extra FROM actions LIMIT 1;");
  tx.commit();
}
#endif

std::shared_ptr<db::Repository> BuildRepository(const runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if ACTIONS_DB_SQLITE
    ACTIONS_LOG_INFO("Using sqlite action store", {StringField("path", database.sqlite().path())});
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    BootstrapSqliteSchema(sqlite_db);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if ACTIONS_DB_POSTGRES
    ACTIONS_LOG_INFO("Using postgres action store");
    BootstrapPostgresSchema(database.postgres().connection_uri());
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), database.postgres().max_connections());
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  ACTIONS_LOG_WARN("No database configured, actions are kept in memory only");
  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

dispatch::DispatcherOptions BuildDispatcherOptions(const runtime::config::SchedulerConfig& config) {
  dispatch::DispatcherOptions options;
  if (config.short_horizon_seconds() > 0) {
    options.short_horizon = std::chrono::seconds(config.short_horizon_seconds());
  }
  if (config.store_retry_backoff_ms() > 0) {
    options.store_retry_backoff = std::chrono::milliseconds(config.store_retry_backoff_ms());
  }
  if (config.delivery_threads() > 0) {
    options.delivery_threads = config.delivery_threads();
  }
  return options;
}

/*
    Build full application dependency graph
*/
Application Build(const runtime::config::RuntimeConfig& config) {
  Application app;

  app.repository = BuildRepository(config);

  std::chrono::milliseconds fetch_horizon = store::RepositoryActionStore::kDefaultFetchHorizon;
  if (config.scheduler().fetch_horizon_days() > 0) {
    fetch_horizon = std::chrono::hours(24) * config.scheduler().fetch_horizon_days();
  }
  app.store = std::make_shared<store::RepositoryActionStore>(app.repository, fetch_horizon);

  // fired actions are always logged; embedders subscribe further handlers
  app.notifier = std::make_shared<notify::FanoutNotifier>();
  auto log_notifier = std::make_shared<notify::LogNotifier>();
  app.notifier->Subscribe([log_notifier](const model::Action& action) { log_notifier->Notify(action); });

  app.dispatcher = std::make_shared<dispatch::Dispatcher>(app.store, app.notifier, BuildDispatcherOptions(config.scheduler()));

  return app;
}

} // namespace actions::factory
