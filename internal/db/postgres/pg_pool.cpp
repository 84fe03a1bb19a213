#include "pg_pool.hpp"

namespace actions::db::postgres {

namespace {

constexpr const char* kActionColumns =
    "id,kind,author_id,guild_id,channel_id,message_id,created_at_ms,trigger_at_ms,extra::text";

} // namespace

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (...) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("insert_action",
               "INSERT INTO actions(kind,author_id,guild_id,channel_id,message_id,created_at_ms,trigger_at_ms,extra) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8::jsonb) RETURNING id");

  conn.prepare("get_action", std::string("SELECT ") + kActionColumns + " FROM actions WHERE id=$1");

  conn.prepare("soonest_action",
               std::string("SELECT ") + kActionColumns +
                   " FROM actions WHERE trigger_at_ms < $1 ORDER BY trigger_at_ms ASC, id ASC LIMIT 1");

  conn.prepare("list_actions", std::string("SELECT ") + kActionColumns + " FROM actions ORDER BY trigger_at_ms ASC, id ASC");

  conn.prepare("delete_action", "DELETE FROM actions WHERE id=$1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (conn->is_open()) {
      idle_.emplace_back(conn);
    } else {
      // broken by a server restart; the next Acquire dials a fresh one
      delete conn;
      --live_connections_;
    }
  }
  cv_.notify_one();
}

} // namespace actions::db::postgres
