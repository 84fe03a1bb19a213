#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace actions::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One handle is shared by every transaction; WriteMutex() serializes them
  since a sqlite connection carries a single open transaction.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::mutex& WriteMutex() {
    return write_mutex_;
  }

  // Execute a SQL string (used for pragmas/schema bootstrap)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  write_mutex_;
};

} // namespace actions::db::sqlite
