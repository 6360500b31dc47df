#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace vesting::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by every transaction, so transactions are
  serialized on the connection through LockTransaction().
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (used for pragmas/schema)
  void Exec(const std::string& sql);

  // Held for the lifetime of a SqliteTransaction
  std::unique_lock<std::recursive_mutex> LockTransaction() {
    return std::unique_lock<std::recursive_mutex>(tx_mutex_);
  }

 private:
  void Configure(bool wal_mode);

  sqlite3*             db_ = nullptr;
  std::string          path_;
  std::recursive_mutex tx_mutex_;
};

} // namespace vesting::db::sqlite
