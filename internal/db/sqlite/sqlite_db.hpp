#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace datahub::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection per process. Transactions serialize on TxMutex(); sqlite
  allows a single writer anyway and the connection cannot nest BEGIN.
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

  const std::string& Path() const {
    return path_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/migrations/transaction control).
  // Throws util::TransactionConflict on SQLITE_BUSY/SQLITE_LOCKED.
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace datahub::db::sqlite
