#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

#include "internal/db/api/result.hpp"

namespace tuplestore::db::sqlite {

struct StatementDeleter {
  void operator()(sqlite3_stmt* stmt) const {
    sqlite3_finalize(stmt);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by all transactions of an engine, so
  transactions serialize on TransactionLock().
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

  // Execute a SQL string (pragmas, BEGIN/ROLLBACK, fixtures)
  void Exec(const std::string& sql);

  Statement Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure();

  std::unique_lock<std::mutex> TransactionLock() {
    return std::unique_lock<std::mutex>(tx_mutex_);
  }

  const std::string& Path() const {
    return path_;
  }

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

// Maps a sqlite return code onto the portable codes.
ErrorCode Translate(int rc);

// Throws DatabaseError carrying sqlite3_errmsg(db) unless rc is OK/ROW/DONE.
void ThrowIf(int rc, sqlite3* db, const char* what);

} // namespace tuplestore::db::sqlite
