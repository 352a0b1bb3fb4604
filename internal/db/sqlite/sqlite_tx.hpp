#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/read_transaction.hpp"
#include "sqlite_db.hpp"

namespace tuplestore::db::sqlite {

/*
  SQLite read transaction.

  Uses BEGIN DEFERRED: the read lock is taken by the first SELECT and
  held until ROLLBACK, so every Run() sees one snapshot.
  Holds the connection's transaction lock for its whole lifetime.
*/
class SqliteTransaction final : public db::ReadTransaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  std::unique_ptr<RowCursor> Run(const sql::SelectQuery& query) override;

  void Rollback() override;
  bool IsRolledBack() const override { return rolled_back_; }

private:
  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> lock_;
  bool                         rolled_back_ = false;
};

}
