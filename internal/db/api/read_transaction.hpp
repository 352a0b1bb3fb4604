#pragma once

#include <memory>

#include "internal/db/api/row_cursor.hpp"
#include "internal/db/sql/select_query.hpp"

namespace tuplestore::db {

/*
  Abstract read transaction.

  Semantics guaranteed for ALL engines:

  - Every Run() inside one transaction sees the same snapshot
  - Nothing is ever written; the transaction is only an isolation fence
  - Rollback() ends it; a second Rollback() is a no-op
  - Destructor MUST rollback if Rollback() was not called

  SQLite: BEGIN DEFERRED
  Postgres: pqxx::transaction<repeatable_read, read_only>
  Memory: snapshot copy
*/

class ReadTransaction {
public:
  virtual ~ReadTransaction() = default;

  // Throws DatabaseError on execution failure.
  // The returned cursor must not outlive this transaction.
  virtual std::unique_ptr<RowCursor> Run(const sql::SelectQuery& query) = 0;

  virtual void Rollback() = 0;

  virtual bool IsRolledBack() const = 0;
};

}
