#pragma once

#include "internal/db/sql/sql_row.hpp"

namespace tuplestore::db {

/*
  Forward-only cursor over the rows produced by ReadTransaction::Run().

  Next() returns nullptr once the result set is exhausted. The returned
  row is valid until the following Next() call. Throws DatabaseError if
  the engine fails while producing a row.
*/
class RowCursor {
 public:
  virtual ~RowCursor() = default;

  virtual const sql::Row* Next() = 0;
};

} // namespace tuplestore::db
