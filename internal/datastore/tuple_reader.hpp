#pragma once

#include <memory>
#include <string>

#include "internal/datastore/tuple_iterator.hpp"
#include "internal/datastore/tuple_query.hpp"
#include "internal/db/api/storage_engine.hpp"

namespace tuplestore::datastore {

/*
  TupleReader

  Executes TupleQuery values against a StorageEngine.

  Each Execute() call:
    1. opens a read transaction (isolation fence only, never committed)
    2. compiles the query plus the visibility clauses
    3. drains every matching row
    4. rolls the transaction back
  and hands the rows to the caller in a fresh, open TupleIterator.

  Results are all-or-nothing: a failure at any step throws
  util::QueryError and no tuples are returned. Nothing is retried.
*/
class TupleReader {
 public:
  explicit TupleReader(std::shared_ptr<db::StorageEngine> engine, std::string table = kDefaultTupleTable);

  // Root of every query: all tuples of `ns` visible at `revision`.
  TupleQuery QueryTuples(std::string ns, Revision revision) const;

  // Throws util::QueryError.
  TupleIterator Execute(const TupleQuery& query) const;

 private:
  std::shared_ptr<db::StorageEngine> engine_;
  std::string                        table_;
};

} // namespace tuplestore::datastore
