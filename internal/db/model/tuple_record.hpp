#pragma once

#include <cstdint>

#include "internal/datastore/tuple.hpp"

namespace tuplestore::db::model {

/*
  Persistent tuple row.

  IMPORTANT:
  - Rows are append-only; deletion only sets deleted_txn.
  - deleted_txn == kLiveDeletedRevision while the row is live.
  - The revision columns are never handed to datastore callers.
*/

struct TupleRecord {
  datastore::RelationTuple tuple;

  // revision that wrote the row
  uint64_t created_txn = 0;

  // revision that deleted the row
  uint64_t deleted_txn = datastore::kLiveDeletedRevision;
};

}
