#pragma once

#include <vector>

#include "internal/datastore/tuple.hpp"
#include "internal/db/sql/predicate.hpp"

namespace tuplestore::datastore {

/*
  Snapshot rule for the append-only tuple table.

  A row is visible at revision R iff
    created_transaction <= R
    AND (deleted_transaction = kLiveDeletedRevision OR deleted_transaction > R)

  Every tuple query is conjoined with these clauses; callers cannot
  remove or override them.
*/
std::vector<db::sql::Clause> VisibleAt(Revision revision);

// Same rule evaluated directly on revision values.
bool IsVisibleAt(Revision created_txn, Revision deleted_txn, Revision revision);

} // namespace tuplestore::datastore
