#include "internal/datastore/visibility.hpp"

namespace tuplestore::datastore {

using db::sql::AnyOf;
using db::sql::Column;

std::vector<db::sql::Clause> VisibleAt(Revision revision) {
  return {
      db::sql::LtOrEq(Column::CreatedTxn, revision),
      AnyOf{{
          db::sql::Eq(Column::DeletedTxn, kLiveDeletedRevision),
          db::sql::Gt(Column::DeletedTxn, revision),
      }},
  };
}

bool IsVisibleAt(Revision created_txn, Revision deleted_txn, Revision revision) {
  return created_txn <= revision && (deleted_txn == kLiveDeletedRevision || deleted_txn > revision);
}

} // namespace tuplestore::datastore
