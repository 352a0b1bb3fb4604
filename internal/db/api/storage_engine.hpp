#pragma once

#include <memory>

#include "internal/db/api/read_transaction.hpp"
#include "internal/db/sql/select_query.hpp"

namespace tuplestore::db {

/*
  The relational execution engine the datastore reads through.

  Only the read side is modelled: open a transaction, run a compiled
  SELECT inside it, roll it back.
*/
class StorageEngine {
 public:
  virtual ~StorageEngine() = default;

  // Throws DatabaseError if no transaction can be opened.
  virtual std::unique_ptr<ReadTransaction> BeginReadTransaction() = 0;

  // How this engine renders bound parameters.
  virtual sql::PlaceholderStyle Placeholders() const = 0;
};

} // namespace tuplestore::db
