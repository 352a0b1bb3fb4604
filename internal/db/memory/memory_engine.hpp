#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/storage_engine.hpp"
#include "internal/db/model/tuple_record.hpp"

namespace tuplestore::db::memory {

class MemoryTransaction;

/*
  In-process engine over a vector of TupleRecords.

  Rows keep insertion order, which is the order Run() yields them.
  Insert()/MarkDeleted() seed fixtures; they are not a transactional
  write path.
*/
class MemoryEngine final : public db::StorageEngine {
public:
  MemoryEngine() = default;

  std::unique_ptr<ReadTransaction> BeginReadTransaction() override;

  sql::PlaceholderStyle Placeholders() const override {
    return sql::PlaceholderStyle::Question;
  }

  void Insert(const model::TupleRecord& record);

  // Sets deleted_txn on every live row equal to `tuple`. Returns the
  // number of rows touched.
  std::size_t MarkDeleted(const datastore::RelationTuple& tuple, uint64_t revision);

  // Makes the next BeginReadTransaction() throw once.
  void FailNextBegin(Result error);

private:
  friend class MemoryTransaction;

  using State = std::vector<model::TupleRecord>;

  std::mutex mutex_;
  State      committed_;
  Result     pending_begin_failure_;
};

}
