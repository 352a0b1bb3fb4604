#include "memory_engine.hpp"

#include "memory_tx.hpp"

namespace tuplestore::db::memory {

std::unique_ptr<db::ReadTransaction> MemoryEngine::BeginReadTransaction() {
  {
    std::scoped_lock lock(mutex_);
    if (!pending_begin_failure_) {
      auto failure           = std::move(pending_begin_failure_);
      pending_begin_failure_ = Result::Ok();
      throw DatabaseError(failure.code, failure.message);
    }
  }
  return std::make_unique<MemoryTransaction>(*this);
}

void MemoryEngine::Insert(const model::TupleRecord& record) {
  std::scoped_lock lock(mutex_);
  committed_.push_back(record);
}

std::size_t MemoryEngine::MarkDeleted(const datastore::RelationTuple& tuple, uint64_t revision) {
  std::scoped_lock lock(mutex_);
  std::size_t      touched = 0;
  for (auto& record : committed_) {
    if (record.tuple == tuple && record.deleted_txn == datastore::kLiveDeletedRevision) {
      record.deleted_txn = revision;
      ++touched;
    }
  }
  return touched;
}

void MemoryEngine::FailNextBegin(Result error) {
  std::scoped_lock lock(mutex_);
  pending_begin_failure_ = std::move(error);
}

} // namespace tuplestore::db::memory
