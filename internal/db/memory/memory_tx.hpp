#pragma once

#include "internal/db/api/read_transaction.hpp"
#include "memory_engine.hpp"

namespace tuplestore::db::memory {

/*
  Transaction = snapshot copy of the engine's rows.
*/

class MemoryTransaction final : public db::ReadTransaction {
 public:
  explicit MemoryTransaction(MemoryEngine& engine);

  std::unique_ptr<RowCursor> Run(const sql::SelectQuery& query) override;

  void Rollback() override;
  bool IsRolledBack() const override {
    return rolled_back_;
  }

 private:
  MemoryEngine::State snapshot_;
  bool                rolled_back_ = false;
};

// Evaluates one compiled clause against a stored row.
// Throws DatabaseError(InvalidQuery) on type mismatches.
bool Matches(const sql::Clause& clause, const model::TupleRecord& record);

} // namespace tuplestore::db::memory
