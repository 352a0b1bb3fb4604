#include "memory_tx.hpp"

#include <optional>
#include <string>
#include <variant>

namespace tuplestore::db::memory {

namespace {

using ColumnValue = std::variant<std::string, uint64_t>;

ColumnValue ValueOf(sql::Column column, const model::TupleRecord& r) {
  switch (column) {
    case sql::Column::Namespace:
      return r.tuple.object_and_relation.ns;
    case sql::Column::ObjectId:
      return r.tuple.object_and_relation.object_id;
    case sql::Column::Relation:
      return r.tuple.object_and_relation.relation;
    case sql::Column::UsersetNamespace:
      return r.tuple.userset.ns;
    case sql::Column::UsersetObjectId:
      return r.tuple.userset.object_id;
    case sql::Column::UsersetRelation:
      return r.tuple.userset.relation;
    case sql::Column::CreatedTxn:
      return r.created_txn;
    case sql::Column::DeletedTxn:
      return r.deleted_txn;
  }
  throw DatabaseError(ErrorCode::InvalidQuery, "unknown column");
}

// <0, 0, >0 like strcmp.
int Compare(const ColumnValue& lhs, const sql::Param& rhs, sql::Column column) {
  if (const auto* text = std::get_if<std::string>(&lhs)) {
    const auto* other = std::get_if<std::string>(&rhs);
    if (other == nullptr) {
      throw DatabaseError(ErrorCode::InvalidQuery, std::string("text column compared to integer: ") + sql::ColumnName(column));
    }
    return text->compare(*other);
  }

  const uint64_t value = std::get<uint64_t>(lhs);
  uint64_t       other = 0;
  if (const auto* u = std::get_if<uint64_t>(&rhs)) {
    other = *u;
  } else if (const auto* i = std::get_if<int64_t>(&rhs)) {
    if (*i < 0) return 1;
    other = static_cast<uint64_t>(*i);
  } else {
    throw DatabaseError(ErrorCode::InvalidQuery, std::string("integer column compared to text: ") + sql::ColumnName(column));
  }
  return value < other ? -1 : (value > other ? 1 : 0);
}

bool Matches(const sql::Comparison& cmp, const model::TupleRecord& record) {
  const int order = Compare(ValueOf(cmp.column, record), cmp.value, cmp.column);
  switch (cmp.op) {
    case sql::CompareOp::Eq:
      return order == 0;
    case sql::CompareOp::LtOrEq:
      return order <= 0;
    case sql::CompareOp::Gt:
      return order > 0;
  }
  throw DatabaseError(ErrorCode::InvalidQuery, "unknown comparison operator");
}

class ProjectedRow final : public sql::Row {
 public:
  ProjectedRow(const std::vector<sql::Column>& columns, const model::TupleRecord& record)
      : columns_(columns), record_(record) {
  }

  int Columns() const override {
    return static_cast<int>(columns_.size());
  }

  std::string GetText(int col) const override {
    auto value = ValueOf(columns_.at(col), record_);
    if (auto* text = std::get_if<std::string>(&value)) {
      return *text;
    }
    return std::to_string(std::get<uint64_t>(value));
  }

  int64_t GetInt64(int col) const override {
    auto value = ValueOf(columns_.at(col), record_);
    if (auto* u = std::get_if<uint64_t>(&value)) {
      return static_cast<int64_t>(*u);
    }
    throw DatabaseError(ErrorCode::DecodeFailure, std::string("not an integer column: ") + sql::ColumnName(columns_.at(col)));
  }

  bool IsNull(int) const override {
    return false;
  }

 private:
  const std::vector<sql::Column>& columns_;
  const model::TupleRecord&       record_;
};

class MemoryCursor final : public RowCursor {
 public:
  MemoryCursor(std::vector<sql::Column> columns, std::vector<model::TupleRecord> rows)
      : columns_(std::move(columns)), rows_(std::move(rows)) {
  }

  const sql::Row* Next() override {
    if (next_ >= rows_.size()) {
      return nullptr;
    }
    current_.emplace(columns_, rows_[next_++]);
    return &*current_;
  }

 private:
  std::vector<sql::Column>        columns_;
  std::vector<model::TupleRecord> rows_;
  std::size_t                     next_ = 0;
  std::optional<ProjectedRow>     current_;
};

} // namespace

bool Matches(const sql::Clause& clause, const model::TupleRecord& record) {
  if (const auto* cmp = std::get_if<sql::Comparison>(&clause)) {
    return Matches(*cmp, record);
  }

  const auto& any_of = std::get<sql::AnyOf>(clause);
  if (any_of.alternatives.empty()) {
    throw DatabaseError(ErrorCode::InvalidQuery, "OR group without alternatives");
  }
  for (const auto& alternative : any_of.alternatives) {
    if (Matches(alternative, record)) {
      return true;
    }
  }
  return false;
}

MemoryTransaction::MemoryTransaction(MemoryEngine& engine) {
  std::scoped_lock lock(engine.mutex_);
  snapshot_ = engine.committed_; // snapshot copy
}

std::unique_ptr<RowCursor> MemoryTransaction::Run(const sql::SelectQuery& query) {
  if (rolled_back_) {
    throw DatabaseError(ErrorCode::InternalError, "transaction already rolled back");
  }
  if (query.Columns().empty()) {
    throw DatabaseError(ErrorCode::InvalidQuery, "select statements must have at least one result column");
  }

  std::vector<model::TupleRecord> matched;
  for (const auto& record : snapshot_) {
    bool keep = true;
    for (const auto& clause : query.Clauses()) {
      if (!Matches(clause, record)) {
        keep = false;
        break;
      }
    }
    if (keep) {
      matched.push_back(record);
    }
  }

  return std::make_unique<MemoryCursor>(query.Columns(), std::move(matched));
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
  snapshot_.clear();
}

} // namespace tuplestore::db::memory
