#pragma once

#include <variant>
#include <vector>

#include "internal/db/sql/sql_params.hpp"

namespace tuplestore::db::sql {

/*
  Typed WHERE clauses.

  Kept structured (instead of raw SQL text) so that every engine can
  consume the same compiled request: SQL engines render it, the memory
  engine evaluates it row by row.
*/

enum class Column {
  Namespace,
  ObjectId,
  Relation,
  UsersetNamespace,
  UsersetObjectId,
  UsersetRelation,
  CreatedTxn,
  DeletedTxn
};

const char* ColumnName(Column column);

enum class CompareOp {
  Eq,
  LtOrEq,
  Gt
};

const char* OperatorToken(CompareOp op);

struct Comparison {
  Column    column;
  CompareOp op;
  Param     value;
};

// Disjunction of comparisons. Must not be empty.
struct AnyOf {
  std::vector<Comparison> alternatives;
};

using Clause = std::variant<Comparison, AnyOf>;

inline Comparison Eq(Column column, Param value) {
  return {column, CompareOp::Eq, std::move(value)};
}

inline Comparison LtOrEq(Column column, Param value) {
  return {column, CompareOp::LtOrEq, std::move(value)};
}

inline Comparison Gt(Column column, Param value) {
  return {column, CompareOp::Gt, std::move(value)};
}

} // namespace tuplestore::db::sql
