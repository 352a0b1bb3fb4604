#pragma once

#include <string>
#include <vector>

#include "internal/db/sql/predicate.hpp"
#include "internal/db/sql/sql_params.hpp"

namespace tuplestore::db::sql {

enum class PlaceholderStyle {
  Dollar,   // postgres: $1, $2
  Question  // sqlite: ?
};

struct Statement {
  std::string text;
  Params      params;
};

/*
  Immutable SELECT request: projected columns, one table, and a list of
  clauses joined by AND. Where() returns a copy with one more clause.
*/
class SelectQuery {
 public:
  SelectQuery(std::string table, std::vector<Column> columns);

  SelectQuery Where(Clause clause) const;

  const std::string&         Table() const { return table_; }
  const std::vector<Column>& Columns() const { return columns_; }
  const std::vector<Clause>& Clauses() const { return clauses_; }

  // Throws std::invalid_argument when the request cannot be rendered.
  Statement ToSql(PlaceholderStyle style) const;

 private:
  std::string         table_;
  std::vector<Column> columns_;
  std::vector<Clause> clauses_;
};

bool IsValidIdentifier(const std::string& name);

} // namespace tuplestore::db::sql
