#include "internal/db/sql/select_query.hpp"

#include <cctype>
#include <sstream>
#include <stdexcept>

namespace tuplestore::db::sql {

const char* ColumnName(Column column) {
  switch (column) {
    case Column::Namespace:
      return "namespace";
    case Column::ObjectId:
      return "object_id";
    case Column::Relation:
      return "relation";
    case Column::UsersetNamespace:
      return "userset_namespace";
    case Column::UsersetObjectId:
      return "userset_object_id";
    case Column::UsersetRelation:
      return "userset_relation";
    case Column::CreatedTxn:
      return "created_transaction";
    case Column::DeletedTxn:
      return "deleted_transaction";
  }
  throw std::invalid_argument("unknown column");
}

const char* OperatorToken(CompareOp op) {
  switch (op) {
    case CompareOp::Eq:
      return "=";
    case CompareOp::LtOrEq:
      return "<=";
    case CompareOp::Gt:
      return ">";
  }
  throw std::invalid_argument("unknown comparison operator");
}

std::string ParamToString(const Param& param) {
  if (const auto* text = std::get_if<std::string>(&param)) {
    return "'" + *text + "'";
  }
  if (const auto* u = std::get_if<uint64_t>(&param)) {
    return std::to_string(*u);
  }
  return std::to_string(std::get<int64_t>(param));
}

std::string ParamsToString(const Params& params) {
  std::string out = "[";
  for (std::size_t i = 0; i < params.size(); ++i) {
    if (i > 0) out += ", ";
    out += ParamToString(params[i]);
  }
  out += "]";
  return out;
}

bool IsValidIdentifier(const std::string& name) {
  if (name.empty()) return false;
  if (!(std::isalpha(static_cast<unsigned char>(name[0])) || name[0] == '_')) return false;
  for (char c : name) {
    if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_')) return false;
  }
  return true;
}

namespace {

class Renderer {
 public:
  explicit Renderer(PlaceholderStyle style) : style_(style) {
  }

  void Render(std::ostringstream& out, const Comparison& cmp) {
    out << ColumnName(cmp.column) << ' ' << OperatorToken(cmp.op) << ' ' << Bind(cmp.value);
  }

  Params TakeParams() {
    return std::move(params_);
  }

 private:
  std::string Bind(const Param& value) {
    params_.push_back(value);
    if (style_ == PlaceholderStyle::Dollar) {
      return "$" + std::to_string(params_.size());
    }
    return "?";
  }

  PlaceholderStyle style_;
  Params           params_;
};

} // namespace

SelectQuery::SelectQuery(std::string table, std::vector<Column> columns)
    : table_(std::move(table)), columns_(std::move(columns)) {
}

SelectQuery SelectQuery::Where(Clause clause) const {
  SelectQuery next = *this;
  next.clauses_.push_back(std::move(clause));
  return next;
}

Statement SelectQuery::ToSql(PlaceholderStyle style) const {
  if (columns_.empty()) {
    throw std::invalid_argument("select statements must have at least one result column");
  }
  if (!IsValidIdentifier(table_)) {
    throw std::invalid_argument("invalid table name: '" + table_ + "'");
  }

  Renderer           renderer(style);
  std::ostringstream out;

  out << "SELECT ";
  for (std::size_t i = 0; i < columns_.size(); ++i) {
    if (i > 0) out << ", ";
    out << ColumnName(columns_[i]);
  }
  out << " FROM " << table_;

  for (std::size_t i = 0; i < clauses_.size(); ++i) {
    out << (i == 0 ? " WHERE " : " AND ");

    if (const auto* cmp = std::get_if<Comparison>(&clauses_[i])) {
      renderer.Render(out, *cmp);
      continue;
    }

    const auto& any_of = std::get<AnyOf>(clauses_[i]);
    if (any_of.alternatives.empty()) {
      throw std::invalid_argument("OR group without alternatives");
    }
    out << '(';
    for (std::size_t j = 0; j < any_of.alternatives.size(); ++j) {
      if (j > 0) out << " OR ";
      renderer.Render(out, any_of.alternatives[j]);
    }
    out << ')';
  }

  return Statement{out.str(), renderer.TakeParams()};
}

} // namespace tuplestore::db::sql
