#include "pg_tx.hpp"

#include <cstdint>
#include <limits>
#include <optional>
#include <variant>

#include "internal/observability/logging.hpp"

namespace tuplestore::db::postgres {

namespace {

class PgRow final : public sql::Row {
 public:
  explicit PgRow(pqxx::row row) : row_(std::move(row)) {
  }

  int Columns() const override {
    return static_cast<int>(row_.size());
  }

  std::string GetText(int col) const override {
    return row_[col].c_str();
  }

  int64_t GetInt64(int col) const override {
    return row_[col].as<int64_t>();
  }

  bool IsNull(int col) const override {
    return row_[col].is_null();
  }

 private:
  pqxx::row row_;
};

// pqxx::result is reference counted; the cursor keeps it alive after
// the transaction has been aborted.
class PgCursor final : public RowCursor {
 public:
  explicit PgCursor(pqxx::result result) : result_(std::move(result)) {
  }

  const sql::Row* Next() override {
    if (next_ >= result_.size()) {
      return nullptr;
    }
    current_.emplace(result_[static_cast<pqxx::result::size_type>(next_++)]);
    return &*current_;
  }

 private:
  pqxx::result          result_;
  std::size_t           next_ = 0;
  std::optional<PgRow>  current_;
};

int64_t ClampRevision(uint64_t value) {
  // No stored revision exceeds BIGINT's range.
  constexpr auto kMax = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
  return static_cast<int64_t>(value > kMax ? kMax : value);
}

pqxx::params ToParams(const sql::Params& in) {
  pqxx::params out;
  for (const auto& param : in) {
    if (const auto* text = std::get_if<std::string>(&param)) {
      out.append(*text);
    } else if (const auto* u = std::get_if<uint64_t>(&param)) {
      out.append(ClampRevision(*u));
    } else {
      out.append(std::get<int64_t>(param));
    }
  }
  return out;
}

} // namespace

DatabaseError Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::broken_connection*>(&e) != nullptr) {
    return DatabaseError(ErrorCode::ConnectionFailure, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) != nullptr ||
      dynamic_cast<const pqxx::deadlock_detected*>(&e) != nullptr) {
    return DatabaseError(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::syntax_error*>(&e) != nullptr) {
    return DatabaseError(ErrorCode::InvalidQuery, e.what());
  }
  if (dynamic_cast<const pqxx::conversion_error*>(&e) != nullptr) {
    return DatabaseError(ErrorCode::DecodeFailure, e.what());
  }
  if (dynamic_cast<const pqxx::insufficient_resources*>(&e) != nullptr) {
    return DatabaseError(ErrorCode::Busy, e.what());
  }
  return DatabaseError(ErrorCode::InternalError, e.what());
}

PgTransaction::PgTransaction(const std::string& conninfo) {
  try {
    conn_ = std::make_unique<pqxx::connection>(conninfo);
    tx_   = std::make_unique<ReadWork>(*conn_);
  } catch (const std::exception& e) {
    throw Translate(e);
  }
}

PgTransaction::~PgTransaction() {
  if (!rolled_back_ && tx_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      TUPLESTORE_LOG_WARN("postgres rollback in destructor failed", {observability::StringField("error", e.what())});
    }
  }
}

std::unique_ptr<RowCursor> PgTransaction::Run(const sql::SelectQuery& query) {
  if (rolled_back_) {
    throw DatabaseError(ErrorCode::InternalError, "transaction already rolled back");
  }

  sql::Statement statement;
  try {
    statement = query.ToSql(sql::PlaceholderStyle::Dollar);
  } catch (const std::invalid_argument& e) {
    throw DatabaseError(ErrorCode::InvalidQuery, e.what());
  }

  try {
    auto result = tx_->exec_params(statement.text, ToParams(statement.params));
    return std::make_unique<PgCursor>(std::move(result));
  } catch (const std::exception& e) {
    throw Translate(e);
  }
}

void PgTransaction::Rollback() {
  if (rolled_back_) {
    return;
  }
  rolled_back_ = true;
  try {
    tx_->abort();
  } catch (const std::exception& e) {
    throw Translate(e);
  }
}

}
