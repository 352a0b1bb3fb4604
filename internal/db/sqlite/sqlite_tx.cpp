#include "sqlite_tx.hpp"

#include <limits>
#include <stdexcept>
#include <string>
#include <variant>

#include "internal/observability/logging.hpp"

namespace tuplestore::db::sqlite {

namespace {

void Bind(sqlite3* db, sqlite3_stmt* st, int idx, const sql::Param& param) {
  int rc = SQLITE_OK;
  if (const auto* text = std::get_if<std::string>(&param)) {
    rc = sqlite3_bind_text(st, idx, text->data(), static_cast<int>(text->size()), SQLITE_TRANSIENT);
  } else if (const auto* u = std::get_if<uint64_t>(&param)) {
    // Revisions above INT64_MAX cannot be stored; clamping keeps the
    // comparisons right because no stored revision exceeds INT64_MAX.
    constexpr auto kMax = static_cast<uint64_t>(std::numeric_limits<sqlite3_int64>::max());
    rc = sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(*u > kMax ? kMax : *u));
  } else {
    rc = sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(std::get<int64_t>(param)));
  }
  ThrowIf(rc, db, "sqlite bind");
}

class SqliteRow final : public sql::Row {
 public:
  explicit SqliteRow(sqlite3_stmt* st) : st_(st) {
  }

  int Columns() const override {
    return sqlite3_column_count(st_);
  }

  std::string GetText(int col) const override {
    const unsigned char* t = sqlite3_column_text(st_, col);
    if (!t) {
      return {};
    }
    return std::string(reinterpret_cast<const char*>(t), static_cast<std::size_t>(sqlite3_column_bytes(st_, col)));
  }

  int64_t GetInt64(int col) const override {
    return static_cast<int64_t>(sqlite3_column_int64(st_, col));
  }

  bool IsNull(int col) const override {
    return sqlite3_column_type(st_, col) == SQLITE_NULL;
  }

 private:
  sqlite3_stmt* st_;
};

class SqliteCursor final : public RowCursor {
 public:
  SqliteCursor(sqlite3* db, Statement st) : db_(db), st_(std::move(st)), row_(st_.get()) {
  }

  const sql::Row* Next() override {
    if (done_) {
      return nullptr;
    }

    int rc = sqlite3_step(st_.get());
    if (rc == SQLITE_ROW) {
      return &row_;
    }

    done_ = true;
    if (rc != SQLITE_DONE) {
      ThrowIf(rc, db_, "sqlite step");
    }
    return nullptr;
  }

 private:
  sqlite3*  db_;
  Statement st_;
  SqliteRow row_;
  bool      done_ = false;
};

} // namespace

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TransactionLock()) {
  db_->Exec("BEGIN DEFERRED;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!rolled_back_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      TUPLESTORE_LOG_WARN("sqlite rollback in destructor failed", {observability::StringField("error", e.what())});
    }
  }
}

std::unique_ptr<RowCursor> SqliteTransaction::Run(const sql::SelectQuery& query) {
  if (rolled_back_) {
    throw DatabaseError(ErrorCode::InternalError, "transaction already rolled back");
  }

  sql::Statement statement;
  try {
    statement = query.ToSql(sql::PlaceholderStyle::Question);
  } catch (const std::invalid_argument& e) {
    throw DatabaseError(ErrorCode::InvalidQuery, e.what());
  }

  auto st = db_->Prepare(statement.text);
  for (std::size_t i = 0; i < statement.params.size(); ++i) {
    Bind(db_->Handle(), st.get(), static_cast<int>(i + 1), statement.params[i]);
  }

  return std::make_unique<SqliteCursor>(db_->Handle(), std::move(st));
}

void SqliteTransaction::Rollback() {
  if (rolled_back_) {
    return;
  }
  db_->Exec("ROLLBACK;");
  rolled_back_ = true;
}

} // namespace tuplestore::db::sqlite
