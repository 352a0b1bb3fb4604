#include "sqlite_db.hpp"

namespace tuplestore::db::sqlite {

ErrorCode Translate(int rc) {
  switch (rc & 0xff) {
    case SQLITE_OK:
    case SQLITE_ROW:
    case SQLITE_DONE:
      return ErrorCode::OK;
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return ErrorCode::Busy;
    case SQLITE_IOERR:
      return ErrorCode::IOError;
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return ErrorCode::Corruption;
    case SQLITE_CANTOPEN:
      return ErrorCode::ConnectionFailure;
    case SQLITE_ERROR:
    case SQLITE_RANGE:
      return ErrorCode::InvalidQuery;
    case SQLITE_MISMATCH:
      return ErrorCode::DecodeFailure;
    default:
      return ErrorCode::InternalError;
  }
}

void ThrowIf(int rc, sqlite3* db, const char* what) {
  const auto code = Translate(rc);
  if (code != ErrorCode::OK) {
    throw DatabaseError(code, std::string(what) + ": " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc)));
  }
}

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw DatabaseError(ErrorCode::ConnectionFailure, "sqlite open " + path_ + ": " + msg);
  }

  try {
    Configure();
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw DatabaseError(Translate(rc), msg);
  }
}

Statement SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  Statement     owned(stmt);
  ThrowIf(rc, db_, "sqlite prepare");
  return owned;
}

void SqliteDB::Configure() {
  // WAL lets readers proceed while a writer holds the lock
  Exec("PRAGMA journal_mode=WAL;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace tuplestore::db::sqlite
