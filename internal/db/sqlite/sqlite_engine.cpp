#include "sqlite_engine.hpp"

#include "sqlite_tx.hpp"

namespace tuplestore::db::sqlite {

SqliteEngine::SqliteEngine(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::ReadTransaction> SqliteEngine::BeginReadTransaction() {
  return std::make_unique<SqliteTransaction>(db_);
}

} // namespace tuplestore::db::sqlite
