#include "pg_engine.hpp"

#include "pg_tx.hpp"

namespace tuplestore::db::postgres {

PgEngine::PgEngine(std::string conninfo) : conninfo_(std::move(conninfo)) {
}

std::unique_ptr<db::ReadTransaction> PgEngine::BeginReadTransaction() {
  return std::make_unique<PgTransaction>(conninfo_);
}

} // namespace tuplestore::db::postgres
