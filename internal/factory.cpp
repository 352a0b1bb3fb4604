#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_engine.hpp"
#include "internal/observability/logging.hpp"
#if TUPLESTORE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_engine.hpp"
#endif
#if TUPLESTORE_DB_POSTGRES
#include "internal/db/postgres/pg_engine.hpp"
#endif

namespace tuplestore::factory {

namespace {

std::shared_ptr<db::StorageEngine> BuildEngine(const tuplestore::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if TUPLESTORE_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    TUPLESTORE_LOG_INFO("using sqlite engine", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteEngine>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if TUPLESTORE_DB_POSTGRES
    TUPLESTORE_LOG_INFO("using postgres engine");
    return std::make_shared<db::postgres::PgEngine>(database.postgres().connection_uri());
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  TUPLESTORE_LOG_INFO("using memory engine");
  return std::make_shared<db::memory::MemoryEngine>();
}

} // namespace

Application Build(const tuplestore::runtime::config::RuntimeConfig& config) {
  Application app;
  app.engine = BuildEngine(config);

  std::string table = config.datastore().table();
  if (table.empty()) {
    table = datastore::kDefaultTupleTable;
  }
  app.reader = std::make_shared<datastore::TupleReader>(app.engine, std::move(table));
  return app;
}

} // namespace tuplestore::factory
