#pragma once

#include <memory>
#include <pqxx/pqxx>
#include <string>

#include "internal/db/api/read_transaction.hpp"

namespace tuplestore::db::postgres {

using ReadWork = pqxx::transaction<pqxx::isolation_level::repeatable_read, pqxx::write_policy::read_only>;

/*
  Postgres read transaction.

  Each transaction opens its own connection (libpqxx connections are
  not thread-safe, so they are never shared) and runs under
  REPEATABLE READ, READ ONLY so every Run() sees one snapshot.
*/
class PgTransaction final : public db::ReadTransaction {
public:
  explicit PgTransaction(const std::string& conninfo);
  ~PgTransaction();

  std::unique_ptr<RowCursor> Run(const sql::SelectQuery& query) override;

  void Rollback() override;
  bool IsRolledBack() const override { return rolled_back_; }

private:
  std::unique_ptr<pqxx::connection> conn_;
  std::unique_ptr<ReadWork> tx_;
  bool rolled_back_ = false;
};

// Maps libpqxx exceptions onto the portable codes.
DatabaseError Translate(const std::exception& e);

}
