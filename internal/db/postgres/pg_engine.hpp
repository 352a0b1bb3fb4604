#pragma once

#include <memory>
#include <string>

#include "internal/db/api/storage_engine.hpp"

namespace tuplestore::db::postgres {

/*
  PgEngine

  Connection factory for read transactions. Each transaction gets its
  own connection; no pooling.
*/
class PgEngine final : public db::StorageEngine {
 public:
  explicit PgEngine(std::string conninfo);

  std::unique_ptr<ReadTransaction> BeginReadTransaction() override;

  sql::PlaceholderStyle Placeholders() const override {
    return sql::PlaceholderStyle::Dollar;
  }

 private:
  std::string conninfo_;
};

} // namespace tuplestore::db::postgres
