#pragma once

#include <memory>

#include "internal/db/api/storage_engine.hpp"
#include "sqlite_db.hpp"

namespace tuplestore::db::sqlite {

class SqliteEngine final : public db::StorageEngine {
 public:
  explicit SqliteEngine(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<ReadTransaction> BeginReadTransaction() override;

  sql::PlaceholderStyle Placeholders() const override {
    return sql::PlaceholderStyle::Question;
  }

 private:
  std::shared_ptr<SqliteDB> db_;
};

} // namespace tuplestore::db::sqlite
