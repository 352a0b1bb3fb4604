#include "internal/datastore/tuple_reader.hpp"

#include <stdexcept>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace tuplestore::datastore {

namespace obs = tuplestore::observability;

namespace {

constexpr int kTupleColumns = 6;

std::string ReadColumn(const db::sql::Row& row, int col) {
  if (row.IsNull(col)) {
    throw db::DatabaseError(db::ErrorCode::DecodeFailure, "column " + std::to_string(col) + " is NULL");
  }
  return row.GetText(col);
}

RelationTuple DecodeTuple(const db::sql::Row& row) {
  if (row.Columns() < kTupleColumns) {
    throw db::DatabaseError(db::ErrorCode::DecodeFailure,
                            "expected " + std::to_string(kTupleColumns) + " columns, got " + std::to_string(row.Columns()));
  }

  RelationTuple tuple;
  tuple.object_and_relation.ns        = ReadColumn(row, 0);
  tuple.object_and_relation.object_id = ReadColumn(row, 1);
  tuple.object_and_relation.relation  = ReadColumn(row, 2);
  tuple.userset.ns                    = ReadColumn(row, 3);
  tuple.userset.object_id             = ReadColumn(row, 4);
  tuple.userset.relation              = ReadColumn(row, 5);
  return tuple;
}

util::QueryError Fail(db::ErrorCode code, const std::string& cause, const TupleQuery& query) {
  TUPLESTORE_LOG_WARN("tuple query failed", {obs::StringField("namespace", query.Namespace()),
                                             obs::IntField("revision", static_cast<std::int64_t>(query.AsOfRevision())),
                                             obs::StringField("code", db::ErrorCodeName(code)),
                                             obs::StringField("error", cause)});
  return util::QueryError(code, cause);
}

} // namespace

TupleReader::TupleReader(std::shared_ptr<db::StorageEngine> engine, std::string table)
    : engine_(std::move(engine)), table_(std::move(table)) {
  if (!engine_) {
    throw std::invalid_argument("TupleReader requires a storage engine");
  }
}

TupleQuery TupleReader::QueryTuples(std::string ns, Revision revision) const {
  return TupleQuery::ForNamespace(std::move(ns), revision);
}

TupleIterator TupleReader::Execute(const TupleQuery& query) const {
  std::vector<RelationTuple> tuples;
  std::string                origin;

  try {
    auto tx = engine_->BeginReadTransaction();

    auto request   = query.Compile(table_);
    auto statement = request.ToSql(engine_->Placeholders());
    origin         = statement.text + " args: " + db::sql::ParamsToString(statement.params);

    {
      auto cursor = tx->Run(request);
      while (const db::sql::Row* row = cursor->Next()) {
        tuples.push_back(DecodeTuple(*row));
      }
    }

    try {
      tx->Rollback();
    } catch (const db::DatabaseError& e) {
      // Rows are already in memory; the engine discards the transaction anyway.
      TUPLESTORE_LOG_WARN("read transaction rollback failed", {obs::StringField("error", e.what())});
    }
  } catch (const db::DatabaseError& e) {
    throw Fail(e.code(), e.what(), query);
  } catch (const std::invalid_argument& e) {
    throw Fail(db::ErrorCode::InvalidQuery, e.what(), query);
  } catch (const std::exception& e) {
    throw Fail(db::ErrorCode::InternalError, e.what(), query);
  }

  TUPLESTORE_LOG_DEBUG("tuple query executed", {obs::StringField("namespace", query.Namespace()),
                                                obs::IntField("revision", static_cast<std::int64_t>(query.AsOfRevision())),
                                                obs::IntField("rows", static_cast<std::int64_t>(tuples.size()))});

  return TupleIterator(std::move(tuples), std::move(origin));
}

} // namespace tuplestore::datastore
