#include "internal/datastore/tuple_reader.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/memory/memory_engine.hpp"
#include "internal/db/model/tuple_record.hpp"
#include "internal/util/errors.hpp"

namespace {

using tuplestore::datastore::kLiveDeletedRevision;
using tuplestore::datastore::ObjectAndRelation;
using tuplestore::datastore::RelationTuple;
using tuplestore::datastore::TupleIterator;
using tuplestore::datastore::TupleQuery;
using tuplestore::datastore::TupleReader;
using tuplestore::db::DatabaseError;
using tuplestore::db::ErrorCode;
using tuplestore::db::memory::MemoryEngine;
using tuplestore::db::model::TupleRecord;
using tuplestore::util::QueryError;

RelationTuple MakeTuple(const std::string& object_id, const std::string& relation = "viewer",
                        const std::string& user = "alice") {
  return RelationTuple{{"doc", object_id, relation}, {"user", user, ""}};
}

TupleRecord MakeRecord(const RelationTuple& tuple, uint64_t created, uint64_t deleted = kLiveDeletedRevision) {
  TupleRecord record;
  record.tuple       = tuple;
  record.created_txn = created;
  record.deleted_txn = deleted;
  return record;
}

std::vector<RelationTuple> Drain(const TupleReader& reader, const TupleQuery& query) {
  auto                       iter = reader.Execute(query);
  std::vector<RelationTuple> out;
  while (auto tuple = iter.Next()) {
    out.push_back(std::move(*tuple));
  }
  assert(iter.LastError());
  iter.Close();
  return out;
}

// ------------------------------------------------------------------
// Scripted engine for failure paths
// ------------------------------------------------------------------

struct Script {
  std::vector<std::vector<std::optional<std::string>>> rows;
  std::optional<ErrorCode>                             fail_begin;
  std::optional<ErrorCode>                             fail_run;
  std::optional<std::size_t>                           fail_after_rows;

  int begun       = 0;
  int rolled_back = 0;
  int open        = 0;
};

class ScriptedRow final : public tuplestore::db::sql::Row {
 public:
  explicit ScriptedRow(const std::vector<std::optional<std::string>>& values) : values_(values) {
  }

  int Columns() const override {
    return static_cast<int>(values_.size());
  }
  std::string GetText(int col) const override {
    return values_.at(col).value();
  }
  int64_t GetInt64(int) const override {
    throw DatabaseError(ErrorCode::DecodeFailure, "not an integer");
  }
  bool IsNull(int col) const override {
    return !values_.at(col).has_value();
  }

 private:
  const std::vector<std::optional<std::string>>& values_;
};

class ScriptedCursor final : public tuplestore::db::RowCursor {
 public:
  explicit ScriptedCursor(Script& script) : script_(script) {
  }

  const tuplestore::db::sql::Row* Next() override {
    if (script_.fail_after_rows && next_ == *script_.fail_after_rows) {
      throw DatabaseError(ErrorCode::IOError, "connection reset while reading");
    }
    if (next_ >= script_.rows.size()) {
      return nullptr;
    }
    current_.emplace(script_.rows[next_++]);
    return &*current_;
  }

 private:
  Script&                    script_;
  std::size_t                next_ = 0;
  std::optional<ScriptedRow> current_;
};

class ScriptedTransaction final : public tuplestore::db::ReadTransaction {
 public:
  explicit ScriptedTransaction(Script& script) : script_(script) {
    ++script_.open;
  }
  ~ScriptedTransaction() override {
    if (!rolled_back_) {
      Rollback();
    }
    --script_.open;
  }

  std::unique_ptr<tuplestore::db::RowCursor> Run(const tuplestore::db::sql::SelectQuery&) override {
    if (script_.fail_run) {
      throw DatabaseError(*script_.fail_run, "relation \"relation_tuple\" does not exist");
    }
    return std::make_unique<ScriptedCursor>(script_);
  }

  void Rollback() override {
    rolled_back_ = true;
    ++script_.rolled_back;
  }
  bool IsRolledBack() const override {
    return rolled_back_;
  }

 private:
  Script& script_;
  bool    rolled_back_ = false;
};

class ScriptedEngine final : public tuplestore::db::StorageEngine {
 public:
  explicit ScriptedEngine(Script& script) : script_(script) {
  }

  std::unique_ptr<tuplestore::db::ReadTransaction> BeginReadTransaction() override {
    if (script_.fail_begin) {
      throw DatabaseError(*script_.fail_begin, "could not connect");
    }
    ++script_.begun;
    return std::make_unique<ScriptedTransaction>(script_);
  }

  tuplestore::db::sql::PlaceholderStyle Placeholders() const override {
    return tuplestore::db::sql::PlaceholderStyle::Dollar;
  }

 private:
  Script& script_;
};

std::vector<std::optional<std::string>> FullRow(const std::string& object_id) {
  return {"doc", object_id, "viewer", "user", "alice", ""};
}

// ------------------------------------------------------------------
// Tests
// ------------------------------------------------------------------

void TestSnapshotScenario() {
  auto engine = std::make_shared<MemoryEngine>();
  auto stored = RelationTuple{{"doc", "42", "viewer"}, {"user", "alice", ""}};
  engine->Insert(MakeRecord(stored, 5));

  TupleReader reader(engine);
  auto        query_at = [&](uint64_t revision) { return reader.QueryTuples("doc", revision).WithObjectId("42"); };

  assert(Drain(reader, query_at(4)).empty());

  auto at5 = Drain(reader, query_at(5));
  assert(at5.size() == 1);
  assert(at5[0] == stored);

  assert(engine->MarkDeleted(stored, 9) == 1);
  assert(Drain(reader, query_at(9)).empty());

  auto at8 = Drain(reader, query_at(8));
  assert(at8.size() == 1);
  assert(at8[0] == stored);
}

void TestRepeatedObjectIdIsIdempotent() {
  auto engine = std::make_shared<MemoryEngine>();
  engine->Insert(MakeRecord(MakeTuple("1"), 1));
  engine->Insert(MakeRecord(MakeTuple("2"), 1));
  engine->Insert(MakeRecord(MakeTuple("1", "editor"), 1));

  TupleReader reader(engine);
  auto        once  = Drain(reader, reader.QueryTuples("doc", 10).WithObjectId("1"));
  auto        twice = Drain(reader, reader.QueryTuples("doc", 10).WithObjectId("1").WithObjectId("1"));
  assert(once.size() == 2);
  assert(once == twice);

  // differing refinements accumulate instead of replacing each other
  assert(Drain(reader, reader.QueryTuples("doc", 10).WithObjectId("1").WithObjectId("2")).empty());
}

void TestBranchesFromSharedBaseAreIndependent() {
  auto engine = std::make_shared<MemoryEngine>();
  engine->Insert(MakeRecord(MakeTuple("1", "viewer"), 1));
  engine->Insert(MakeRecord(MakeTuple("1", "editor"), 1));
  engine->Insert(MakeRecord(MakeTuple("1", "editor", "bob"), 1));

  TupleReader reader(engine);
  const auto  base    = reader.QueryTuples("doc", 3).WithObjectId("1");
  const auto  viewers = base.WithRelation("viewer");
  const auto  editors = base.WithRelation("editor");

  assert(Drain(reader, editors).size() == 2);
  assert(Drain(reader, viewers).size() == 1);
  assert(Drain(reader, base).size() == 3);
}

void TestUsersetFilterMatchesAllThreeFields() {
  auto engine = std::make_shared<MemoryEngine>();
  engine->Insert(MakeRecord(RelationTuple{{"doc", "1", "viewer"}, {"group", "eng", "member"}}, 1));
  engine->Insert(MakeRecord(RelationTuple{{"doc", "1", "viewer"}, {"group", "eng", ""}}, 1));
  engine->Insert(MakeRecord(RelationTuple{{"doc", "1", "viewer"}, {"group", "ops", "member"}}, 1));

  TupleReader reader(engine);
  auto        matched = Drain(reader, reader.QueryTuples("doc", 1).WithUserset(ObjectAndRelation{"group", "eng", "member"}));
  assert(matched.size() == 1);
  assert(matched[0].userset.relation == "member");
  assert(matched[0].userset.object_id == "eng");
}

void TestOtherNamespacesAreExcluded() {
  auto engine = std::make_shared<MemoryEngine>();
  engine->Insert(MakeRecord(MakeTuple("1"), 1));
  engine->Insert(MakeRecord(RelationTuple{{"folder", "1", "viewer"}, {"user", "alice", ""}}, 1));

  TupleReader reader(engine);
  auto        docs = Drain(reader, reader.QueryTuples("doc", 1));
  assert(docs.size() == 1);
  assert(docs[0].object_and_relation.ns == "doc");
}

void TestResultsKeepEngineOrder() {
  auto engine = std::make_shared<MemoryEngine>();
  for (const char* id : {"c", "a", "b", "d"}) {
    engine->Insert(MakeRecord(MakeTuple(id), 1));
  }

  TupleReader reader(engine);
  auto        tuples = Drain(reader, reader.QueryTuples("doc", 1));
  assert(tuples.size() == 4);
  assert(tuples[0].object_and_relation.object_id == "c");
  assert(tuples[1].object_and_relation.object_id == "a");
  assert(tuples[2].object_and_relation.object_id == "b");
  assert(tuples[3].object_and_relation.object_id == "d");
}

void TestIteratorIsDetachedFromLaterWrites() {
  auto engine = std::make_shared<MemoryEngine>();
  engine->Insert(MakeRecord(MakeTuple("1"), 1));

  TupleReader reader(engine);
  auto        iter = reader.Execute(reader.QueryTuples("doc", 100));

  engine->Insert(MakeRecord(MakeTuple("2"), 2));
  assert(engine->MarkDeleted(MakeTuple("1"), 3) == 1);

  auto first = iter.Next();
  assert(first && first->object_and_relation.object_id == "1");
  assert(!iter.Next().has_value());
  iter.Close();
}

void TestTransactionOpenFailureIsQueryError() {
  Script script;
  script.fail_begin = ErrorCode::ConnectionFailure;

  TupleReader reader(std::make_shared<ScriptedEngine>(script));
  bool        threw = false;
  try {
    auto iter = reader.Execute(reader.QueryTuples("doc", 1));
    iter.Close();
  } catch (const QueryError& e) {
    threw = true;
    assert(e.cause() == ErrorCode::ConnectionFailure);
    assert(std::string(e.what()) == "unable to query tuples: could not connect");
  }
  assert(threw);
  assert(script.begun == 0);
}

void TestCompilationFailureIsQueryError() {
  auto engine = std::make_shared<MemoryEngine>();
  engine->Insert(MakeRecord(MakeTuple("1"), 1));

  TupleReader reader(engine, "not a table");
  bool        threw = false;
  try {
    auto iter = reader.Execute(reader.QueryTuples("doc", 1));
    iter.Close();
  } catch (const QueryError& e) {
    threw = true;
    assert(e.cause() == ErrorCode::InvalidQuery);
  }
  assert(threw);
}

void TestExecutionFailureRollsBack() {
  Script script;
  script.fail_run = ErrorCode::InvalidQuery;

  TupleReader reader(std::make_shared<ScriptedEngine>(script));
  bool        threw = false;
  try {
    auto iter = reader.Execute(reader.QueryTuples("doc", 1));
    iter.Close();
  } catch (const QueryError& e) {
    threw = true;
    assert(e.cause() == ErrorCode::InvalidQuery);
  }
  assert(threw);
  assert(script.begun == 1);
  assert(script.rolled_back == 1);
  assert(script.open == 0);
}

void TestNullColumnDiscardsWholeResult() {
  Script script;
  script.rows.push_back(FullRow("1"));
  script.rows.push_back({"doc", "2", "viewer", "user", std::nullopt, ""});
  script.rows.push_back(FullRow("3"));

  TupleReader reader(std::make_shared<ScriptedEngine>(script));
  bool        threw = false;
  try {
    auto iter = reader.Execute(reader.QueryTuples("doc", 1));
    iter.Close();
  } catch (const QueryError& e) {
    threw = true;
    assert(e.cause() == ErrorCode::DecodeFailure);
  }
  assert(threw && "a malformed row must fail the whole query");
  assert(script.rolled_back == 1);
  assert(script.open == 0);
}

void TestShortRowIsDecodeFailure() {
  Script script;
  script.rows.push_back({"doc", "1", "viewer"});

  TupleReader reader(std::make_shared<ScriptedEngine>(script));
  bool        threw = false;
  try {
    auto iter = reader.Execute(reader.QueryTuples("doc", 1));
    iter.Close();
  } catch (const QueryError& e) {
    threw = true;
    assert(e.cause() == ErrorCode::DecodeFailure);
  }
  assert(threw);
}

void TestCursorFailureMidStreamIsQueryError() {
  Script script;
  script.rows.push_back(FullRow("1"));
  script.rows.push_back(FullRow("2"));
  script.fail_after_rows = 1;

  TupleReader reader(std::make_shared<ScriptedEngine>(script));
  bool        threw = false;
  try {
    auto iter = reader.Execute(reader.QueryTuples("doc", 1));
    iter.Close();
  } catch (const QueryError& e) {
    threw = true;
    assert(e.cause() == ErrorCode::IOError);
  }
  assert(threw);
  assert(script.open == 0);
}

void TestSuccessfulQueryRollsBackBeforeReturning() {
  Script script;
  script.rows.push_back(FullRow("1"));
  script.rows.push_back(FullRow("2"));

  TupleReader reader(std::make_shared<ScriptedEngine>(script));
  auto        iter = reader.Execute(reader.QueryTuples("doc", 1));

  assert(script.begun == 1);
  assert(script.rolled_back == 1);
  assert(script.open == 0);

  auto first = iter.Next();
  assert(first && first->object_and_relation.object_id == "1");
  iter.Close();
}

void TestBeginFailureFromMemoryEngine() {
  auto engine = std::make_shared<MemoryEngine>();
  engine->FailNextBegin(tuplestore::db::Result::Err(ErrorCode::Busy, "engine busy"));

  TupleReader reader(engine);
  bool        threw = false;
  try {
    auto iter = reader.Execute(reader.QueryTuples("doc", 1));
    iter.Close();
  } catch (const QueryError& e) {
    threw = true;
    assert(e.cause() == ErrorCode::Busy);
  }
  assert(threw);

  // the failure is one-shot
  assert(Drain(reader, reader.QueryTuples("doc", 1)).empty());
}

} // namespace

int main() {
  TestSnapshotScenario();
  TestRepeatedObjectIdIsIdempotent();
  TestBranchesFromSharedBaseAreIndependent();
  TestUsersetFilterMatchesAllThreeFields();
  TestOtherNamespacesAreExcluded();
  TestResultsKeepEngineOrder();
  TestIteratorIsDetachedFromLaterWrites();
  TestTransactionOpenFailureIsQueryError();
  TestCompilationFailureIsQueryError();
  TestExecutionFailureRollsBack();
  TestNullColumnDiscardsWholeResult();
  TestShortRowIsDecodeFailure();
  TestCursorFailureMidStreamIsQueryError();
  TestSuccessfulQueryRollsBackBeforeReturning();
  TestBeginFailureFromMemoryEngine();

  std::cout << "tuplestore_unit_tuple_reader: pass\n";
  return 0;
}
