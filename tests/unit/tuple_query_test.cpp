#include "internal/datastore/tuple_query.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using tuplestore::datastore::kLiveDeletedRevision;
using tuplestore::datastore::ObjectAndRelation;
using tuplestore::datastore::TupleQuery;
using tuplestore::db::sql::Column;
using tuplestore::db::sql::PlaceholderStyle;

void TestRootCarriesNamespaceAndRevision() {
  auto query = TupleQuery::ForNamespace("doc", 12);
  assert(query.Namespace() == "doc");
  assert(query.AsOfRevision() == 12);
  assert(query.Filters().empty());
}

void TestCompiledQueryAlwaysCarriesVisibility() {
  auto statement = TupleQuery::ForNamespace("doc", 12).Compile().ToSql(PlaceholderStyle::Dollar);

  assert(statement.text ==
         "SELECT namespace, object_id, relation, userset_namespace, userset_object_id, userset_relation "
         "FROM relation_tuple WHERE namespace = $1 AND created_transaction <= $2 "
         "AND (deleted_transaction = $3 OR deleted_transaction > $4)");
  assert(statement.params.size() == 4);
  assert(std::get<std::string>(statement.params[0]) == "doc");
  assert(std::get<uint64_t>(statement.params[1]) == 12);
  assert(std::get<uint64_t>(statement.params[2]) == kLiveDeletedRevision);
  assert(std::get<uint64_t>(statement.params[3]) == 12);
}

void TestRefinementsFollowVisibilityInCallOrder() {
  auto query = TupleQuery::ForNamespace("doc", 3)
                   .WithRelation("viewer")
                   .WithObjectId("42")
                   .WithUserset(ObjectAndRelation{"user", "alice", ""});

  auto statement = query.Compile("tuples").ToSql(PlaceholderStyle::Question);
  assert(statement.text.find("FROM tuples WHERE") != std::string::npos);
  assert(statement.text.find("AND relation = ? AND object_id = ? AND userset_namespace = ? "
                             "AND userset_object_id = ? AND userset_relation = ?") != std::string::npos);
  assert(statement.params.size() == 9);
  assert(std::get<std::string>(statement.params[4]) == "viewer");
  assert(std::get<std::string>(statement.params[5]) == "42");
  assert(std::get<std::string>(statement.params[8]).empty());
}

void TestRefinementsDoNotMutateBase() {
  const auto base    = TupleQuery::ForNamespace("doc", 9).WithObjectId("42");
  const auto viewers = base.WithRelation("viewer");
  const auto editors = base.WithRelation("editor");

  assert(base.Filters().size() == 1);
  assert(viewers.Filters().size() == 2);
  assert(editors.Filters().size() == 2);
  assert(std::get<std::string>(viewers.Filters()[1].value) == "viewer");
  assert(std::get<std::string>(editors.Filters()[1].value) == "editor");
}

void TestWithSubjectMatchesWithUserset() {
  auto a = TupleQuery::ForNamespace("doc", 1).WithSubject("group", "eng", "member");
  auto b = TupleQuery::ForNamespace("doc", 1).WithUserset(ObjectAndRelation{"group", "eng", "member"});

  auto sa = a.Compile().ToSql(PlaceholderStyle::Dollar);
  auto sb = b.Compile().ToSql(PlaceholderStyle::Dollar);
  assert(sa.text == sb.text);
  assert(sa.params == sb.params);

  assert(a.Filters().size() == 3);
  assert(a.Filters()[0].column == Column::UsersetNamespace);
  assert(a.Filters()[1].column == Column::UsersetObjectId);
  assert(a.Filters()[2].column == Column::UsersetRelation);
}

} // namespace

int main() {
  TestRootCarriesNamespaceAndRevision();
  TestCompiledQueryAlwaysCarriesVisibility();
  TestRefinementsFollowVisibilityInCallOrder();
  TestRefinementsDoNotMutateBase();
  TestWithSubjectMatchesWithUserset();

  std::cout << "tuplestore_unit_tuple_query: pass\n";
  return 0;
}
