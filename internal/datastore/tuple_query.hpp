#pragma once

#include <string>
#include <vector>

#include "internal/datastore/tuple.hpp"
#include "internal/db/sql/predicate.hpp"
#include "internal/db/sql/select_query.hpp"

namespace tuplestore::datastore {

inline constexpr const char* kDefaultTupleTable = "relation_tuple";

/*
  TupleQuery

  Immutable filter accumulator for one namespace at one revision.
  Every With*() returns a new query with one more AND-ed constraint and
  leaves the receiver untouched, so a base query can be shared and
  refined in several directions.

  Building a query never touches storage and never fails. Empty ids or
  relations are a caller contract violation and are not checked here.
*/
class TupleQuery {
 public:
  static TupleQuery ForNamespace(std::string ns, Revision revision);

  [[nodiscard]] TupleQuery WithObjectId(const std::string& object_id) const;
  [[nodiscard]] TupleQuery WithRelation(const std::string& relation) const;

  // Matches namespace, object id and relation of the subject together.
  [[nodiscard]] TupleQuery WithUserset(const ObjectAndRelation& userset) const;
  [[nodiscard]] TupleQuery WithSubject(const std::string& subject_ns, const std::string& subject_object_id,
                                       const std::string& subject_relation) const;

  const std::string& Namespace() const { return namespace_; }
  Revision AsOfRevision() const { return revision_; }

  // Caller filters in call order, without the namespace and visibility clauses.
  const std::vector<db::sql::Comparison>& Filters() const { return filters_; }

  // SELECT of the six tuple columns from `table`, filtered by namespace,
  // visibility at AsOfRevision() and every refinement.
  db::sql::SelectQuery Compile(const std::string& table = kDefaultTupleTable) const;

 private:
  TupleQuery(std::string ns, Revision revision);

  TupleQuery With(db::sql::Comparison filter) const;

  std::string                       namespace_;
  Revision                          revision_;
  std::vector<db::sql::Comparison> filters_;
};

} // namespace tuplestore::datastore
