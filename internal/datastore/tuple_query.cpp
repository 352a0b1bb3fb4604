#include "internal/datastore/tuple_query.hpp"

#include "internal/datastore/visibility.hpp"

namespace tuplestore::datastore {

using db::sql::Column;

TupleQuery::TupleQuery(std::string ns, Revision revision) : namespace_(std::move(ns)), revision_(revision) {
}

TupleQuery TupleQuery::ForNamespace(std::string ns, Revision revision) {
  return TupleQuery(std::move(ns), revision);
}

TupleQuery TupleQuery::With(db::sql::Comparison filter) const {
  TupleQuery next = *this;
  next.filters_.push_back(std::move(filter));
  return next;
}

TupleQuery TupleQuery::WithObjectId(const std::string& object_id) const {
  return With(db::sql::Eq(Column::ObjectId, object_id));
}

TupleQuery TupleQuery::WithRelation(const std::string& relation) const {
  return With(db::sql::Eq(Column::Relation, relation));
}

TupleQuery TupleQuery::WithUserset(const ObjectAndRelation& userset) const {
  return With(db::sql::Eq(Column::UsersetNamespace, userset.ns))
      .With(db::sql::Eq(Column::UsersetObjectId, userset.object_id))
      .With(db::sql::Eq(Column::UsersetRelation, userset.relation));
}

TupleQuery TupleQuery::WithSubject(const std::string& subject_ns, const std::string& subject_object_id,
                                   const std::string& subject_relation) const {
  return WithUserset(ObjectAndRelation{subject_ns, subject_object_id, subject_relation});
}

db::sql::SelectQuery TupleQuery::Compile(const std::string& table) const {
  db::sql::SelectQuery query(table,
                             {
                                 Column::Namespace,
                                 Column::ObjectId,
                                 Column::Relation,
                                 Column::UsersetNamespace,
                                 Column::UsersetObjectId,
                                 Column::UsersetRelation,
                             });

  query = query.Where(db::sql::Eq(Column::Namespace, namespace_));
  for (auto& clause : VisibleAt(revision_)) {
    query = query.Where(std::move(clause));
  }
  for (const auto& filter : filters_) {
    query = query.Where(filter);
  }
  return query;
}

} // namespace tuplestore::datastore
