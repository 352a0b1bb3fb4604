#include "internal/datastore/tuple.hpp"

namespace tuplestore::datastore {

std::string ToString(const ObjectAndRelation& onr) {
  return onr.ns + ":" + onr.object_id + "#" + onr.relation;
}

std::string ToString(const RelationTuple& tuple) {
  return ToString(tuple.object_and_relation) + "@" + ToString(tuple.userset);
}

} // namespace tuplestore::datastore
