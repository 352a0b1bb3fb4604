#pragma once

#include <cstdint>
#include <limits>
#include <string>

namespace tuplestore::datastore {

/*
  Revision = number of committed write transactions.

  A read is pinned to exactly one revision and sees every tuple created
  at or before it and not yet deleted at it.
*/
using Revision = uint64_t;

// deleted_transaction value of a tuple that was never deleted.
// INT64_MAX is the largest value a signed BIGINT column can hold, so it
// is reserved and is never a valid revision.
inline constexpr Revision kLiveDeletedRevision = static_cast<Revision>(std::numeric_limits<int64_t>::max());

struct ObjectAndRelation {
  std::string ns;
  std::string object_id;
  std::string relation;

  bool operator==(const ObjectAndRelation&) const = default;
};

/*
  One fact: object_and_relation's relation includes userset.
  userset.relation is empty when the subject is a plain object.
*/
struct RelationTuple {
  ObjectAndRelation object_and_relation;
  ObjectAndRelation userset;

  bool operator==(const RelationTuple&) const = default;
};

// ns:object_id#relation
std::string ToString(const ObjectAndRelation& onr);

// ns:object_id#relation@ns:object_id#relation
std::string ToString(const RelationTuple& tuple);

} // namespace tuplestore::datastore
