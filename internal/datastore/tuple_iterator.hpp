#pragma once

#include <deque>
#include <optional>
#include <string>
#include <vector>

#include "internal/datastore/tuple.hpp"
#include "internal/db/api/result.hpp"

namespace tuplestore::datastore {

/*
  TupleIterator

  Caller-owned view over a fully materialized query result.

  Lifecycle:
    open --Close()--> closed

  - Next() yields tuples in the order the engine produced them, then
    std::nullopt forever. After Close() it yields std::nullopt and
    records an IteratorClosed error, readable via LastError().
  - Close() on a closed iterator aborts the process.
  - Destroying an iterator that is still open aborts the process; the
    report names the query that produced it.

  Moving transfers the obligation to close. A moved-from iterator is
  inert and may be destroyed without Close().
*/
class TupleIterator {
 public:
  // origin describes the producing query for leak reports.
  TupleIterator(std::vector<RelationTuple> tuples, std::string origin);
  ~TupleIterator();

  TupleIterator(const TupleIterator&)            = delete;
  TupleIterator& operator=(const TupleIterator&) = delete;

  TupleIterator(TupleIterator&& other) noexcept;
  TupleIterator& operator=(TupleIterator&& other) noexcept;

  std::optional<RelationTuple> Next();

  // Result::Ok() when nothing was recorded.
  const db::Result& LastError() const { return err_; }

  void Close();

  bool IsClosed() const { return state_ != State::kOpen; }

 private:
  enum class State {
    kOpen,
    kClosed,
    kMovedFrom
  };

  std::deque<RelationTuple> tuples_;
  std::string               origin_;
  State                     state_;
  db::Result                err_;
};

} // namespace tuplestore::datastore
