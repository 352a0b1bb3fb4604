#include "internal/datastore/tuple_iterator.hpp"

#include <cstdlib>
#include <string_view>

#include "internal/observability/logging.hpp"

namespace tuplestore::datastore {

namespace obs = tuplestore::observability;

namespace {

constexpr const char* kErrClosedIterator = "unable to iterate: iterator closed";

[[noreturn]] void LifecycleViolation(std::string_view message, const std::string& origin) {
  TUPLESTORE_LOG_CRITICAL(message, {obs::StringField("query", origin)});
  obs::FlushLogging();
  std::abort();
}

} // namespace

TupleIterator::TupleIterator(std::vector<RelationTuple> tuples, std::string origin)
    : tuples_(std::make_move_iterator(tuples.begin()), std::make_move_iterator(tuples.end())),
      origin_(std::move(origin)),
      state_(State::kOpen) {
}

TupleIterator::~TupleIterator() {
  if (state_ == State::kOpen) {
    LifecycleViolation("tuple iterator destroyed before Close() was called", origin_);
  }
}

TupleIterator::TupleIterator(TupleIterator&& other) noexcept
    : tuples_(std::move(other.tuples_)),
      origin_(std::move(other.origin_)),
      state_(other.state_),
      err_(std::move(other.err_)) {
  other.tuples_.clear();
  other.state_ = State::kMovedFrom;
}

TupleIterator& TupleIterator::operator=(TupleIterator&& other) noexcept {
  if (this == &other) {
    return *this;
  }
  if (state_ == State::kOpen) {
    LifecycleViolation("tuple iterator overwritten before Close() was called", origin_);
  }

  tuples_ = std::move(other.tuples_);
  origin_ = std::move(other.origin_);
  state_  = other.state_;
  err_    = std::move(other.err_);

  other.tuples_.clear();
  other.state_ = State::kMovedFrom;
  return *this;
}

std::optional<RelationTuple> TupleIterator::Next() {
  if (state_ != State::kOpen) {
    err_ = db::Result::Err(db::ErrorCode::IteratorClosed, kErrClosedIterator);
    return std::nullopt;
  }

  if (tuples_.empty()) {
    return std::nullopt;
  }

  RelationTuple first = std::move(tuples_.front());
  tuples_.pop_front();
  return first;
}

void TupleIterator::Close() {
  if (state_ == State::kClosed) {
    LifecycleViolation("tuple iterator double closed", origin_);
  }
  if (state_ == State::kMovedFrom) {
    LifecycleViolation("tuple iterator closed after being moved from", origin_);
  }

  tuples_.clear();
  state_ = State::kClosed;
}

} // namespace tuplestore::datastore
