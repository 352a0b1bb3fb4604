#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"

namespace tuplestore::util {

/*
  Central error types surfaced to datastore callers.
*/

// Any failure while opening the read transaction, compiling or running
// the request, or decoding a row. Carries the engine's error code.
class QueryError : public std::runtime_error {
 public:
  QueryError(db::ErrorCode cause, const std::string& msg)
      : std::runtime_error("unable to query tuples: " + msg), cause_(cause) {
  }

  db::ErrorCode cause() const {
    return cause_;
  }

 private:
  db::ErrorCode cause_;
};

class InvalidConfig : public std::runtime_error {
 public:
  explicit InvalidConfig(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace tuplestore::util
