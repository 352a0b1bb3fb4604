#pragma once

#include <stdexcept>
#include <string>

namespace tuplestore::db {

/*
  Portable DB result codes.

  Storage engines must translate backend errors into these.
  Upper layers should never depend on pqxx/sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  Busy,
  SerializationFailure,
  ConnectionFailure,

  IOError,
  Corruption,

  InvalidQuery,
  DecodeFailure,
  IteratorClosed,

  InternalError
};

const char* ErrorCodeName(ErrorCode code);

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

/*
  Thrown by storage engines when a backend call fails.
  The code is already translated; what() keeps the driver message.
*/
class DatabaseError : public std::runtime_error {
 public:
  DatabaseError(ErrorCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  ErrorCode code() const {
    return code_;
  }

 private:
  ErrorCode code_;
};

} // namespace tuplestore::db
