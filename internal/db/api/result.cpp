#include "internal/db/api/result.hpp"

namespace tuplestore::db {

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::SerializationFailure:
      return "serialization_failure";
    case ErrorCode::ConnectionFailure:
      return "connection_failure";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InvalidQuery:
      return "invalid_query";
    case ErrorCode::DecodeFailure:
      return "decode_failure";
    case ErrorCode::IteratorClosed:
      return "iterator_closed";
    case ErrorCode::InternalError:
      return "internal_error";
  }
  return "unknown";
}

} // namespace tuplestore::db
