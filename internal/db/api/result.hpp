#pragma once

#include <string>
#include <utility>

namespace ure::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Upper layers should never depend on sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,

  ConstraintViolation,
  ForeignKeyViolation,
  SerializationFailure,

  IOError,
  Corruption,

  Unsupported,
  InternalError
};

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
  Outcome of a compare-and-insert.

  inserted == false with an OK result means the unique key already held a
  row; id then names that existing row.
*/
struct InsertOutcome {
  Result      result;
  std::string id;
  bool        inserted = false;
};

const char* ToString(ErrorCode code);

} // namespace ure::db
