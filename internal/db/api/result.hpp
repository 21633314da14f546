#pragma once

#include <stdexcept>
#include <string>

namespace catalog::db {

/*
  Portable DB result codes.

  The sqlite layer must translate backend errors into these.
  Upper layers should never depend on sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,

  ConstraintViolation,

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
  Hard storage failure. Aborts the enclosing transaction.
*/
class DatabaseError : public std::runtime_error {
 public:
  explicit DatabaseError(Result result) : std::runtime_error(result.message), result_(std::move(result)) {
  }

  ErrorCode Code() const {
    return result_.code;
  }

 private:
  Result result_;
};

inline void ThrowIfError(const Result& result, const std::string& prefix) {
  if (result) {
    return;
  }
  throw DatabaseError(Result::Err(result.code, prefix + ": " + result.message));
}

} // namespace catalog::db
