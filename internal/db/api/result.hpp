#pragma once

#include <stdexcept>
#include <string>

namespace timekeeper::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Upper layers should never depend on sqlite or filesystem error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
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
  Raised where a Result cannot be returned: opening a transaction, reads
  returning std::optional/std::vector, and Commit().
*/
class DbError : public std::runtime_error {
 public:
  explicit DbError(Result result) : std::runtime_error(result.message), result_(std::move(result)) {
  }

  DbError(ErrorCode code, const std::string& msg) : DbError(Result::Err(code, msg)) {
  }

  ErrorCode Code() const {
    return result_.code;
  }

  const Result& AsResult() const {
    return result_;
  }

 private:
  Result result_;
};

} // namespace timekeeper::db
