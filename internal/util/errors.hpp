#pragma once

#include <stdexcept>
#include <string>

namespace timekeeper::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
  Absent records are not errors inside the core (std::optional); NotFound is
  raised only at the service boundary.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ValidationFailure : public std::runtime_error {
 public:
  explicit ValidationFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InactiveMatchOperation : public std::runtime_error {
 public:
  explicit InactiveMatchOperation(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UnknownOperation : public std::runtime_error {
 public:
  explicit UnknownOperation(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PermissionDenied : public std::runtime_error {
 public:
  explicit PermissionDenied(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StoreUnavailable : public std::runtime_error {
 public:
  explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StoreCorrupted : public std::runtime_error {
 public:
  explicit StoreCorrupted(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace timekeeper::util
