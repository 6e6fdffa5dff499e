#pragma once

#include <stdexcept>
#include <string>

namespace bazaar::util {

/*
  Central error types.

  Two families:
    ValidationError - bad handle, duplicate key, out-of-range value
    StateError      - operation not allowed in the current session state

  Both are raised synchronously and leave no side effect behind.
  They get translated to economy::v1::StatusCode at the API boundary.
*/

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StateError : public std::runtime_error {
 public:
  explicit StateError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public ValidationError {
 public:
  explicit NotFound(const std::string& msg) : ValidationError(msg) {
  }
};

class DuplicateKey : public ValidationError {
 public:
  explicit DuplicateKey(const std::string& msg) : ValidationError(msg) {
  }
};

class InvalidCategory : public ValidationError {
 public:
  explicit InvalidCategory(const std::string& msg) : ValidationError(msg) {
  }
};

class InvalidArgument : public ValidationError {
 public:
  explicit InvalidArgument(const std::string& msg) : ValidationError(msg) {
  }
};

class NotPurchasable : public ValidationError {
 public:
  explicit NotPurchasable(const std::string& msg) : ValidationError(msg) {
  }
};

class SessionNotActive : public StateError {
 public:
  explicit SessionNotActive(const std::string& msg) : StateError(msg) {
  }
};

class InsufficientFunds : public StateError {
 public:
  explicit InsufficientFunds(const std::string& msg) : StateError(msg) {
  }
};

class CreditLimitExceeded : public StateError {
 public:
  explicit CreditLimitExceeded(const std::string& msg) : StateError(msg) {
  }
};

class AlreadyOwned : public StateError {
 public:
  explicit AlreadyOwned(const std::string& msg) : StateError(msg) {
  }
};

class InvalidState : public StateError {
 public:
  explicit InvalidState(const std::string& msg) : StateError(msg) {
  }
};

// Persistence is shutting down or unreachable; the caller may try later.
class Unavailable : public std::runtime_error {
 public:
  explicit Unavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace bazaar::util
