#pragma once

#include <stdexcept>
#include <string>

namespace bnpl {

// -----------------------------------------------------------------------------
// ErrorKind
// -----------------------------------------------------------------------------
// Failure taxonomy shared by every component. The kind is what callers branch
// on (the node maps it to the "kind" field of an error response); the message
// is for humans.
//
//   Validation   : malformed input, rejected before any mutation.
//   Authorization: the immediate caller is not the stored holder.
//   StateConflict: the request violates a lifecycle invariant.
//   Reentrancy   : a fund-moving entry point was re-entered.
//   External     : the custody asset refused a transfer or a freeze.
// -----------------------------------------------------------------------------
enum class ErrorKind {
  Validation,
  Authorization,
  StateConflict,
  Reentrancy,
  External,
};

inline const char* errorKindToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Validation:    return "validation";
    case ErrorKind::Authorization: return "authorization";
    case ErrorKind::StateConflict: return "state_conflict";
    case ErrorKind::Reentrancy:    return "reentrancy";
    case ErrorKind::External:      return "external";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// ProtocolError: base of every error raised by the core
// -----------------------------------------------------------------------------
//
// @brief  std::runtime_error carrying an ErrorKind.
//
// @details
// Every entry point either completes or throws a ProtocolError. Throwing
// unwinds through the open Journal::Scope objects, which roll back all
// mutations made by the failed operation across all four ledgers.
//
// Soft failures (custody freeze, cross-component notification) are caught as
// ProtocolError at the call site, logged, and not rethrown.
// -----------------------------------------------------------------------------
class ProtocolError : public std::runtime_error {
 public:
  ProtocolError(ErrorKind kind, const std::string& message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

 private:
  ErrorKind kind_;
};

class ValidationError : public ProtocolError {
 public:
  explicit ValidationError(const std::string& message)
      : ProtocolError(ErrorKind::Validation, message) {}
};

class AuthorizationError : public ProtocolError {
 public:
  explicit AuthorizationError(const std::string& message)
      : ProtocolError(ErrorKind::Authorization, message) {}
};

class StateConflictError : public ProtocolError {
 public:
  explicit StateConflictError(const std::string& message)
      : ProtocolError(ErrorKind::StateConflict, message) {}
};

class ReentrancyError : public ProtocolError {
 public:
  explicit ReentrancyError(const std::string& message)
      : ProtocolError(ErrorKind::Reentrancy, message) {}
};

class CustodyError : public ProtocolError {
 public:
  explicit CustodyError(const std::string& message)
      : ProtocolError(ErrorKind::External, message) {}
};

}  // namespace bnpl
