#pragma once

#include <stdexcept>
#include <string>

namespace vesting::util {

/*
  Central error types.

  Four categories, each a base class, with one concrete class per
  failure. Messages are prefixed with the error name so callers on the
  far side of gRPC can tell them apart.

  These get translated later to gRPC status codes.
*/

class ValidationError : public std::runtime_error {
 public:
  ValidationError(const std::string& name, const std::string& msg) : std::runtime_error(name + ": " + msg) {
  }
};

class AuthorizationError : public std::runtime_error {
 public:
  AuthorizationError(const std::string& name, const std::string& msg) : std::runtime_error(name + ": " + msg) {
  }
};

class StateError : public std::runtime_error {
 public:
  StateError(const std::string& name, const std::string& msg) : std::runtime_error(name + ": " + msg) {
  }
};

class CollaboratorError : public std::runtime_error {
 public:
  CollaboratorError(const std::string& name, const std::string& msg) : std::runtime_error(name + ": " + msg) {
  }
};

// ---------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------

class InvalidBeneficiary : public ValidationError {
 public:
  explicit InvalidBeneficiary(const std::string& msg) : ValidationError("InvalidBeneficiary", msg) {
  }
};

class InvalidAmount : public ValidationError {
 public:
  explicit InvalidAmount(const std::string& msg) : ValidationError("InvalidAmount", msg) {
  }
};

class InvalidPercent : public ValidationError {
 public:
  explicit InvalidPercent(const std::string& msg) : ValidationError("InvalidPercent", msg) {
  }
};

class InvalidTimeline : public ValidationError {
 public:
  explicit InvalidTimeline(const std::string& msg) : ValidationError("InvalidTimeline", msg) {
  }
};

class LengthMismatch : public ValidationError {
 public:
  explicit LengthMismatch(const std::string& msg) : ValidationError("LengthMismatch", msg) {
  }
};

class InvalidRecoveryAccount : public ValidationError {
 public:
  explicit InvalidRecoveryAccount(const std::string& msg) : ValidationError("InvalidRecoveryAccount", msg) {
  }
};

class InvalidAdministrator : public ValidationError {
 public:
  explicit InvalidAdministrator(const std::string& msg) : ValidationError("InvalidAdministrator", msg) {
  }
};

// ---------------------------------------------------------------------
// Authorization
// ---------------------------------------------------------------------

class Unauthorized : public AuthorizationError {
 public:
  explicit Unauthorized(const std::string& msg) : AuthorizationError("Unauthorized", msg) {
  }
};

// ---------------------------------------------------------------------
// State
// ---------------------------------------------------------------------

class NoSchedules : public StateError {
 public:
  explicit NoSchedules(const std::string& msg) : StateError("NoSchedules", msg) {
  }
};

class NothingToClaim : public StateError {
 public:
  explicit NothingToClaim(const std::string& msg) : StateError("NothingToClaim", msg) {
  }
};

class NothingToWithdraw : public StateError {
 public:
  explicit NothingToWithdraw(const std::string& msg) : StateError("NothingToWithdraw", msg) {
  }
};

class ReentrantCall : public StateError {
 public:
  explicit ReentrantCall(const std::string& msg) : StateError("ReentrantCall", msg) {
  }
};

// Per-beneficiary schedule cap or batch size cap reached.
class ResourceExhausted : public StateError {
 public:
  ResourceExhausted(const std::string& name, const std::string& msg) : StateError(name, msg) {
  }
};

// ---------------------------------------------------------------------
// Collaborators
// ---------------------------------------------------------------------

class TransferFailed : public CollaboratorError {
 public:
  explicit TransferFailed(const std::string& msg) : CollaboratorError("TransferFailed", msg) {
  }
};

class StorageError : public CollaboratorError {
 public:
  explicit StorageError(const std::string& msg) : CollaboratorError("StorageError", msg) {
  }
};

} // namespace vesting::util
