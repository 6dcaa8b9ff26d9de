#pragma once

#include <stdexcept>
#include <string>

namespace receiver::util {

/*
  Central error types.

  These get translated later to gRPC status codes (internal/grpc/grpc_error.cpp).
*/

// Validation failure: bad type, unknown action, malformed query. No side effects.
class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Authenticated, but not scoped for the operation.
class Forbidden : public std::runtime_error {
 public:
  explicit Forbidden(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Caller (or invocation) could not be authenticated.
class Unauthorized : public std::runtime_error {
 public:
  explicit Unauthorized(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DelegationFailed : public std::runtime_error {
 public:
  explicit DelegationFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Transient; caller may retry.
class RevocationFailed : public std::runtime_error {
 public:
  explicit RevocationFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Non-fatal: the credential is already gone.
class AlreadyRevoked : public std::runtime_error {
 public:
  explicit AlreadyRevoked(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Delegated credential is revoked, expired or unknown.
class CredentialInvalid : public std::runtime_error {
 public:
  explicit CredentialInvalid(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Action engine refused the submission.
class DispatchRejected : public std::runtime_error {
 public:
  explicit DispatchRejected(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Transient infrastructure failure, safe to retry with backoff.
class Unavailable : public std::runtime_error {
 public:
  explicit Unavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace receiver::util
