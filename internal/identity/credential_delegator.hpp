#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "internal/auth/request_context.hpp"
#include "internal/identity/identity_service.hpp"

namespace receiver::identity {

/*
  Capability to act as one user for one (cluster, action) scope.

  Exactly one receiver owns a handle; it is never shared between receivers.
*/
struct CredentialHandle {
  std::string trust_id;

  explicit operator bool() const {
    return !trust_id.empty();
  }
};

/*
  Adapter over the identity service's trust API.

  Every call is bounded by call_timeout; an identity-service failure or a
  missed deadline is surfaced through this adapter's own error types:

    Issue        -> util::DelegationFailed
    Revoke       -> util::AlreadyRevoked (non-fatal) | util::RevocationFailed
    Impersonate  -> util::CredentialInvalid | util::Unavailable
    Authenticate -> util::Unauthorized | util::Unavailable
*/
class CredentialDelegator {
 public:
  CredentialDelegator(std::shared_ptr<IdentityService> identity, std::chrono::milliseconds call_timeout);

  CredentialHandle Issue(const auth::RequestContext& requester, const DelegationScope& scope);

  void Revoke(const CredentialHandle& handle);

  ActingIdentity Impersonate(const CredentialHandle& handle);

  auth::RequestContext Authenticate(const std::string& token);

 private:
  Deadline NextDeadline() const;

  std::shared_ptr<IdentityService> identity_;
  std::chrono::milliseconds        call_timeout_;
};

} // namespace receiver::identity
