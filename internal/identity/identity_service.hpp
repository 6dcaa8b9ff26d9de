#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "internal/auth/request_context.hpp"

namespace receiver::identity {

using Deadline = std::chrono::steady_clock::time_point;

// What a delegated credential is allowed to do: one action on one cluster.
struct DelegationScope {
  std::string cluster_id;
  std::string action;
};

// Identity the system acts as when it consumes a delegated credential.
struct ActingIdentity {
  std::string              user;
  std::string              project;
  std::string              domain;
  std::vector<std::string> roles;

  // Set when the identity was obtained through a trust.
  std::string trust_id;
  DelegationScope scope;
};

/*
  Client interface of the identity / credential service.

  Every call carries a deadline; an implementation that cannot answer in
  time throws util::Unavailable.

  Error contract:
    Authenticate  util::Unauthorized   unknown or invalid token
    CreateTrust   util::Forbidden      trustor may not delegate
    DeleteTrust   util::NotFound       unknown trust
                  util::AlreadyRevoked trust was already deleted
    ConsumeTrust  util::NotFound       unknown trust
                  util::CredentialInvalid revoked or expired trust
  Any call may throw util::Unavailable.
*/
class IdentityService {
 public:
  virtual ~IdentityService() = default;

  virtual auth::RequestContext Authenticate(const std::string& token, Deadline deadline) = 0;

  // Returns the new trust id.
  virtual std::string CreateTrust(const auth::RequestContext& trustor, const DelegationScope& scope, Deadline deadline) = 0;

  virtual void DeleteTrust(const std::string& trust_id, Deadline deadline) = 0;

  virtual ActingIdentity ConsumeTrust(const std::string& trust_id, Deadline deadline) = 0;
};

} // namespace receiver::identity
