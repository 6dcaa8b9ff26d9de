#include "local_identity_service.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace receiver::identity {

LocalIdentityService::LocalIdentityService(std::chrono::milliseconds trust_ttl) : trust_ttl_(trust_ttl) {
}

void LocalIdentityService::CheckDeadline(Deadline deadline, const char* call) {
  if (std::chrono::steady_clock::now() > deadline) {
    throw util::Unavailable(std::string("identity service: ") + call + " deadline exceeded");
  }
}

bool LocalIdentityService::IsExpired(const Trust& trust, Clock::time_point now) {
  return trust.expires_at.has_value() && *trust.expires_at <= now;
}

void LocalIdentityService::AddUser(const std::string& token, const User& user) {
  std::lock_guard lock(mutex_);
  users_[token] = user;
}

auth::RequestContext LocalIdentityService::Authenticate(const std::string& token, Deadline deadline) {
  std::lock_guard lock(mutex_);
  CheckDeadline(deadline, "authenticate");

  auto it = users_.find(token);
  if (token.empty() || it == users_.end()) {
    throw util::Unauthorized("authentication failed: invalid or missing token");
  }
  return it->second.context;
}

std::string LocalIdentityService::CreateTrust(const auth::RequestContext& trustor, const DelegationScope& scope, Deadline deadline) {
  std::lock_guard lock(mutex_);
  CheckDeadline(deadline, "create trust");

  bool can_delegate = false;
  for (const auto& [_, user] : users_) {
    if (user.context.user == trustor.user && user.context.project == trustor.project) {
      can_delegate = user.can_delegate;
      break;
    }
  }
  if (!can_delegate) {
    throw util::Forbidden("user '" + trustor.user + "' in project '" + trustor.project + "' may not delegate");
  }

  Trust trust;
  trust.trustor    = trustor;
  trust.scope      = scope;
  trust.created_at = Clock::now();
  if (trust_ttl_.count() > 0) {
    trust.expires_at = trust.created_at + trust_ttl_;
  }

  auto trust_id = util::NewId();
  trusts_.emplace(trust_id, std::move(trust));
  return trust_id;
}

void LocalIdentityService::DeleteTrust(const std::string& trust_id, Deadline deadline) {
  std::lock_guard lock(mutex_);
  CheckDeadline(deadline, "delete trust");

  auto it = trusts_.find(trust_id);
  if (it == trusts_.end()) {
    throw util::NotFound("trust '" + trust_id + "' not found");
  }
  if (it->second.deleted) {
    throw util::AlreadyRevoked("trust '" + trust_id + "' already deleted");
  }
  it->second.deleted = true;
}

ActingIdentity LocalIdentityService::ConsumeTrust(const std::string& trust_id, Deadline deadline) {
  std::lock_guard lock(mutex_);
  CheckDeadline(deadline, "consume trust");

  auto it = trusts_.find(trust_id);
  if (it == trusts_.end()) {
    throw util::NotFound("trust '" + trust_id + "' not found");
  }

  const auto& trust = it->second;
  if (trust.deleted) {
    throw util::CredentialInvalid("trust '" + trust_id + "' has been revoked");
  }
  if (IsExpired(trust, Clock::now())) {
    throw util::CredentialInvalid("trust '" + trust_id + "' has expired");
  }

  ActingIdentity acting;
  acting.user     = trust.trustor.user;
  acting.project  = trust.trustor.project;
  acting.domain   = trust.trustor.domain;
  acting.roles    = trust.trustor.roles;
  acting.trust_id = trust_id;
  acting.scope    = trust.scope;
  return acting;
}

std::size_t LocalIdentityService::LiveTrustCount() {
  std::lock_guard lock(mutex_);

  const auto  now  = Clock::now();
  std::size_t live = 0;
  for (const auto& [_, trust] : trusts_) {
    if (!trust.deleted && !IsExpired(trust, now)) ++live;
  }
  return live;
}

bool LocalIdentityService::IsTrustLive(const std::string& trust_id) {
  std::lock_guard lock(mutex_);

  auto it = trusts_.find(trust_id);
  return it != trusts_.end() && !it->second.deleted && !IsExpired(it->second, Clock::now());
}

} // namespace receiver::identity
