#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "internal/identity/identity_service.hpp"

namespace receiver::identity {

/*
  In-process identity service.

  Holds a static token table (seeded from config) and the trust table.
  Deleted trusts are kept as tombstones so a second delete reports
  AlreadyRevoked instead of NotFound.
*/
class LocalIdentityService final : public IdentityService {
 public:
  struct User {
    auth::RequestContext context;
    bool                 can_delegate = false;
  };

  // trust_ttl of zero means trusts stay valid until deleted.
  explicit LocalIdentityService(std::chrono::milliseconds trust_ttl = std::chrono::milliseconds::zero());

  void AddUser(const std::string& token, const User& user);

  auth::RequestContext Authenticate(const std::string& token, Deadline deadline) override;
  std::string          CreateTrust(const auth::RequestContext& trustor, const DelegationScope& scope, Deadline deadline) override;
  void                 DeleteTrust(const std::string& trust_id, Deadline deadline) override;
  ActingIdentity       ConsumeTrust(const std::string& trust_id, Deadline deadline) override;

  // Number of trusts that are neither deleted nor expired.
  std::size_t LiveTrustCount();
  bool        IsTrustLive(const std::string& trust_id);

 private:
  using Clock = std::chrono::system_clock;

  struct Trust {
    auth::RequestContext             trustor;
    DelegationScope                  scope;
    Clock::time_point                created_at;
    std::optional<Clock::time_point> expires_at;
    bool                             deleted = false;
  };

  static void CheckDeadline(Deadline deadline, const char* call);
  static bool IsExpired(const Trust& trust, Clock::time_point now);

  std::chrono::milliseconds trust_ttl_;

  std::mutex                             mutex_;
  std::unordered_map<std::string, User>  users_;
  std::unordered_map<std::string, Trust> trusts_;
};

} // namespace receiver::identity
