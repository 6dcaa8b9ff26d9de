#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/identity/credential_delegator.hpp"
#include "internal/identity/local_identity_service.hpp"
#include "internal/util/errors.hpp"

namespace {

using receiver::identity::CredentialDelegator;
using receiver::identity::CredentialHandle;
using receiver::identity::DelegationScope;
using receiver::identity::LocalIdentityService;

receiver::auth::RequestContext Alice() {
  receiver::auth::RequestContext ctx;
  ctx.user    = "alice";
  ctx.project = "web";
  ctx.domain  = "default";
  ctx.roles   = {"member"};
  return ctx;
}

std::shared_ptr<LocalIdentityService> BuildIdentity(bool can_delegate = true) {
  auto identity = std::make_shared<LocalIdentityService>();
  identity->AddUser("alice-token", LocalIdentityService::User{Alice(), can_delegate});
  return identity;
}

// Answers only after `delay`, past any short deadline.
class SlowIdentityService final : public receiver::identity::IdentityService {
 public:
  SlowIdentityService(std::shared_ptr<LocalIdentityService> inner, std::chrono::milliseconds delay) : inner_(std::move(inner)), delay_(delay) {
  }

  receiver::auth::RequestContext Authenticate(const std::string& token, receiver::identity::Deadline deadline) override {
    std::this_thread::sleep_for(delay_);
    return inner_->Authenticate(token, deadline);
  }

  std::string CreateTrust(const receiver::auth::RequestContext& trustor, const DelegationScope& scope,
                          receiver::identity::Deadline deadline) override {
    std::this_thread::sleep_for(delay_);
    return inner_->CreateTrust(trustor, scope, deadline);
  }

  void DeleteTrust(const std::string& trust_id, receiver::identity::Deadline deadline) override {
    std::this_thread::sleep_for(delay_);
    inner_->DeleteTrust(trust_id, deadline);
  }

  receiver::identity::ActingIdentity ConsumeTrust(const std::string& trust_id, receiver::identity::Deadline deadline) override {
    std::this_thread::sleep_for(delay_);
    return inner_->ConsumeTrust(trust_id, deadline);
  }

 private:
  std::shared_ptr<LocalIdentityService> inner_;
  std::chrono::milliseconds             delay_;
};

template <typename Error, typename Fn>
void ExpectThrows(Fn&& fn) {
  bool threw = false;
  try {
    fn();
  } catch (const Error&) {
    threw = true;
  }
  assert(threw);
}

void TestIssueImpersonateRevoke() {
  auto                identity = BuildIdentity();
  CredentialDelegator delegator(identity, std::chrono::milliseconds(500));

  const auto handle = delegator.Issue(Alice(), DelegationScope{"cluster-1", "CLUSTER_RESIZE"});
  assert(handle);
  assert(identity->IsTrustLive(handle.trust_id));

  const auto acting = delegator.Impersonate(handle);
  assert(acting.user == "alice");
  assert(acting.project == "web");
  assert(acting.trust_id == handle.trust_id);
  assert(acting.scope.cluster_id == "cluster-1");
  assert(acting.scope.action == "CLUSTER_RESIZE");

  delegator.Revoke(handle);
  assert(!identity->IsTrustLive(handle.trust_id));

  ExpectThrows<receiver::util::AlreadyRevoked>([&] { delegator.Revoke(handle); });
  ExpectThrows<receiver::util::CredentialInvalid>([&] { delegator.Impersonate(handle); });
}

void TestUnknownHandles() {
  CredentialDelegator delegator(BuildIdentity(), std::chrono::milliseconds(500));

  ExpectThrows<receiver::util::AlreadyRevoked>([&] { delegator.Revoke(CredentialHandle{"missing"}); });
  ExpectThrows<receiver::util::AlreadyRevoked>([&] { delegator.Revoke(CredentialHandle{}); });
  ExpectThrows<receiver::util::CredentialInvalid>([&] { delegator.Impersonate(CredentialHandle{"missing"}); });
  ExpectThrows<receiver::util::CredentialInvalid>([&] { delegator.Impersonate(CredentialHandle{}); });
}

void TestIssueWithoutDelegationRights() {
  auto                identity = BuildIdentity(false);
  CredentialDelegator delegator(identity, std::chrono::milliseconds(500));

  ExpectThrows<receiver::util::DelegationFailed>([&] { delegator.Issue(Alice(), DelegationScope{"cluster-1", "CLUSTER_CHECK"}); });
  assert(identity->LiveTrustCount() == 0);
}

void TestAuthenticate() {
  CredentialDelegator delegator(BuildIdentity(), std::chrono::milliseconds(500));

  const auto ctx = delegator.Authenticate("alice-token");
  assert(ctx.user == "alice");
  assert(!ctx.IsAdmin());
  ExpectThrows<receiver::util::Unauthorized>([&] { delegator.Authenticate("nope"); });
}

void TestDeadlinesBoundEveryCall() {
  auto identity = BuildIdentity();

  // a trust created through a healthy service, consumed through a slow one
  CredentialDelegator healthy(identity, std::chrono::milliseconds(500));
  const auto          handle = healthy.Issue(Alice(), DelegationScope{"cluster-1", "CLUSTER_CHECK"});

  CredentialDelegator slow(std::make_shared<SlowIdentityService>(identity, std::chrono::milliseconds(30)), std::chrono::milliseconds(5));

  const auto started = std::chrono::steady_clock::now();
  ExpectThrows<receiver::util::DelegationFailed>([&] { slow.Issue(Alice(), DelegationScope{"cluster-1", "CLUSTER_CHECK"}); });
  // a slow identity service is an outage, not a bad credential
  ExpectThrows<receiver::util::Unavailable>([&] { slow.Impersonate(handle); });
  ExpectThrows<receiver::util::RevocationFailed>([&] { slow.Revoke(handle); });
  ExpectThrows<receiver::util::Unavailable>([&] { slow.Authenticate("alice-token"); });
  assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(5));

  // the timed-out revoke left the trust in place
  assert(identity->IsTrustLive(handle.trust_id));
  assert(identity->LiveTrustCount() == 1);
}

} // namespace

int main() {
  TestIssueImpersonateRevoke();
  TestUnknownHandles();
  TestIssueWithoutDelegationRights();
  TestAuthenticate();
  TestDeadlinesBoundEveryCall();

  std::cout << "receiver_manager_unit_credential_delegator: pass\n";
  return 0;
}
