#include "credential_delegator.hpp"

#include <stdexcept>
#include <string_view>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace receiver::identity {

namespace {

class CallTimer {
 public:
  explicit CallTimer(std::string_view call) : call_(call), started_at_(std::chrono::steady_clock::now()) {
  }

  ~CallTimer() {
    receiver::observability::Metrics::Instance().ObserveIdentityCallLatencyMs(
        call_, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at_).count());
  }

  CallTimer(const CallTimer&)            = delete;
  CallTimer& operator=(const CallTimer&) = delete;

 private:
  std::string_view                      call_;
  std::chrono::steady_clock::time_point started_at_;
};

} // namespace

CredentialDelegator::CredentialDelegator(std::shared_ptr<IdentityService> identity, std::chrono::milliseconds call_timeout)
    : identity_(std::move(identity)), call_timeout_(call_timeout) {
  if (!identity_) {
    throw std::invalid_argument("CredentialDelegator requires an identity service");
  }
}

Deadline CredentialDelegator::NextDeadline() const {
  return std::chrono::steady_clock::now() + call_timeout_;
}

CredentialHandle CredentialDelegator::Issue(const auth::RequestContext& requester, const DelegationScope& scope) {
  receiver::observability::SpanScope span("CredentialDelegator.Issue");
  span.SetAttribute("cluster.id", scope.cluster_id);
  CallTimer timer("create_trust");

  CredentialHandle handle;
  try {
    handle.trust_id = identity_->CreateTrust(requester, scope, NextDeadline());
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    throw util::DelegationFailed("failed to delegate credential for user '" + requester.user + "': " + e.what());
  }

  if (!handle) {
    throw util::DelegationFailed("identity service returned an empty trust for user '" + requester.user + "'");
  }
  return handle;
}

void CredentialDelegator::Revoke(const CredentialHandle& handle) {
  receiver::observability::SpanScope span("CredentialDelegator.Revoke");
  span.SetAttribute("trust.id", handle.trust_id);
  CallTimer timer("delete_trust");

  if (!handle) {
    throw util::AlreadyRevoked("empty credential handle");
  }

  try {
    identity_->DeleteTrust(handle.trust_id, NextDeadline());
  } catch (const util::AlreadyRevoked&) {
    throw;
  } catch (const util::NotFound& e) {
    throw util::AlreadyRevoked(e.what());
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    throw util::RevocationFailed("failed to revoke trust '" + handle.trust_id + "': " + e.what());
  }
}

ActingIdentity CredentialDelegator::Impersonate(const CredentialHandle& handle) {
  receiver::observability::SpanScope span("CredentialDelegator.Impersonate");
  span.SetAttribute("trust.id", handle.trust_id);
  CallTimer timer("consume_trust");

  if (!handle) {
    throw util::CredentialInvalid("receiver has no delegated credential");
  }

  try {
    return identity_->ConsumeTrust(handle.trust_id, NextDeadline());
  } catch (const util::CredentialInvalid&) {
    throw;
  } catch (const util::Unavailable& e) {
    // outage or deadline miss: the credential may still be good
    span.RecordException(e.what());
    throw;
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    throw util::CredentialInvalid("trust '" + handle.trust_id + "' is not usable: " + e.what());
  }
}

auth::RequestContext CredentialDelegator::Authenticate(const std::string& token) {
  CallTimer timer("authenticate");

  try {
    return identity_->Authenticate(token, NextDeadline());
  } catch (const util::Unauthorized&) {
    throw;
  } catch (const util::Unavailable&) {
    throw;
  } catch (const std::exception& e) {
    throw util::Unauthorized(std::string("authentication failed: ") + e.what());
  }
}

} // namespace receiver::identity
