#pragma once

#include <memory>
#include <string>
#include <variant>

#include "internal/cluster/cluster_registry.hpp"
#include "internal/core/receiver_manager.hpp"
#include "internal/engine/action_engine.hpp"
#include "internal/identity/credential_delegator.hpp"
#include "internal/model/invocation_state.hpp"
#include "internal/model/receiver.hpp"

namespace receiver::core {

// Credentials presented by whoever fires the receiver.
struct InvocationAuth {
  // Caller's own bearer token; unused for webhooks.
  std::string token;
};

// Webhook: the receiver's delegated credential is the authority.
class WebhookAuthentication {
 public:
  explicit WebhookAuthentication(std::shared_ptr<identity::CredentialDelegator> delegator);

  identity::ActingIdentity Authenticate(const model::Receiver& receiver, const InvocationAuth& auth) const;

 private:
  std::shared_ptr<identity::CredentialDelegator> delegator_;
};

// Signal: the caller authenticates as itself and must share the
// receiver's project (or be admin).
class SignalAuthentication {
 public:
  explicit SignalAuthentication(std::shared_ptr<identity::CredentialDelegator> delegator);

  identity::ActingIdentity Authenticate(const model::Receiver& receiver, const InvocationAuth& auth) const;

 private:
  std::shared_ptr<identity::CredentialDelegator> delegator_;
};

using AuthenticationStrategy = std::variant<WebhookAuthentication, SignalAuthentication>;

struct Invocation {
  std::string            receiver_id;
  model::InvocationState state = model::InvocationState::kReceived;
  std::string            action_id;
  model::Params          effective_params;
};

/*
  Trigger dispatcher.

  Stateless between calls: every invocation authenticates on its own and
  gets its own action handle. Ordering of actions on a cluster is the
  action engine's concern.

  Errors:
    util::NotFound          receiver unknown
    util::Unauthorized      authentication failed
    util::DispatchRejected  cluster gone, or the engine refused
    util::Unavailable       identity service unreachable
*/
class TriggerDispatcher {
 public:
  TriggerDispatcher(std::shared_ptr<ReceiverManager> receivers, std::shared_ptr<cluster::ClusterRegistry> clusters,
                    std::shared_ptr<engine::ActionEngine> engine, std::shared_ptr<identity::CredentialDelegator> delegator);

  // Invocation values override stored params of the same key.
  Invocation Invoke(const std::string& receiver_id, const model::Params& invocation_params, const InvocationAuth& auth);

  static model::Params MergeParams(const model::Params& stored, const model::Params& invocation);

 private:
  AuthenticationStrategy StrategyFor(model::ReceiverType type) const;

  std::shared_ptr<ReceiverManager>               receivers_;
  std::shared_ptr<cluster::ClusterRegistry>      clusters_;
  std::shared_ptr<engine::ActionEngine>          engine_;
  std::shared_ptr<identity::CredentialDelegator> delegator_;
};

} // namespace receiver::core
