#include "trigger_dispatcher.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace receiver::core {

using receiver::observability::StringField;

namespace {

void Transition(Invocation& invocation, model::InvocationState next) {
  if (!model::CanTransition(invocation.state, next)) {
    throw std::logic_error("invalid invocation transition " + std::string(model::ToString(invocation.state)) + " -> " +
                           std::string(model::ToString(next)));
  }

  RECEIVER_LOG_DEBUG("invocation transition", {StringField("receiver_id", invocation.receiver_id),
                                               StringField("from", model::ToString(invocation.state)), StringField("to", model::ToString(next))});
  invocation.state = next;
}

void Reject(Invocation& invocation, model::ReceiverType type, const std::string& reason) {
  Transition(invocation, model::InvocationState::kRejected);
  receiver::observability::Metrics::Instance().RecordTrigger(model::ToString(type), "rejected");
  RECEIVER_LOG_WARN("invocation rejected", {StringField("receiver_id", invocation.receiver_id), StringField("reason", reason)});
}

} // namespace

WebhookAuthentication::WebhookAuthentication(std::shared_ptr<identity::CredentialDelegator> delegator) : delegator_(std::move(delegator)) {
}

identity::ActingIdentity WebhookAuthentication::Authenticate(const model::Receiver& receiver, const InvocationAuth&) const {
  const auto trust_id = receiver.TrustId();
  if (!trust_id) {
    throw util::Unauthorized("receiver '" + receiver.id + "' has no delegated credential");
  }

  identity::ActingIdentity acting;
  try {
    acting = delegator_->Impersonate(identity::CredentialHandle{*trust_id});
  } catch (const util::CredentialInvalid& e) {
    throw util::Unauthorized(e.what());
  }

  if (acting.scope.cluster_id != receiver.cluster_id || acting.scope.action != receiver.action) {
    throw util::Unauthorized("delegated credential of receiver '" + receiver.id + "' is not scoped for its action");
  }
  return acting;
}

SignalAuthentication::SignalAuthentication(std::shared_ptr<identity::CredentialDelegator> delegator) : delegator_(std::move(delegator)) {
}

identity::ActingIdentity SignalAuthentication::Authenticate(const model::Receiver& receiver, const InvocationAuth& auth) const {
  if (auth.token.empty()) {
    throw util::Unauthorized("signal requires a caller token");
  }

  const auto caller = delegator_->Authenticate(auth.token);
  if (caller.project != receiver.project && !caller.IsAdmin()) {
    throw util::Unauthorized("caller '" + caller.user + "' may not signal receivers of another project");
  }

  identity::ActingIdentity acting;
  acting.user    = caller.user;
  acting.project = caller.project;
  acting.domain  = caller.domain;
  acting.roles   = caller.roles;
  acting.scope   = identity::DelegationScope{receiver.cluster_id, receiver.action};
  return acting;
}

TriggerDispatcher::TriggerDispatcher(std::shared_ptr<ReceiverManager> receivers, std::shared_ptr<cluster::ClusterRegistry> clusters,
                                     std::shared_ptr<engine::ActionEngine> engine, std::shared_ptr<identity::CredentialDelegator> delegator)
    : receivers_(std::move(receivers)), clusters_(std::move(clusters)), engine_(std::move(engine)), delegator_(std::move(delegator)) {
  if (!receivers_ || !clusters_ || !engine_ || !delegator_) {
    throw std::invalid_argument("TriggerDispatcher requires receivers, clusters, engine and delegator");
  }
}

model::Params TriggerDispatcher::MergeParams(const model::Params& stored, const model::Params& invocation) {
  model::Params merged = stored;
  for (const auto& [key, value] : invocation) {
    merged[key] = value;
  }
  return merged;
}

AuthenticationStrategy TriggerDispatcher::StrategyFor(model::ReceiverType type) const {
  switch (type) {
    case model::ReceiverType::kWebhook:
      return WebhookAuthentication(delegator_);
    case model::ReceiverType::kSignal:
      return SignalAuthentication(delegator_);
    case model::ReceiverType::kUnspecified:
      break;
  }
  throw std::runtime_error("receiver has no type");
}

Invocation TriggerDispatcher::Invoke(const std::string& receiver_id, const model::Params& invocation_params, const InvocationAuth& auth) {
  receiver::observability::SpanScope span("TriggerDispatcher.Invoke");
  span.SetAttribute("receiver.id", receiver_id);

  const auto receiver = receivers_->Find(receiver_id);
  if (!receiver) {
    throw util::NotFound("receiver '" + receiver_id + "' not found");
  }

  Invocation invocation;
  invocation.receiver_id = receiver->id;
  Transition(invocation, model::InvocationState::kAuthenticating);

  identity::ActingIdentity acting;
  try {
    const auto strategy = StrategyFor(receiver->type);
    acting = std::visit([&](const auto& s) { return s.Authenticate(*receiver, auth); }, strategy);
  } catch (const util::Unauthorized& e) {
    Reject(invocation, receiver->type, e.what());
    span.RecordException(e.what());
    throw;
  } catch (const util::Unavailable& e) {
    Reject(invocation, receiver->type, e.what());
    span.RecordException(e.what());
    throw;
  }
  Transition(invocation, model::InvocationState::kAuthorized);

  if (!clusters_->Get(receiver->cluster_id)) {
    Reject(invocation, receiver->type, "cluster no longer exists");
    throw util::DispatchRejected("cluster '" + receiver->cluster_id + "' of receiver '" + receiver->id + "' no longer exists");
  }

  invocation.effective_params = MergeParams(receiver->params, invocation_params);

  engine::ActionRequest request;
  request.action     = receiver->action;
  request.cluster_id = receiver->cluster_id;
  request.inputs     = invocation.effective_params;
  request.actor      = std::move(acting);
  request.cause      = "receiver:" + receiver->id;

  engine::ActionHandle handle;
  try {
    handle = engine_->Submit(request);
  } catch (const util::DispatchRejected& e) {
    Reject(invocation, receiver->type, e.what());
    span.RecordException(e.what());
    throw;
  }

  invocation.action_id = handle.action_id;
  Transition(invocation, model::InvocationState::kSubmitted);
  receiver::observability::Metrics::Instance().RecordTrigger(model::ToString(receiver->type), "submitted");

  RECEIVER_LOG_INFO("receiver triggered", {StringField("receiver_id", receiver->id), StringField("action", receiver->action),
                                           StringField("cluster_id", receiver->cluster_id), StringField("action_id", handle.action_id),
                                           StringField("user", request.actor.user)});
  return invocation;
}

} // namespace receiver::core
