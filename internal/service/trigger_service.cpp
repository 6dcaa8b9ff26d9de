#include "trigger_service.hpp"

#include <stdexcept>

#include "internal/auth/policy.hpp"
#include "internal/core/receiver_codec.hpp"
#include "internal/core/trigger_dispatcher.hpp"
#include "internal/engine/action_engine.hpp"
#include "internal/identity/credential_delegator.hpp"
#include "internal/model/receiver.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/util/errors.hpp"
#include "receiver/manager/v1.hpp"

namespace receiver::service {

using namespace receiver::manager::v1;

namespace {

TriggerResponse ToResponse(const receiver::core::Invocation& invocation) {
  TriggerResponse resp;
  resp.set_action_id(invocation.action_id);
  resp.set_state(std::string(receiver::model::ToString(invocation.state)));
  resp.mutable_effective_params()->insert(invocation.effective_params.begin(), invocation.effective_params.end());
  return resp;
}

} // namespace

TriggerService::TriggerService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.dispatcher || !ctx_.engine || !ctx_.delegator) {
    throw std::invalid_argument("TriggerService requires dispatcher, engine and delegator");
  }
}

TriggerResponse TriggerService::TriggerWebhook(const TriggerWebhookRequest& req, const CallContext& call) {
  return ObserveRpc("TriggerService.TriggerWebhook", call, req.receiver_id(), [&] {
    receiver::model::Params params(req.params().begin(), req.params().end());
    // the caller's token, if any, plays no part for webhooks
    return ToResponse(ctx_.dispatcher->Invoke(req.receiver_id(), params, receiver::core::InvocationAuth{}));
  });
}

TriggerResponse TriggerService::Signal(const SignalReceiverRequest& req, const CallContext& call) {
  return ObserveRpc("TriggerService.Signal", call, req.receiver_id(), [&] {
    receiver::model::Params params(req.params().begin(), req.params().end());
    return ToResponse(ctx_.dispatcher->Invoke(req.receiver_id(), params, receiver::core::InvocationAuth{call.auth_token}));
  });
}

GetActionResponse TriggerService::GetAction(const GetActionRequest& req, const CallContext& call) {
  return ObserveRpc("TriggerService.GetAction", call, "", [&] {
    if (call.auth_token.empty()) {
      throw receiver::util::Unauthorized("missing x-auth-token");
    }
    const auto requester = ctx_.delegator->Authenticate(call.auth_token);
    receiver::auth::Enforce(requester, receiver::auth::Permission::kGetAction);

    const auto action = ctx_.engine->GetAction(req.action_id());
    if (!action || (action->project != requester.project && !requester.IsAdmin())) {
      throw receiver::util::NotFound("action '" + req.action_id() + "' not found");
    }

    GetActionResponse resp;
    *resp.mutable_action() = receiver::core::ToProto(*action);
    return resp;
  });
}

}
