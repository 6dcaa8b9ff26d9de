#include "receiver_service.hpp"

#include <stdexcept>

#include "internal/auth/request_context.hpp"
#include "internal/core/receiver_codec.hpp"
#include "internal/core/receiver_manager.hpp"
#include "internal/identity/credential_delegator.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/util/errors.hpp"
#include "receiver/manager/v1.hpp"

namespace receiver::service {

using namespace receiver::manager::v1;

ReceiverService::ReceiverService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.manager || !ctx_.delegator) {
    throw std::invalid_argument("ReceiverService requires manager and delegator");
  }
}

receiver::auth::RequestContext ReceiverService::Authenticate(const CallContext& call) const {
  if (call.auth_token.empty()) {
    throw receiver::util::Unauthorized("missing x-auth-token");
  }
  auto requester       = ctx_.delegator->Authenticate(call.auth_token);
  requester.request_id = call.request_id;
  return requester;
}

ListReceiversResponse ReceiverService::List(const ListReceiversRequest& req, const CallContext& call) {
  return ObserveRpc("ReceiverService.List", call, "", [&] {
    const auto requester = Authenticate(call);

    receiver::core::ListReceiversParams query;
    query.limit          = req.limit();
    query.marker         = req.marker();
    query.sort           = req.sort();
    query.global_project = req.global_project();
    query.names.assign(req.name().begin(), req.name().end());
    query.types.assign(req.type().begin(), req.type().end());
    query.cluster_ids.assign(req.cluster_id().begin(), req.cluster_id().end());
    query.actions.assign(req.action().begin(), req.action().end());

    auto page = ctx_.manager->List(query, requester);

    ListReceiversResponse resp;
    for (const auto& item : page.receivers) {
      *resp.add_receivers() = receiver::core::ToProto(item);
    }
    resp.set_next_marker(page.next_marker);
    return resp;
  });
}

CreateReceiverResponse ReceiverService::Create(const CreateReceiverRequest& req, const CallContext& call) {
  return ObserveRpc("ReceiverService.Create", call, "", [&] {
    const auto requester = Authenticate(call);

    receiver::core::CreateReceiverParams params;
    params.name    = req.name();
    params.type    = req.type();
    params.cluster = req.cluster_id();
    params.action  = req.action();
    params.actor.insert(req.actor().begin(), req.actor().end());
    params.params.insert(req.params().begin(), req.params().end());

    CreateReceiverResponse resp;
    *resp.mutable_receiver() = receiver::core::ToProto(ctx_.manager->Create(params, requester));
    return resp;
  });
}

GetReceiverResponse ReceiverService::Get(const GetReceiverRequest& req, const CallContext& call) {
  return ObserveRpc("ReceiverService.Get", call, req.id(), [&] {
    const auto requester = Authenticate(call);

    GetReceiverResponse resp;
    *resp.mutable_receiver() = receiver::core::ToProto(ctx_.manager->Get(req.id(), requester));
    return resp;
  });
}

void ReceiverService::Delete(const DeleteReceiverRequest& req, const CallContext& call) {
  ObserveRpc("ReceiverService.Delete", call, req.id(), [&] {
    const auto requester = Authenticate(call);
    ctx_.manager->Delete(req.id(), requester);
  });
}

}
