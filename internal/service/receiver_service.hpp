#pragma once

#include "receiver/manager/v1.hpp"
#include "service_context.hpp"

namespace receiver::auth { struct RequestContext; }

namespace receiver::service {

class ReceiverService {
public:
  explicit ReceiverService(ServiceContext ctx);

  receiver::manager::v1::ListReceiversResponse
  List(const receiver::manager::v1::ListReceiversRequest& req, const CallContext& call);

  receiver::manager::v1::CreateReceiverResponse
  Create(const receiver::manager::v1::CreateReceiverRequest& req, const CallContext& call);

  receiver::manager::v1::GetReceiverResponse
  Get(const receiver::manager::v1::GetReceiverRequest& req, const CallContext& call);

  void Delete(const receiver::manager::v1::DeleteReceiverRequest& req, const CallContext& call);

private:
  receiver::auth::RequestContext Authenticate(const CallContext& call) const;

  ServiceContext ctx_;
};

}
