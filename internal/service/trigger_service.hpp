#pragma once

#include "receiver/manager/v1.hpp"
#include "service_context.hpp"

namespace receiver::service {

class TriggerService {
public:
  explicit TriggerService(ServiceContext ctx);

  receiver::manager::v1::TriggerResponse
  TriggerWebhook(const receiver::manager::v1::TriggerWebhookRequest& req, const CallContext& call);

  receiver::manager::v1::TriggerResponse
  Signal(const receiver::manager::v1::SignalReceiverRequest& req, const CallContext& call);

  receiver::manager::v1::GetActionResponse
  GetAction(const receiver::manager::v1::GetActionRequest& req, const CallContext& call);

private:
  ServiceContext ctx_;
};

}
