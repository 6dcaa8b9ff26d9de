#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "receiver/manager/services/v1/trigger_service.grpc.pb.h"
#include "internal/service/trigger_service.hpp"
#include "receiver/manager/v1.hpp"

namespace receiver::grpc {

class TriggerServer final : public receiver::manager::v1::TriggerService::Service {
public:
  explicit TriggerServer(std::shared_ptr<receiver::service::TriggerService> svc);

  ::grpc::Status TriggerWebhook(::grpc::ServerContext*,
                                const receiver::manager::v1::TriggerWebhookRequest*,
                                receiver::manager::v1::TriggerResponse*) override;

  ::grpc::Status SignalReceiver(::grpc::ServerContext*,
                                const receiver::manager::v1::SignalReceiverRequest*,
                                receiver::manager::v1::TriggerResponse*) override;

  ::grpc::Status GetAction(::grpc::ServerContext*,
                           const receiver::manager::v1::GetActionRequest*,
                           receiver::manager::v1::GetActionResponse*) override;

private:
  std::shared_ptr<receiver::service::TriggerService> service_;
};

}
