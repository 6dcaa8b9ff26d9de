#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "receiver/manager/services/v1/receiver_service.grpc.pb.h"
#include "internal/service/receiver_service.hpp"
#include "receiver/manager/v1.hpp"

namespace receiver::grpc {

class ReceiverServer final : public receiver::manager::v1::ReceiverService::Service {
public:
  explicit ReceiverServer(std::shared_ptr<receiver::service::ReceiverService> svc);

  ::grpc::Status ListReceivers(::grpc::ServerContext*,
                               const receiver::manager::v1::ListReceiversRequest*,
                               receiver::manager::v1::ListReceiversResponse*) override;

  ::grpc::Status CreateReceiver(::grpc::ServerContext*,
                                const receiver::manager::v1::CreateReceiverRequest*,
                                receiver::manager::v1::CreateReceiverResponse*) override;

  ::grpc::Status GetReceiver(::grpc::ServerContext*,
                             const receiver::manager::v1::GetReceiverRequest*,
                             receiver::manager::v1::GetReceiverResponse*) override;

  ::grpc::Status DeleteReceiver(::grpc::ServerContext*,
                                const receiver::manager::v1::DeleteReceiverRequest*,
                                google::protobuf::Empty*) override;

private:
  std::shared_ptr<receiver::service::ReceiverService> service_;
};

}
