#include "trigger_server.hpp"
#include "grpc_error.hpp"
#include "request_metadata.hpp"
#include "receiver/manager/v1.hpp"

namespace receiver::grpc {

TriggerServer::TriggerServer(std::shared_ptr<receiver::service::TriggerService> svc)
    : service_(std::move(svc)) {}

::grpc::Status TriggerServer::TriggerWebhook(::grpc::ServerContext* ctx,
                                             const receiver::manager::v1::TriggerWebhookRequest* req,
                                             receiver::manager::v1::TriggerResponse* resp) {
  try {
    *resp = service_->TriggerWebhook(*req, ReadCallContext(ctx));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TriggerServer::SignalReceiver(::grpc::ServerContext* ctx,
                                             const receiver::manager::v1::SignalReceiverRequest* req,
                                             receiver::manager::v1::TriggerResponse* resp) {
  try {
    *resp = service_->Signal(*req, ReadCallContext(ctx));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TriggerServer::GetAction(::grpc::ServerContext* ctx,
                                        const receiver::manager::v1::GetActionRequest* req,
                                        receiver::manager::v1::GetActionResponse* resp) {
  try {
    *resp = service_->GetAction(*req, ReadCallContext(ctx));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
