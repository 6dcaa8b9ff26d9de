#include "receiver_server.hpp"
#include "grpc_error.hpp"
#include "request_metadata.hpp"
#include "receiver/manager/v1.hpp"

namespace receiver::grpc {

ReceiverServer::ReceiverServer(std::shared_ptr<receiver::service::ReceiverService> svc)
    : service_(std::move(svc)) {}

::grpc::Status ReceiverServer::ListReceivers(::grpc::ServerContext* ctx,
                                             const receiver::manager::v1::ListReceiversRequest* req,
                                             receiver::manager::v1::ListReceiversResponse* resp) {
  try {
    *resp = service_->List(*req, ReadCallContext(ctx));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ReceiverServer::CreateReceiver(::grpc::ServerContext* ctx,
                                              const receiver::manager::v1::CreateReceiverRequest* req,
                                              receiver::manager::v1::CreateReceiverResponse* resp) {
  try {
    *resp = service_->Create(*req, ReadCallContext(ctx));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ReceiverServer::GetReceiver(::grpc::ServerContext* ctx,
                                           const receiver::manager::v1::GetReceiverRequest* req,
                                           receiver::manager::v1::GetReceiverResponse* resp) {
  try {
    *resp = service_->Get(*req, ReadCallContext(ctx));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ReceiverServer::DeleteReceiver(::grpc::ServerContext* ctx,
                                              const receiver::manager::v1::DeleteReceiverRequest* req,
                                              google::protobuf::Empty*) {
  try {
    service_->Delete(*req, ReadCallContext(ctx));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
