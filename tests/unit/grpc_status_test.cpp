#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/cluster/cluster_registry.hpp"
#include "internal/core/channel_allocator.hpp"
#include "internal/core/receiver_manager.hpp"
#include "internal/core/trigger_dispatcher.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/engine/action_scheduler.hpp"
#include "internal/engine/local_action_engine.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/receiver_server.hpp"
#include "internal/grpc/request_metadata.hpp"
#include "internal/grpc/trigger_server.hpp"
#include "internal/identity/credential_delegator.hpp"
#include "internal/identity/local_identity_service.hpp"
#include "internal/service/receiver_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/trigger_service.hpp"
#include "receiver/manager/v1.hpp"

namespace {

receiver::service::ServiceContext BuildServiceContext() {
  auto identity = std::make_shared<receiver::identity::LocalIdentityService>(std::chrono::milliseconds::zero());
  auto clusters = std::make_shared<receiver::cluster::StaticClusterRegistry>(
      std::vector<receiver::cluster::Cluster>{{"c-1", "web-frontend", "web"}});
  auto engine    = std::make_shared<receiver::engine::LocalActionEngine>(clusters, std::make_shared<receiver::engine::ActionScheduler>(),
                                                                      receiver::engine::LocalActionEngine::Options{});
  auto delegator = std::make_shared<receiver::identity::CredentialDelegator>(identity, std::chrono::milliseconds(1000));

  receiver::service::ServiceContext ctx;
  ctx.manager    = std::make_shared<receiver::core::ReceiverManager>(std::make_shared<receiver::db::memory::MemoryRepository>(), clusters,
                                                                  engine, delegator,
                                                                  std::make_shared<receiver::core::ChannelAllocator>("http://localhost:8778"),
                                                                  receiver::core::ReceiverManager::Options{});
  ctx.dispatcher = std::make_shared<receiver::core::TriggerDispatcher>(ctx.manager, clusters, engine, delegator);
  ctx.engine     = engine;
  ctx.delegator  = delegator;
  return ctx;
}

::grpc::StatusCode CodeOf(const std::exception& e) {
  return receiver::grpc::ToStatus(e).error_code();
}

void TestExceptionsMapToStatusCodes() {
  using namespace receiver::util;

  assert(CodeOf(InvalidArgument("x")) == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(CodeOf(Unauthorized("x")) == ::grpc::StatusCode::UNAUTHENTICATED);
  assert(CodeOf(CredentialInvalid("x")) == ::grpc::StatusCode::UNAUTHENTICATED);
  assert(CodeOf(Forbidden("x")) == ::grpc::StatusCode::PERMISSION_DENIED);
  assert(CodeOf(NotFound("x")) == ::grpc::StatusCode::NOT_FOUND);
  assert(CodeOf(AlreadyExists("x")) == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(CodeOf(DispatchRejected("x")) == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(CodeOf(AlreadyRevoked("x")) == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(CodeOf(Unavailable("x")) == ::grpc::StatusCode::UNAVAILABLE);
  assert(CodeOf(DelegationFailed("x")) == ::grpc::StatusCode::INTERNAL);
  assert(CodeOf(RevocationFailed("x")) == ::grpc::StatusCode::INTERNAL);
  assert(CodeOf(std::runtime_error("x")) == ::grpc::StatusCode::INTERNAL);

  const auto status = receiver::grpc::ToStatus(NotFound("receiver 'r' not found"));
  assert(status.error_message() == "receiver 'r' not found");
}

void TestApiVersionCheck() {
  receiver::grpc::CheckApiVersion("1");
  receiver::grpc::CheckApiVersion("1.0");
  receiver::grpc::CheckApiVersion("1.12");

  for (const char* bad : {"2", "2.0", "1.", "1.x", "v1", "latest"}) {
    bool threw = false;
    try {
      receiver::grpc::CheckApiVersion(bad);
    } catch (const receiver::util::InvalidArgument&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestListWithoutTokenReturnsUnauthenticated() {
  auto ctx     = BuildServiceContext();
  auto service = std::make_shared<receiver::service::ReceiverService>(ctx);
  receiver::grpc::ReceiverServer server(service);

  receiver::manager::v1::ListReceiversRequest  req;
  receiver::manager::v1::ListReceiversResponse resp;
  ::grpc::ServerContext                        grpc_ctx;

  const auto status = server.ListReceivers(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::UNAUTHENTICATED);
}

void TestWebhookForMissingReceiverReturnsNotFound() {
  auto ctx     = BuildServiceContext();
  auto service = std::make_shared<receiver::service::TriggerService>(ctx);
  receiver::grpc::TriggerServer server(service);

  receiver::manager::v1::TriggerWebhookRequest req;
  req.set_receiver_id("2b0d6c2e-6f4b-4e0e-9a51-0c8f5f2f1d00");
  receiver::manager::v1::TriggerResponse resp;
  ::grpc::ServerContext                  grpc_ctx;

  const auto status = server.TriggerWebhook(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestGetActionWithoutTokenReturnsUnauthenticated() {
  auto ctx     = BuildServiceContext();
  auto service = std::make_shared<receiver::service::TriggerService>(ctx);
  receiver::grpc::TriggerServer server(service);

  receiver::manager::v1::GetActionRequest req;
  req.set_action_id("a-1");
  receiver::manager::v1::GetActionResponse resp;
  ::grpc::ServerContext                    grpc_ctx;

  const auto status = server.GetAction(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::UNAUTHENTICATED);
}

} // namespace

int main() {
  TestExceptionsMapToStatusCodes();
  TestApiVersionCheck();
  TestListWithoutTokenReturnsUnauthenticated();
  TestWebhookForMissingReceiverReturnsNotFound();
  TestGetActionWithoutTokenReturnsUnauthenticated();

  std::cout << "receiver_manager_unit_grpc_status: pass\n";
  return 0;
}
