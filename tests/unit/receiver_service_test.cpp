#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/cluster/cluster_registry.hpp"
#include "internal/core/channel_allocator.hpp"
#include "internal/core/receiver_manager.hpp"
#include "internal/core/trigger_dispatcher.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/engine/action_scheduler.hpp"
#include "internal/engine/local_action_engine.hpp"
#include "internal/identity/credential_delegator.hpp"
#include "internal/identity/local_identity_service.hpp"
#include "internal/service/receiver_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/trigger_service.hpp"
#include "internal/util/errors.hpp"
#include "receiver/manager/v1.hpp"

namespace {

using namespace receiver::manager::v1;
using receiver::service::CallContext;

constexpr char kWebCluster[] = "6b1e0a52-3f0e-4a43-9d59-6d3b8f2a6c11";
constexpr char kOpsCluster[] = "0f9c7a2e-8d7b-4d1e-b4a6-2c5e1f3a9b70";

receiver::auth::RequestContext Context(const std::string& user, const std::string& project, const std::string& role) {
  receiver::auth::RequestContext ctx;
  ctx.user    = user;
  ctx.project = project;
  ctx.domain  = "default";
  ctx.roles   = {role};
  return ctx;
}

struct Services {
  std::shared_ptr<receiver::identity::LocalIdentityService> identity;
  std::shared_ptr<receiver::service::ReceiverService>       receivers;
  std::shared_ptr<receiver::service::TriggerService>        triggers;
};

Services BuildServices() {
  Services s;
  s.identity = std::make_shared<receiver::identity::LocalIdentityService>();
  s.identity->AddUser("alice-token", {Context("alice", "web", "member"), true});
  s.identity->AddUser("bob-token", {Context("bob", "web", "reader"), false});
  s.identity->AddUser("carol-token", {Context("carol", "ops", "member"), true});
  s.identity->AddUser("admin-token", {Context("admin", "ops", "admin"), true});

  auto clusters = std::make_shared<receiver::cluster::StaticClusterRegistry>(std::vector<receiver::cluster::Cluster>{
      {kWebCluster, "web-frontend", "web"},
      {kOpsCluster, "batch", "ops"},
  });
  auto engine    = std::make_shared<receiver::engine::LocalActionEngine>(clusters, std::make_shared<receiver::engine::ActionScheduler>(),
                                                                      receiver::engine::LocalActionEngine::Options{});
  auto delegator = std::make_shared<receiver::identity::CredentialDelegator>(s.identity, std::chrono::milliseconds(1000));

  receiver::core::ReceiverManager::Options options;
  options.default_limit = 2;
  options.max_limit     = 10;

  receiver::service::ServiceContext ctx;
  ctx.manager    = std::make_shared<receiver::core::ReceiverManager>(std::make_shared<receiver::db::memory::MemoryRepository>(), clusters,
                                                                  engine, delegator,
                                                                  std::make_shared<receiver::core::ChannelAllocator>("https://hooks.example.com"),
                                                                  options);
  ctx.dispatcher = std::make_shared<receiver::core::TriggerDispatcher>(ctx.manager, clusters, engine, delegator);
  ctx.engine     = engine;
  ctx.delegator  = delegator;

  s.receivers = std::make_shared<receiver::service::ReceiverService>(ctx);
  s.triggers  = std::make_shared<receiver::service::TriggerService>(ctx);
  return s;
}

CallContext As(const std::string& token) {
  return CallContext{token, "req-test"};
}

template <typename Error, typename Fn>
void ExpectThrows(Fn&& fn) {
  bool threw = false;
  try {
    fn();
  } catch (const Error&) {
    threw = true;
  }
  assert(threw);
}

Receiver Create(Services& s, const std::string& token, const std::string& name, const std::string& type, const std::string& cluster) {
  CreateReceiverRequest req;
  req.set_name(name);
  req.set_type(type);
  req.set_cluster_id(cluster);
  req.set_action("CLUSTER_SCALE_OUT");
  (*req.mutable_params())["count"] = "1";
  return s.receivers->Create(req, As(token)).receiver();
}

void TestCreateWebhookReturnsChannel() {
  auto s = BuildServices();

  CreateReceiverRequest req;
  req.set_name("cpu-high");
  req.set_type("webhook");
  req.set_cluster_id("web-frontend");
  req.set_action("CLUSTER_SCALE_OUT");
  (*req.mutable_actor())["trust_id"] = "forged";
  (*req.mutable_params())["count"]   = "2";

  const auto created = s.receivers->Create(req, As("alice-token")).receiver();
  assert(!created.id().empty());
  assert(created.cluster_id() == kWebCluster);
  assert(created.project() == "web");
  assert(created.user() == "alice");
  assert(created.channel().alarm_url() == "https://hooks.example.com/v1/webhooks/" + created.id() + "/trigger?V=1");
  assert(created.actor().count("trust_id") == 1);
  assert(created.actor().at("trust_id") != "forged");
  assert(s.identity->IsTrustLive(created.actor().at("trust_id")));

  GetReceiverRequest get;
  get.set_id("cpu-high");
  const auto fetched = s.receivers->Get(get, As("bob-token")).receiver();
  assert(fetched.id() == created.id());
  assert(fetched.channel().alarm_url() == created.channel().alarm_url());
}

void TestAuthenticationAndPermissions() {
  auto s = BuildServices();

  ExpectThrows<receiver::util::Unauthorized>([&] { s.receivers->List(ListReceiversRequest{}, As("")); });
  ExpectThrows<receiver::util::Unauthorized>([&] { s.receivers->List(ListReceiversRequest{}, As("stolen-token")); });
  ExpectThrows<receiver::util::Forbidden>([&] { Create(s, "bob-token", "nope", "signal", kWebCluster); });

  ListReceiversRequest global;
  global.set_global_project(true);
  ExpectThrows<receiver::util::Forbidden>([&] { s.receivers->List(global, As("alice-token")); });
}

void TestListIsProjectScopedAndPaged() {
  auto s = BuildServices();
  Create(s, "alice-token", "a", "signal", kWebCluster);
  Create(s, "alice-token", "b", "webhook", kWebCluster);
  Create(s, "alice-token", "c", "signal", kWebCluster);
  Create(s, "carol-token", "d", "signal", kOpsCluster);

  ListReceiversRequest req;
  req.set_sort("name");
  auto first = s.receivers->List(req, As("bob-token"));
  assert(first.receivers_size() == 2);
  assert(first.receivers(0).name() == "a");
  assert(first.receivers(1).name() == "b");
  assert(!first.next_marker().empty());

  req.set_marker(first.next_marker());
  auto second = s.receivers->List(req, As("bob-token"));
  assert(second.receivers_size() == 1);
  assert(second.receivers(0).name() == "c");
  assert(second.next_marker().empty());

  ListReceiversRequest filtered;
  filtered.add_type("webhook");
  auto webhooks = s.receivers->List(filtered, As("alice-token"));
  assert(webhooks.receivers_size() == 1);
  assert(webhooks.receivers(0).name() == "b");

  ListReceiversRequest global;
  global.set_global_project(true);
  global.set_limit(10);
  assert(s.receivers->List(global, As("admin-token")).receivers_size() == 4);

  ListReceiversRequest too_many;
  too_many.set_limit(11);
  ExpectThrows<receiver::util::InvalidArgument>([&] { s.receivers->List(too_many, As("alice-token")); });

  ListReceiversRequest bad_type;
  bad_type.add_type("carrier-pigeon");
  ExpectThrows<receiver::util::InvalidArgument>([&] { s.receivers->List(bad_type, As("alice-token")); });
}

void TestOtherProjectsSeeNotFound() {
  auto       s       = BuildServices();
  const auto created = Create(s, "alice-token", "private", "webhook", kWebCluster);

  GetReceiverRequest get;
  get.set_id(created.id());
  ExpectThrows<receiver::util::NotFound>([&] { s.receivers->Get(get, As("carol-token")); });
  assert(s.receivers->Get(get, As("admin-token")).receiver().name() == "private");

  DeleteReceiverRequest del;
  del.set_id(created.id());
  ExpectThrows<receiver::util::NotFound>([&] { s.receivers->Delete(del, As("carol-token")); });
}

void TestDeleteRevokesCredential() {
  auto       s       = BuildServices();
  const auto created = Create(s, "alice-token", "short-lived", "webhook", kWebCluster);
  const auto trust   = created.actor().at("trust_id");
  assert(s.identity->IsTrustLive(trust));

  DeleteReceiverRequest del;
  del.set_id(created.id());
  ExpectThrows<receiver::util::Forbidden>([&] { s.receivers->Delete(del, As("bob-token")); });
  s.receivers->Delete(del, As("alice-token"));
  assert(!s.identity->IsTrustLive(trust));

  ExpectThrows<receiver::util::NotFound>([&] { s.receivers->Delete(del, As("alice-token")); });

  TriggerWebhookRequest fire;
  fire.set_receiver_id(created.id());
  ExpectThrows<receiver::util::NotFound>([&] { s.triggers->TriggerWebhook(fire, As("")); });
}

void TestWebhookAndActionVisibility() {
  auto       s       = BuildServices();
  const auto created = Create(s, "alice-token", "hook", "webhook", kWebCluster);

  TriggerWebhookRequest fire;
  fire.set_receiver_id(created.id());
  (*fire.mutable_params())["count"] = "5";
  const auto fired                  = s.triggers->TriggerWebhook(fire, As(""));
  assert(!fired.action_id().empty());
  assert(fired.state() == "SUBMITTED");
  assert(fired.effective_params().at("count") == "5");

  GetActionRequest get;
  get.set_action_id(fired.action_id());
  const auto action = s.triggers->GetAction(get, As("bob-token")).action();
  assert(action.action() == "CLUSTER_SCALE_OUT");
  assert(action.cluster_id() == kWebCluster);
  assert(action.cause() == "receiver:" + created.id());
  assert(action.inputs().at("count") == "5");
  assert(action.user() == "alice");

  ExpectThrows<receiver::util::NotFound>([&] { s.triggers->GetAction(get, As("carol-token")); });
  assert(s.triggers->GetAction(get, As("admin-token")).action().action_id() == fired.action_id());

  GetActionRequest missing;
  missing.set_action_id("no-such-action");
  ExpectThrows<receiver::util::NotFound>([&] { s.triggers->GetAction(missing, As("alice-token")); });
}

void TestSignalUsesCallerToken() {
  auto       s       = BuildServices();
  const auto created = Create(s, "alice-token", "sig", "signal", kWebCluster);
  assert(!created.has_channel());

  SignalReceiverRequest req;
  req.set_receiver_id(created.id());

  ExpectThrows<receiver::util::Unauthorized>([&] { s.triggers->Signal(req, As("")); });
  ExpectThrows<receiver::util::Unauthorized>([&] { s.triggers->Signal(req, As("carol-token")); });

  const auto fired = s.triggers->Signal(req, As("bob-token"));
  assert(fired.state() == "SUBMITTED");

  GetActionRequest get;
  get.set_action_id(fired.action_id());
  assert(s.triggers->GetAction(get, As("alice-token")).action().user() == "bob");
}

} // namespace

int main() {
  TestCreateWebhookReturnsChannel();
  TestAuthenticationAndPermissions();
  TestListIsProjectScopedAndPaged();
  TestOtherProjectsSeeNotFound();
  TestDeleteRevokesCredential();
  TestWebhookAndActionVisibility();
  TestSignalUsesCallerToken();

  std::cout << "receiver_manager_unit_receiver_service: pass\n";
  return 0;
}
