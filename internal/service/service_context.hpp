#pragma once

#include <memory>
#include <string>

namespace receiver::core {
class ReceiverManager;
class TriggerDispatcher;
} // namespace receiver::core
namespace receiver::engine { class ActionEngine; }
namespace receiver::identity { class CredentialDelegator; }

namespace receiver::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<receiver::core::ReceiverManager> manager;
  std::shared_ptr<receiver::core::TriggerDispatcher> dispatcher;
  std::shared_ptr<receiver::engine::ActionEngine> engine;
  std::shared_ptr<receiver::identity::CredentialDelegator> delegator;
};

/*
  Per-call transport data extracted by the gRPC layer.
*/
struct CallContext {
  // x-auth-token; empty for anonymous calls.
  std::string auth_token;
  // x-request-id, echoed or generated.
  std::string request_id;
};

}
