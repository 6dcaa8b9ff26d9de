#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/auth/request_context.hpp"
#include "internal/cluster/cluster_registry.hpp"
#include "internal/core/channel_allocator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/engine/action_engine.hpp"
#include "internal/identity/credential_delegator.hpp"
#include "internal/model/receiver.hpp"

namespace receiver::core {

struct CreateReceiverParams {
  std::string   name;
  std::string   type;
  // Cluster id, or a name unique among the requester's visible clusters.
  std::string   cluster;
  std::string   action;
  model::Params actor;
  model::Params params;
};

struct ListReceiversParams {
  uint32_t    limit = 0;
  std::string marker;
  std::string sort;
  bool        global_project = false;

  std::vector<std::string> names;
  std::vector<std::string> types;
  std::vector<std::string> cluster_ids;
  std::vector<std::string> actions;
};

struct ReceiverPage {
  std::vector<model::Receiver> receivers;
  std::string                  next_marker;
};

/*
  Lifecycle manager: create / delete / list / get.

  A webhook receiver and its delegated credential are created and removed
  together. Create issues the credential first and revokes it again when
  the receiver cannot be persisted; Delete revokes first and then removes
  the row, so a failed delete can be retried until the row is gone.

  No manager-level lock: store operations are transactional and the
  duplicate-name check is enforced again by the store at commit.
*/
class ReceiverManager {
 public:
  struct Options {
    uint32_t default_limit = 20;
    uint32_t max_limit     = 1000;
  };

  ReceiverManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<cluster::ClusterRegistry> clusters,
                  std::shared_ptr<engine::ActionEngine> engine, std::shared_ptr<identity::CredentialDelegator> delegator,
                  std::shared_ptr<ChannelAllocator> channels, Options options);

  model::Receiver Create(const CreateReceiverParams& request, const auth::RequestContext& requester);

  void Delete(const std::string& identity, const auth::RequestContext& requester);

  model::Receiver Get(const std::string& identity, const auth::RequestContext& requester);

  ReceiverPage List(const ListReceiversParams& query, const auth::RequestContext& requester);

  // Unscoped lookup by id, used by the trigger path.
  std::optional<model::Receiver> Find(const std::string& receiver_id);

 private:
  // Id, or name within the requester's project. nullopt when not visible.
  std::optional<db::model::ReceiverRecord> Lookup(const std::string& identity, const auth::RequestContext& requester);

  model::Receiver WithChannel(model::Receiver receiver) const;

  void RevokeQuietly(const identity::CredentialHandle& handle, const std::string& receiver_id);

  std::shared_ptr<db::Repository>                repository_;
  std::shared_ptr<cluster::ClusterRegistry>      clusters_;
  std::shared_ptr<engine::ActionEngine>          engine_;
  std::shared_ptr<identity::CredentialDelegator> delegator_;
  std::shared_ptr<ChannelAllocator>              channels_;
  Options                                        options_;
};

// Maps a repository result onto the util:: error types.
void ThrowIfDbError(const db::Result& result, const std::string& context);

} // namespace receiver::core
