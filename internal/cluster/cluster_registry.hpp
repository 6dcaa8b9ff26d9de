#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/auth/request_context.hpp"

namespace receiver::cluster {

struct Cluster {
  std::string id;
  std::string name;
  std::string project;
};

/*
  Existence / visibility lookups against the cluster service.

  A cluster is visible to a requester in the same project, or to an admin.
*/
class ClusterRegistry {
 public:
  virtual ~ClusterRegistry() = default;

  // Resolves an id, or a name unique within the requester's visible
  // clusters. nullopt when nothing visible matches; throws
  // util::InvalidArgument when a name matches more than one cluster.
  virtual std::optional<Cluster> Resolve(const std::string& identity, const auth::RequestContext& requester) const = 0;

  // Unscoped lookup by id.
  virtual std::optional<Cluster> Get(const std::string& cluster_id) const = 0;
};

/*
  Registry backed by a fixed cluster list (config `clusters`).
*/
class StaticClusterRegistry final : public ClusterRegistry {
 public:
  StaticClusterRegistry() = default;
  explicit StaticClusterRegistry(const std::vector<Cluster>& clusters);

  void Add(const Cluster& cluster);
  bool Remove(const std::string& cluster_id);

  std::optional<Cluster> Resolve(const std::string& identity, const auth::RequestContext& requester) const override;
  std::optional<Cluster> Get(const std::string& cluster_id) const override;

 private:
  static bool IsVisible(const Cluster& cluster, const auth::RequestContext& requester);

  mutable std::mutex                       mutex_;
  std::unordered_map<std::string, Cluster> clusters_;
};

} // namespace receiver::cluster
