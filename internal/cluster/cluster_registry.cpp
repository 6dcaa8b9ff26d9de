#include "cluster_registry.hpp"

#include "internal/util/errors.hpp"

namespace receiver::cluster {

StaticClusterRegistry::StaticClusterRegistry(const std::vector<Cluster>& clusters) {
  for (const auto& cluster : clusters) {
    Add(cluster);
  }
}

void StaticClusterRegistry::Add(const Cluster& cluster) {
  std::lock_guard lock(mutex_);
  clusters_[cluster.id] = cluster;
}

bool StaticClusterRegistry::Remove(const std::string& cluster_id) {
  std::lock_guard lock(mutex_);
  return clusters_.erase(cluster_id) > 0;
}

bool StaticClusterRegistry::IsVisible(const Cluster& cluster, const auth::RequestContext& requester) {
  return requester.IsAdmin() || cluster.project == requester.project;
}

std::optional<Cluster> StaticClusterRegistry::Resolve(const std::string& identity, const auth::RequestContext& requester) const {
  std::lock_guard lock(mutex_);

  if (auto it = clusters_.find(identity); it != clusters_.end()) {
    if (IsVisible(it->second, requester)) {
      return it->second;
    }
    return std::nullopt;
  }

  std::optional<Cluster> match;
  for (const auto& [_, cluster] : clusters_) {
    if (cluster.name != identity || !IsVisible(cluster, requester)) {
      continue;
    }
    if (match) {
      throw util::InvalidArgument("Multiple clusters named '" + identity + "' found, use the cluster id instead");
    }
    match = cluster;
  }
  return match;
}

std::optional<Cluster> StaticClusterRegistry::Get(const std::string& cluster_id) const {
  std::lock_guard lock(mutex_);
  auto            it = clusters_.find(cluster_id);
  if (it == clusters_.end()) {
    return std::nullopt;
  }
  return it->second;
}

} // namespace receiver::cluster
