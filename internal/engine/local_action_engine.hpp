#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/cluster/cluster_registry.hpp"
#include "internal/engine/action_engine.hpp"
#include "internal/engine/action_scheduler.hpp"

namespace receiver::engine {

/*
  In-process action engine.

  Actions on the same cluster run one at a time in submission order;
  different clusters run in parallel on the ActionWorker pool. A cluster
  holds at most one task in the scheduler, re-enqueued after each action
  while READY actions remain.

  Submit rejects (util::DispatchRejected) unknown actions, clusters the
  registry does not know, and clusters whose READY queue is full.
*/
class LocalActionEngine final : public ActionEngine {
 public:
  // Runs one action; throwing marks it FAILED with the exception text.
  using Executor = std::function<void(const ActionRecord&)>;

  struct Options {
    std::vector<std::string> actions;
    std::size_t              max_pending_per_cluster = 64;
  };

  static const std::vector<std::string>& DefaultActions();

  LocalActionEngine(std::shared_ptr<cluster::ClusterRegistry> clusters, std::shared_ptr<ActionScheduler> scheduler, Options options,
                    Executor executor = {});

  bool                        IsKnownAction(const std::string& action) const override;
  ActionHandle                Submit(const ActionRequest& request) override;
  std::optional<ActionRecord> GetAction(const std::string& action_id) const override;

  // Runs the oldest READY action of the cluster. Called by ActionWorker.
  void RunNext(const std::string& cluster_id);

  // READY -> CANCELLED. False when the action is unknown or already started.
  bool Cancel(const std::string& action_id);

  // Cancels every READY action, used on shutdown.
  void CancelPending();

  std::size_t PendingCount(const std::string& cluster_id) const;

 private:
  struct ClusterQueue {
    std::deque<std::string> ready;
    // a task for this cluster is queued in the scheduler or running
    bool scheduled = false;
  };

  std::shared_ptr<cluster::ClusterRegistry> clusters_;
  std::shared_ptr<ActionScheduler>          scheduler_;
  std::size_t                               max_pending_per_cluster_;
  Executor                                  executor_;
  std::set<std::string>                     known_actions_;

  mutable std::mutex                            mutex_;
  std::unordered_map<std::string, ActionRecord> actions_;
  std::unordered_map<std::string, ClusterQueue> queues_;
};

} // namespace receiver::engine
