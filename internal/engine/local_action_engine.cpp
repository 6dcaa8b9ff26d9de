#include "local_action_engine.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace receiver::engine {

using receiver::observability::IntField;
using receiver::observability::StringField;

const std::vector<std::string>& LocalActionEngine::DefaultActions() {
  static const std::vector<std::string> kActions = {
      "CLUSTER_CREATE",    "CLUSTER_DELETE",   "CLUSTER_UPDATE", "CLUSTER_ADD_NODES", "CLUSTER_DEL_NODES",     "CLUSTER_SCALE_OUT",
      "CLUSTER_SCALE_IN",  "CLUSTER_RESIZE",   "CLUSTER_CHECK",  "CLUSTER_RECOVER",   "CLUSTER_ATTACH_POLICY", "CLUSTER_DETACH_POLICY",
  };
  return kActions;
}

LocalActionEngine::LocalActionEngine(std::shared_ptr<cluster::ClusterRegistry> clusters, std::shared_ptr<ActionScheduler> scheduler,
                                     Options options, Executor executor)
    : clusters_(std::move(clusters)),
      scheduler_(std::move(scheduler)),
      max_pending_per_cluster_(options.max_pending_per_cluster == 0 ? 1 : options.max_pending_per_cluster),
      executor_(std::move(executor)) {
  if (!clusters_ || !scheduler_) {
    throw std::invalid_argument("LocalActionEngine requires a cluster registry and a scheduler");
  }

  const auto& actions = options.actions.empty() ? DefaultActions() : options.actions;
  known_actions_.insert(actions.begin(), actions.end());
}

bool LocalActionEngine::IsKnownAction(const std::string& action) const {
  return known_actions_.contains(action);
}

ActionHandle LocalActionEngine::Submit(const ActionRequest& request) {
  if (!IsKnownAction(request.action)) {
    throw util::DispatchRejected("Action '" + request.action + "' is not supported");
  }
  if (!clusters_->Get(request.cluster_id)) {
    throw util::DispatchRejected("Cluster '" + request.cluster_id + "' could not be found");
  }

  ActionRecord record;
  record.id         = util::NewId();
  record.action     = request.action;
  record.cluster_id = request.cluster_id;
  record.cause      = request.cause;
  record.inputs     = request.inputs;
  record.user       = request.actor.user;
  record.project    = request.actor.project;
  record.created_at = util::Now();

  bool        schedule = false;
  std::size_t pending  = 0;
  {
    std::lock_guard lock(mutex_);
    auto&           queue = queues_[request.cluster_id];
    if (queue.ready.size() >= max_pending_per_cluster_) {
      throw util::DispatchRejected("Cluster '" + request.cluster_id + "' is busy: " + std::to_string(queue.ready.size()) + " actions pending");
    }

    record.status = ActionStatus::kReady;
    actions_.emplace(record.id, record);
    queue.ready.push_back(record.id);
    pending = queue.ready.size();

    if (!queue.scheduled) {
      queue.scheduled = true;
      schedule        = true;
    }
  }

  receiver::observability::Metrics::Instance().SetPendingActions(request.cluster_id, pending);
  if (schedule) {
    scheduler_->Enqueue(ActionTask{request.cluster_id});
  }

  RECEIVER_LOG_INFO("action submitted", {StringField("action_id", record.id), StringField("action", record.action),
                                         StringField("cluster_id", record.cluster_id), StringField("cause", record.cause),
                                         IntField("pending", static_cast<std::int64_t>(pending))});
  return ActionHandle{record.id, ActionStatus::kReady};
}

std::optional<ActionRecord> LocalActionEngine::GetAction(const std::string& action_id) const {
  std::lock_guard lock(mutex_);
  auto            it = actions_.find(action_id);
  if (it == actions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void LocalActionEngine::RunNext(const std::string& cluster_id) {
  ActionRecord snapshot;
  {
    std::lock_guard lock(mutex_);
    auto&           queue = queues_[cluster_id];
    if (queue.ready.empty()) {
      queue.scheduled = false;
      return;
    }

    auto action_id = queue.ready.front();
    queue.ready.pop_front();

    auto& record  = actions_.at(action_id);
    record.status = ActionStatus::kRunning;
    snapshot      = record;
  }

  receiver::observability::SpanScope span("LocalActionEngine.RunNext");
  span.SetAttribute("action.id", snapshot.id);
  span.SetAttribute("cluster.id", cluster_id);

  ActionStatus final_status = ActionStatus::kSucceeded;
  std::string  reason       = "Action completed successfully";
  try {
    if (executor_) {
      executor_(snapshot);
    }
  } catch (const std::exception& e) {
    final_status = ActionStatus::kFailed;
    reason       = e.what();
    span.RecordException(e.what());
  }

  bool        reschedule = false;
  std::size_t pending    = 0;
  {
    std::lock_guard lock(mutex_);
    auto&           record = actions_.at(snapshot.id);
    record.status          = final_status;
    record.status_reason   = reason;

    auto& queue = queues_[cluster_id];
    pending     = queue.ready.size();
    if (pending > 0) {
      reschedule = true;
    } else {
      queue.scheduled = false;
    }
  }

  receiver::observability::Metrics::Instance().SetPendingActions(cluster_id, pending);
  if (reschedule) {
    scheduler_->Enqueue(ActionTask{cluster_id});
  }

  if (final_status == ActionStatus::kFailed) {
    RECEIVER_LOG_WARN("action failed", {StringField("action_id", snapshot.id), StringField("action", snapshot.action),
                                        StringField("cluster_id", cluster_id), StringField("reason", reason)});
  } else {
    RECEIVER_LOG_INFO("action succeeded", {StringField("action_id", snapshot.id), StringField("action", snapshot.action),
                                           StringField("cluster_id", cluster_id)});
  }
}

bool LocalActionEngine::Cancel(const std::string& action_id) {
  std::lock_guard lock(mutex_);
  auto            it = actions_.find(action_id);
  if (it == actions_.end() || it->second.status != ActionStatus::kReady) {
    return false;
  }

  auto& ready = queues_[it->second.cluster_id].ready;
  ready.erase(std::remove(ready.begin(), ready.end(), action_id), ready.end());
  it->second.status        = ActionStatus::kCancelled;
  it->second.status_reason = "Action cancelled before it started";
  return true;
}

void LocalActionEngine::CancelPending() {
  std::lock_guard lock(mutex_);
  for (auto& [cluster_id, queue] : queues_) {
    for (const auto& action_id : queue.ready) {
      auto& record         = actions_.at(action_id);
      record.status        = ActionStatus::kCancelled;
      record.status_reason = "Engine shutting down";
    }
    queue.ready.clear();
  }
}

std::size_t LocalActionEngine::PendingCount(const std::string& cluster_id) const {
  std::lock_guard lock(mutex_);
  auto            it = queues_.find(cluster_id);
  return it == queues_.end() ? 0 : it->second.ready.size();
}

} // namespace receiver::engine
