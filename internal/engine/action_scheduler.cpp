#include "action_scheduler.hpp"

namespace receiver::engine {

void ActionScheduler::Enqueue(const ActionTask& task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return;
    queue_.push(task);
  }
  cv_.notify_one();
}

std::optional<ActionTask> ActionScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  ActionTask task = queue_.front();
  queue_.pop();
  return task;
}

void ActionScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

} // namespace receiver::engine
