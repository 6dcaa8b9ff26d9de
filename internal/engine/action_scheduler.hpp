#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>
#include <string>

namespace receiver::engine {

// A cluster with at least one READY action and no action running.
struct ActionTask {
  std::string cluster_id;
};

/*
  Thread-safe blocking queue for action workers.
*/
class ActionScheduler {
 public:
  void Enqueue(const ActionTask& task);

  // blocking wait; nullopt once shut down and drained
  std::optional<ActionTask> Dequeue();

  void Shutdown();

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::queue<ActionTask>  queue_;
  bool                    shutdown_ = false;
};

} // namespace receiver::engine
