#pragma once

#include <atomic>
#include <memory>
#include <thread>

#include "action_scheduler.hpp"

namespace receiver::engine {

class LocalActionEngine;

/*
  Background worker that runs queued cluster actions.
*/
class ActionWorker {
 public:
  ActionWorker(std::shared_ptr<ActionScheduler> scheduler, std::shared_ptr<LocalActionEngine> engine);
  ~ActionWorker();

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<ActionScheduler>   scheduler_;
  std::shared_ptr<LocalActionEngine> engine_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace receiver::engine
