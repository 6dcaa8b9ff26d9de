#include "action_worker.hpp"

#include "internal/engine/local_action_engine.hpp"
#include "internal/observability/logging.hpp"

namespace receiver::engine {

ActionWorker::ActionWorker(std::shared_ptr<ActionScheduler> scheduler,
                           std::shared_ptr<LocalActionEngine> engine)
    : scheduler_(std::move(scheduler)),
      engine_(std::move(engine)) {}

ActionWorker::~ActionWorker() {
  Stop();
}

void ActionWorker::Start() {
  running_ = true;
  thread_ = std::thread(&ActionWorker::Run, this);
}

void ActionWorker::Stop() {
  scheduler_->Shutdown();
  running_ = false;
  if (thread_.joinable())
    thread_.join();
}

void ActionWorker::Run() {
  while (running_) {

    auto task = scheduler_->Dequeue();
    if (!task)
      break;

    try {
      engine_->RunNext(task->cluster_id);
    }
    catch (const std::exception& e) {
      RECEIVER_LOG_ERROR("action worker failed", {receiver::observability::StringField("cluster_id", task->cluster_id),
                                                  receiver::observability::StringField("error", e.what())});
    }
  }
}

}
