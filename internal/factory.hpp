#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace receiver::engine {
class ActionWorker;
class LocalActionEngine;
}

namespace receiver::factory {

/*
  Application

  Everything the process runs: gRPC services to register and the
  background workers that must outlive them.
*/
struct Application {
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
  std::vector<std::shared_ptr<receiver::engine::ActionWorker>> background_workers;

  // READY actions are cancelled on shutdown.
  std::shared_ptr<receiver::engine::LocalActionEngine> action_engine;
};

/*
  Build

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const receiver::runtime::config::RuntimeConfig& config);

}
