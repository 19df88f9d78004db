#pragma once

#include <grpcpp/impl/service_type.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"

namespace debugpod::registry {
class InstanceRegistry;
}
namespace debugpod::core {
class Orchestrator;
}
namespace debugpod::proxy {
class SpecFilteredProxy;
}
namespace debugpod::service {
class InstanceService;
}
namespace debugpod::reaper {
class ReaperWorker;
}

namespace debugpod::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<registry::InstanceRegistry> registry;
  std::shared_ptr<core::Orchestrator>         orchestrator;
  std::shared_ptr<proxy::SpecFilteredProxy>   proxy;
  std::shared_ptr<service::InstanceService>   instance_service;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  // Null when reaper.interval_seconds is 0. Not started by Build.
  std::shared_ptr<reaper::ReaperWorker> reaper_worker;
};

/*
  Build

  Constructs the entire backend based on runtime config. Clones the project
  repository first when repository.path holds none.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete implementations.
*/
Application Build(const debugpod::runtime::config::RuntimeConfig& config);

} // namespace debugpod::factory
