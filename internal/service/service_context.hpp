#pragma once

#include <memory>

namespace debugpod::core {
class Orchestrator;
}
namespace debugpod::registry {
class InstanceRegistry;
}
namespace debugpod::process {
class ProcessSupervisor;
}
namespace debugpod::reaper {
class OrphanReaper;
}
namespace debugpod::proxy {
class SpecFilteredProxy;
}

namespace debugpod::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<debugpod::core::Orchestrator>        orchestrator;
  std::shared_ptr<debugpod::registry::InstanceRegistry> registry;
  std::shared_ptr<debugpod::process::ProcessSupervisor> supervisor;
  std::shared_ptr<debugpod::reaper::OrphanReaper>       reaper;
  std::shared_ptr<debugpod::proxy::SpecFilteredProxy>   proxy;
};

} // namespace debugpod::service
