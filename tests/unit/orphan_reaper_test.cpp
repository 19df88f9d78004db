#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "internal/core/orchestrator.hpp"
#include "internal/ports/port_allocator.hpp"
#include "internal/process/process_supervisor.hpp"
#include "internal/proxy/spec_filtered_proxy.hpp"
#include "internal/reaper/orphan_reaper.hpp"
#include "internal/reaper/reaper_worker.hpp"
#include "internal/registry/instance_registry.hpp"
#include "test_fakes.hpp"

namespace {

using debugpod::reaper::OrphanReaper;

struct Fixture {
  explicit Fixture(std::chrono::seconds max_lifetime = std::chrono::seconds(0)) {
    registry   = std::make_shared<debugpod::registry::InstanceRegistry>();
    ports      = std::make_shared<debugpod::ports::PortAllocator>(4100, 4200, std::make_shared<debugpod::testing::FakeProbe>());
    worktrees  = std::make_shared<debugpod::testing::FakeWorkingCopyManager>();
    supervisor = std::make_shared<debugpod::testing::FakeSupervisor>();
    upstream   = std::make_shared<debugpod::testing::FakeUpstream>();
    auto proxy = std::make_shared<debugpod::proxy::SpecFilteredProxy>(registry, supervisor, upstream, debugpod::proxy::ProxyOptions{});

    debugpod::core::OrchestratorOptions options;
    options.readiness_timeout       = std::chrono::milliseconds(100);
    options.readiness_poll_interval = std::chrono::milliseconds(5);
    orchestrator = std::make_shared<debugpod::core::Orchestrator>(registry, ports, worktrees, supervisor, proxy, nullptr, nullptr, options);
    reaper       = std::make_shared<OrphanReaper>(orchestrator, registry, worktrees, supervisor, max_lifetime);
  }

  std::shared_ptr<debugpod::registry::InstanceRegistry>      registry;
  std::shared_ptr<debugpod::ports::PortAllocator>            ports;
  std::shared_ptr<debugpod::testing::FakeWorkingCopyManager> worktrees;
  std::shared_ptr<debugpod::testing::FakeSupervisor>         supervisor;
  std::shared_ptr<debugpod::testing::FakeUpstream>           upstream;
  std::shared_ptr<debugpod::core::Orchestrator>              orchestrator;
  std::shared_ptr<OrphanReaper>                              reaper;
};

void TestHealthyInstancesAreKept() {
  Fixture f;
  f.orchestrator->Setup("abc123", "c0ffee");

  const auto report = f.reaper->RunOnce();
  assert(report.instances_reaped.empty());
  assert(report.markers_reclaimed == 0);
  assert(f.worktrees->sweep_calls == 1);
  assert(f.registry->Size() == 1);
}

void TestDeadProcessIsReapedOnce() {
  Fixture f;
  const auto running = f.orchestrator->Setup("abc123", "c0ffee");
  f.supervisor->Kill(running.instance.process_id);

  const auto first = f.reaper->RunOnce();
  assert(first.instances_reaped.size() == 1);
  assert(first.instances_reaped[0] == "abc123");
  assert(f.registry->Size() == 0);
  assert(f.ports->ReservedCount() == 0);
  assert(!f.worktrees->Exists("abc123"));

  const auto second = f.reaper->RunOnce();
  assert(second.instances_reaped.empty());
  assert(second.markers_reclaimed == 0);
}

void TestMissingWorkingCopyIsReaped() {
  Fixture f;
  const auto running = f.orchestrator->Setup("abc123", "c0ffee");
  f.worktrees->Vanish("abc123");

  const auto report = f.reaper->RunOnce();
  assert(report.instances_reaped.size() == 1);
  assert(!f.supervisor->IsAlive(running.instance.process_id));
}

void TestLifetimeLimit() {
  Fixture f(std::chrono::seconds(1));
  f.orchestrator->Setup("abc123", "c0ffee");

  assert(f.reaper->RunOnce().instances_reaped.empty());
  std::this_thread::sleep_for(std::chrono::milliseconds(1100));
  assert(f.reaper->RunOnce().instances_reaped.size() == 1);
}

void TestBusyInstancesAreSkipped() {
  Fixture f;
  const auto running = f.orchestrator->Setup("abc123", "c0ffee");
  f.supervisor->Kill(running.instance.process_id);

  // a setup or delete in flight on another thread holds the key
  std::promise<void> locked;
  std::promise<void> release;
  std::thread        holder([&] {
    auto            key_mutex = f.registry->KeyMutex("abc123");
    std::lock_guard hold(*key_mutex);
    locked.set_value();
    release.get_future().wait();
  });
  locked.get_future().wait();

  const auto report = f.reaper->RunOnce();
  assert(report.skipped_busy == 1);
  assert(report.instances_reaped.empty());

  release.set_value();
  holder.join();

  assert(f.reaper->RunOnce().instances_reaped.size() == 1);
}

void TestUnownedMarkersAreReclaimed() {
  Fixture f;
  const auto stray = f.supervisor->Spawn({"ghost", "/tmp/ghost", 4150});

  const auto report = f.reaper->RunOnce();
  assert(report.markers_reclaimed == 1);
  assert(!f.supervisor->IsAlive(stray.pid));
  assert(f.supervisor->markers.empty());

  assert(f.reaper->RunOnce().markers_reclaimed == 0);
}

void TestMarkersNamingOtherProcessesAreDropped() {
  Fixture f;
  const auto stray = f.supervisor->Spawn({"ghost", "/tmp/ghost", 4150});
  f.supervisor->strangers.insert(stray.pid);
  f.supervisor->markers["init"] = 1;

  const auto report = f.reaper->RunOnce();
  assert(report.markers_reclaimed == 2);
  assert(f.supervisor->terminated.empty());
  assert(f.supervisor->IsAlive(stray.pid));
  assert(f.supervisor->markers.empty());
}

// Same as above against real processes: a pid marker left over from an
// earlier run must not take down whatever now owns that pid.
void TestRealSupervisorSparesBystanders() {
  namespace fs = std::filesystem;

  const auto root = fs::temp_directory_path() / ("debugpod_reaper_" + std::to_string(::getpid()));
  fs::remove_all(root);
  fs::create_directories(root / "pids");
  fs::create_directories(root / "orphan");

  debugpod::process::AgentOptions agent;
  agent.binary          = "sleep";
  agent.args            = {"30"};
  agent.pid_dir         = (root / "pids").string();
  agent.terminate_grace = std::chrono::seconds(2);
  auto supervisor       = std::make_shared<debugpod::process::PosixProcessSupervisor>(agent);

  const auto orphan = supervisor->Spawn({"orphan", (root / "orphan").string(), 4150});
  assert(supervisor->IsAgentProcess(orphan.pid));

  // Its own session and group, not matching the agent command line.
  const pid_t bystander = ::fork();
  assert(bystander >= 0);
  if (bystander == 0) {
    ::setsid();
    ::execlp("sleep", "sleep", "31", static_cast<char*>(nullptr));
    ::_exit(127);
  }
  // wait for the exec so the check below sees "sleep 31"
  for (int i = 0; i < 200; ++i) {
    std::ifstream cmdline("/proc/" + std::to_string(bystander) + "/cmdline");
    std::string   argv0;
    std::getline(cmdline, argv0, '\0');
    if (argv0 == "sleep") break;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  assert(!supervisor->IsAgentProcess(bystander));
  assert(!supervisor->IsAgentProcess(1));

  std::ofstream(root / "pids" / "debugpod-pid-stale") << bystander << '\n';
  std::ofstream(root / "pids" / "debugpod-pid-one") << 1 << '\n';

  auto registry  = std::make_shared<debugpod::registry::InstanceRegistry>();
  auto ports     = std::make_shared<debugpod::ports::PortAllocator>(4100, 4200, std::make_shared<debugpod::testing::FakeProbe>());
  auto worktrees = std::make_shared<debugpod::testing::FakeWorkingCopyManager>();
  auto proxy     = std::make_shared<debugpod::proxy::SpecFilteredProxy>(registry, supervisor, std::make_shared<debugpod::testing::FakeUpstream>(),
                                                                    debugpod::proxy::ProxyOptions{});
  auto orchestrator =
      std::make_shared<debugpod::core::Orchestrator>(registry, ports, worktrees, supervisor, proxy, nullptr, nullptr, debugpod::core::OrchestratorOptions{});
  OrphanReaper reaper(orchestrator, registry, worktrees, supervisor, std::chrono::seconds(0));

  const auto report = reaper.RunOnce();
  assert(report.markers_reclaimed == 3);
  assert(supervisor->ListPidMarkers().empty());
  assert(!supervisor->IsAlive(orphan.pid));

  int status = 0;
  assert(::waitpid(bystander, &status, WNOHANG) == 0);
  assert(::kill(bystander, 0) == 0);

  ::kill(bystander, SIGKILL);
  ::waitpid(bystander, &status, 0);

  std::error_code ec;
  fs::remove_all(root, ec);
}

void TestWorkerRunsAndStops() {
  Fixture f;
  const auto running = f.orchestrator->Setup("abc123", "c0ffee");
  f.supervisor->Kill(running.instance.process_id);

  debugpod::reaper::ReaperWorker worker(f.reaper, std::chrono::seconds(1));
  worker.Start();
  for (int i = 0; i < 300 && f.registry->Size() > 0; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  worker.Stop();
  assert(f.registry->Size() == 0);
}

} // namespace

int main() {
  TestHealthyInstancesAreKept();
  TestDeadProcessIsReapedOnce();
  TestMissingWorkingCopyIsReaped();
  TestLifetimeLimit();
  TestBusyInstancesAreSkipped();
  TestUnownedMarkersAreReclaimed();
  TestMarkersNamingOtherProcessesAreDropped();
  TestRealSupervisorSparesBystanders();
  TestWorkerRunsAndStops();

  std::cout << "debugpod_unit_orphan_reaper: pass\n";
  return 0;
}
