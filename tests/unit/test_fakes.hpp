#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "internal/ports/port_probe.hpp"
#include "internal/process/process_supervisor.hpp"
#include "internal/proxy/upstream.hpp"
#include "internal/util/errors.hpp"
#include "internal/worktree/working_copy_manager.hpp"

namespace debugpod::testing {

class FakeProbe final : public ports::PortProbe {
 public:
  std::set<std::uint16_t> PortsInUse() override {
    return used;
  }

  std::set<std::uint16_t> used;
};

/*
  In-memory checkouts; "missing" commits throw CommitNotFound.
*/
class FakeWorkingCopyManager final : public worktree::WorkingCopyManager {
 public:
  worktree::WorkingCopy Create(const std::string& correlation_id, const std::string& source_commit) override {
    std::lock_guard lock(mutex);
    ++create_calls;
    if (copies.contains(correlation_id)) {
      throw util::AlreadyExists("working copy exists: " + correlation_id);
    }
    if (source_commit == "missing") {
      throw util::CommitNotFound("unknown commit " + source_commit);
    }
    worktree::WorkingCopy copy{PathFor(correlation_id), "debug/" + correlation_id, source_commit.empty() ? "head000" : source_commit};
    copies[correlation_id] = copy;
    return copy;
  }

  void Remove(const std::string& correlation_id) override {
    std::lock_guard lock(mutex);
    ++remove_calls;
    copies.erase(correlation_id);
  }

  worktree::SweepReport SweepOrphans() override {
    ++sweep_calls;
    return {};
  }

  bool Exists(const std::string& correlation_id) const override {
    std::lock_guard lock(mutex);
    return copies.contains(correlation_id);
  }

  std::string PathFor(const std::string& correlation_id) const override {
    return "/tmp/fake-worktrees/" + correlation_id;
  }

  // Simulates an operator deleting the directory.
  void Vanish(const std::string& correlation_id) {
    std::lock_guard lock(mutex);
    copies.erase(correlation_id);
  }

  mutable std::mutex                           mutex;
  std::map<std::string, worktree::WorkingCopy> copies;
  int                                          create_calls = 0;
  int                                          remove_calls = 0;
  int                                          sweep_calls  = 0;
};

/*
  Hands out increasing fake pids; nothing is executed.
*/
class FakeSupervisor final : public process::ProcessSupervisor {
 public:
  process::SpawnedProcess Spawn(const process::SpawnSpec& spec) override {
    std::lock_guard lock(mutex);
    if (fail_spawn) {
      throw std::runtime_error("spawn failed");
    }
    const auto pid = next_pid++;
    alive.insert(pid);
    markers[spec.correlation_id] = pid;
    ports[pid]                   = spec.port;
    return {pid, spec.working_copy_path + "/server.log"};
  }

  bool IsAlive(std::int64_t pid) override {
    std::lock_guard lock(mutex);
    return alive.contains(pid);
  }

  bool IsAgentProcess(std::int64_t pid) override {
    std::lock_guard lock(mutex);
    return alive.contains(pid) && !strangers.contains(pid);
  }

  void Terminate(std::int64_t pid) override {
    std::lock_guard lock(mutex);
    terminated.push_back(pid);
    alive.erase(pid);
  }

  bool Wait(std::int64_t pid, std::chrono::milliseconds) override {
    return !IsAlive(pid);
  }

  void RemovePidMarker(const std::string& correlation_id) override {
    std::lock_guard lock(mutex);
    markers.erase(correlation_id);
  }

  std::vector<process::PidMarker> ListPidMarkers() override {
    std::lock_guard                 lock(mutex);
    std::vector<process::PidMarker> out;
    for (const auto& [id, pid] : markers) {
      out.push_back({id, pid, "/tmp/debugpod-pid-" + id});
    }
    return out;
  }

  std::vector<process::AgentProcessInfo> ListAgentProcesses() override {
    std::lock_guard                        lock(mutex);
    std::vector<process::AgentProcessInfo> out;
    for (auto pid : alive) {
      if (strangers.contains(pid)) continue;
      out.push_back({pid, ports[pid], "opencode serve --port " + std::to_string(ports[pid])});
    }
    return out;
  }

  void Kill(std::int64_t pid) {
    std::lock_guard lock(mutex);
    alive.erase(pid);
  }

  std::mutex                            mutex;
  std::int64_t                          next_pid = 1000;
  std::set<std::int64_t>                alive;
  std::set<std::int64_t>                strangers;  // alive, not agents
  std::map<std::string, std::int64_t>   markers;
  std::map<std::int64_t, std::uint16_t> ports;
  std::vector<std::int64_t>             terminated;
  bool                                  fail_spawn = false;
};

/*
  Records forwarded requests and answers with a canned response.
*/
class FakeUpstream final : public proxy::Upstream {
 public:
  std::string FetchContract(std::uint16_t, const std::string&) override {
    ++contract_fetches;
    if (contract.empty()) {
      throw util::ContractUnavailable("no contract");
    }
    return contract;
  }

  void Forward(std::uint16_t port, const proxy::ProxyRequest& request, proxy::ResponseSink& sink) override {
    {
      std::lock_guard lock(mutex);
      forwarded.push_back(request);
      forwarded_ports.push_back(port);
    }
    sink.OnHead(200, {{"Content-Type", "application/json"}});
    sink.OnChunk(response_body);
    sink.OnComplete();
  }

  proxy::PortCheckResult CheckPort(std::uint16_t port) override {
    proxy::PortCheckResult result;
    result.port      = port;
    result.listening = listening;
    result.healthy   = listening;
    result.version   = listening ? "1.0.0" : "";
    return result;
  }

  bool IsListening(std::uint16_t) override {
    return listening;
  }

  std::mutex                       mutex;
  std::string                      contract;
  std::string                      response_body = "{\"ok\":true}";
  std::atomic<int>                 contract_fetches{0};
  std::atomic<bool>                listening{true};
  std::vector<proxy::ProxyRequest> forwarded;
  std::vector<std::uint16_t>       forwarded_ports;
};

// Minimal OpenAPI document with the given operations.
inline std::string OpenApiDocument(const std::vector<std::pair<std::string, std::string>>& operations) {
  std::map<std::string, std::vector<std::string>> paths;
  for (const auto& [method, path] : operations) {
    paths[path].push_back(method);
  }

  std::string doc = R"({"openapi":"3.0.0","paths":{)";
  bool        first_path = true;
  for (const auto& [path, methods] : paths) {
    if (!first_path) doc += ",";
    first_path = false;
    doc += "\"" + path + "\":{";
    bool first_method = true;
    for (const auto& method : methods) {
      if (!first_method) doc += ",";
      first_method = false;
      doc += "\"" + method + "\":{\"responses\":{}}";
    }
    doc += "}";
  }
  doc += "}}";
  return doc;
}

} // namespace debugpod::testing
