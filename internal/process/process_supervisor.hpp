#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace debugpod::process {

struct SpawnSpec {
  std::string   correlation_id;
  std::string   working_copy_path;
  std::uint16_t port = 0;
};

struct SpawnedProcess {
  std::int64_t pid = 0;
  std::string  log_path;
};

struct PidMarker {
  std::string  correlation_id;
  std::int64_t pid = 0;
  std::string  path;
};

struct AgentProcessInfo {
  std::int64_t  pid  = 0;
  std::uint16_t port = 0;
  std::string   cmdline;
};

/*
  Owns the agent processes started for instances.

  Spawn returns as soon as the program has been exec'd; readiness is the
  caller's concern. Terminate and Wait are idempotent for processes that
  already exited.
*/
class ProcessSupervisor {
 public:
  virtual ~ProcessSupervisor() = default;

  virtual SpawnedProcess Spawn(const SpawnSpec& spec) = 0;

  virtual bool IsAlive(std::int64_t pid) = 0;

  // True when pid is a live process running the configured agent command.
  virtual bool IsAgentProcess(std::int64_t pid) = 0;

  // SIGTERM, then SIGKILL once the grace period has passed.
  virtual void Terminate(std::int64_t pid) = 0;

  // True when the process is gone before the timeout.
  virtual bool Wait(std::int64_t pid, std::chrono::milliseconds timeout) = 0;

  // ---------------------------------------------------------------------
  // Recovery artifacts
  // ---------------------------------------------------------------------

  virtual void                   RemovePidMarker(const std::string& correlation_id) = 0;
  virtual std::vector<PidMarker> ListPidMarkers()                                   = 0;

  // ---------------------------------------------------------------------
  // Host inspection
  // ---------------------------------------------------------------------

  virtual std::vector<AgentProcessInfo> ListAgentProcesses() = 0;
};

struct AgentOptions {
  std::string               binary;
  std::vector<std::string>  args;
  std::string               log_file_name = "server.log";
  std::string               pid_dir       = "/tmp";
  std::chrono::milliseconds terminate_grace{5000};
};

/*
  fork/exec based supervisor.

  Each agent runs in its own process group with stdout/stderr appended to
  <working_copy>/<log_file_name>. A marker file <pid_dir>/debugpod-pid-<id>
  holds the pid for manual recovery.
*/
class PosixProcessSupervisor final : public ProcessSupervisor {
 public:
  explicit PosixProcessSupervisor(AgentOptions options);

  SpawnedProcess Spawn(const SpawnSpec& spec) override;
  bool           IsAlive(std::int64_t pid) override;
  bool           IsAgentProcess(std::int64_t pid) override;
  void           Terminate(std::int64_t pid) override;
  bool           Wait(std::int64_t pid, std::chrono::milliseconds timeout) override;

  void                   RemovePidMarker(const std::string& correlation_id) override;
  std::vector<PidMarker> ListPidMarkers() override;

  std::vector<AgentProcessInfo> ListAgentProcesses() override;

  // Substitutes {port} and {host} in the configured arguments.
  static std::vector<std::string> ExpandArgs(const std::vector<std::string>& args, std::uint16_t port);

  // Recognizes an agent command line; exposed for tests.
  std::optional<AgentProcessInfo> MatchAgentCmdline(std::int64_t pid, const std::vector<std::string>& argv) const;

 private:
  std::string MarkerPath(const std::string& correlation_id) const;

  AgentOptions options_;
};

inline constexpr const char* kPidMarkerPrefix = "debugpod-pid-";
inline constexpr const char* kAgentHost       = "127.0.0.1";

} // namespace debugpod::process
