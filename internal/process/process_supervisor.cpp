#include "process_supervisor.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <thread>

#include "internal/observability/logging.hpp"

namespace debugpod::process {

namespace fs = std::filesystem;

using debugpod::observability::IntField;
using debugpod::observability::StringField;

namespace {

void ReplaceAll(std::string* value, const std::string& from, const std::string& to) {
  std::size_t pos = 0;
  while ((pos = value->find(from, pos)) != std::string::npos) {
    value->replace(pos, from.size(), to);
    pos += to.size();
  }
}

// Zombies still answer kill(pid, 0).
bool IsZombie(std::int64_t pid) {
  std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
  if (!stat) {
    return false;
  }
  std::string contents;
  std::getline(stat, contents);
  const auto close_paren = contents.rfind(')');
  if (close_paren == std::string::npos || close_paren + 2 >= contents.size()) {
    return false;
  }
  return contents[close_paren + 2] == 'Z';
}

std::vector<std::string> ReadCmdline(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return {};
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  const auto raw = buffer.str();

  std::vector<std::string> argv;
  std::string              current;
  for (char c : raw) {
    if (c == '\0') {
      argv.push_back(current);
      current.clear();
    } else {
      current.push_back(c);
    }
  }
  if (!current.empty()) {
    argv.push_back(current);
  }
  return argv;
}

} // namespace

PosixProcessSupervisor::PosixProcessSupervisor(AgentOptions options) : options_(std::move(options)) {
  if (options_.binary.empty()) {
    throw std::invalid_argument("agent binary must be configured");
  }
}

std::vector<std::string> PosixProcessSupervisor::ExpandArgs(const std::vector<std::string>& args, std::uint16_t port) {
  std::vector<std::string> expanded;
  expanded.reserve(args.size());
  for (auto arg : args) {
    ReplaceAll(&arg, "{port}", std::to_string(port));
    ReplaceAll(&arg, "{host}", kAgentHost);
    expanded.push_back(std::move(arg));
  }
  return expanded;
}

std::string PosixProcessSupervisor::MarkerPath(const std::string& correlation_id) const {
  return (fs::path(options_.pid_dir) / (std::string(kPidMarkerPrefix) + correlation_id)).string();
}

SpawnedProcess PosixProcessSupervisor::Spawn(const SpawnSpec& spec) {
  const auto log_path = (fs::path(spec.working_copy_path) / options_.log_file_name).string();

  std::vector<std::string> args = {options_.binary};
  for (auto& arg : ExpandArgs(options_.args, spec.port)) {
    args.push_back(std::move(arg));
  }
  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for (auto& arg : args) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);

  const int log_fd = ::open(log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
  if (log_fd < 0) {
    throw std::runtime_error("cannot open agent log " + log_path + ": " + std::strerror(errno));
  }

  // Closed by a successful exec; carries errno back when exec fails.
  int status_pipe[2] = {-1, -1};
  if (::pipe2(status_pipe, O_CLOEXEC) != 0) {
    ::close(log_fd);
    throw std::runtime_error(std::string("pipe failed: ") + std::strerror(errno));
  }

  const pid_t pid = ::fork();
  if (pid < 0) {
    const std::string error = std::strerror(errno);
    ::close(log_fd);
    ::close(status_pipe[0]);
    ::close(status_pipe[1]);
    throw std::runtime_error("fork failed: " + error);
  }

  if (pid == 0) {
    ::setpgid(0, 0);
    ::dup2(log_fd, STDOUT_FILENO);
    ::dup2(log_fd, STDERR_FILENO);
    const int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
    }
    int child_errno = 0;
    if (::chdir(spec.working_copy_path.c_str()) == 0) {
      ::execvp(argv[0], argv.data());
    }
    child_errno = errno;
    [[maybe_unused]] auto written = ::write(status_pipe[1], &child_errno, sizeof(child_errno));
    ::_exit(127);
  }

  ::close(log_fd);
  ::close(status_pipe[1]);

  int     child_errno = 0;
  ssize_t n           = 0;
  do {
    n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  ::close(status_pipe[0]);

  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    int status = 0;
    ::waitpid(pid, &status, 0);
    throw std::runtime_error("failed to start agent " + options_.binary + ": " + std::strerror(child_errno));
  }

  std::error_code ec;
  fs::create_directories(options_.pid_dir, ec);
  std::ofstream marker(MarkerPath(spec.correlation_id), std::ios::trunc);
  if (marker) {
    marker << pid << '\n';
  } else {
    DEBUGPOD_LOG_WARN("Could not write pid marker", {StringField("correlation_id", spec.correlation_id), StringField("path", MarkerPath(spec.correlation_id))});
  }

  DEBUGPOD_LOG_INFO("Agent spawned",
                    {StringField("correlation_id", spec.correlation_id), IntField("pid", pid), IntField("port", spec.port), StringField("log", log_path)});

  return {pid, log_path};
}

bool PosixProcessSupervisor::IsAlive(std::int64_t pid) {
  if (pid <= 0) {
    return false;
  }

  int         status = 0;
  const pid_t rc     = ::waitpid(static_cast<pid_t>(pid), &status, WNOHANG);
  if (rc == 0) {
    return true;
  }
  if (rc == pid) {
    return false;
  }

  // Not our child (adopted after a restart): fall back to signal 0.
  if (::kill(static_cast<pid_t>(pid), 0) == 0 || errno == EPERM) {
    return !IsZombie(pid);
  }
  return false;
}

bool PosixProcessSupervisor::Wait(std::int64_t pid, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (IsAlive(pid)) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
  return true;
}

bool PosixProcessSupervisor::IsAgentProcess(std::int64_t pid) {
  if (pid <= 1 || !IsAlive(pid)) {
    return false;
  }
  const auto argv = ReadCmdline(fs::path("/proc") / std::to_string(pid) / "cmdline");
  return !argv.empty() && MatchAgentCmdline(pid, argv).has_value();
}

void PosixProcessSupervisor::Terminate(std::int64_t pid) {
  if (pid <= 1) {
    throw std::invalid_argument("refusing to signal pid " + std::to_string(pid));
  }
  if (!IsAlive(pid)) {
    return;
  }

  const auto target = static_cast<pid_t>(pid);

  // Signal the group only when the process leads it; an adopted process
  // may share a group with unrelated ones.
  const bool group_leader = ::getpgid(target) == target;
  if (group_leader) {
    ::kill(-target, SIGTERM);
  }
  ::kill(target, SIGTERM);

  if (Wait(pid, options_.terminate_grace)) {
    DEBUGPOD_LOG_INFO("Agent terminated", {IntField("pid", pid)});
    return;
  }

  DEBUGPOD_LOG_WARN("Agent ignored SIGTERM, escalating", {IntField("pid", pid)});
  if (group_leader) {
    ::kill(-target, SIGKILL);
  }
  ::kill(target, SIGKILL);

  if (!Wait(pid, std::chrono::seconds(2))) {
    throw std::runtime_error("process " + std::to_string(pid) + " survived SIGKILL");
  }
}

void PosixProcessSupervisor::RemovePidMarker(const std::string& correlation_id) {
  std::error_code ec;
  fs::remove(MarkerPath(correlation_id), ec);
  if (ec) {
    DEBUGPOD_LOG_WARN("Could not remove pid marker", {StringField("correlation_id", correlation_id), StringField("error", ec.message())});
  }
}

std::vector<PidMarker> PosixProcessSupervisor::ListPidMarkers() {
  std::vector<PidMarker> markers;

  std::error_code ec;
  if (!fs::is_directory(options_.pid_dir, ec)) {
    return markers;
  }

  const std::string prefix = kPidMarkerPrefix;
  for (const auto& entry : fs::directory_iterator(options_.pid_dir, ec)) {
    const auto name = entry.path().filename().string();
    if (name.rfind(prefix, 0) != 0 || !entry.is_regular_file(ec)) {
      continue;
    }

    PidMarker marker;
    marker.correlation_id = name.substr(prefix.size());
    marker.path           = entry.path().string();

    std::ifstream in(entry.path());
    in >> marker.pid;
    markers.push_back(std::move(marker));
  }

  return markers;
}

std::optional<AgentProcessInfo> PosixProcessSupervisor::MatchAgentCmdline(std::int64_t pid, const std::vector<std::string>& argv) const {
  const auto binary_name = fs::path(options_.binary).filename().string();
  const auto verb        = options_.args.empty() ? std::string() : options_.args.front();

  bool has_binary = false;
  bool has_verb   = verb.empty();
  for (const auto& arg : argv) {
    if (fs::path(arg).filename().string() == binary_name) {
      has_binary = true;
    }
    if (!verb.empty() && arg == verb) {
      has_verb = true;
    }
  }
  if (!has_binary || !has_verb) {
    return std::nullopt;
  }

  AgentProcessInfo info;
  info.pid = pid;
  for (std::size_t i = 0; i < argv.size(); ++i) {
    if (i > 0) {
      info.cmdline.push_back(' ');
    }
    info.cmdline += argv[i];
    if (argv[i] == "--port" && i + 1 < argv.size()) {
      try {
        const auto port = std::stoul(argv[i + 1]);
        if (port <= 0xFFFF) {
          info.port = static_cast<std::uint16_t>(port);
        }
      } catch (const std::exception&) {
        info.port = 0;
      }
    }
  }
  return info;
}

std::vector<AgentProcessInfo> PosixProcessSupervisor::ListAgentProcesses() {
  std::vector<AgentProcessInfo> agents;

  std::error_code ec;
  for (const auto& entry : fs::directory_iterator("/proc", ec)) {
    const auto name = entry.path().filename().string();
    if (name.empty() || name.find_first_not_of("0123456789") != std::string::npos) {
      continue;
    }

    const auto argv = ReadCmdline(entry.path() / "cmdline");
    if (argv.empty()) {
      continue;
    }

    if (auto info = MatchAgentCmdline(std::stoll(name), argv)) {
      agents.push_back(std::move(*info));
    }
  }

  return agents;
}

} // namespace debugpod::process
