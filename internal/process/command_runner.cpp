#include "command_runner.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <stdexcept>
#include <string_view>

extern char** environ;

namespace debugpod::process {

namespace {

void CloseFd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

// Reads whatever is available on fd; returns false once the pipe hits EOF.
bool Drain(int fd, std::string* out) {
  std::array<char, 4096> buffer{};
  const ssize_t          n = ::read(fd, buffer.data(), buffer.size());
  if (n > 0) {
    out->append(buffer.data(), static_cast<size_t>(n));
    return true;
  }
  if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
    return true;
  }
  return false;
}

// The inherited environment with `overrides` applied. Built before fork:
// setenv is not async-signal-safe.
std::vector<std::string> MergeEnvironment(const std::map<std::string, std::string>& overrides) {
  std::vector<std::string> merged;
  for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
    const std::string_view current(*entry);
    const auto             name = current.substr(0, current.find('='));
    if (!overrides.contains(std::string(name))) {
      merged.emplace_back(current);
    }
  }
  for (const auto& [key, value] : overrides) {
    merged.push_back(key + "=" + value);
  }
  return merged;
}

} // namespace

CommandResult CommandRunner::Run(const CommandSpec& spec) {
  if (spec.argv.empty()) {
    throw std::invalid_argument("command argv must not be empty");
  }

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
    throw std::runtime_error(std::string("pipe failed: ") + std::strerror(errno));
  }
  if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
    CloseFd(out_pipe[0]);
    CloseFd(out_pipe[1]);
    throw std::runtime_error(std::string("pipe failed: ") + std::strerror(errno));
  }

  std::vector<char*> argv;
  argv.reserve(spec.argv.size() + 1);
  for (const auto& arg : spec.argv) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  auto               environment = MergeEnvironment(spec.env);
  std::vector<char*> envp;
  envp.reserve(environment.size() + 1);
  for (auto& entry : environment) {
    envp.push_back(entry.data());
  }
  envp.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) {
    const std::string error = std::strerror(errno);
    CloseFd(out_pipe[0]);
    CloseFd(out_pipe[1]);
    CloseFd(err_pipe[0]);
    CloseFd(err_pipe[1]);
    throw std::runtime_error("fork failed: " + error);
  }

  if (pid == 0) {
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);
    const int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
    }
    if (!spec.working_dir.empty() && ::chdir(spec.working_dir.c_str()) != 0) {
      ::_exit(127);
    }
    ::execvpe(argv[0], argv.data(), envp.data());
    ::_exit(127);
  }

  CloseFd(out_pipe[1]);
  CloseFd(err_pipe[1]);

  CommandResult result;
  const auto    deadline = std::chrono::steady_clock::now() + spec.timeout;

  bool out_open = true;
  bool err_open = true;
  while (out_open || err_open) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      result.timed_out = true;
      ::kill(pid, SIGKILL);
      break;
    }

    pollfd fds[2] = {{out_open ? out_pipe[0] : -1, POLLIN, 0}, {err_open ? err_pipe[0] : -1, POLLIN, 0}};
    const int ready = ::poll(fds, 2, static_cast<int>(std::min<long long>(remaining.count(), 1000)));
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    if (out_open && (fds[0].revents & (POLLIN | POLLHUP | POLLERR))) {
      out_open = Drain(out_pipe[0], &result.out);
    }
    if (err_open && (fds[1].revents & (POLLIN | POLLHUP | POLLERR))) {
      err_open = Drain(err_pipe[0], &result.err);
    }
  }

  CloseFd(out_pipe[0]);
  CloseFd(err_pipe[0]);

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      break;
    }
  }

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }

  return result;
}

std::string Trim(const std::string& value) {
  const auto begin = value.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return {};
  }
  const auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(begin, end - begin + 1);
}

std::string FirstLine(const std::string& output) {
  const auto newline = output.find('\n');
  return Trim(newline == std::string::npos ? output : output.substr(0, newline));
}

} // namespace debugpod::process
