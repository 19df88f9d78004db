#pragma once

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace debugpod::process {

struct CommandSpec {
  std::vector<std::string> argv;

  // Empty means inherit the caller's working directory.
  std::string working_dir;

  // Added to (or replacing in) the inherited environment.
  std::map<std::string, std::string> env;

  std::chrono::milliseconds timeout{std::chrono::seconds(120)};
};

struct CommandResult {
  int         exit_code = -1;
  bool        timed_out = false;
  std::string out;
  std::string err;

  bool ok() const {
    return exit_code == 0 && !timed_out;
  }
};

/*
  Runs a program without a shell and captures stdout/stderr.

  A non-zero exit is reported in the result, never thrown. Failure to start
  the program at all throws std::runtime_error.
*/
class CommandRunner {
 public:
  virtual ~CommandRunner() = default;

  virtual CommandResult Run(const CommandSpec& spec);
};

// First line of output with trailing whitespace removed.
std::string FirstLine(const std::string& output);

std::string Trim(const std::string& value);

} // namespace debugpod::process
