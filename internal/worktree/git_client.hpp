#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/process/command_runner.hpp"

namespace debugpod::worktree {

struct WorktreeEntry {
  std::string path;
  std::string head;
  std::string branch;  // short name, empty when detached
  bool        bare     = false;
  bool        detached = false;
  bool        prunable = false;
};

/*
  Thin wrapper over the git CLI for one repository.

  Every call is `git -C <repo> ...` through a CommandRunner; nothing goes
  through a shell. Callers that change refs, the worktree list or fetched
  objects hold LockRepository() for the whole sequence.
*/
class GitClient {
 public:
  GitClient(std::string repo_path, std::shared_ptr<process::CommandRunner> runner, std::map<std::string, std::string> env = {});

  const std::string& RepoPath() const {
    return repo_path_;
  }

  process::CommandResult Git(const std::vector<std::string>& args) const;

  std::unique_lock<std::mutex> LockRepository() const {
    return std::unique_lock(repository_mutex_);
  }

  std::optional<std::string> RevParseCommit(const std::string& ref) const;
  bool                       Fetch(const std::string& remote, const std::string& branch) const;

  process::CommandResult     WorktreeAdd(const std::string& path, const std::string& commit, const std::string& branch) const;
  process::CommandResult     WorktreeRemove(const std::string& path, bool force) const;
  process::CommandResult     WorktreePrune() const;
  std::vector<WorktreeEntry> ListWorktrees() const;

  bool                     BranchExists(const std::string& branch) const;
  std::vector<std::string> MergedBranches(const std::string& into) const;
  process::CommandResult   DeleteBranch(const std::string& branch, bool force) const;

  static bool                       IsRepository(const std::string& path);
  static process::CommandResult     Clone(process::CommandRunner& runner, const std::string& url, const std::string& path,
                                          const std::map<std::string, std::string>& env);
  static std::vector<WorktreeEntry> ParseWorktreePorcelain(const std::string& output);

  // GIT_SSH_COMMAND for a deploy key; empty map when no key is configured.
  static std::map<std::string, std::string> SshEnvironment(const std::string& ssh_key_path);

 private:
  std::string                             repo_path_;
  std::shared_ptr<process::CommandRunner> runner_;
  std::map<std::string, std::string>      env_;

  mutable std::mutex repository_mutex_;
};

} // namespace debugpod::worktree
