#include "git_client.hpp"

#include <filesystem>
#include <sstream>
#include <stdexcept>

namespace debugpod::worktree {

namespace fs = std::filesystem;

namespace {

constexpr const char* kHeadsPrefix = "refs/heads/";

} // namespace

GitClient::GitClient(std::string repo_path, std::shared_ptr<process::CommandRunner> runner, std::map<std::string, std::string> env)
    : repo_path_(std::move(repo_path)), runner_(std::move(runner)), env_(std::move(env)) {
  if (!runner_) {
    throw std::invalid_argument("git client requires a command runner");
  }
}

process::CommandResult GitClient::Git(const std::vector<std::string>& args) const {
  process::CommandSpec spec;
  spec.argv = {"git", "-C", repo_path_};
  spec.argv.insert(spec.argv.end(), args.begin(), args.end());
  spec.env = env_;
  spec.env.emplace("GIT_TERMINAL_PROMPT", "0");
  return runner_->Run(spec);
}

std::optional<std::string> GitClient::RevParseCommit(const std::string& ref) const {
  if (ref.empty() || ref.front() == '-') {
    return std::nullopt;
  }
  auto result = Git({"rev-parse", "--verify", "--quiet", ref + "^{commit}"});
  if (!result.ok()) {
    return std::nullopt;
  }
  auto commit = process::FirstLine(result.out);
  if (commit.empty()) {
    return std::nullopt;
  }
  return commit;
}

bool GitClient::Fetch(const std::string& remote, const std::string& branch) const {
  return Git({"fetch", "--quiet", remote, branch}).ok();
}

process::CommandResult GitClient::WorktreeAdd(const std::string& path, const std::string& commit, const std::string& branch) const {
  return Git({"worktree", "add", "-b", branch, path, commit});
}

process::CommandResult GitClient::WorktreeRemove(const std::string& path, bool force) const {
  if (force) {
    return Git({"worktree", "remove", "--force", path});
  }
  return Git({"worktree", "remove", path});
}

process::CommandResult GitClient::WorktreePrune() const {
  return Git({"worktree", "prune"});
}

std::vector<WorktreeEntry> GitClient::ListWorktrees() const {
  auto result = Git({"worktree", "list", "--porcelain"});
  if (!result.ok()) {
    throw std::runtime_error("git worktree list failed: " + process::Trim(result.err));
  }
  return ParseWorktreePorcelain(result.out);
}

std::vector<WorktreeEntry> GitClient::ParseWorktreePorcelain(const std::string& output) {
  std::vector<WorktreeEntry> entries;
  std::istringstream         in(output);
  std::string                line;

  while (std::getline(in, line)) {
    if (line.rfind("worktree ", 0) == 0) {
      WorktreeEntry entry;
      entry.path = line.substr(9);
      entries.push_back(std::move(entry));
      continue;
    }
    if (entries.empty()) {
      continue;
    }

    auto& current = entries.back();
    if (line.rfind("HEAD ", 0) == 0) {
      current.head = line.substr(5);
    } else if (line.rfind("branch ", 0) == 0) {
      auto ref = line.substr(7);
      if (ref.rfind(kHeadsPrefix, 0) == 0) {
        ref = ref.substr(std::string(kHeadsPrefix).size());
      }
      current.branch = ref;
    } else if (line == "bare") {
      current.bare = true;
    } else if (line == "detached") {
      current.detached = true;
    } else if (line.rfind("prunable", 0) == 0) {
      current.prunable = true;
    }
  }

  return entries;
}

bool GitClient::BranchExists(const std::string& branch) const {
  return Git({"show-ref", "--verify", "--quiet", std::string(kHeadsPrefix) + branch}).ok();
}

std::vector<std::string> GitClient::MergedBranches(const std::string& into) const {
  auto result = Git({"branch", "--merged", into, "--format=%(refname:short)"});
  if (!result.ok()) {
    throw std::runtime_error("git branch --merged failed: " + process::Trim(result.err));
  }

  std::vector<std::string> branches;
  std::istringstream       in(result.out);
  std::string              line;
  while (std::getline(in, line)) {
    auto name = process::Trim(line);
    if (!name.empty()) {
      branches.push_back(std::move(name));
    }
  }
  return branches;
}

process::CommandResult GitClient::DeleteBranch(const std::string& branch, bool force) const {
  return Git({"branch", force ? "-D" : "-d", branch});
}

bool GitClient::IsRepository(const std::string& path) {
  std::error_code ec;
  return fs::exists(fs::path(path) / ".git", ec);
}

process::CommandResult GitClient::Clone(process::CommandRunner& runner, const std::string& url, const std::string& path,
                                        const std::map<std::string, std::string>& env) {
  process::CommandSpec spec;
  spec.argv    = {"git", "clone", url, path};
  spec.env     = env;
  spec.timeout = std::chrono::seconds(120);
  spec.env.emplace("GIT_TERMINAL_PROMPT", "0");
  return runner.Run(spec);
}

std::map<std::string, std::string> GitClient::SshEnvironment(const std::string& ssh_key_path) {
  if (ssh_key_path.empty()) {
    return {};
  }
  return {{"GIT_SSH_COMMAND", "ssh -i " + ssh_key_path + " -o IdentitiesOnly=yes -o StrictHostKeyChecking=accept-new"}};
}

} // namespace debugpod::worktree
