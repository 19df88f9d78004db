#include <unistd.h>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include "internal/process/command_runner.hpp"
#include "internal/util/errors.hpp"
#include "internal/worktree/git_client.hpp"
#include "internal/worktree/working_copy_manager.hpp"

namespace {

namespace fs = std::filesystem;

using debugpod::worktree::GitClient;
using debugpod::worktree::GitWorkingCopyManager;
using debugpod::worktree::WorkingCopyOptions;

struct Sandbox {
  explicit Sandbox(const std::string& name) {
    root = fs::temp_directory_path() / ("debugpod_worktree_" + name + "_" + std::to_string(::getpid()));
    fs::remove_all(root);
    fs::create_directories(root / "repo");

    runner = std::make_shared<debugpod::process::CommandRunner>();
    git    = std::make_shared<GitClient>((root / "repo").string(), runner);

    Must({"init", "-q"});
    Must({"symbolic-ref", "HEAD", "refs/heads/master"});
    Must({"config", "user.email", "test@example.com"});
    Must({"config", "user.name", "Test"});
    Write(root / "repo" / "README", "hello\n");
    Must({"add", "README"});
    Must({"commit", "-q", "-m", "initial"});
    head = *git->RevParseCommit("HEAD");
  }

  ~Sandbox() {
    std::error_code ec;
    fs::remove_all(root, ec);
  }

  void Must(const std::vector<std::string>& args) {
    auto result = git->Git(args);
    if (!result.ok()) {
      std::cerr << "git failed: " << result.err << "\n";
    }
    assert(result.ok());
  }

  static void Write(const fs::path& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
  }

  std::shared_ptr<GitWorkingCopyManager> Manager(bool fallback_to_head = false) {
    WorkingCopyOptions options;
    options.base_dir         = (root / "worktrees").string();
    options.env_template     = ".env.debug.template";
    options.fallback_to_head = fallback_to_head;
    return std::make_shared<GitWorkingCopyManager>(git, options);
  }

  fs::path                                          root;
  std::shared_ptr<debugpod::process::CommandRunner> runner;
  std::shared_ptr<GitClient>                        git;
  std::string                                       head;
};

template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

void TestCreateChecksOutHeadOnDebugBranch() {
  Sandbox sandbox("create");
  Sandbox::Write(sandbox.root / "repo" / ".env.debug.template", "PORT=0\n");
  auto manager = sandbox.Manager();

  const auto copy = manager->Create("abc123", "");
  assert(copy.commit == sandbox.head);
  assert(copy.branch == "debug/abc123");
  assert(copy.path == manager->PathFor("abc123"));
  assert(manager->Exists("abc123"));
  assert(fs::exists(fs::path(copy.path) / "README"));
  assert(fs::exists(fs::path(copy.path) / ".env"));
  assert(sandbox.git->BranchExists("debug/abc123"));

  assert(Throws<debugpod::util::AlreadyExists>([&] { manager->Create("abc123", ""); }));
}

void TestExplicitCommitIsPinned() {
  Sandbox sandbox("pinned");
  const auto first = sandbox.head;
  Sandbox::Write(sandbox.root / "repo" / "README", "second\n");
  sandbox.Must({"commit", "-q", "-am", "second"});

  auto       manager = sandbox.Manager();
  const auto copy    = manager->Create("old", first.substr(0, 12));
  assert(copy.commit == first);

  std::ifstream in(fs::path(copy.path) / "README");
  std::string   line;
  std::getline(in, line);
  assert(line == "hello");
}

void TestUnknownCommit() {
  Sandbox sandbox("unknown");

  auto strict = sandbox.Manager();
  assert(Throws<debugpod::util::CommitNotFound>([&] { strict->Create("abc123", "0123456789abcdef0123456789abcdef01234567"); }));
  assert(!strict->Exists("abc123"));

  auto lenient = sandbox.Manager(/*fallback_to_head=*/true);
  assert(lenient->Create("abc123", "nosuchref").commit == sandbox.head);
}

void TestRemoveDeletesDirectoryAndBranch() {
  Sandbox sandbox("remove");
  auto    manager = sandbox.Manager();

  manager->Create("abc123", "");
  manager->Remove("abc123");
  assert(!manager->Exists("abc123"));
  assert(!sandbox.git->BranchExists("debug/abc123"));

  // idempotent
  manager->Remove("abc123");

  // the id can be reused
  manager->Create("abc123", "");
  assert(manager->Exists("abc123"));
}

void TestLeftoversAreReplaced() {
  Sandbox sandbox("leftover");
  auto    manager = sandbox.Manager();

  // plain directory where a checkout should go
  fs::create_directories(fs::path(manager->PathFor("stray")) / "junk");
  assert(manager->Create("stray", "").commit == sandbox.head);

  // branch left behind by a crashed run
  sandbox.Must({"branch", "debug/crashed"});
  assert(manager->Create("crashed", "").branch == "debug/crashed");
}

void TestSweepRemovesVanishedCheckoutsAndMergedBranches() {
  Sandbox sandbox("sweep");
  auto    manager = sandbox.Manager();

  manager->Create("kept", "");
  manager->Create("gone", "");
  fs::remove_all(manager->PathFor("gone"));

  const auto report = manager->SweepOrphans();
  assert(report.worktrees_pruned == 1);
  assert(report.branches_deleted == 1);
  assert(!sandbox.git->BranchExists("debug/gone"));
  assert(sandbox.git->BranchExists("debug/kept"));
  assert(sandbox.git->BranchExists("master"));

  const auto again = manager->SweepOrphans();
  assert(again.worktrees_pruned == 0);
  assert(again.branches_deleted == 0);
}

void TestParseWorktreePorcelain() {
  const std::string output =
      "worktree /srv/project\n"
      "HEAD 1111111111111111111111111111111111111111\n"
      "branch refs/heads/master\n"
      "\n"
      "worktree /tmp/debug-worktrees/abc\n"
      "HEAD 2222222222222222222222222222222222222222\n"
      "branch refs/heads/debug/abc\n"
      "prunable gitdir file points to non-existent location\n"
      "\n"
      "worktree /tmp/detached\n"
      "HEAD 3333333333333333333333333333333333333333\n"
      "detached\n";

  const auto entries = GitClient::ParseWorktreePorcelain(output);
  assert(entries.size() == 3);
  assert(entries[0].branch == "master");
  assert(entries[1].branch == "debug/abc");
  assert(entries[1].prunable);
  assert(entries[2].detached);
  assert(entries[2].branch.empty());
}

} // namespace

int main() {
  TestCreateChecksOutHeadOnDebugBranch();
  TestExplicitCommitIsPinned();
  TestUnknownCommit();
  TestRemoveDeletesDirectoryAndBranch();
  TestLeftoversAreReplaced();
  TestSweepRemovesVanishedCheckoutsAndMergedBranches();
  TestParseWorktreePorcelain();

  std::cout << "debugpod_unit_git_working_copy_manager: pass\n";
  return 0;
}
