#include "working_copy_manager.hpp"

#include <filesystem>
#include <set>
#include <stdexcept>

#include "internal/model/instance.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace debugpod::worktree {

namespace fs = std::filesystem;

using debugpod::observability::IntField;
using debugpod::observability::StringField;

namespace {

bool SamePath(const std::string& a, const std::string& b) {
  std::error_code ec;
  const auto      lhs = fs::weakly_canonical(a, ec);
  if (ec) {
    return a == b;
  }
  const auto rhs = fs::weakly_canonical(b, ec);
  if (ec) {
    return a == b;
  }
  return lhs == rhs;
}

} // namespace

GitWorkingCopyManager::GitWorkingCopyManager(std::shared_ptr<GitClient> git, WorkingCopyOptions options)
    : git_(std::move(git)), options_(std::move(options)) {
  if (!git_) {
    throw std::invalid_argument("working copy manager requires a git client");
  }
  if (options_.base_dir.empty()) {
    throw std::invalid_argument("working copy base directory must be configured");
  }
  options_.base_dir = fs::absolute(options_.base_dir).lexically_normal().string();
}

std::string GitWorkingCopyManager::PathFor(const std::string& correlation_id) const {
  return (fs::path(options_.base_dir) / correlation_id).string();
}

bool GitWorkingCopyManager::Exists(const std::string& correlation_id) const {
  std::error_code ec;
  return fs::is_directory(PathFor(correlation_id), ec);
}

std::string GitWorkingCopyManager::ResolveCommit(const std::string& source_commit) const {
  const auto requested = source_commit.empty() ? std::string("HEAD") : source_commit;
  if (auto commit = git_->RevParseCommit(requested)) {
    return *commit;
  }

  if (options_.fallback_to_head) {
    if (auto head = git_->RevParseCommit("HEAD")) {
      DEBUGPOD_LOG_WARN("Commit not found, pinning to HEAD", {StringField("requested", requested), StringField("head", *head)});
      return *head;
    }
  }

  throw debugpod::util::CommitNotFound("cannot resolve commit '" + requested + "'");
}

void GitWorkingCopyManager::CopyEnvTemplate(const std::string& checkout_path) const {
  if (options_.env_template.empty()) {
    return;
  }

  fs::path source(options_.env_template);
  if (source.is_relative()) {
    source = fs::path(git_->RepoPath()) / source;
  }

  std::error_code ec;
  if (!fs::is_regular_file(source, ec)) {
    DEBUGPOD_LOG_WARN("Environment template missing, skipping", {StringField("template", source.string())});
    return;
  }

  fs::copy_file(source, fs::path(checkout_path) / ".env", fs::copy_options::overwrite_existing, ec);
  if (ec) {
    throw std::runtime_error("cannot copy environment template: " + ec.message());
  }
}

WorkingCopy GitWorkingCopyManager::Create(const std::string& correlation_id, const std::string& source_commit) {
  auto lock = git_->LockRepository();

  WorkingCopy copy;
  copy.path   = PathFor(correlation_id);
  copy.branch = debugpod::model::BranchNameFor(correlation_id);

  const auto worktrees = git_->ListWorktrees();

  bool registered = false;
  for (const auto& entry : worktrees) {
    if (SamePath(entry.path, copy.path)) {
      registered = true;
    } else if (entry.branch == copy.branch) {
      throw debugpod::util::AlreadyExists("branch " + copy.branch + " is checked out at " + entry.path);
    }
  }

  std::error_code ec;
  const bool      on_disk = fs::exists(copy.path, ec);

  if (registered && on_disk) {
    throw debugpod::util::AlreadyExists("working copy for " + correlation_id + " already exists at " + copy.path);
  }
  if (registered) {
    DEBUGPOD_LOG_WARN("Dropping stale worktree registration", {StringField("path", copy.path)});
    git_->WorktreePrune();
  }
  if (on_disk) {
    DEBUGPOD_LOG_WARN("Removing unregistered directory in worktree base", {StringField("path", copy.path)});
    fs::remove_all(copy.path, ec);
    if (ec) {
      throw std::runtime_error("cannot clear " + copy.path + ": " + ec.message());
    }
  }
  if (git_->BranchExists(copy.branch)) {
    DEBUGPOD_LOG_WARN("Deleting stale branch", {StringField("branch", copy.branch)});
    auto deleted = git_->DeleteBranch(copy.branch, /*force=*/true);
    if (!deleted.ok()) {
      throw std::runtime_error("cannot delete stale branch " + copy.branch + ": " + debugpod::process::Trim(deleted.err));
    }
  }

  copy.commit = ResolveCommit(source_commit);

  fs::create_directories(options_.base_dir, ec);
  if (ec) {
    throw std::runtime_error("cannot create worktree base " + options_.base_dir + ": " + ec.message());
  }

  auto added = git_->WorktreeAdd(copy.path, copy.commit, copy.branch);
  if (!added.ok()) {
    throw std::runtime_error("git worktree add failed: " + debugpod::process::Trim(added.err));
  }

  try {
    CopyEnvTemplate(copy.path);
  } catch (const std::exception&) {
    RemoveUnlocked(correlation_id);
    throw;
  }

  DEBUGPOD_LOG_INFO("Working copy created",
                    {StringField("correlation_id", correlation_id), StringField("path", copy.path), StringField("commit", copy.commit)});
  return copy;
}

void GitWorkingCopyManager::Remove(const std::string& correlation_id) {
  auto lock = git_->LockRepository();
  RemoveUnlocked(correlation_id);
}

void GitWorkingCopyManager::RemoveUnlocked(const std::string& correlation_id) {
  const auto path   = PathFor(correlation_id);
  const auto branch = debugpod::model::BranchNameFor(correlation_id);

  try {
    auto removed = git_->WorktreeRemove(path, /*force=*/true);
    if (!removed.ok()) {
      DEBUGPOD_LOG_WARN("git worktree remove failed, cleaning up manually",
                        {StringField("path", path), StringField("error", debugpod::process::Trim(removed.err))});
      std::error_code ec;
      fs::remove_all(path, ec);
      if (ec) {
        DEBUGPOD_LOG_ERROR("Cannot delete working copy directory", {StringField("path", path), StringField("error", ec.message())});
      }
      git_->WorktreePrune();
    }

    if (git_->BranchExists(branch)) {
      auto deleted = git_->DeleteBranch(branch, /*force=*/true);
      if (!deleted.ok()) {
        DEBUGPOD_LOG_WARN("Cannot delete branch", {StringField("branch", branch), StringField("error", debugpod::process::Trim(deleted.err))});
      }
    }
  } catch (const std::exception& e) {
    DEBUGPOD_LOG_ERROR("Working copy removal failed", {StringField("correlation_id", correlation_id), StringField("error", e.what())});
    return;
  }

  DEBUGPOD_LOG_INFO("Working copy removed", {StringField("correlation_id", correlation_id), StringField("path", path)});
}

SweepReport GitWorkingCopyManager::SweepOrphans() {
  auto lock = git_->LockRepository();

  SweepReport report;

  // Phase 1: registrations whose directory is gone.
  const auto worktrees = git_->ListWorktrees();
  for (std::size_t i = 0; i < worktrees.size(); ++i) {
    const auto& entry = worktrees[i];
    if (i == 0 || entry.bare) {
      continue;  // main worktree
    }

    std::error_code ec;
    if (fs::exists(entry.path, ec)) {
      continue;
    }

    DEBUGPOD_LOG_INFO("Removing orphaned worktree", {StringField("path", entry.path), StringField("branch", entry.branch)});
    auto removed = git_->WorktreeRemove(entry.path, /*force=*/true);
    if (!removed.ok()) {
      DEBUGPOD_LOG_DEBUG("git worktree remove refused, relying on prune", {StringField("path", entry.path)});
    }
    ++report.worktrees_pruned;
  }
  if (report.worktrees_pruned > 0) {
    git_->WorktreePrune();
  }

  // Phase 2: merged ephemeral branches no checkout uses.
  std::set<std::string> in_use;
  for (const auto& entry : git_->ListWorktrees()) {
    if (!entry.branch.empty()) {
      in_use.insert(entry.branch);
    }
  }

  const auto merge_target = git_->RevParseCommit(options_.main_branch) ? options_.main_branch : std::string("HEAD");
  for (const auto& branch : git_->MergedBranches(merge_target)) {
    if (branch.rfind("debug/", 0) != 0 || in_use.contains(branch)) {
      continue;
    }
    auto deleted = git_->DeleteBranch(branch, /*force=*/true);
    if (deleted.ok()) {
      DEBUGPOD_LOG_INFO("Deleted merged branch", {StringField("branch", branch)});
      ++report.branches_deleted;
    } else {
      DEBUGPOD_LOG_WARN("Cannot delete merged branch", {StringField("branch", branch), StringField("error", debugpod::process::Trim(deleted.err))});
    }
  }

  if (report.worktrees_pruned > 0 || report.branches_deleted > 0) {
    DEBUGPOD_LOG_INFO("Worktree sweep finished",
                      {IntField("worktrees_pruned", report.worktrees_pruned), IntField("branches_deleted", report.branches_deleted)});
  }
  return report;
}

} // namespace debugpod::worktree
