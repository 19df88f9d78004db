#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "git_client.hpp"

namespace debugpod::worktree {

struct WorkingCopy {
  std::string path;
  std::string branch;
  std::string commit;
};

struct SweepReport {
  std::uint32_t worktrees_pruned = 0;
  std::uint32_t branches_deleted = 0;
};

/*
  Creates and destroys the per-instance checkouts.

  Paths and branch names are pure functions of the correlation id:
  <base>/<id> on branch debug/<id>.
*/
class WorkingCopyManager {
 public:
  virtual ~WorkingCopyManager() = default;

  // Throws util::AlreadyExists when a healthy checkout for the id is present,
  // util::CommitNotFound when the commit does not resolve.
  virtual WorkingCopy Create(const std::string& correlation_id, const std::string& source_commit) = 0;

  // Best effort; never throws.
  virtual void Remove(const std::string& correlation_id) = 0;

  // Deregisters checkouts whose directory vanished, then prunes merged
  // debug/* branches that no checkout uses anymore.
  virtual SweepReport SweepOrphans() = 0;

  virtual bool        Exists(const std::string& correlation_id) const  = 0;
  virtual std::string PathFor(const std::string& correlation_id) const = 0;
};

struct WorkingCopyOptions {
  std::string base_dir;
  std::string main_branch = "master";

  // Absolute or relative to the repository; copied to <checkout>/.env.
  std::string env_template;

  bool fallback_to_head = false;
};

class GitWorkingCopyManager final : public WorkingCopyManager {
 public:
  GitWorkingCopyManager(std::shared_ptr<GitClient> git, WorkingCopyOptions options);

  WorkingCopy Create(const std::string& correlation_id, const std::string& source_commit) override;
  void        Remove(const std::string& correlation_id) override;
  SweepReport SweepOrphans() override;

  bool        Exists(const std::string& correlation_id) const override;
  std::string PathFor(const std::string& correlation_id) const override;

 private:
  std::string ResolveCommit(const std::string& source_commit) const;
  void        CopyEnvTemplate(const std::string& checkout_path) const;
  void        RemoveUnlocked(const std::string& correlation_id);

  std::shared_ptr<GitClient> git_;
  WorkingCopyOptions         options_;
};

} // namespace debugpod::worktree
