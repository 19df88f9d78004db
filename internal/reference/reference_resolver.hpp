#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/process/command_runner.hpp"
#include "internal/worktree/git_client.hpp"

namespace debugpod::reference {

/*
  Produces the commit a new instance is pinned to when the caller does not
  name one.

  Resolve returns nullopt when the strategy has no answer; it never throws
  for ordinary failures (unreachable endpoint, non-zero exit).
*/
class ReferenceCommitResolver {
 public:
  virtual ~ReferenceCommitResolver() = default;

  virtual std::optional<std::string> Resolve() = 0;

  virtual std::string Name() const = 0;
};

// Runs an argv; the first whitespace token of stdout is the commit.
class CommandReferenceResolver final : public ReferenceCommitResolver {
 public:
  CommandReferenceResolver(std::vector<std::string> argv, std::shared_ptr<process::CommandRunner> runner, std::string working_dir);

  std::optional<std::string> Resolve() override;
  std::string                Name() const override {
    return "command";
  }

 private:
  std::vector<std::string>                argv_;
  std::shared_ptr<process::CommandRunner> runner_;
  std::string                             working_dir_;
};

// GET <url>; body is a bare commit id or {"commit": "..."}.
class HttpReferenceResolver final : public ReferenceCommitResolver {
 public:
  explicit HttpReferenceResolver(std::string url, std::chrono::milliseconds timeout = std::chrono::seconds(10));

  std::optional<std::string> Resolve() override;
  std::string                Name() const override {
    return "http";
  }

  static std::optional<std::string> ParseBody(const std::string& body);

 private:
  std::string               url_;
  std::chrono::milliseconds timeout_;
};

class LocalHeadResolver final : public ReferenceCommitResolver {
 public:
  explicit LocalHeadResolver(std::shared_ptr<worktree::GitClient> git);

  std::optional<std::string> Resolve() override;
  std::string                Name() const override {
    return "local-head";
  }

 private:
  std::shared_ptr<worktree::GitClient> git_;
};

// First strategy with an answer wins.
class FallbackReferenceResolver final : public ReferenceCommitResolver {
 public:
  explicit FallbackReferenceResolver(std::vector<std::shared_ptr<ReferenceCommitResolver>> chain);

  std::optional<std::string> Resolve() override;
  std::string                Name() const override {
    return "fallback";
  }

 private:
  std::vector<std::shared_ptr<ReferenceCommitResolver>> chain_;
};

/*
  Latest known main-line commit: fetch <remote> <branch>, then
  <remote>/<branch>, then the local <branch>. Runs under the repository
  lock shared with the working copy manager.
*/
class UpstreamMainResolver {
 public:
  UpstreamMainResolver(std::shared_ptr<worktree::GitClient> git, std::string remote, std::string main_branch);

  virtual ~UpstreamMainResolver() = default;

  virtual std::optional<std::string> Resolve();

  const std::string& MainBranch() const {
    return main_branch_;
  }

 private:
  std::shared_ptr<worktree::GitClient> git_;
  std::string                          remote_;
  std::string                          main_branch_;
};

bool        IsCommitId(const std::string& value);
std::string CompareAdvice(const std::string& source_commit, const std::string& reference_commit, const std::string& main_branch);

} // namespace debugpod::reference
