#include "reference_resolver.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <httplib.h>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace debugpod::reference {

using debugpod::observability::IntField;
using debugpod::observability::StringField;

namespace {

std::string FirstToken(const std::string& text) {
  std::istringstream in(text);
  std::string        token;
  in >> token;
  return token;
}

// Splits http://host:port/path into the origin httplib wants and the path.
std::pair<std::string, std::string> SplitUrl(const std::string& url) {
  const auto scheme_end = url.find("://");
  const auto host_start = scheme_end == std::string::npos ? 0 : scheme_end + 3;
  const auto path_start = url.find('/', host_start);
  if (path_start == std::string::npos) {
    return {url, "/"};
  }
  return {url.substr(0, path_start), url.substr(path_start)};
}

} // namespace

bool IsCommitId(const std::string& value) {
  if (value.size() < 7 || value.size() > 64) {
    return false;
  }
  return std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isxdigit(c) != 0; });
}

std::string CompareAdvice(const std::string& source_commit, const std::string& reference_commit, const std::string& main_branch) {
  if (reference_commit.empty()) {
    return "";
  }
  if (source_commit == reference_commit) {
    return "The error occurred on the latest " + main_branch + " commit; no newer fixes available.";
  }
  return "The error occurred on commit " + source_commit + ". Compare with current " + main_branch + " (" + reference_commit +
         ") to see if the bug is already fixed (e.g., git diff " + source_commit + ".." + reference_commit + ").";
}

// ---------------------------------------------------------------------------
// CommandReferenceResolver
// ---------------------------------------------------------------------------

CommandReferenceResolver::CommandReferenceResolver(std::vector<std::string> argv, std::shared_ptr<process::CommandRunner> runner,
                                                   std::string working_dir)
    : argv_(std::move(argv)), runner_(std::move(runner)), working_dir_(std::move(working_dir)) {
  if (argv_.empty()) {
    throw std::invalid_argument("reference command must not be empty");
  }
}

std::optional<std::string> CommandReferenceResolver::Resolve() {
  process::CommandSpec spec;
  spec.argv        = argv_;
  spec.working_dir = working_dir_;
  spec.timeout     = std::chrono::seconds(30);

  process::CommandResult result;
  try {
    result = runner_->Run(spec);
  } catch (const std::exception& e) {
    DEBUGPOD_LOG_WARN("Reference command could not start", {StringField("command", argv_.front()), StringField("error", e.what())});
    return std::nullopt;
  }

  if (!result.ok()) {
    DEBUGPOD_LOG_WARN("Reference command failed",
                      {StringField("command", argv_.front()), IntField("exit_code", result.exit_code), StringField("stderr", process::Trim(result.err))});
    return std::nullopt;
  }

  auto token = FirstToken(result.out);
  if (token.empty()) {
    return std::nullopt;
  }
  return token;
}

// ---------------------------------------------------------------------------
// HttpReferenceResolver
// ---------------------------------------------------------------------------

HttpReferenceResolver::HttpReferenceResolver(std::string url, std::chrono::milliseconds timeout) : url_(std::move(url)), timeout_(timeout) {
}

std::optional<std::string> HttpReferenceResolver::ParseBody(const std::string& body) {
  const auto trimmed = process::Trim(body);
  if (trimmed.empty()) {
    return std::nullopt;
  }

  if (trimmed.front() == '{') {
    google::protobuf::Struct                 parsed;
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;
    if (!google::protobuf::util::JsonStringToMessage(trimmed, &parsed, options).ok()) {
      return std::nullopt;
    }
    const auto it = parsed.fields().find("commit");
    if (it == parsed.fields().end() || it->second.kind_case() != google::protobuf::Value::kStringValue) {
      return std::nullopt;
    }
    auto commit = process::Trim(it->second.string_value());
    if (commit.empty()) {
      return std::nullopt;
    }
    return commit;
  }

  return FirstToken(trimmed);
}

std::optional<std::string> HttpReferenceResolver::Resolve() {
  const auto [origin, path] = SplitUrl(url_);

  httplib::Client client(origin);
  const auto      seconds = std::chrono::duration_cast<std::chrono::seconds>(timeout_);
  client.set_connection_timeout(seconds.count(), 0);
  client.set_read_timeout(seconds.count(), 0);

  auto response = client.Get(path);
  if (!response) {
    DEBUGPOD_LOG_WARN("Reference endpoint unreachable", {StringField("url", url_), StringField("error", httplib::to_string(response.error()))});
    return std::nullopt;
  }
  if (response->status != 200) {
    DEBUGPOD_LOG_WARN("Reference endpoint returned error", {StringField("url", url_), IntField("status", response->status)});
    return std::nullopt;
  }
  return ParseBody(response->body);
}

// ---------------------------------------------------------------------------
// LocalHeadResolver
// ---------------------------------------------------------------------------

LocalHeadResolver::LocalHeadResolver(std::shared_ptr<worktree::GitClient> git) : git_(std::move(git)) {
}

std::optional<std::string> LocalHeadResolver::Resolve() {
  return git_->RevParseCommit("HEAD");
}

// ---------------------------------------------------------------------------
// FallbackReferenceResolver
// ---------------------------------------------------------------------------

FallbackReferenceResolver::FallbackReferenceResolver(std::vector<std::shared_ptr<ReferenceCommitResolver>> chain) : chain_(std::move(chain)) {
}

std::optional<std::string> FallbackReferenceResolver::Resolve() {
  for (const auto& resolver : chain_) {
    if (auto commit = resolver->Resolve()) {
      DEBUGPOD_LOG_DEBUG("Reference commit resolved", {StringField("strategy", resolver->Name()), StringField("commit", *commit)});
      return commit;
    }
  }
  return std::nullopt;
}

// ---------------------------------------------------------------------------
// UpstreamMainResolver
// ---------------------------------------------------------------------------

UpstreamMainResolver::UpstreamMainResolver(std::shared_ptr<worktree::GitClient> git, std::string remote, std::string main_branch)
    : git_(std::move(git)), remote_(std::move(remote)), main_branch_(std::move(main_branch)) {
}

std::optional<std::string> UpstreamMainResolver::Resolve() {
  // fetch writes refs and objects the working copy manager reads
  auto lock = git_->LockRepository();

  if (!remote_.empty()) {
    if (git_->Fetch(remote_, main_branch_)) {
      if (auto commit = git_->RevParseCommit(remote_ + "/" + main_branch_)) {
        return commit;
      }
    } else {
      DEBUGPOD_LOG_WARN("Fetch of main line failed, using local branch", {StringField("remote", remote_), StringField("branch", main_branch_)});
    }
  }
  return git_->RevParseCommit(main_branch_);
}

} // namespace debugpod::reference
