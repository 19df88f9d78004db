#include "factory.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/core/orchestrator.hpp"
#include "internal/db/api/instance_repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/instance_admin_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/ports/port_allocator.hpp"
#include "internal/ports/port_probe.hpp"
#include "internal/process/command_runner.hpp"
#include "internal/process/process_supervisor.hpp"
#include "internal/proxy/http_upstream.hpp"
#include "internal/proxy/spec_filtered_proxy.hpp"
#include "internal/reaper/orphan_reaper.hpp"
#include "internal/reaper/reaper_worker.hpp"
#include "internal/reference/reference_resolver.hpp"
#include "internal/registry/instance_registry.hpp"
#include "internal/service/instance_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/worktree/git_client.hpp"
#include "internal/worktree/working_copy_manager.hpp"
#if DEBUGPOD_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_instance_repository.hpp"
#endif

namespace debugpod::factory {

using debugpod::observability::StringField;
using debugpod::runtime::config::RuntimeConfig;

namespace {

std::shared_ptr<db::InstanceRepository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if DEBUGPOD_DB_SQLITE
    const auto busy_timeout = database.sqlite().has_busy_timeout_ms() ? database.sqlite().busy_timeout_ms() : 5000u;
    auto       sqlite_db    = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), std::chrono::milliseconds(busy_timeout));
    db::sqlite::SqliteInstanceRepository::BootstrapSchema(*sqlite_db);
    return std::make_shared<db::sqlite::SqliteInstanceRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryInstanceRepository>();
}

void PrepareRepository(const RuntimeConfig& config, process::CommandRunner& runner, const std::map<std::string, std::string>& git_env) {
  const auto& repository = config.repository();
  if (worktree::GitClient::IsRepository(repository.path())) {
    return;
  }
  if (repository.url().empty()) {
    throw std::runtime_error("no git repository at " + repository.path() + " and repository.url is not set");
  }

  DEBUGPOD_LOG_INFO("Cloning project repository", {StringField("url", repository.url()), StringField("path", repository.path())});
  auto result = worktree::GitClient::Clone(runner, repository.url(), repository.path(), git_env);
  if (!result.ok()) {
    throw std::runtime_error("git clone failed: " + process::Trim(result.err));
  }
}

std::shared_ptr<reference::ReferenceCommitResolver> BuildReferenceResolver(const RuntimeConfig&                           config,
                                                                            const std::shared_ptr<process::CommandRunner>& runner,
                                                                            const std::shared_ptr<worktree::GitClient>&     git) {
  std::vector<std::shared_ptr<reference::ReferenceCommitResolver>> chain;

  const auto& reference = config.reference();
  if (!reference.command().empty()) {
    std::vector<std::string> argv(reference.command().begin(), reference.command().end());
    chain.push_back(std::make_shared<reference::CommandReferenceResolver>(std::move(argv), runner, config.repository().path()));
  }
  if (!reference.http_url().empty()) {
    chain.push_back(std::make_shared<reference::HttpReferenceResolver>(reference.http_url()));
  }
  chain.push_back(std::make_shared<reference::LocalHeadResolver>(git));

  return std::make_shared<reference::FallbackReferenceResolver>(std::move(chain));
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Repository access
  // ------------------------------------------------------------------
  auto runner  = std::make_shared<process::CommandRunner>();
  auto git_env = worktree::GitClient::SshEnvironment(config.repository().ssh_key_path());

  PrepareRepository(config, *runner, git_env);

  auto git = std::make_shared<worktree::GitClient>(config.repository().path(), runner, git_env);

  worktree::WorkingCopyOptions worktree_options;
  worktree_options.base_dir         = config.worktrees().base_dir();
  worktree_options.main_branch      = config.repository().main_branch();
  worktree_options.env_template     = config.repository().env_template();
  worktree_options.fallback_to_head = config.repository().fallback_to_head();
  auto worktrees                    = std::make_shared<worktree::GitWorkingCopyManager>(git, worktree_options);

  auto reference_resolver = BuildReferenceResolver(config, runner, git);
  auto upstream_main = std::make_shared<reference::UpstreamMainResolver>(git, config.repository().remote(), config.repository().main_branch());

  // ------------------------------------------------------------------
  // Ports and processes
  // ------------------------------------------------------------------
  const auto range_start = static_cast<std::uint16_t>(config.ports().range_start());
  const auto range_end   = static_cast<std::uint16_t>(config.ports().range_end());
  auto       ports       = std::make_shared<ports::PortAllocator>(range_start, range_end, std::make_shared<ports::ProcNetPortProbe>(range_start, range_end));

  process::AgentOptions agent_options;
  agent_options.binary          = config.agent().binary();
  agent_options.args.assign(config.agent().args().begin(), config.agent().args().end());
  agent_options.log_file_name   = config.agent().log_file_name();
  agent_options.pid_dir         = config.agent().pid_dir();
  agent_options.terminate_grace = std::chrono::milliseconds(config.agent().terminate_grace_ms());
  auto supervisor               = std::make_shared<process::PosixProcessSupervisor>(agent_options);

  // ------------------------------------------------------------------
  // Registry and proxy
  // ------------------------------------------------------------------
  app.registry = std::make_shared<registry::InstanceRegistry>(BuildRepository(config));

  proxy::HttpUpstreamOptions upstream_options;
  upstream_options.host            = process::kAgentHost;
  upstream_options.health_path     = config.agent().health_path();
  upstream_options.request_timeout = std::chrono::milliseconds(config.proxy().request_timeout_ms());

  proxy::ProxyOptions proxy_options;
  proxy_options.contract_path               = config.agent().contract_path();
  proxy_options.fail_open_on_contract_error = config.proxy().fail_open_on_contract_error();
  proxy_options.delete_requests_per_minute  = config.proxy().delete_requests_per_minute();

  app.proxy = std::make_shared<proxy::SpecFilteredProxy>(app.registry, supervisor, std::make_shared<proxy::HttpUpstream>(upstream_options), proxy_options);

  // ------------------------------------------------------------------
  // Core
  // ------------------------------------------------------------------
  core::OrchestratorOptions orchestrator_options;
  orchestrator_options.readiness_timeout       = std::chrono::milliseconds(config.agent().readiness_timeout_ms());
  orchestrator_options.readiness_poll_interval = std::chrono::milliseconds(config.agent().readiness_poll_interval_ms());
  orchestrator_options.main_branch             = config.repository().main_branch();

  app.orchestrator = std::make_shared<core::Orchestrator>(app.registry, ports, worktrees, supervisor, app.proxy, reference_resolver, upstream_main,
                                                          orchestrator_options);

  auto orphan_reaper = std::make_shared<reaper::OrphanReaper>(app.orchestrator, app.registry, worktrees, supervisor,
                                                              std::chrono::seconds(config.reaper().max_instance_lifetime_seconds()));
  if (config.reaper().interval_seconds() > 0) {
    app.reaper_worker = std::make_shared<reaper::ReaperWorker>(orphan_reaper, std::chrono::seconds(config.reaper().interval_seconds()));
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.orchestrator = app.orchestrator;
  ctx.registry     = app.registry;
  ctx.supervisor   = supervisor;
  ctx.reaper       = orphan_reaper;
  ctx.proxy        = app.proxy;

  app.instance_service = std::make_shared<service::InstanceService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::InstanceAdminServer>(app.instance_service));

  return app;
}

} // namespace debugpod::factory
