#include "spec_filtered_proxy.hpp"

#include "internal/model/instance.hpp"
#include "internal/observability/logging.hpp"
#include "internal/process/process_supervisor.hpp"
#include "internal/registry/instance_registry.hpp"
#include "internal/util/errors.hpp"

namespace debugpod::proxy {

using debugpod::model::InstanceStatus;
using debugpod::observability::IntField;
using debugpod::observability::StringField;

SpecFilteredProxy::SpecFilteredProxy(std::shared_ptr<registry::InstanceRegistry> registry, std::shared_ptr<process::ProcessSupervisor> supervisor,
                                     std::shared_ptr<Upstream> upstream, ProxyOptions options)
    : registry_(std::move(registry)),
      supervisor_(std::move(supervisor)),
      upstream_(std::move(upstream)),
      options_(std::move(options)),
      delete_limiter_(options_.delete_requests_per_minute, std::chrono::minutes(1)) {
}

std::shared_ptr<std::mutex> SpecFilteredProxy::FetchMutex(const std::string& correlation_id) {
  std::lock_guard<std::mutex> lock(fetch_mutexes_guard_);
  auto&                       fetch_mutex = fetch_mutexes_[correlation_id];
  if (!fetch_mutex) {
    fetch_mutex = std::make_shared<std::mutex>();
  }
  return fetch_mutex;
}

std::shared_ptr<const ApiContract> SpecFilteredProxy::ContractFor(const model::Instance& instance) {
  if (instance.api_contract) {
    return instance.api_contract;
  }

  // one fetch per instance even under concurrent first use
  auto            fetch_mutex = FetchMutex(instance.correlation_id);
  std::lock_guard lock(*fetch_mutex);

  auto current = registry_->Get(instance.correlation_id);
  if (current && current->generation == instance.generation && current->api_contract) {
    return current->api_contract;
  }

  try {
    auto contract = std::make_shared<const ApiContract>(ApiContract::ParseOpenApi(upstream_->FetchContract(instance.port, options_.contract_path)));
    registry_->AttachContract(instance.correlation_id, instance.generation, contract);
    DEBUGPOD_LOG_INFO("API contract cached",
                      {StringField("correlation_id", instance.correlation_id), IntField("operations", static_cast<std::int64_t>(contract->Size()))});
    return contract;
  } catch (const debugpod::util::ContractUnavailable& e) {
    if (!options_.fail_open_on_contract_error) {
      throw;
    }
    DEBUGPOD_LOG_WARN("API contract unavailable, forwarding unfiltered",
                      {StringField("correlation_id", instance.correlation_id), StringField("error", e.what())});
    return nullptr;
  }
}

std::uint16_t SpecFilteredProxy::Authorize(const std::string& correlation_id, const ProxyRequest& request) {
  auto instance = registry_->Get(correlation_id);
  if (!instance || instance->status == InstanceStatus::kTerminated) {
    throw debugpod::util::InstanceNotFound("instance not found: " + correlation_id);
  }
  if (instance->status != InstanceStatus::kRunning || !supervisor_->IsAlive(instance->process_id)) {
    throw debugpod::util::UpstreamUnavailable("instance " + correlation_id + " is not serving (" + model::ToString(instance->status) + ")");
  }

  auto contract = ContractFor(*instance);
  if (contract && !contract->Allows(request.method, request.path)) {
    DEBUGPOD_LOG_INFO("Proxy request rejected",
                      {StringField("correlation_id", correlation_id), StringField("method", request.method), StringField("path", request.path)});
    throw debugpod::util::RequestRejected(request.method + " " + ApiContract::NormalizePath(request.path) + " is not part of the agent API");
  }

  if (request.method == "DELETE" && !delete_limiter_.TryAcquire(correlation_id)) {
    throw debugpod::util::RateLimited("too many DELETE requests for instance " + correlation_id);
  }

  return instance->port;
}

void SpecFilteredProxy::Forward(const std::string& correlation_id, const ProxyRequest& request, ResponseSink& sink) {
  ForwardTo(Authorize(correlation_id, request), request, sink);
}

void SpecFilteredProxy::ForwardTo(std::uint16_t port, const ProxyRequest& request, ResponseSink& sink) {
  upstream_->Forward(port, request, sink);
}

PortCheckResult SpecFilteredProxy::CheckPort(std::uint16_t port) {
  return upstream_->CheckPort(port);
}

bool SpecFilteredProxy::IsListening(std::uint16_t port) {
  return upstream_->IsListening(port);
}

void SpecFilteredProxy::Forget(const std::string& correlation_id) {
  delete_limiter_.Forget(correlation_id);
  std::lock_guard<std::mutex> lock(fetch_mutexes_guard_);
  fetch_mutexes_.erase(correlation_id);
}

} // namespace debugpod::proxy
