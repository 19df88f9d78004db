#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "api_contract.hpp"
#include "rate_limiter.hpp"
#include "upstream.hpp"

namespace debugpod::registry {
class InstanceRegistry;
}

namespace debugpod::model {
struct Instance;
}

namespace debugpod::process {
class ProcessSupervisor;
}

namespace debugpod::proxy {

struct ProxyOptions {
  std::string   contract_path               = "/doc";
  bool          fail_open_on_contract_error = false;
  std::uint32_t delete_requests_per_minute  = 5;
};

/*
  Forwards client requests to an instance's agent, but only those its API
  contract lists.

  Validation happens entirely before the upstream is touched; a rejected
  request never reaches the agent.
*/
class SpecFilteredProxy {
 public:
  SpecFilteredProxy(std::shared_ptr<registry::InstanceRegistry> registry, std::shared_ptr<process::ProcessSupervisor> supervisor,
                    std::shared_ptr<Upstream> upstream, ProxyOptions options);

  // Returns the port to forward to. Throws util::InstanceNotFound,
  // util::UpstreamUnavailable, util::ContractUnavailable,
  // util::RequestRejected or util::RateLimited.
  std::uint16_t Authorize(const std::string& correlation_id, const ProxyRequest& request);

  // Authorize, then forward synchronously into the sink.
  void Forward(const std::string& correlation_id, const ProxyRequest& request, ResponseSink& sink);

  void ForwardTo(std::uint16_t port, const ProxyRequest& request, ResponseSink& sink);

  PortCheckResult CheckPort(std::uint16_t port);
  bool            IsListening(std::uint16_t port);

  // Cached contract, fetched on first use. nullptr means unfiltered
  // (fetch failed and fail-open is configured).
  std::shared_ptr<const ApiContract> ContractFor(const model::Instance& instance);

  // Drops per-instance proxy state once the instance is gone.
  void Forget(const std::string& correlation_id);

 private:
  std::shared_ptr<std::mutex> FetchMutex(const std::string& correlation_id);

  std::shared_ptr<registry::InstanceRegistry>  registry_;
  std::shared_ptr<process::ProcessSupervisor> supervisor_;
  std::shared_ptr<Upstream>                   upstream_;
  ProxyOptions                                options_;

  RateLimiter delete_limiter_;

  std::mutex                                                   fetch_mutexes_guard_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> fetch_mutexes_;
};

} // namespace debugpod::proxy
