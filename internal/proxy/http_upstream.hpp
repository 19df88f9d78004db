#pragma once

#include <chrono>
#include <string>

#include "upstream.hpp"

namespace debugpod::proxy {

struct HttpUpstreamOptions {
  std::string               host        = "127.0.0.1";
  std::string               health_path = "/global/health";
  std::chrono::milliseconds connect_timeout{2000};
  std::chrono::milliseconds request_timeout{300000};
};

/*
  cpp-httplib client side of the proxy. A fresh client per call; agents are
  local and connections are cheap.
*/
class HttpUpstream final : public Upstream {
 public:
  explicit HttpUpstream(HttpUpstreamOptions options);

  std::string     FetchContract(std::uint16_t port, const std::string& path) override;
  void            Forward(std::uint16_t port, const ProxyRequest& request, ResponseSink& sink) override;
  PortCheckResult CheckPort(std::uint16_t port) override;
  bool            IsListening(std::uint16_t port) override;

 private:
  HttpUpstreamOptions options_;
};

} // namespace debugpod::proxy
