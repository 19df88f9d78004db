#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace debugpod::proxy {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct ProxyRequest {
  std::string method;
  std::string path;   // raw, leading slash, no query
  std::string query;  // without '?'
  HeaderList  headers;
  std::string body;
};

struct PortCheckResult {
  std::uint16_t port      = 0;
  bool          listening = false;
  bool          healthy   = false;
  std::string   version;
  std::string   detail;
};

/*
  Receives one upstream response incrementally.

  OnHead is called exactly once before any chunk; the stream then ends with
  exactly one of OnComplete or OnError. Returning false from OnChunk aborts
  the transfer.
*/
class ResponseSink {
 public:
  virtual ~ResponseSink() = default;

  virtual void OnHead(int status, const HeaderList& headers) = 0;
  virtual bool OnChunk(std::string_view data)                = 0;
  virtual void OnComplete()                                  = 0;
  virtual void OnError(const std::string& message)           = 0;
};

/*
  Network side of the proxy: everything that talks to an agent port.
*/
class Upstream {
 public:
  virtual ~Upstream() = default;

  // Raw API description. Throws util::ContractUnavailable.
  virtual std::string FetchContract(std::uint16_t port, const std::string& path) = 0;

  // Throws util::UpstreamUnavailable when no response head arrives; later
  // failures are reported through the sink.
  virtual void Forward(std::uint16_t port, const ProxyRequest& request, ResponseSink& sink) = 0;

  virtual PortCheckResult CheckPort(std::uint16_t port) = 0;

  // TCP connect only.
  virtual bool IsListening(std::uint16_t port) = 0;
};

// Host-identifying and hop-by-hop headers never cross the proxy.
bool       IsHopByHopHeader(std::string_view name);
HeaderList FilterHeaders(const HeaderList& headers);

} // namespace debugpod::proxy
