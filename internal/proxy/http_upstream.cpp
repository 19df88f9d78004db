#include "http_upstream.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <httplib.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace debugpod::proxy {

using debugpod::observability::IntField;
using debugpod::observability::StringField;

namespace {

void ApplyTimeouts(httplib::Client& client, std::chrono::milliseconds connect, std::chrono::milliseconds read) {
  client.set_connection_timeout(std::chrono::duration_cast<std::chrono::seconds>(connect).count(),
                                static_cast<time_t>((connect.count() % 1000) * 1000));
  client.set_read_timeout(std::chrono::duration_cast<std::chrono::seconds>(read).count(), static_cast<time_t>((read.count() % 1000) * 1000));
}

HeaderList ToHeaderList(const httplib::Headers& headers) {
  HeaderList out;
  out.reserve(headers.size());
  for (const auto& [name, value] : headers) {
    out.emplace_back(name, value);
  }
  return FilterHeaders(out);
}

} // namespace

HttpUpstream::HttpUpstream(HttpUpstreamOptions options) : options_(std::move(options)) {
}

std::string HttpUpstream::FetchContract(std::uint16_t port, const std::string& path) {
  httplib::Client client(options_.host, port);
  ApplyTimeouts(client, options_.connect_timeout, std::chrono::seconds(10));

  auto response = client.Get(path);
  if (!response) {
    throw debugpod::util::ContractUnavailable("cannot fetch " + path + " from port " + std::to_string(port) + ": " +
                                              httplib::to_string(response.error()));
  }
  if (response->status != 200) {
    throw debugpod::util::ContractUnavailable(path + " on port " + std::to_string(port) + " returned HTTP " + std::to_string(response->status));
  }
  return response->body;
}

void HttpUpstream::Forward(std::uint16_t port, const ProxyRequest& request, ResponseSink& sink) {
  httplib::Client client(options_.host, port);
  ApplyTimeouts(client, options_.connect_timeout, options_.request_timeout);

  httplib::Request upstream_request;
  upstream_request.method = request.method;
  upstream_request.path   = request.query.empty() ? request.path : request.path + "?" + request.query;
  upstream_request.body   = request.body;
  for (const auto& [name, value] : FilterHeaders(request.headers)) {
    upstream_request.headers.emplace(name, value);
  }

  bool head_sent                   = false;
  upstream_request.response_handler = [&](const httplib::Response& response) {
    sink.OnHead(response.status, ToHeaderList(response.headers));
    head_sent = true;
    return true;
  };
  upstream_request.content_receiver = [&](const char* data, size_t length, uint64_t, uint64_t) {
    return sink.OnChunk(std::string_view(data, length));
  };

  httplib::Response response;
  httplib::Error    error = httplib::Error::Success;
  if (!client.send(upstream_request, response, error)) {
    if (!head_sent) {
      throw debugpod::util::UpstreamUnavailable("agent on port " + std::to_string(port) + " unreachable: " + httplib::to_string(error));
    }
    sink.OnError(httplib::to_string(error));
    return;
  }

  // 204 and HEAD responses bypass the response handler
  if (!head_sent) {
    sink.OnHead(response.status, ToHeaderList(response.headers));
  }
  sink.OnComplete();
}

bool HttpUpstream::IsListening(std::uint16_t port) {
  int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0);
  if (fd < 0) {
    return false;
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port   = htons(port);
  if (::inet_pton(AF_INET, options_.host.c_str(), &addr.sin_addr) != 1) {
    ::close(fd);
    return false;
  }

  bool connected = ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
  if (!connected && errno == EINPROGRESS) {
    pollfd pfd{fd, POLLOUT, 0};
    if (::poll(&pfd, 1, static_cast<int>(options_.connect_timeout.count())) == 1) {
      int       so_error = 0;
      socklen_t len      = sizeof(so_error);
      connected          = ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) == 0 && so_error == 0;
    }
  }

  ::close(fd);
  return connected;
}

PortCheckResult HttpUpstream::CheckPort(std::uint16_t port) {
  PortCheckResult result;
  result.port = port;

  result.listening = IsListening(port);
  if (!result.listening) {
    result.detail = "nothing is listening on port " + std::to_string(port);
    return result;
  }

  httplib::Client client(options_.host, port);
  ApplyTimeouts(client, options_.connect_timeout, std::chrono::seconds(5));

  auto response = client.Get(options_.health_path);
  if (!response) {
    result.detail = "health handshake failed: " + httplib::to_string(response.error());
    return result;
  }
  if (response->status != 200) {
    result.detail = "health endpoint returned HTTP " + std::to_string(response->status);
    return result;
  }

  google::protobuf::Struct                 body;
  google::protobuf::util::JsonParseOptions parse_options;
  parse_options.ignore_unknown_fields = true;
  if (!google::protobuf::util::JsonStringToMessage(response->body, &body, parse_options).ok()) {
    result.detail = "health endpoint returned a non-JSON body";
    return result;
  }

  const auto& fields = body.fields();
  if (auto it = fields.find("healthy"); it != fields.end() && it->second.kind_case() == google::protobuf::Value::kBoolValue) {
    result.healthy = it->second.bool_value();
  }
  if (auto it = fields.find("version"); it != fields.end() && it->second.kind_case() == google::protobuf::Value::kStringValue) {
    result.version = it->second.string_value();
  }
  result.detail = result.healthy ? "agent healthy" : "agent reports unhealthy";

  DEBUGPOD_LOG_DEBUG("Port checked", {IntField("port", port), StringField("version", result.version), StringField("detail", result.detail)});
  return result;
}

} // namespace debugpod::proxy
