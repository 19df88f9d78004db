#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

namespace httplib {
class Server;
struct Request;
struct Response;
}

namespace debugpod::service {
class InstanceService;
}
namespace debugpod::proxy {
class SpecFilteredProxy;
}

namespace debugpod::http {

struct HttpServerOptions {
  std::string   bind_address = "0.0.0.0";
  std::uint16_t port         = 8000;  // 0 binds any free port
  std::size_t   threads      = 8;

  // Chunks buffered between an agent response and the client.
  std::size_t relay_queue_chunks = 64;
};

/*
  Public HTTP surface: instance lifecycle, the filtered proxy, host
  inspection and the manual reaper trigger.

  Listens on its own thread; Start() returns once the socket accepts.
*/
class HttpServer {
 public:
  HttpServer(std::shared_ptr<service::InstanceService> service, std::shared_ptr<proxy::SpecFilteredProxy> proxy, HttpServerOptions options);
  ~HttpServer();

  HttpServer(const HttpServer&)            = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  void Start();
  void Stop();

  std::uint16_t BoundPort() const {
    return bound_port_;
  }

 private:
  void ConfigureRoutes(httplib::Server& server);
  void HandleProxy(const httplib::Request& req, httplib::Response& res);

  std::shared_ptr<service::InstanceService>  service_;
  std::shared_ptr<proxy::SpecFilteredProxy> proxy_;
  HttpServerOptions                         options_;

  std::unique_ptr<httplib::Server> server_;
  std::thread                      server_thread_;
  std::atomic<std::uint16_t>       bound_port_{0};
};

} // namespace debugpod::http
