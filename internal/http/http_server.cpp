#include "http_server.hpp"

#include <httplib.h>
#include <strings.h>

#include <stdexcept>

#include "debugpod/v1/instance.pb.h"
#include "http_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/proxy/spec_filtered_proxy.hpp"
#include "internal/proxy/stream_relay.hpp"
#include "internal/service/instance_service.hpp"
#include "internal/util/errors.hpp"
#include "json_codec.hpp"

namespace debugpod::http {

using debugpod::observability::IntField;
using debugpod::observability::StringField;

namespace {

constexpr const char* kJson = "application/json";

// Runs a handler body and turns any exception into the error payload.
template <typename Fn>
void Respond(httplib::Response& res, Fn&& fn) {
  try {
    fn();
  } catch (const std::exception& e) {
    res.status = HttpStatusFor(e);
    res.set_content(ErrorBody(e), kJson);
  }
}

void WriteJson(httplib::Response& res, int status, const google::protobuf::Value& value) {
  res.status = status;
  res.set_content(ToJson(value), kJson);
}

void WriteJson(httplib::Response& res, int status, const google::protobuf::Message& message) {
  WriteJson(res, status, ToValue(message));
}

// Descriptor fields at the top level with "created" beside them.
google::protobuf::Value SetupBody(const debugpod::v1::SetupResponse& response) {
  auto body = ToValue(response.instance());
  (*body.mutable_struct_value()->mutable_fields())["created"].set_bool_value(response.created());
  return body;
}

std::int64_t ParseInteger(const std::string& value, const char* what) {
  try {
    std::size_t consumed = 0;
    const auto  parsed   = std::stoll(value, &consumed);
    if (consumed != value.size()) {
      throw debugpod::util::InvalidRequest(std::string("invalid ") + what + ": " + value);
    }
    return parsed;
  } catch (const std::logic_error&) {
    throw debugpod::util::InvalidRequest(std::string("invalid ") + what + ": " + value);
  }
}

} // namespace

HttpServer::HttpServer(std::shared_ptr<service::InstanceService> service, std::shared_ptr<proxy::SpecFilteredProxy> proxy, HttpServerOptions options)
    : service_(std::move(service)), proxy_(std::move(proxy)), options_(std::move(options)) {
}

HttpServer::~HttpServer() {
  Stop();
}

void HttpServer::Start() {
  if (server_) {
    throw std::runtime_error("HTTP server already running");
  }

  server_ = std::make_unique<httplib::Server>();

  const auto threads      = options_.threads == 0 ? std::size_t{1} : options_.threads;
  server_->new_task_queue = [threads] { return new httplib::ThreadPool(threads); };

  server_->set_logger([](const httplib::Request& req, const httplib::Response& res) {
    DEBUGPOD_LOG_DEBUG("HTTP request", {StringField("method", req.method), StringField("path", req.path), IntField("status", res.status)});
  });

  ConfigureRoutes(*server_);

  int bound = options_.port;
  if (options_.port == 0) {
    bound = server_->bind_to_any_port(options_.bind_address);
  } else if (!server_->bind_to_port(options_.bind_address, options_.port)) {
    bound = -1;
  }
  if (bound < 0) {
    server_.reset();
    throw std::runtime_error("cannot bind HTTP server to " + options_.bind_address + ":" + std::to_string(options_.port));
  }
  bound_port_ = static_cast<std::uint16_t>(bound);

  server_thread_ = std::thread([server = server_.get()] { server->listen_after_bind(); });
  server_->wait_until_ready();

  DEBUGPOD_LOG_INFO("HTTP listening", {StringField("bind_address", options_.bind_address), IntField("port", bound_port_)});
}

void HttpServer::Stop() {
  if (!server_) {
    return;
  }
  server_->stop();
  if (server_thread_.joinable()) server_thread_.join();
  server_.reset();
  bound_port_ = 0;
}

void HttpServer::ConfigureRoutes(httplib::Server& server) {
  server.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
    Respond(res, [&] { WriteJson(res, 200, service_->Health()); });
  });

  // ------------------------------------------------------------------
  // Instance lifecycle
  // ------------------------------------------------------------------

  auto setup = [this](const httplib::Request& req, httplib::Response& res) {
    Respond(res, [&] {
      debugpod::v1::SetupRequest request;
      FromJson(req.body, &request);
      WriteJson(res, 200, SetupBody(service_->Setup(request)));
    });
  };
  server.Post("/instances/setup", setup);
  server.Post("/instances", setup);

  server.Get("/instances", [this](const httplib::Request&, httplib::Response& res) {
    Respond(res, [&] { WriteJson(res, 200, service_->ListInstances(debugpod::v1::ListInstancesRequest{})); });
  });

  server.Get(R"(/instances/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
    Respond(res, [&] {
      debugpod::v1::GetInstanceRequest request;
      request.set_correlation_id(req.matches[1]);
      WriteJson(res, 200, service_->GetInstance(request).instance());
    });
  });

  server.Delete(R"(/instances/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
    Respond(res, [&] {
      debugpod::v1::DeleteInstanceRequest request;
      request.set_correlation_id(req.matches[1]);
      service_->DeleteInstance(request);
      res.status = 204;
    });
  });

  // ------------------------------------------------------------------
  // Filtered proxy
  // ------------------------------------------------------------------

  const char* proxy_pattern = R"(/instances/([^/]+)/proxy(/.*)?)";
  auto        proxy         = [this](const httplib::Request& req, httplib::Response& res) { HandleProxy(req, res); };
  server.Get(proxy_pattern, proxy);
  server.Post(proxy_pattern, proxy);
  server.Put(proxy_pattern, proxy);
  server.Patch(proxy_pattern, proxy);
  server.Delete(proxy_pattern, proxy);

  // ------------------------------------------------------------------
  // Host inspection
  // ------------------------------------------------------------------

  server.Get("/proc/check_port", [this](const httplib::Request& req, httplib::Response& res) {
    Respond(res, [&] {
      if (!req.has_param("port")) {
        throw debugpod::util::InvalidRequest("port query parameter is required");
      }
      const auto port = ParseInteger(req.get_param_value("port"), "port");
      if (port <= 0 || port > 65535) {
        throw debugpod::util::InvalidRequest("port must be between 1 and 65535");
      }

      debugpod::v1::CheckPortRequest request;
      request.set_port(static_cast<std::uint32_t>(port));
      auto result = service_->CheckPort(request);
      WriteJson(res, result.listening && result.healthy ? 200 : 502, result);
    });
  });

  server.Get("/proc/agents", [this](const httplib::Request&, httplib::Response& res) {
    Respond(res, [&] { WriteJson(res, 200, service_->ListAgentProcesses()); });
  });

  server.Delete(R"(/proc/(\d+))", [this](const httplib::Request& req, httplib::Response& res) {
    Respond(res, [&] {
      auto result = service_->KillProcess(ParseInteger(req.matches[1], "pid"));
      WriteJson(res, result.success() ? 200 : 400, result);
    });
  });

  server.Post("/admin/reap", [this](const httplib::Request&, httplib::Response& res) {
    Respond(res, [&] { WriteJson(res, 200, service_->Reap(debugpod::v1::ReapRequest{})); });
  });
}

void HttpServer::HandleProxy(const httplib::Request& req, httplib::Response& res) {
  Respond(res, [&] {
    const std::string correlation_id = req.matches[1];

    // the suffix form wins over ?path=
    std::string target      = req.matches.size() > 2 ? req.matches[2].str() : std::string();
    const bool  suffix_form = !target.empty();
    if (!suffix_form) {
      target = req.get_param_value("path");
    }
    if (target.empty()) {
      throw debugpod::util::InvalidRequest("proxy target path is required");
    }

    proxy::ProxyRequest request;
    request.method = req.method;
    request.body   = req.body;

    const auto query = target.find('?');
    request.path     = target.substr(0, query);
    if (request.path.empty() || request.path.front() != '/') {
      request.path.insert(request.path.begin(), '/');
    }
    if (query != std::string::npos) {
      request.query = target.substr(query + 1);
    } else {
      auto params = req.params;
      if (!suffix_form) params.erase("path");
      request.query = httplib::detail::params_to_query_str(params);
    }

    for (const auto& [name, value] : req.headers) {
      request.headers.emplace_back(name, value);
    }
    request.headers = proxy::FilterHeaders(request.headers);

    const auto port = proxy_->Authorize(correlation_id, request);

    auto relay = std::make_shared<proxy::StreamRelay>(options_.relay_queue_chunks);
    std::thread([proxy = proxy_, relay, port, request] {
      try {
        proxy->ForwardTo(port, request, *relay);
      } catch (const std::exception&) {
        relay->Fail(std::current_exception());
      }
    }).detach();

    auto head  = relay->WaitHead();
    res.status = head.status;

    std::string content_type = "application/octet-stream";
    for (const auto& [name, value] : head.headers) {
      if (strcasecmp(name.c_str(), "Content-Type") == 0) {
        content_type = value;
      } else {
        res.set_header(name, value);
      }
    }

    if (head.status == 204 || head.status == 304) {
      relay->Cancel();
      return;
    }

    res.set_chunked_content_provider(
        content_type,
        [relay](size_t, httplib::DataSink& sink) {
          auto chunk = relay->Next();
          if (!chunk) {
            if (relay->Failed()) return false;
            sink.done();
            return true;
          }
          return sink.write(chunk->data(), chunk->size());
        },
        [relay](bool) { relay->Cancel(); });
  });
}

} // namespace debugpod::http
