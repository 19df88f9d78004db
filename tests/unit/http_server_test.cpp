#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <httplib.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/core/orchestrator.hpp"
#include "internal/http/http_server.hpp"
#include "internal/ports/port_allocator.hpp"
#include "internal/proxy/http_upstream.hpp"
#include "internal/proxy/spec_filtered_proxy.hpp"
#include "internal/reaper/orphan_reaper.hpp"
#include "internal/registry/instance_registry.hpp"
#include "internal/service/instance_service.hpp"
#include "test_fakes.hpp"

namespace {

using google::protobuf::Struct;

// Orchestrator, service and HTTP server over fake host resources.
struct Stack {
  Stack(std::shared_ptr<debugpod::proxy::Upstream> upstream, std::uint16_t first_port, std::uint16_t last_port,
        std::chrono::milliseconds readiness_timeout = std::chrono::seconds(2)) {
    registry   = std::make_shared<debugpod::registry::InstanceRegistry>();
    ports      = std::make_shared<debugpod::ports::PortAllocator>(first_port, last_port, std::make_shared<debugpod::testing::FakeProbe>());
    worktrees  = std::make_shared<debugpod::testing::FakeWorkingCopyManager>();
    supervisor = std::make_shared<debugpod::testing::FakeSupervisor>();
    proxy      = std::make_shared<debugpod::proxy::SpecFilteredProxy>(registry, supervisor, std::move(upstream), debugpod::proxy::ProxyOptions{});

    debugpod::core::OrchestratorOptions options;
    options.readiness_timeout       = readiness_timeout;
    options.readiness_poll_interval = std::chrono::milliseconds(5);
    orchestrator = std::make_shared<debugpod::core::Orchestrator>(registry, ports, worktrees, supervisor, proxy, nullptr, nullptr, options);

    auto reaper  = std::make_shared<debugpod::reaper::OrphanReaper>(orchestrator, registry, worktrees, supervisor, std::chrono::seconds(0));
    auto service = std::make_shared<debugpod::service::InstanceService>(debugpod::service::ServiceContext{orchestrator, registry, supervisor, reaper, proxy});

    debugpod::http::HttpServerOptions http;
    http.bind_address = "127.0.0.1";
    http.port         = 0;
    http.threads      = 4;
    server            = std::make_unique<debugpod::http::HttpServer>(service, proxy, http);
    server->Start();
  }

  ~Stack() {
    server->Stop();
  }

  httplib::Client Client() const {
    httplib::Client client("127.0.0.1", server->BoundPort());
    client.set_read_timeout(10, 0);
    return client;
  }

  std::shared_ptr<debugpod::registry::InstanceRegistry>      registry;
  std::shared_ptr<debugpod::ports::PortAllocator>            ports;
  std::shared_ptr<debugpod::testing::FakeWorkingCopyManager> worktrees;
  std::shared_ptr<debugpod::testing::FakeSupervisor>         supervisor;
  std::shared_ptr<debugpod::proxy::SpecFilteredProxy>        proxy;
  std::shared_ptr<debugpod::core::Orchestrator>              orchestrator;
  std::unique_ptr<debugpod::http::HttpServer>                server;
};

/*
  A stand-in agent on a real socket: API description, health, an echo
  route, a slow event stream and a route the contract does not list.
*/
struct FakeAgent {
  FakeAgent() {
    server.Get("/doc", [](const httplib::Request&, httplib::Response& res) {
      res.set_content(debugpod::testing::OpenApiDocument(
                          {{"get", "/global/health"}, {"get", "/session/{id}"}, {"post", "/session/{id}/message"}, {"get", "/event"}}),
                      "application/json");
    });
    server.Get("/global/health", [](const httplib::Request&, httplib::Response& res) {
      res.set_content(R"({"healthy":true,"version":"9.9.9"})", "application/json");
    });
    server.Get(R"(/session/([^/]+))", [](const httplib::Request& req, httplib::Response& res) {
      res.set_content("session=" + req.matches[1].str() + ";x=" + req.get_param_value("x"), "text/plain");
    });
    server.Post(R"(/session/([^/]+)/message)", [](const httplib::Request& req, httplib::Response& res) {
      res.set_content(req.matches[1].str() + ":" + req.body, "text/plain");
    });
    server.Get("/event", [](const httplib::Request&, httplib::Response& res) {
      res.set_chunked_content_provider("text/event-stream", [](size_t, httplib::DataSink& sink) {
        for (int i = 1; i <= 3; ++i) {
          const auto event = "data: " + std::to_string(i) + "\n\n";
          if (!sink.write(event.data(), event.size())) return false;
          std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        sink.done();
        return true;
      });
    });
    server.Get("/secret", [this](const httplib::Request&, httplib::Response& res) {
      ++secret_hits;
      res.set_content("leaked", "text/plain");
    });

    port = static_cast<std::uint16_t>(server.bind_to_any_port("127.0.0.1"));
    assert(port > 0);
    thread = std::thread([this] { server.listen_after_bind(); });
    server.wait_until_ready();
  }

  ~FakeAgent() {
    server.stop();
    thread.join();
  }

  httplib::Server  server;
  std::thread      thread;
  std::uint16_t    port = 0;
  std::atomic<int> secret_hits{0};
};

Struct ParseObject(const std::string& body) {
  Struct out;
  auto   status = google::protobuf::util::JsonStringToMessage(body, &out);
  assert(status.ok());
  return out;
}

const google::protobuf::Value& Field(const Struct& object, const std::string& name) {
  const auto it = object.fields().find(name);
  assert(it != object.fields().end());
  return it->second;
}

std::string ErrorKind(const std::string& body) {
  return Field(Field(ParseObject(body), "error").struct_value(), "kind").string_value();
}

void TestHealthListAndUnknownRoutes() {
  Stack f(std::make_shared<debugpod::testing::FakeUpstream>(), 4100, 4200);
  auto  client = f.Client();

  auto health = client.Get("/health");
  assert(health && health->status == 200);
  assert(Field(ParseObject(health->body), "status").string_value() == "healthy");

  auto list = client.Get("/instances");
  assert(list && list->status == 200);
  assert(list->body == R"({"instances":[]})");

  auto unknown = client.Get("/nothing/here");
  assert(unknown && unknown->status == 404);

  auto missing = client.Get("/instances/ghost");
  assert(missing && missing->status == 404);
  assert(ErrorKind(missing->body) == "InstanceNotFound");
}

void TestSetupBodyIsFlatDescriptor() {
  Stack f(std::make_shared<debugpod::testing::FakeUpstream>(), 4100, 4200);
  auto  client = f.Client();

  auto first = client.Post("/instances/setup", R"({"correlation_id":"abc123","source_commit":"c0ffee"})", "application/json");
  assert(first && first->status == 200);

  const auto body = ParseObject(first->body);
  assert(body.fields().count("instance") == 0);
  assert(Field(body, "correlation_id").string_value() == "abc123");
  assert(Field(body, "source_commit").string_value() == "c0ffee");
  assert(Field(body, "working_copy_path").string_value() == "/tmp/fake-worktrees/abc123");
  assert(Field(body, "status").string_value() == "Running");
  assert(Field(body, "created").bool_value());
  assert(Field(body, "matches_reference").kind_case() == google::protobuf::Value::kBoolValue);
  assert(Field(body, "compare_advice").kind_case() == google::protobuf::Value::kStringValue);

  const auto port = Field(body, "port").number_value();
  assert(port >= 4100 && port <= 4200);
  assert(Field(body, "process_id").kind_case() == google::protobuf::Value::kNumberValue);
  assert(Field(body, "process_id").number_value() == 1000);
  assert(Field(body, "created_at_ms").kind_case() == google::protobuf::Value::kNumberValue);
  assert(Field(body, "created_at_ms").number_value() > 1.6e12);

  // same id again, through the short route: existing instance, same port
  auto again = client.Post("/instances", R"({"correlation_id":"abc123"})", "application/json");
  assert(again && again->status == 200);
  const auto second = ParseObject(again->body);
  assert(!Field(second, "created").bool_value());
  assert(Field(second, "port").number_value() == port);
  assert(f.worktrees->create_calls == 1);

  auto get = client.Get("/instances/abc123");
  assert(get && get->status == 200);
  const auto fetched = ParseObject(get->body);
  assert(Field(fetched, "status").string_value() == "Running");
  assert(Field(fetched, "port").number_value() == port);
  assert(fetched.fields().count("created") == 0);

  auto list = client.Get("/instances");
  assert(list && list->status == 200);
  const auto  listed    = ParseObject(list->body);
  const auto& instances = Field(listed, "instances").list_value();
  assert(instances.values_size() == 1);
  assert(Field(instances.values(0).struct_value(), "correlation_id").string_value() == "abc123");

  auto deleted = client.Delete("/instances/abc123");
  assert(deleted && deleted->status == 204);
  assert(deleted->body.empty());
  assert(f.registry->Size() == 0);
  assert(f.ports->ReservedCount() == 0);

  auto gone = client.Delete("/instances/abc123");
  assert(gone && gone->status == 404);
  assert(ErrorKind(gone->body) == "InstanceNotFound");
}

void TestSetupErrorsCarryKinds() {
  Stack f(std::make_shared<debugpod::testing::FakeUpstream>(), 4100, 4200);
  auto  client = f.Client();

  auto malformed = client.Post("/instances/setup", "{not json", "application/json");
  assert(malformed && malformed->status == 400);
  assert(ErrorKind(malformed->body) == "InvalidRequest");

  auto no_id = client.Post("/instances/setup", "{}", "application/json");
  assert(no_id && no_id->status == 400);

  auto missing_commit = client.Post("/instances/setup", R"({"correlation_id":"abc123","source_commit":"missing"})", "application/json");
  assert(missing_commit && missing_commit->status == 422);
  assert(ErrorKind(missing_commit->body) == "CommitNotFound");
  assert(f.registry->Size() == 0);
  assert(f.ports->ReservedCount() == 0);
}

void TestHostInspectionRoutes() {
  auto  upstream = std::make_shared<debugpod::testing::FakeUpstream>();
  Stack f(upstream, 4100, 4200);
  auto  client = f.Client();

  auto healthy = client.Get("/proc/check_port?port=4150");
  assert(healthy && healthy->status == 200);
  assert(Field(ParseObject(healthy->body), "port").number_value() == 4150);

  upstream->listening = false;
  auto down = client.Get("/proc/check_port?port=4150");
  assert(down && down->status == 502);
  assert(!Field(ParseObject(down->body), "listening").bool_value());

  for (const std::string bad : {"/proc/check_port", "/proc/check_port?port=abc", "/proc/check_port?port=70000"}) {
    auto response = client.Get(bad);
    assert(response && response->status == 400);
  }

  const auto stray = f.supervisor->Spawn({"stray", "/tmp/stray", 4160});
  auto       agents = client.Get("/proc/agents");
  assert(agents && agents->status == 200);
  const auto  listed    = ParseObject(agents->body);
  const auto& processes = Field(listed, "processes").list_value();
  assert(processes.values_size() == 1);
  assert(Field(processes.values(0).struct_value(), "pid").number_value() == stray.pid);

  auto init = client.Delete("/proc/1");
  assert(init && init->status == 400);

  auto killed = client.Delete("/proc/" + std::to_string(stray.pid));
  assert(killed && killed->status == 200);
  assert(!f.supervisor->IsAlive(stray.pid));

  auto reap = client.Post("/admin/reap", "", "application/json");
  assert(reap && reap->status == 200);
  assert(Field(ParseObject(reap->body), "markers_reclaimed").number_value() == 1);
}

void TestProxyThroughRealAgent() {
  FakeAgent agent;

  debugpod::proxy::HttpUpstreamOptions upstream_options;
  upstream_options.health_path = "/global/health";
  Stack f(std::make_shared<debugpod::proxy::HttpUpstream>(upstream_options), agent.port, agent.port);
  auto  client = f.Client();

  auto setup = client.Post("/instances/setup", R"({"correlation_id":"abc123"})", "application/json");
  assert(setup && setup->status == 200);
  assert(Field(ParseObject(setup->body), "port").number_value() == agent.port);

  // path suffix, query passed through
  auto suffix = client.Get("/instances/abc123/proxy/session/s1?x=7");
  assert(suffix && suffix->status == 200);
  assert(suffix->body == "session=s1;x=7");

  // ?path= form; the remaining parameters are forwarded
  auto by_param = client.Get("/instances/abc123/proxy?path=/session/s2&x=8");
  assert(by_param && by_param->status == 200);
  assert(by_param->body == "session=s2;x=8");

  // the suffix wins over ?path=
  auto both = client.Get("/instances/abc123/proxy/session/s3?path=/secret");
  assert(both && both->status == 200);
  assert(both->body == "session=s3;x=");

  auto post = client.Post("/instances/abc123/proxy/session/s1/message", "hello", "text/plain");
  assert(post && post->status == 200);
  assert(post->body == "s1:hello");

  auto rejected = client.Get("/instances/abc123/proxy/secret");
  assert(rejected && rejected->status == 403);
  assert(ErrorKind(rejected->body) == "RequestRejected");

  auto dotted = client.Get("/instances/abc123/proxy/session/../secret");
  assert(dotted && dotted->status == 403);

  auto no_target = client.Get("/instances/abc123/proxy");
  assert(no_target && no_target->status == 400);

  auto unknown = client.Get("/instances/nobody/proxy/global/health");
  assert(unknown && unknown->status == 404);

  assert(agent.secret_hits == 0);

  // events are relayed as they arrive, not after the agent finishes
  const auto start = std::chrono::steady_clock::now();
  std::chrono::steady_clock::time_point first_chunk;
  std::string                           streamed;
  auto events = client.Get("/instances/abc123/proxy/event", [&](const char* data, size_t length) {
    if (streamed.empty()) first_chunk = std::chrono::steady_clock::now();
    streamed.append(data, length);
    return true;
  });
  const auto finished = std::chrono::steady_clock::now();
  assert(events && events->status == 200);
  assert(events->get_header_value("Content-Type") == "text/event-stream");
  assert(streamed == "data: 1\n\ndata: 2\n\ndata: 3\n\n");
  assert(first_chunk - start < std::chrono::milliseconds(300));
  assert(finished - first_chunk >= std::chrono::milliseconds(300));

  auto check = client.Get("/proc/check_port?port=" + std::to_string(agent.port));
  assert(check && check->status == 200);
  const auto checked = ParseObject(check->body);
  assert(Field(checked, "healthy").bool_value());
  assert(Field(checked, "version").string_value() == "9.9.9");

  auto deleted = client.Delete("/instances/abc123");
  assert(deleted && deleted->status == 204);
}

// A delete for an id whose setup is still waiting on readiness blocks until
// the setup finishes, then tears down everything it acquired.
void TestDeleteWaitsForInFlightSetup() {
  auto upstream       = std::make_shared<debugpod::testing::FakeUpstream>();
  upstream->listening = false;
  Stack f(upstream, 4100, 4200, std::chrono::seconds(5));

  std::atomic<int> setup_status{0};
  std::thread      setup([&] {
    auto client   = f.Client();
    auto response = client.Post("/instances/setup", R"({"correlation_id":"race1"})", "application/json");
    setup_status  = response ? response->status : -1;
  });

  for (int i = 0; i < 400 && !f.registry->Get("race1"); ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  assert(f.registry->Get("race1").has_value());

  std::atomic<int> delete_status{0};
  std::thread      remove([&] {
    auto client   = f.Client();
    auto response = client.Delete("/instances/race1");
    delete_status = response ? response->status : -1;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  assert(delete_status == 0);
  assert(setup_status == 0);

  upstream->listening = true;
  setup.join();
  remove.join();

  assert(setup_status == 200);
  assert(delete_status == 204);
  assert(f.registry->Size() == 0);
  assert(f.ports->ReservedCount() == 0);
  assert(!f.worktrees->Exists("race1"));
  assert(f.supervisor->terminated.size() == 1);
  assert(f.supervisor->markers.empty());
}

} // namespace

int main() {
  TestHealthListAndUnknownRoutes();
  TestSetupBodyIsFlatDescriptor();
  TestSetupErrorsCarryKinds();
  TestHostInspectionRoutes();
  TestProxyThroughRealAgent();
  TestDeleteWaitsForInFlightSetup();

  std::cout << "debugpod_unit_http_server: pass\n";
  return 0;
}
