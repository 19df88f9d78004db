#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "debugpod/v1/instance.pb.h"
#include "internal/http/http_error.hpp"
#include "internal/http/json_codec.hpp"
#include "internal/util/errors.hpp"

namespace {

using debugpod::http::HttpStatusFor;

void TestStatusMapping() {
  using namespace debugpod::util;

  assert(HttpStatusFor(InvalidRequest("x")) == 400);
  assert(HttpStatusFor(RequestRejected("x")) == 403);
  assert(HttpStatusFor(InstanceNotFound("x")) == 404);
  assert(HttpStatusFor(AlreadyExists("x")) == 409);
  assert(HttpStatusFor(CommitNotFound("x")) == 422);
  assert(HttpStatusFor(RateLimited("x")) == 429);
  assert(HttpStatusFor(UpstreamUnavailable("x")) == 502);
  assert(HttpStatusFor(ContractUnavailable("x")) == 502);
  assert(HttpStatusFor(ResourceExhausted("x")) == 503);
  assert(HttpStatusFor(StartupTimeout("x")) == 504);
  assert(HttpStatusFor(std::runtime_error("x")) == 500);
}

void TestErrorBodyCarriesKindAndMessage() {
  const auto body = debugpod::http::ErrorBody(debugpod::util::RequestRejected("GET /secret is not part of the agent API"));

  debugpod::v1::ErrorResponse parsed;
  debugpod::http::FromJson(body, &parsed);
  assert(parsed.error().kind() == "RequestRejected");
  assert(parsed.error().message() == "GET /secret is not part of the agent API");

  assert(body.find("\"error\"") != std::string::npos);
}

void TestRequestBodies() {
  debugpod::v1::SetupRequest req;
  debugpod::http::FromJson(R"({"correlation_id":"abc123","source_commit":"c0ffee"})", &req);
  assert(req.correlation_id() == "abc123");
  assert(req.source_commit() == "c0ffee");

  debugpod::v1::SetupRequest empty;
  debugpod::http::FromJson("  \n", &empty);
  assert(empty.correlation_id().empty());

  for (const std::string bad : {"{", R"({"correlation_id":1,)", R"({"unexpected":true})"}) {
    bool threw = false;
    try {
      debugpod::v1::SetupRequest out;
      debugpod::http::FromJson(bad, &out);
    } catch (const debugpod::util::InvalidRequest&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestResponsesUseProtoFieldNames() {
  debugpod::v1::InstanceDescriptor descriptor;
  descriptor.set_correlation_id("abc123");
  descriptor.set_port(4100);
  descriptor.set_status(debugpod::v1::INSTANCE_STATUS_RUNNING);
  descriptor.set_process_id(31337);
  descriptor.set_created_at_ms(1792438202532ULL);

  const auto json = debugpod::http::ToJson(descriptor);
  assert(json.find("\"correlation_id\":\"abc123\"") != std::string::npos);
  assert(json.find("\"port\":4100") != std::string::npos);
  // defaults are printed too
  assert(json.find("\"matches_reference\":false") != std::string::npos);

  // 64-bit integers stay numbers, enums use the model's names
  assert(json.find("\"process_id\":31337") != std::string::npos);
  assert(json.find("\"created_at_ms\":1792438202532") != std::string::npos);
  assert(json.find("\"status\":\"Running\"") != std::string::npos);
  assert(json.find("INSTANCE_STATUS") == std::string::npos);
}

void TestEnumLabels() {
  const auto* status = debugpod::v1::InstanceStatus_descriptor();
  assert(debugpod::http::EnumValueLabel(*status->FindValueByNumber(debugpod::v1::INSTANCE_STATUS_PROVISIONING)) == "Provisioning");
  assert(debugpod::http::EnumValueLabel(*status->FindValueByNumber(debugpod::v1::INSTANCE_STATUS_DRAINING)) == "Draining");
  assert(debugpod::http::EnumValueLabel(*status->FindValueByNumber(debugpod::v1::INSTANCE_STATUS_TERMINATED)) == "Terminated");
}

void TestNestedAndRepeatedFields() {
  debugpod::v1::ListInstancesResponse list;
  assert(debugpod::http::ToJson(list) == R"({"instances":[]})");

  auto* first = list.add_instances();
  first->set_correlation_id("a");
  list.add_instances()->set_correlation_id("b");

  const auto value = debugpod::http::ToValue(list);
  const auto& instances = value.struct_value().fields().at("instances").list_value();
  assert(instances.values_size() == 2);
  assert(instances.values(1).struct_value().fields().at("correlation_id").string_value() == "b");

  debugpod::v1::SetupResponse setup;
  setup.set_created(true);
  // unset messages are left out rather than printed as null
  assert(debugpod::http::ToJson(setup) == R"({"created":true})");
}

} // namespace

int main() {
  TestStatusMapping();
  TestErrorBodyCarriesKindAndMessage();
  TestRequestBodies();
  TestResponsesUseProtoFieldNames();
  TestEnumLabels();
  TestNestedAndRepeatedFields();

  std::cout << "debugpod_unit_http_error: pass\n";
  return 0;
}
