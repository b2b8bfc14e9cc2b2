#include "internal/jsonrpc/jsonrpc_handler.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/devserver/memory_service.hpp"
#include "internal/jsonrpc/jsonrpc_codec.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace launcher;
namespace wire = launcher::jsonrpc::wire;

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

std::shared_ptr<devserver::MemoryService> NewService() {
  launcher::runtime::config::DevServerConfig config;
  config.set_enroll_secret("s3cret");
  config.set_config_json(R"({"options":{"logger_plugin":"kolide_grpc"}})");
  (*config.mutable_queries())["uptime"] = "select * from uptime";
  return std::make_shared<devserver::MemoryService>(config);
}

std::string Enroll(const jsonrpc::JsonRpcHandler& handler, const std::string& secret) {
  service::EnrollmentRequest request{secret, "host-1", {}};
  request.details.hostname = "laptop";

  const auto body = handler.Handle(
      jsonrpc::EncodeRequest("RequestEnrollment", jsonrpc::EncodeEnrollmentParams(request), "enroll-1"));

  wire::EnrollmentResult result;
  jsonrpc::DecodeResponse(body, &result);
  return result.node_invalid() ? "" : result.node_key();
}

void TestEnrollThenFetch() {
  auto                    svc = NewService();
  jsonrpc::JsonRpcHandler handler(svc);

  assert(Enroll(handler, "wrong").empty());
  const auto node_key = Enroll(handler, "s3cret");
  assert(!node_key.empty());
  assert(svc->DetailsFor(node_key).hostname == "laptop");

  const auto body = handler.Handle(
      jsonrpc::EncodeRequest("RequestConfig", jsonrpc::EncodeNodeKeyParams({node_key}), "corr-42"));
  assert(Contains(body, "\"id\":\"corr-42\""));
  assert(svc->LastCorrelationId() == "corr-42");

  wire::ConfigResult config;
  jsonrpc::DecodeResponse(body, &config);
  assert(config.config() == R"({"options":{"logger_plugin":"kolide_grpc"}})");
  assert(!config.disable_device());

  wire::QueriesResult queries;
  jsonrpc::DecodeResponse(
      handler.Handle(jsonrpc::EncodeRequest("RequestQueries", jsonrpc::EncodeNodeKeyParams({node_key}), "q")),
      &queries);
  assert(queries.queries().queries().at("uptime") == "select * from uptime");

  service::LogCollection logs{node_key, service::LogType::kAgent, {"a", "b"}};
  wire::PublishResult    published;
  jsonrpc::DecodeResponse(handler.Handle(jsonrpc::EncodeRequest("PublishLogs", jsonrpc::EncodeLogParams(logs), "l")),
                          &published);
  assert(svc->LogCount(service::LogType::kAgent) == 2);

  // Body exactly as deployed agents send it.
  const auto status_body = handler.Handle(R"({"jsonrpc":"2.0","method":"PublishLogs","params":{"node_key":")" +
                                          node_key + R"(","LogType":4,"Logs":["up"]},"id":"s"})");
  assert(!Contains(status_body, "\"error\""));
  assert(svc->LogCount(service::LogType::kStatus) == 1);

  wire::HealthResult health;
  jsonrpc::DecodeResponse(handler.Handle(jsonrpc::EncodeRequest("CheckHealth", wire::HealthParams(), "h")), &health);
  assert(health.status() == static_cast<int>(service::HealthStatus::kServing));
}

void TestNumericIdIsTheCorrelationId() {
  auto                    svc = NewService();
  jsonrpc::JsonRpcHandler handler(svc);

  const auto body = handler.Handle(R"({"jsonrpc":"2.0","method":"CheckHealth","params":{},"id":7})");
  assert(Contains(body, "\"id\":7"));
  assert(svc->LastCorrelationId() == "7");
}

void TestUnknownNodeKeyIsNodeInvalid() {
  jsonrpc::JsonRpcHandler handler(NewService());

  const auto body =
      handler.Handle(jsonrpc::EncodeRequest("RequestConfig", jsonrpc::EncodeNodeKeyParams({"bogus"}), "x"));
  assert(Contains(body, "\"code\":-32001"));
  assert(Contains(body, "\"message\":\"Node Invalid\""));
  // The service's own message stays on the server.
  assert(!Contains(body, "unknown node key"));
}

void TestDeviceDisabledIsAResult() {
  auto                    svc = NewService();
  jsonrpc::JsonRpcHandler handler(svc);
  const auto              node_key = Enroll(handler, "s3cret");

  svc->SetDisableDevice(true);
  assert(svc->DisableDevice());
  const auto body =
      handler.Handle(jsonrpc::EncodeRequest("RequestQueries", jsonrpc::EncodeNodeKeyParams({node_key}), "x"));
  assert(!Contains(body, "\"error\""));

  wire::QueriesResult result;
  jsonrpc::DecodeResponse(body, &result);
  assert(result.disable_device());
}

class FailingService final : public service::KolideService {
 public:
  service::EnrollmentResult RequestEnrollment(const service::CallContext&, const std::string&, const std::string&,
                                              const service::EnrollmentDetails&) override {
    throw std::runtime_error("database is locked");
  }
  service::ConfigResult RequestConfig(const service::CallContext&, const std::string&) override {
    throw std::runtime_error("database is locked");
  }
  service::PublishResult PublishLogs(const service::CallContext&, const std::string&, service::LogType,
                                     const std::vector<std::string>&) override {
    throw std::runtime_error("database is locked");
  }
  service::QueriesResult RequestQueries(const service::CallContext&, const std::string&) override {
    throw std::runtime_error("database is locked");
  }
  service::PublishResult PublishResults(const service::CallContext&, const std::string&,
                                        const std::vector<service::DistributedResult>&) override {
    throw std::runtime_error("database is locked");
  }
  service::HealthStatus CheckHealth(const service::CallContext&) override {
    throw std::runtime_error("database is locked");
  }
};

void TestInternalErrorsAreMasked() {
  jsonrpc::JsonRpcHandler handler(std::make_shared<FailingService>());

  const auto body = handler.Handle(jsonrpc::EncodeRequest("CheckHealth", wire::HealthParams(), "x"));
  assert(Contains(body, "\"code\":-32603"));
  assert(Contains(body, "\"message\":\"Server Error\""));
  assert(!Contains(body, "database is locked"));
}

void TestMalformedRequests() {
  jsonrpc::JsonRpcHandler handler(NewService());

  auto body = handler.Handle("{not json");
  assert(Contains(body, "\"code\":-32000"));
  assert(Contains(body, "\"id\":null"));

  body = handler.Handle(R"({"jsonrpc":"2.0","method":"RequestConfig","params":{"node_key":["a"]},"id":"p"})");
  assert(Contains(body, "\"code\":-32000"));
  assert(Contains(body, "unmarshal body to NodeKeyParams"));
  assert(Contains(body, "\"id\":\"p\""));

  body = handler.Handle(R"({"jsonrpc":"2.0","method":"RequestFlags","params":{},"id":"m"})");
  assert(Contains(body, "\"code\":-32601"));
  assert(Contains(body, "\"message\":\"Method not found\""));
}

} // namespace

int main() {
  TestEnrollThenFetch();
  TestNumericIdIsTheCorrelationId();
  TestUnknownNodeKeyIsNodeInvalid();
  TestDeviceDisabledIsAResult();
  TestInternalErrorsAreMasked();
  TestMalformedRequests();

  std::cout << "launcher_unit_jsonrpc_handler: pass\n";
  return 0;
}
