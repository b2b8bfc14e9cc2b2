#include <cassert>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "client/cpp/kolide_client.h"
#include "internal/devserver/memory_service.hpp"
#include "internal/jsonrpc/http_server.hpp"
#include "internal/jsonrpc/jsonrpc_handler.hpp"
#include "internal/runtime/server.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/mock_api_server.hpp"

namespace {

using namespace launcher;

std::shared_ptr<config::Flags> PlaintextFlags(const std::string& transport, int port) {
  launcher::runtime::config::RuntimeConfig config;
  config.mutable_server()->set_kolide_server_url("127.0.0.1:" + std::to_string(port));
  config.mutable_server()->set_transport(transport);
  config.mutable_server()->set_insecure_transport(true);
  return std::make_shared<config::Flags>(config);
}

// Invokes every operation and counts the DeviceDisabled failures.
int CountDisabled(service::KolideService& client) {
  const auto ctx = service::CallContext::Background();

  const std::vector<std::function<void()>> calls = {
      [&] { (void)client.RequestEnrollment(ctx, "secret", "host", {}); },
      [&] { (void)client.RequestConfig(ctx, "nk"); },
      [&] { (void)client.PublishLogs(ctx, "nk", service::LogType::kStatus, {"log"}); },
      [&] { (void)client.RequestQueries(ctx, "nk"); },
      [&] { (void)client.PublishResults(ctx, "nk", {}); },
      [&] { (void)client.CheckHealth(ctx); },
  };

  int disabled = 0;
  for (const auto& call : calls) {
    try {
      call();
    } catch (const util::DeviceDisabled& e) {
      assert(std::string(e.what()) == "device disabled");
      ++disabled;
    }
  }
  return disabled;
}

void TestGrpcKillSwitch() {
  auto mock = std::make_shared<testing::MockApiService>();

  runtime::Server server("127.0.0.1:0", {mock});
  server.Start();

  auto client = client::NewClient(PlaintextFlags("grpc", server.port()));

  assert(CountDisabled(*client) == 0);

  // The kill switch wins even when the same response marks the node invalid.
  mock->SetDisableDevice(true);
  mock->SetNodeInvalid(true);
  assert(CountDisabled(*client) == 6);

  mock->SetDisableDevice(false);
  const auto config = client->RequestConfig(service::CallContext::Background(), "nk");
  assert(config.node_invalid);
  assert(config.config == testing::MockApiService::kConfig);

  server.Stop();
}

void TestJsonRpcKillSwitch() {
  auto svc = std::make_shared<devserver::MemoryService>(launcher::runtime::config::DevServerConfig());
  auto handler = std::make_shared<jsonrpc::JsonRpcHandler>(svc);

  jsonrpc::HttpServer server("127.0.0.1:0", [handler](const std::string& body) { return handler->Handle(body); });
  server.Start();

  auto client = client::NewClient(PlaintextFlags("jsonrpc", server.port()));

  svc->SetDisableDevice(true);
  assert(CountDisabled(*client) == 6);

  svc->SetDisableDevice(false);
  const auto enrolled = client->RequestEnrollment(service::CallContext::Background(), "any", "host", {});
  assert(!enrolled.node_invalid);
  assert(!enrolled.node_key.empty());

  server.Stop();
}

} // namespace

int main() {
  TestGrpcKillSwitch();
  TestJsonRpcKillSwitch();

  std::cout << "launcher_integration_device_disabled: pass\n";
  return 0;
}
