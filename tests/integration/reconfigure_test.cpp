#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "client/cpp/kolide_client.h"
#include "internal/jsonrpc/http_server.hpp"
#include "internal/runtime/server.hpp"
#include "tests/support/mock_api_server.hpp"

namespace {

using namespace launcher;

std::shared_ptr<config::Flags> PlaintextFlags(const std::string& url, const std::string& transport) {
  launcher::runtime::config::RuntimeConfig config;
  config.mutable_server()->set_kolide_server_url(url);
  config.mutable_server()->set_transport(transport);
  config.mutable_server()->set_insecure_transport(true);
  return std::make_shared<config::Flags>(config);
}

// Answers every call with a config naming the server.
jsonrpc::HttpServer::Handler NamedConfig(const std::string& name, std::atomic<int>* calls) {
  return [name, calls](const std::string&) {
    ++*calls;
    return R"({"jsonrpc":"2.0","result":{"config":")" + name + R"(","node_invalid":false,"disable_device":false},"id":"x"})";
  };
}

void TestConcurrentCallsDuringServerChange() {
  std::atomic<int>    calls_a{0};
  std::atomic<int>    calls_b{0};
  jsonrpc::HttpServer server_a("127.0.0.1:0", NamedConfig("A", &calls_a));
  jsonrpc::HttpServer server_b("127.0.0.1:0", NamedConfig("B", &calls_b));
  server_a.Start();
  server_b.Start();

  auto flags  = PlaintextFlags("127.0.0.1:" + std::to_string(server_a.port()), "jsonrpc");
  auto client = client::NewClient(flags);

  constexpr int     kWorkers = 4;
  std::atomic<bool> stop{false};
  std::atomic<int>  failures{0};
  std::atomic<int>  unexpected{0};

  std::vector<std::thread> workers;
  for (int i = 0; i < kWorkers; ++i) {
    workers.emplace_back([&] {
      while (!stop) {
        try {
          const auto config = client->RequestConfig(service::CallContext::Background(), "nk");
          if (config.config != "A" && config.config != "B") {
            ++unexpected;
          }
        } catch (const std::exception&) {
          ++failures;
        }
      }
    });
  }

  while (calls_a < 20) {
    std::this_thread::yield();
  }
  flags->SetKolideServerURL("127.0.0.1:" + std::to_string(server_b.port()));

  // Every call that starts after the change goes to B.
  const int a_after_change = calls_a.load();
  while (calls_b < 20) {
    std::this_thread::yield();
  }
  stop = true;
  for (auto& worker : workers) {
    worker.join();
  }

  assert(failures == 0);
  assert(unexpected == 0);
  // Calls already in flight when the URL changed may still land on A.
  assert(calls_a <= a_after_change + kWorkers);
  assert(client->RequestConfig(service::CallContext::Background(), "nk").config == "B");

  server_a.Stop();
  server_b.Stop();
}

void TestGrpcServerChange() {
  auto mock_a = std::make_shared<testing::MockApiService>();
  auto mock_b = std::make_shared<testing::MockApiService>();

  runtime::Server server_a("127.0.0.1:0", {mock_a});
  runtime::Server server_b("127.0.0.1:0", {mock_b});
  server_a.Start();
  server_b.Start();

  auto flags  = PlaintextFlags("127.0.0.1:" + std::to_string(server_a.port()), "grpc");
  auto client = client::NewClient(flags);

  (void)client->RequestConfig(service::CallContext::Background(), "nk");
  assert(mock_a->Calls() == 1);

  flags->SetKolideServerURL("127.0.0.1:" + std::to_string(server_b.port()));
  (void)client->RequestConfig(service::CallContext::Background(), "nk");
  (void)client->CheckHealth(service::CallContext::Background());
  assert(mock_a->Calls() == 1);
  assert(mock_b->Calls() == 2);

  // Switching back reuses the cached channel to A.
  flags->SetKolideServerURL("127.0.0.1:" + std::to_string(server_a.port()));
  (void)client->RequestQueries(service::CallContext::Background(), "nk");
  assert(mock_a->Calls() == 2);

  server_a.Stop();
  server_b.Stop();
}

} // namespace

int main() {
  TestConcurrentCallsDuringServerChange();
  TestGrpcServerChange();

  std::cout << "launcher_integration_reconfigure: pass\n";
  return 0;
}
