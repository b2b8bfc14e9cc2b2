#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "client/cpp/kolide_client.h"
#include "internal/util/errors.hpp"

using launcher::service::CallContext;

int main(int argc, char** argv) {
  // Allow overriding the server for remote or containerized runs. The default
  // matches kolide-devserver started with examples/config/devserver.yaml.
  const std::string target    = argc > 1 ? argv[1] : "localhost:8800";
  const std::string transport = argc > 2 ? argv[2] : "grpc";
  const std::string secret    = argc > 3 ? argv[3] : "dev-secret";

  launcher::runtime::config::RuntimeConfig config;
  config.mutable_server()->set_kolide_server_url(target);
  config.mutable_server()->set_transport(transport);
  config.mutable_server()->set_insecure_transport(true);

  auto client = launcher::client::NewClient(std::make_shared<launcher::config::Flags>(config));

  try {
    // Enroll once, then use the node key for every other call.
    launcher::service::EnrollmentDetails details;
    details.hostname         = "example-host";
    details.launcher_version = "example";

    const auto enrolled = client->RequestEnrollment(CallContext::Background(), secret, "example-host", details);
    if (enrolled.node_invalid) {
      std::cerr << "RequestEnrollment rejected: check the enroll secret\n";
      return 1;
    }
    std::cout << "Enrolled node_key=" << enrolled.node_key << '\n';

    const auto config_result = client->RequestConfig(CallContext::Background(), enrolled.node_key);
    std::cout << "Config: " << config_result.config << '\n';

    // Answer every distributed query with an empty result set so the server
    // stops handing them out.
    const auto queries = client->RequestQueries(CallContext::Background(), enrolled.node_key);
    std::vector<launcher::service::DistributedResult> results;
    for (const auto& [name, sql] : queries.queries.queries) {
      std::cout << "Query " << name << ": " << sql << '\n';

      launcher::service::DistributedResult result;
      result.query_name = name;
      results.push_back(std::move(result));
    }
    if (!results.empty()) {
      (void)client->PublishResults(CallContext::Background(), enrolled.node_key, results);
    }

    (void)client->PublishLogs(CallContext::Background(), enrolled.node_key, launcher::service::LogType::kStatus,
                              {R"({"severity":"0","message":"example started"})"});

    const auto health = client->CheckHealth(CallContext::Background());
    std::cout << "Health: " << launcher::service::ToString(health) << '\n';
  } catch (const launcher::util::DeviceDisabled&) {
    std::cerr << "Server disabled this device\n";
    return 3;
  } catch (const std::exception& e) {
    std::cerr << "Call failed: " << e.what() << '\n';
    return 1;
  }

  return 0;
}
