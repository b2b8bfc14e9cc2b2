#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>
#include <mutex>
#include <string>

#include "launcher/agent/v1.hpp"

namespace launcher::testing {

/*
  MockApiService

  kolide.agent.Api answering every method with a fixed, non-empty payload.
  Tests flip the flags below to shape the responses.
*/
class MockApiService final : public launcher::agent::v1::Api::Service {
 public:
  static constexpr const char* kNodeKey = "mock-node-key";
  static constexpr const char* kConfig  = R"({"options":{"distributed_interval":60}})";

  void SetDisableDevice(bool disabled);
  void SetNodeInvalid(bool invalid);
  // A non-OK status is returned instead of any response.
  void SetStatus(::grpc::Status status);

  int         Calls() const;
  std::string LastCorrelationId() const;

  ::grpc::Status RequestEnrollment(::grpc::ServerContext*, const launcher::agent::v1::EnrollmentRequest*,
                                   launcher::agent::v1::EnrollmentResponse*) override;
  ::grpc::Status RequestConfig(::grpc::ServerContext*, const launcher::agent::v1::AgentApiRequest*,
                               launcher::agent::v1::ConfigResponse*) override;
  ::grpc::Status PublishLogs(::grpc::ServerContext*, const launcher::agent::v1::LogCollection*,
                             launcher::agent::v1::AgentApiResponse*) override;
  ::grpc::Status RequestQueries(::grpc::ServerContext*, const launcher::agent::v1::AgentApiRequest*,
                                launcher::agent::v1::QueryCollection*) override;
  ::grpc::Status PublishResults(::grpc::ServerContext*, const launcher::agent::v1::ResultCollection*,
                                launcher::agent::v1::AgentApiResponse*) override;
  ::grpc::Status CheckHealth(::grpc::ServerContext*, const launcher::agent::v1::HealthCheckRequest*,
                             launcher::agent::v1::HealthCheckResponse*) override;

 private:
  struct Shape {
    bool           disable_device{false};
    bool           node_invalid{false};
    ::grpc::Status status;
  };

  // Records the call and returns the current shape.
  Shape Begin(::grpc::ServerContext* ctx);

  mutable std::mutex mutex_;
  Shape              shape_;
  int                calls_{0};
  std::string        last_correlation_id_;
};

} // namespace launcher::testing
