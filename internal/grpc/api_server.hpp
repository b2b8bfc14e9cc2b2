#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/kolide_service.hpp"
#include "launcher/agent/v1.hpp"

namespace launcher::grpc {

/*
  ApiServer

  kolide.agent.Api adapter over any KolideService. The correlation id is
  recovered from the "uuid" call metadata. DeviceDisabled thrown by the
  service is answered with disable_device set; other errors go through
  ToStatus.
*/
class ApiServer final : public launcher::agent::v1::Api::Service {
 public:
  explicit ApiServer(std::shared_ptr<service::KolideService> svc);

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
  std::shared_ptr<service::KolideService> service_;
};

// Server-side call context: deadline and correlation id taken from the call.
service::CallContext ContextFromServer(const ::grpc::ServerContext* server_ctx);

} // namespace launcher::grpc
