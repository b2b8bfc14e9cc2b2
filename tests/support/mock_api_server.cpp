#include "mock_api_server.hpp"

#include "internal/grpc/grpc_endpoints.hpp"

namespace launcher::testing {

namespace pb = launcher::agent::v1;

void MockApiService::SetDisableDevice(bool disabled) {
  std::lock_guard lock(mutex_);
  shape_.disable_device = disabled;
}

void MockApiService::SetNodeInvalid(bool invalid) {
  std::lock_guard lock(mutex_);
  shape_.node_invalid = invalid;
}

void MockApiService::SetStatus(::grpc::Status status) {
  std::lock_guard lock(mutex_);
  shape_.status = std::move(status);
}

int MockApiService::Calls() const {
  std::lock_guard lock(mutex_);
  return calls_;
}

std::string MockApiService::LastCorrelationId() const {
  std::lock_guard lock(mutex_);
  return last_correlation_id_;
}

MockApiService::Shape MockApiService::Begin(::grpc::ServerContext* ctx) {
  std::lock_guard lock(mutex_);
  ++calls_;

  const auto& metadata = ctx->client_metadata();
  auto        it       = metadata.find(launcher::grpc::kCorrelationMetadataKey);
  last_correlation_id_ = it == metadata.end() ? "" : std::string(it->second.data(), it->second.size());
  return shape_;
}

::grpc::Status MockApiService::RequestEnrollment(::grpc::ServerContext* ctx, const pb::EnrollmentRequest*,
                                                 pb::EnrollmentResponse* resp) {
  const auto shape = Begin(ctx);
  if (!shape.status.ok()) {
    return shape.status;
  }
  resp->set_node_key(kNodeKey);
  resp->set_node_invalid(shape.node_invalid);
  resp->set_disable_device(shape.disable_device);
  return ::grpc::Status::OK;
}

::grpc::Status MockApiService::RequestConfig(::grpc::ServerContext* ctx, const pb::AgentApiRequest*,
                                             pb::ConfigResponse* resp) {
  const auto shape = Begin(ctx);
  if (!shape.status.ok()) {
    return shape.status;
  }
  resp->set_config_json_blob(kConfig);
  resp->set_node_invalid(shape.node_invalid);
  resp->set_disable_device(shape.disable_device);
  return ::grpc::Status::OK;
}

::grpc::Status MockApiService::PublishLogs(::grpc::ServerContext* ctx, const pb::LogCollection*,
                                           pb::AgentApiResponse* resp) {
  const auto shape = Begin(ctx);
  if (!shape.status.ok()) {
    return shape.status;
  }
  resp->set_message("logs accepted");
  resp->set_node_invalid(shape.node_invalid);
  resp->set_disable_device(shape.disable_device);
  return ::grpc::Status::OK;
}

::grpc::Status MockApiService::RequestQueries(::grpc::ServerContext* ctx, const pb::AgentApiRequest*,
                                              pb::QueryCollection* resp) {
  const auto shape = Begin(ctx);
  if (!shape.status.ok()) {
    return shape.status;
  }
  auto* query = resp->add_queries();
  query->set_id("uptime");
  query->set_query("select * from uptime");
  resp->set_node_invalid(shape.node_invalid);
  resp->set_disable_device(shape.disable_device);
  return ::grpc::Status::OK;
}

::grpc::Status MockApiService::PublishResults(::grpc::ServerContext* ctx, const pb::ResultCollection*,
                                              pb::AgentApiResponse* resp) {
  const auto shape = Begin(ctx);
  if (!shape.status.ok()) {
    return shape.status;
  }
  resp->set_message("results accepted");
  resp->set_node_invalid(shape.node_invalid);
  resp->set_disable_device(shape.disable_device);
  return ::grpc::Status::OK;
}

::grpc::Status MockApiService::CheckHealth(::grpc::ServerContext* ctx, const pb::HealthCheckRequest*,
                                           pb::HealthCheckResponse* resp) {
  const auto shape = Begin(ctx);
  if (!shape.status.ok()) {
    return shape.status;
  }
  resp->set_status(pb::HealthCheckResponse::SERVING);
  resp->set_disable_device(shape.disable_device);
  return ::grpc::Status::OK;
}

} // namespace launcher::testing
