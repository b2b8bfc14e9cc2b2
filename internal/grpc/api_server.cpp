#include "api_server.hpp"

#include "grpc_codec.hpp"
#include "grpc_endpoints.hpp"
#include "grpc_error.hpp"

namespace launcher::grpc {

namespace {

template <typename Response, typename Handler>
::grpc::Status Serve(Response* resp, Handler&& handler) {
  try {
    *resp = handler();
    return ::grpc::Status::OK;
  } catch (const util::DeviceDisabled&) {
    resp->Clear();
    resp->set_disable_device(true);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace

service::CallContext ContextFromServer(const ::grpc::ServerContext* server_ctx) {
  auto ctx = service::CallContext::Background();
  if (server_ctx == nullptr) {
    return ctx;
  }

  const auto deadline = server_ctx->deadline();
  if (deadline != std::chrono::system_clock::time_point::max()) {
    ctx = ctx.WithTimeout(deadline - std::chrono::system_clock::now());
  }

  const auto& metadata = server_ctx->client_metadata();
  auto        it       = metadata.find(kCorrelationMetadataKey);
  if (it != metadata.end()) {
    ctx = ctx.WithCorrelationId(std::string(it->second.data(), it->second.size()));
  }
  return ctx;
}

ApiServer::ApiServer(std::shared_ptr<service::KolideService> svc) : service_(std::move(svc)) {
}

::grpc::Status ApiServer::RequestEnrollment(::grpc::ServerContext* ctx, const launcher::agent::v1::EnrollmentRequest* req,
                                            launcher::agent::v1::EnrollmentResponse* resp) {
  return Serve(resp, [&] {
    const auto request = DecodeEnrollmentRequest(*req);
    return EncodeEnrollmentResponse(service_->RequestEnrollment(ContextFromServer(ctx), request.enroll_secret,
                                                                request.host_identifier, request.details));
  });
}

::grpc::Status ApiServer::RequestConfig(::grpc::ServerContext* ctx, const launcher::agent::v1::AgentApiRequest* req,
                                        launcher::agent::v1::ConfigResponse* resp) {
  return Serve(resp, [&] { return EncodeConfigResponse(service_->RequestConfig(ContextFromServer(ctx), req->node_key())); });
}

::grpc::Status ApiServer::PublishLogs(::grpc::ServerContext* ctx, const launcher::agent::v1::LogCollection* req,
                                      launcher::agent::v1::AgentApiResponse* resp) {
  return Serve(resp, [&] {
    const auto request = DecodeLogCollection(*req);
    return EncodeAgentApiResponse(
        service_->PublishLogs(ContextFromServer(ctx), request.node_key, request.log_type, request.logs));
  });
}

::grpc::Status ApiServer::RequestQueries(::grpc::ServerContext* ctx, const launcher::agent::v1::AgentApiRequest* req,
                                         launcher::agent::v1::QueryCollection* resp) {
  return Serve(resp, [&] { return EncodeQueryCollection(service_->RequestQueries(ContextFromServer(ctx), req->node_key())); });
}

::grpc::Status ApiServer::PublishResults(::grpc::ServerContext* ctx, const launcher::agent::v1::ResultCollection* req,
                                         launcher::agent::v1::AgentApiResponse* resp) {
  return Serve(resp, [&] {
    const auto request = DecodeResultCollection(*req);
    return EncodeAgentApiResponse(service_->PublishResults(ContextFromServer(ctx), request.node_key, request.results));
  });
}

::grpc::Status ApiServer::CheckHealth(::grpc::ServerContext* ctx, const launcher::agent::v1::HealthCheckRequest*,
                                      launcher::agent::v1::HealthCheckResponse* resp) {
  return Serve(resp, [&] { return EncodeHealthCheckResponse(service_->CheckHealth(ContextFromServer(ctx))); });
}

} // namespace launcher::grpc
