#include "jsonrpc_endpoints.hpp"

#include "internal/jsonrpc/jsonrpc_codec.hpp"

namespace launcher::jsonrpc {

namespace {

using util::CallContext;

template <typename Result>
Result Call(const CallContext& ctx, const HttpClient& client, const ServerAddress& address, std::string_view method,
            const google::protobuf::Message& params) {
  const std::string body = client.Post(ctx, address, EncodeRequest(method, params, ctx.correlation_id()));

  Result result;
  DecodeResponse(body, &result);
  return result;
}

} // namespace

service::EndpointFactory MakeJsonRpcEndpointFactory(std::shared_ptr<HttpClient> client, bool insecure_transport) {
  return [client, insecure_transport](const std::string& server_url) {
    const ServerAddress address = ParseServerAddress(server_url, insecure_transport);

    service::EndpointSet endpoints;

    endpoints.request_enrollment = [client, address](const CallContext& ctx, const service::EnrollmentRequest& request) {
      return DecodeEnrollmentResult(
          Call<wire::EnrollmentResult>(ctx, *client, address, "RequestEnrollment", EncodeEnrollmentParams(request)));
    };

    endpoints.request_config = [client, address](const CallContext& ctx, const service::NodeKeyRequest& request) {
      return DecodeConfigResult(
          Call<wire::ConfigResult>(ctx, *client, address, "RequestConfig", EncodeNodeKeyParams(request)));
    };

    endpoints.publish_logs = [client, address](const CallContext& ctx, const service::LogCollection& request) {
      return DecodePublishResult(
          Call<wire::PublishResult>(ctx, *client, address, "PublishLogs", EncodeLogParams(request)));
    };

    endpoints.request_queries = [client, address](const CallContext& ctx, const service::NodeKeyRequest& request) {
      return DecodeQueriesResult(
          Call<wire::QueriesResult>(ctx, *client, address, "RequestQueries", EncodeNodeKeyParams(request)));
    };

    endpoints.publish_results = [client, address](const CallContext& ctx, const service::ResultCollection& request) {
      return DecodePublishResult(
          Call<wire::PublishResult>(ctx, *client, address, "PublishResults", EncodeResultParams(request)));
    };

    endpoints.check_health = [client, address](const CallContext& ctx, const service::HealthCheckRequest&) {
      return DecodeHealthResult(Call<wire::HealthResult>(ctx, *client, address, "CheckHealth", wire::HealthParams()));
    };

    return endpoints;
  };
}

} // namespace launcher::jsonrpc
