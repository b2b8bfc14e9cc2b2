#include "grpc_endpoints.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>

#include "internal/grpc/grpc_codec.hpp"
#include "launcher/agent/v1.hpp"

namespace launcher::grpc {

namespace {

using util::CallContext;

constexpr auto kCancelPollInterval = std::chrono::milliseconds(50);

std::chrono::system_clock::time_point ToSystemDeadline(util::TimePoint deadline) {
  return std::chrono::system_clock::now() +
         std::chrono::duration_cast<std::chrono::system_clock::duration>(deadline - util::Now());
}

template <typename Request, typename Response>
using AsyncCall =
    std::function<void(::grpc::ClientContext*, const Request*, Response*, std::function<void(::grpc::Status)>)>;

// Runs one unary call through the callback API, cancelling it if the caller's
// context is cancelled while waiting.
template <typename Request, typename Response>
Response Invoke(const CallContext& ctx, const HandshakeRecorder& recorder, const AsyncCall<Request, Response>& call,
                const Request& request) {
  ctx.ThrowIfDone();

  ::grpc::ClientContext client_ctx;
  if (ctx.deadline()) {
    client_ctx.set_deadline(ToSystemDeadline(*ctx.deadline()));
  }
  if (!ctx.correlation_id().empty()) {
    client_ctx.AddMetadata(kCorrelationMetadataKey, ctx.correlation_id());
  }

  std::mutex              mutex;
  std::condition_variable done_cv;
  bool                    done = false;
  ::grpc::Status          status;
  Response                response;

  call(&client_ctx, &request, &response, [&](::grpc::Status result) {
    std::lock_guard lock(mutex);
    status = std::move(result);
    done   = true;
    done_cv.notify_one();
  });

  {
    std::unique_lock lock(mutex);
    while (!done_cv.wait_for(lock, kCancelPollInterval, [&] { return done; })) {
      if (ctx.Cancelled()) {
        client_ctx.TryCancel();
      }
    }
  }

  if (!status.ok()) {
    if (status.error_code() == ::grpc::StatusCode::CANCELLED && ctx.Cancelled()) {
      throw util::Cancelled();
    }
    ThrowCallError(recorder, status);
  }
  return response;
}

} // namespace

service::EndpointFactory MakeGrpcEndpointFactory(std::shared_ptr<GrpcConnection> connection) {
  return [connection](const std::string& server_url) {
    std::shared_ptr<pb::Api::Stub>     stub     = pb::Api::NewStub(connection->Channel(server_url));
    std::shared_ptr<HandshakeRecorder> recorder = connection->Recorder(server_url);

    service::EndpointSet endpoints;

    endpoints.request_enrollment = [recorder, stub](const CallContext& ctx, const service::EnrollmentRequest& request) {
      AsyncCall<pb::EnrollmentRequest, pb::EnrollmentResponse> call = [stub](auto* c, auto* req, auto* resp, auto done) {
        stub->async()->RequestEnrollment(c, req, resp, std::move(done));
      };
      return DecodeEnrollmentResponse(Invoke(ctx, *recorder, call, EncodeEnrollmentRequest(request)));
    };

    endpoints.request_config = [recorder, stub](const CallContext& ctx, const service::NodeKeyRequest& request) {
      AsyncCall<pb::AgentApiRequest, pb::ConfigResponse> call = [stub](auto* c, auto* req, auto* resp, auto done) {
        stub->async()->RequestConfig(c, req, resp, std::move(done));
      };
      return DecodeConfigResponse(Invoke(ctx, *recorder, call, EncodeNodeKeyRequest(request)));
    };

    endpoints.publish_logs = [recorder, stub](const CallContext& ctx, const service::LogCollection& request) {
      AsyncCall<pb::LogCollection, pb::AgentApiResponse> call = [stub](auto* c, auto* req, auto* resp, auto done) {
        stub->async()->PublishLogs(c, req, resp, std::move(done));
      };
      return DecodeAgentApiResponse(Invoke(ctx, *recorder, call, EncodeLogCollection(request)));
    };

    endpoints.request_queries = [recorder, stub](const CallContext& ctx, const service::NodeKeyRequest& request) {
      AsyncCall<pb::AgentApiRequest, pb::QueryCollection> call = [stub](auto* c, auto* req, auto* resp, auto done) {
        stub->async()->RequestQueries(c, req, resp, std::move(done));
      };
      return DecodeQueryCollection(Invoke(ctx, *recorder, call, EncodeNodeKeyRequest(request)));
    };

    endpoints.publish_results = [recorder, stub](const CallContext& ctx, const service::ResultCollection& request) {
      AsyncCall<pb::ResultCollection, pb::AgentApiResponse> call = [stub](auto* c, auto* req, auto* resp, auto done) {
        stub->async()->PublishResults(c, req, resp, std::move(done));
      };
      return DecodeAgentApiResponse(Invoke(ctx, *recorder, call, EncodeResultCollection(request)));
    };

    endpoints.check_health = [recorder, stub](const CallContext& ctx, const service::HealthCheckRequest& request) {
      AsyncCall<pb::HealthCheckRequest, pb::HealthCheckResponse> call = [stub](auto* c, auto* req, auto* resp, auto done) {
        stub->async()->CheckHealth(c, req, resp, std::move(done));
      };
      return DecodeHealthCheckResponse(Invoke(ctx, *recorder, call, EncodeHealthCheckRequest(request)));
    };

    return endpoints;
  };
}

} // namespace launcher::grpc
