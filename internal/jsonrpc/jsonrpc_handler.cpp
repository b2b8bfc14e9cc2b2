#include "jsonrpc_handler.hpp"

#include "internal/jsonrpc/jsonrpc_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace launcher::jsonrpc {

namespace {

using util::CallContext;

std::string CorrelationId(const google::protobuf::Value& id) {
  switch (id.kind_case()) {
    case google::protobuf::Value::kStringValue:
      return id.string_value();
    case google::protobuf::Value::kNumberValue:
      return std::to_string(static_cast<int64_t>(id.number_value()));
    default:
      return "";
  }
}

template <typename Params, typename Result, typename Handler>
std::string Serve(const wire::Request& request, Handler&& handler) {
  Params params;
  try {
    if (request.has_params()) {
      JsonToMessage(MessageToJson(request.params()), &params);
    }
  } catch (const util::DecodeError& e) {
    return EncodeErrorResponse(kDecodeErrorCode, e.what(), request.id());
  }

  const auto ctx = CallContext::Background().WithCorrelationId(CorrelationId(request.id()));
  try {
    return EncodeResultResponse(handler(ctx, params), request.id());
  } catch (const util::DeviceDisabled&) {
    Result disabled;
    disabled.set_disable_device(true);
    return EncodeResultResponse(disabled, request.id());
  } catch (const util::NodeInvalid&) {
    return EncodeErrorResponse(kNodeInvalidCode, kNodeInvalidMessage, request.id());
  } catch (const std::exception& e) {
    LAUNCHER_LOG_ERROR("request failed", {observability::StringField("method", request.method()),
                                          observability::StringField("uuid", ctx.correlation_id()),
                                          observability::StringField("err", e.what())});
    return EncodeErrorResponse(kServerErrorCode, kServerErrorMessage, request.id());
  }
}

} // namespace

JsonRpcHandler::JsonRpcHandler(std::shared_ptr<service::KolideService> svc) : service_(std::move(svc)) {
}

std::string JsonRpcHandler::Handle(const std::string& body) const {
  wire::Request request;
  try {
    JsonToMessage(body, &request);
  } catch (const util::DecodeError& e) {
    return EncodeErrorResponse(kDecodeErrorCode, e.what(), google::protobuf::Value());
  }

  const std::string& method = request.method();

  if (method == "RequestEnrollment") {
    return Serve<wire::EnrollmentParams, wire::EnrollmentResult>(
        request, [this](const CallContext& ctx, const wire::EnrollmentParams& params) {
          const auto req = DecodeEnrollmentParams(params);
          return EncodeEnrollmentResult(
              service_->RequestEnrollment(ctx, req.enroll_secret, req.host_identifier, req.details));
        });
  }
  if (method == "RequestConfig") {
    return Serve<wire::NodeKeyParams, wire::ConfigResult>(
        request, [this](const CallContext& ctx, const wire::NodeKeyParams& params) {
          return EncodeConfigResult(service_->RequestConfig(ctx, params.node_key()));
        });
  }
  if (method == "PublishLogs") {
    return Serve<wire::LogParams, wire::PublishResult>(
        request, [this](const CallContext& ctx, const wire::LogParams& params) {
          const auto req = DecodeLogParams(params);
          return EncodePublishResult(service_->PublishLogs(ctx, req.node_key, req.log_type, req.logs));
        });
  }
  if (method == "RequestQueries") {
    return Serve<wire::NodeKeyParams, wire::QueriesResult>(
        request, [this](const CallContext& ctx, const wire::NodeKeyParams& params) {
          return EncodeQueriesResult(service_->RequestQueries(ctx, params.node_key()));
        });
  }
  if (method == "PublishResults") {
    return Serve<wire::ResultParams, wire::PublishResult>(
        request, [this](const CallContext& ctx, const wire::ResultParams& params) {
          const auto req = DecodeResultParams(params);
          return EncodePublishResult(service_->PublishResults(ctx, req.node_key, req.results));
        });
  }
  if (method == "CheckHealth") {
    return Serve<wire::HealthParams, wire::HealthResult>(
        request, [this](const CallContext& ctx, const wire::HealthParams&) {
          return EncodeHealthResult(service_->CheckHealth(ctx));
        });
  }

  LAUNCHER_LOG_DEBUG("jsonrpc method not found", {observability::StringField("method", method)});
  return EncodeErrorResponse(kMethodNotFoundCode, kMethodNotFoundMessage, request.id());
}

} // namespace launcher::jsonrpc
