#include "jsonrpc_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <cmath>
#include <sstream>

#include "internal/util/errors.hpp"

namespace launcher::jsonrpc {

namespace {

std::string TypeName(const google::protobuf::Message& message) {
  return message.GetDescriptor()->name();
}

void ToValue(const google::protobuf::Message& message, google::protobuf::Value* value) {
  JsonToMessage(MessageToJson(message), value);
}

std::string ScalarText(const google::protobuf::Value& value) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kStringValue:
      return value.string_value();
    case google::protobuf::Value::kBoolValue:
      return value.bool_value() ? "true" : "false";
    case google::protobuf::Value::kNumberValue: {
      const double number = value.number_value();
      if (std::floor(number) == number && std::fabs(number) < 9.0e15) {
        return std::to_string(static_cast<int64_t>(number));
      }
      std::ostringstream out;
      out << number;
      return out.str();
    }
    case google::protobuf::Value::kNullValue:
    case google::protobuf::Value::KIND_NOT_SET:
      return "";
    default:
      return MessageToJson(value);
  }
}

// A missing id is answered with null.
void SetId(const google::protobuf::Value& id, wire::Response* response) {
  if (id.kind_case() == google::protobuf::Value::KIND_NOT_SET) {
    response->mutable_id()->set_null_value(google::protobuf::NULL_VALUE);
  } else {
    *response->mutable_id() = id;
  }
}

} // namespace

std::string MessageToJson(const google::protobuf::Message& message) {
  // Keys come from the json_name of each field.
  google::protobuf::util::JsonPrintOptions options;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("couldn't marshal " + TypeName(message) + ": " + std::string(status.message()));
  }
  return json;
}

void JsonToMessage(std::string_view json, google::protobuf::Message* message) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    throw util::DecodeError("couldn't unmarshal body to " + TypeName(*message) + ": " + std::string(status.message()));
  }
}

std::string EncodeRequest(std::string_view method, const google::protobuf::Message& params, const std::string& id) {
  wire::Request request;
  request.set_jsonrpc(kVersion);
  request.set_method(std::string(method));
  ToValue(params, request.mutable_params());
  request.mutable_id()->set_string_value(id);
  return MessageToJson(request);
}

void DecodeResponse(std::string_view body, google::protobuf::Message* result) {
  wire::Response response;
  JsonToMessage(body, &response);

  if (response.has_error()) {
    const auto& error = response.error();
    if (error.code() == kNodeInvalidCode) {
      throw util::NodeInvalid(error.message());
    }
    throw util::RpcError(util::RpcProtocol::kJsonRpc, error.code(), error.message());
  }

  if (!response.has_result() || response.result().kind_case() == google::protobuf::Value::kNullValue) {
    throw util::DecodeError("couldn't unmarshal body to " + TypeName(*result) + ": response has no result");
  }

  JsonToMessage(MessageToJson(response.result()), result);
}

std::string EncodeResultResponse(const google::protobuf::Message& result, const google::protobuf::Value& id) {
  wire::Response response;
  response.set_jsonrpc(kVersion);
  ToValue(result, response.mutable_result());
  SetId(id, &response);
  return MessageToJson(response);
}

std::string EncodeErrorResponse(int code, std::string_view message, const google::protobuf::Value& id) {
  wire::Response response;
  response.set_jsonrpc(kVersion);
  response.mutable_error()->set_code(code);
  response.mutable_error()->set_message(std::string(message));
  SetId(id, &response);
  return MessageToJson(response);
}

// ------------------------------------------------------------
// Params and results
// ------------------------------------------------------------

wire::EnrollmentParams EncodeEnrollmentParams(const service::EnrollmentRequest& request) {
  wire::EnrollmentParams params;
  params.set_enroll_secret(request.enroll_secret);
  params.set_host_identifier(request.host_identifier);

  const auto& details = request.details;
  auto*       out     = params.mutable_enrollment_details();
  out->set_os_version(details.os_version);
  out->set_os_build(details.os_build);
  out->set_os_platform(details.os_platform);
  out->set_os_name(details.os_name);
  out->set_os_platform_like(details.os_platform_like);
  out->set_hostname(details.hostname);
  out->set_hardware_vendor(details.hardware_vendor);
  out->set_hardware_model(details.hardware_model);
  out->set_hardware_serial(details.hardware_serial);
  out->set_osquery_version(details.osquery_version);
  out->set_launcher_version(details.launcher_version);
  return params;
}

wire::NodeKeyParams EncodeNodeKeyParams(const service::NodeKeyRequest& request) {
  wire::NodeKeyParams params;
  params.set_node_key(request.node_key);
  return params;
}

wire::LogParams EncodeLogParams(const service::LogCollection& request) {
  wire::LogParams params;
  params.set_node_key(request.node_key);
  params.set_log_type(static_cast<int32_t>(request.log_type));
  for (const auto& log : request.logs) {
    params.add_logs(log);
  }
  return params;
}

wire::ResultParams EncodeResultParams(const service::ResultCollection& request) {
  wire::ResultParams params;
  params.set_node_key(request.node_key);
  for (const auto& result : request.results) {
    auto* out = params.add_results();
    out->set_query_name(result.query_name);
    out->set_status(result.status);
    out->set_message(result.message);
    for (const auto& row : result.rows) {
      auto* fields = out->add_rows()->mutable_fields();
      for (const auto& [column, value] : row) {
        (*fields)[column].set_string_value(value);
      }
    }
    if (result.stats) {
      auto* stats = out->mutable_stats();
      stats->set_wall_time_ms(static_cast<double>(result.stats->wall_time_ms));
      stats->set_user_time(static_cast<double>(result.stats->user_time));
      stats->set_system_time(static_cast<double>(result.stats->system_time));
      stats->set_memory(static_cast<double>(result.stats->memory));
    }
  }
  return params;
}

service::Envelope<service::EnrollmentResult> DecodeEnrollmentResult(const wire::EnrollmentResult& result) {
  return {{result.node_key(), result.node_invalid()}, result.disable_device()};
}

service::Envelope<service::ConfigResult> DecodeConfigResult(const wire::ConfigResult& result) {
  return {{result.config(), result.node_invalid()}, result.disable_device()};
}

service::Envelope<service::PublishResult> DecodePublishResult(const wire::PublishResult& result) {
  return {{result.message(), result.error_code(), result.node_invalid()}, result.disable_device()};
}

service::Envelope<service::QueriesResult> DecodeQueriesResult(const wire::QueriesResult& result) {
  service::Envelope<service::QueriesResult> out;
  for (const auto& entry : result.queries().queries()) {
    out.result.queries.queries[entry.first] = entry.second;
  }
  for (const auto& entry : result.queries().discovery()) {
    out.result.queries.discovery[entry.first] = entry.second;
  }
  out.result.node_invalid = result.node_invalid();
  out.disable_device      = result.disable_device();
  return out;
}

service::Envelope<service::HealthStatus> DecodeHealthResult(const wire::HealthResult& result) {
  return {static_cast<service::HealthStatus>(result.status()), result.disable_device()};
}

service::EnrollmentRequest DecodeEnrollmentParams(const wire::EnrollmentParams& params) {
  service::EnrollmentRequest request;
  request.enroll_secret   = params.enroll_secret();
  request.host_identifier = params.host_identifier();

  const auto& details                 = params.enrollment_details();
  request.details.os_version          = details.os_version();
  request.details.os_build            = details.os_build();
  request.details.os_platform         = details.os_platform();
  request.details.os_name             = details.os_name();
  request.details.os_platform_like    = details.os_platform_like();
  request.details.hostname            = details.hostname();
  request.details.hardware_vendor     = details.hardware_vendor();
  request.details.hardware_model      = details.hardware_model();
  request.details.hardware_serial     = details.hardware_serial();
  request.details.osquery_version     = details.osquery_version();
  request.details.launcher_version    = details.launcher_version();
  return request;
}

service::LogCollection DecodeLogParams(const wire::LogParams& params) {
  service::LogCollection request;
  request.node_key = params.node_key();
  request.log_type = static_cast<service::LogType>(params.log_type());
  request.logs.assign(params.logs().begin(), params.logs().end());
  return request;
}

service::ResultCollection DecodeResultParams(const wire::ResultParams& params) {
  service::ResultCollection request;
  request.node_key = params.node_key();
  for (const auto& in : params.results()) {
    service::DistributedResult result;
    result.query_name = in.query_name();
    result.status     = in.status();
    result.message    = in.message();
    for (const auto& row : in.rows()) {
      service::ResultRow decoded;
      for (const auto& entry : row.fields()) {
        decoded[entry.first] = ScalarText(entry.second);
      }
      result.rows.push_back(std::move(decoded));
    }
    if (in.has_stats()) {
      const auto& stats = in.stats();
      result.stats      = service::QueryStats{static_cast<int64_t>(std::llround(stats.wall_time_ms())),
                                              static_cast<int64_t>(std::llround(stats.user_time())),
                                              static_cast<int64_t>(std::llround(stats.system_time())),
                                              static_cast<int64_t>(std::llround(stats.memory()))};
    }
    request.results.push_back(std::move(result));
  }
  return request;
}

wire::EnrollmentResult EncodeEnrollmentResult(const service::EnrollmentResult& result) {
  wire::EnrollmentResult out;
  out.set_node_key(result.node_key);
  out.set_node_invalid(result.node_invalid);
  return out;
}

wire::ConfigResult EncodeConfigResult(const service::ConfigResult& result) {
  wire::ConfigResult out;
  out.set_config(result.config);
  out.set_node_invalid(result.node_invalid);
  return out;
}

wire::PublishResult EncodePublishResult(const service::PublishResult& result) {
  wire::PublishResult out;
  out.set_message(result.message);
  out.set_error_code(result.error_code);
  out.set_node_invalid(result.node_invalid);
  return out;
}

wire::QueriesResult EncodeQueriesResult(const service::QueriesResult& result) {
  wire::QueriesResult out;
  auto*               queries = out.mutable_queries();
  queries->mutable_queries()->insert(result.queries.queries.begin(), result.queries.queries.end());
  queries->mutable_discovery()->insert(result.queries.discovery.begin(), result.queries.discovery.end());
  out.set_node_invalid(result.node_invalid);
  return out;
}

wire::HealthResult EncodeHealthResult(service::HealthStatus status) {
  wire::HealthResult out;
  out.set_status(static_cast<int32_t>(status));
  return out;
}

} // namespace launcher::jsonrpc
