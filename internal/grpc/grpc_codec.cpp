#include "grpc_codec.hpp"

#include "internal/util/errors.hpp"

namespace launcher::grpc {

namespace {

pb::EnrollmentDetails EncodeDetails(const service::EnrollmentDetails& details) {
  pb::EnrollmentDetails out;
  out.set_os_version(details.os_version);
  out.set_os_build(details.os_build);
  out.set_os_platform(details.os_platform);
  out.set_os_name(details.os_name);
  out.set_os_platform_like(details.os_platform_like);
  out.set_hostname(details.hostname);
  out.set_hardware_vendor(details.hardware_vendor);
  out.set_hardware_model(details.hardware_model);
  out.set_hardware_serial(details.hardware_serial);
  out.set_osquery_version(details.osquery_version);
  out.set_launcher_version(details.launcher_version);
  return out;
}

service::EnrollmentDetails DecodeDetails(const pb::EnrollmentDetails& details) {
  service::EnrollmentDetails out;
  out.os_version       = details.os_version();
  out.os_build         = details.os_build();
  out.os_platform      = details.os_platform();
  out.os_name          = details.os_name();
  out.os_platform_like = details.os_platform_like();
  out.hostname         = details.hostname();
  out.hardware_vendor  = details.hardware_vendor();
  out.hardware_model   = details.hardware_model();
  out.hardware_serial  = details.hardware_serial();
  out.osquery_version  = details.osquery_version();
  out.launcher_version = details.launcher_version();
  return out;
}

} // namespace

pb::LogCollection::LogType ToWireLogType(service::LogType type) {
  switch (type) {
    case service::LogType::kStatus:
      return pb::LogCollection::STATUS;
    case service::LogType::kString:
    case service::LogType::kSnapshot:
      return pb::LogCollection::RESULT;
    default:
      return pb::LogCollection::AGENT;
  }
}

service::LogType FromWireLogType(pb::LogCollection::LogType type) {
  switch (type) {
    case pb::LogCollection::STATUS:
      return service::LogType::kStatus;
    case pb::LogCollection::RESULT:
      return service::LogType::kSnapshot;
    default:
      throw util::DecodeError("logType " + std::to_string(static_cast<int>(type)) + " not implemented");
  }
}

// ------------------------------------------------------------
// Client side
// ------------------------------------------------------------

pb::EnrollmentRequest EncodeEnrollmentRequest(const service::EnrollmentRequest& request) {
  pb::EnrollmentRequest out;
  out.set_enroll_secret(request.enroll_secret);
  out.set_host_identifier(request.host_identifier);
  *out.mutable_enrollment_details() = EncodeDetails(request.details);
  return out;
}

pb::AgentApiRequest EncodeNodeKeyRequest(const service::NodeKeyRequest& request) {
  pb::AgentApiRequest out;
  out.set_node_key(request.node_key);
  return out;
}

pb::LogCollection EncodeLogCollection(const service::LogCollection& request) {
  pb::LogCollection out;
  out.set_node_key(request.node_key);
  out.set_log_type(ToWireLogType(request.log_type));
  for (const auto& log : request.logs) {
    out.add_logs()->set_data(log);
  }
  return out;
}

pb::ResultCollection EncodeResultCollection(const service::ResultCollection& request) {
  pb::ResultCollection out;
  out.set_node_key(request.node_key);
  for (const auto& result : request.results) {
    auto* wire = out.add_results();
    wire->set_id(result.query_name);
    wire->set_status(result.status);
    for (const auto& row : result.rows) {
      auto* wire_row = wire->add_rows();
      for (const auto& [name, value] : row) {
        auto* column = wire_row->add_columns();
        column->set_name(name);
        column->set_value(value);
      }
    }
  }
  return out;
}

pb::HealthCheckRequest EncodeHealthCheckRequest(const service::HealthCheckRequest&) {
  return {};
}

service::Envelope<service::EnrollmentResult> DecodeEnrollmentResponse(const pb::EnrollmentResponse& response) {
  return {{response.node_key(), response.node_invalid()}, response.disable_device()};
}

service::Envelope<service::ConfigResult> DecodeConfigResponse(const pb::ConfigResponse& response) {
  return {{response.config_json_blob(), response.node_invalid()}, response.disable_device()};
}

service::Envelope<service::PublishResult> DecodeAgentApiResponse(const pb::AgentApiResponse& response) {
  return {{response.message(), response.error_code(), response.node_invalid()}, response.disable_device()};
}

service::Envelope<service::QueriesResult> DecodeQueryCollection(const pb::QueryCollection& response) {
  service::Envelope<service::QueriesResult> out;
  for (const auto& query : response.queries()) {
    out.result.queries.queries[query.id()] = query.query();
  }
  out.result.node_invalid = response.node_invalid();
  out.disable_device      = response.disable_device();
  return out;
}

service::Envelope<service::HealthStatus> DecodeHealthCheckResponse(const pb::HealthCheckResponse& response) {
  return {static_cast<service::HealthStatus>(response.status()), response.disable_device()};
}

// ------------------------------------------------------------
// Server side
// ------------------------------------------------------------

service::EnrollmentRequest DecodeEnrollmentRequest(const pb::EnrollmentRequest& request) {
  return {request.enroll_secret(), request.host_identifier(), DecodeDetails(request.enrollment_details())};
}

service::LogCollection DecodeLogCollection(const pb::LogCollection& request) {
  service::LogCollection out;
  out.node_key = request.node_key();
  out.log_type = FromWireLogType(request.log_type());
  out.logs.reserve(static_cast<size_t>(request.logs_size()));
  for (const auto& log : request.logs()) {
    out.logs.push_back(log.data());
  }
  return out;
}

service::ResultCollection DecodeResultCollection(const pb::ResultCollection& request) {
  service::ResultCollection out;
  out.node_key = request.node_key();
  for (const auto& wire : request.results()) {
    service::DistributedResult result;
    result.query_name = wire.id();
    result.status     = wire.status();
    for (const auto& wire_row : wire.rows()) {
      service::ResultRow row;
      for (const auto& column : wire_row.columns()) {
        row[column.name()] = column.value();
      }
      result.rows.push_back(std::move(row));
    }
    out.results.push_back(std::move(result));
  }
  return out;
}

pb::EnrollmentResponse EncodeEnrollmentResponse(const service::EnrollmentResult& result) {
  pb::EnrollmentResponse out;
  out.set_node_key(result.node_key);
  out.set_node_invalid(result.node_invalid);
  return out;
}

pb::ConfigResponse EncodeConfigResponse(const service::ConfigResult& result) {
  pb::ConfigResponse out;
  out.set_config_json_blob(result.config);
  out.set_node_invalid(result.node_invalid);
  return out;
}

pb::AgentApiResponse EncodeAgentApiResponse(const service::PublishResult& result) {
  pb::AgentApiResponse out;
  out.set_message(result.message);
  out.set_error_code(result.error_code);
  out.set_node_invalid(result.node_invalid);
  return out;
}

pb::QueryCollection EncodeQueryCollection(const service::QueriesResult& result) {
  pb::QueryCollection out;
  for (const auto& [id, query] : result.queries.queries) {
    auto* wire = out.add_queries();
    wire->set_id(id);
    wire->set_query(query);
  }
  out.set_node_invalid(result.node_invalid);
  return out;
}

pb::HealthCheckResponse EncodeHealthCheckResponse(service::HealthStatus status) {
  pb::HealthCheckResponse out;
  out.set_status(static_cast<pb::HealthCheckResponse::ServingStatus>(status));
  return out;
}

} // namespace launcher::grpc
