#pragma once

#include "internal/service/types.hpp"
#include "launcher/agent/v1.hpp"

namespace launcher::grpc {

/*
  Conversions between the service types and the kolide.agent protobuf schema.

  The schema is fixed: stats and per-query messages of distributed results
  and discovery queries have no place on this wire and are dropped.
*/

namespace pb = ::launcher::agent::v1;

// Log types. The agent has more types than the wire: status and
// string/snapshot map to STATUS and RESULT, everything else degrades to AGENT.
pb::LogCollection::LogType ToWireLogType(service::LogType type);
// Only STATUS and RESULT are accepted. Throws util::DecodeError otherwise.
service::LogType FromWireLogType(pb::LogCollection::LogType type);

// Client side.
pb::EnrollmentRequest EncodeEnrollmentRequest(const service::EnrollmentRequest& request);
pb::AgentApiRequest   EncodeNodeKeyRequest(const service::NodeKeyRequest& request);
pb::LogCollection     EncodeLogCollection(const service::LogCollection& request);
pb::ResultCollection  EncodeResultCollection(const service::ResultCollection& request);
pb::HealthCheckRequest EncodeHealthCheckRequest(const service::HealthCheckRequest& request);

service::Envelope<service::EnrollmentResult> DecodeEnrollmentResponse(const pb::EnrollmentResponse& response);
service::Envelope<service::ConfigResult>     DecodeConfigResponse(const pb::ConfigResponse& response);
service::Envelope<service::PublishResult>    DecodeAgentApiResponse(const pb::AgentApiResponse& response);
service::Envelope<service::QueriesResult>    DecodeQueryCollection(const pb::QueryCollection& response);
service::Envelope<service::HealthStatus>     DecodeHealthCheckResponse(const pb::HealthCheckResponse& response);

// Server side.
service::EnrollmentRequest DecodeEnrollmentRequest(const pb::EnrollmentRequest& request);
service::LogCollection     DecodeLogCollection(const pb::LogCollection& request);
service::ResultCollection  DecodeResultCollection(const pb::ResultCollection& request);

pb::EnrollmentResponse  EncodeEnrollmentResponse(const service::EnrollmentResult& result);
pb::ConfigResponse      EncodeConfigResponse(const service::ConfigResult& result);
pb::AgentApiResponse    EncodeAgentApiResponse(const service::PublishResult& result);
pb::QueryCollection     EncodeQueryCollection(const service::QueriesResult& result);
pb::HealthCheckResponse EncodeHealthCheckResponse(service::HealthStatus status);

} // namespace launcher::grpc
