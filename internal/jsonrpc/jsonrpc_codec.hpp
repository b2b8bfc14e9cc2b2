#pragma once

#include <google/protobuf/message.h>
#include <google/protobuf/struct.pb.h>

#include <string>
#include <string_view>

#include "internal/service/types.hpp"
#include "launcher/agent/v1.hpp"

namespace launcher::jsonrpc {

namespace wire = ::kolide::agent::jsonrpc;

// Error codes. Decode failures use a code outside the JSON-RPC reserved
// range so they are never confused with application errors.
inline constexpr int kDecodeErrorCode    = -32000;
inline constexpr int kNodeInvalidCode    = -32001;
inline constexpr int kMethodNotFoundCode = -32601;
inline constexpr int kServerErrorCode    = -32603;

inline constexpr const char* kVersion = "2.0";

// Protobuf JSON mapping with original field names and default values printed.
std::string MessageToJson(const google::protobuf::Message& message);

// Throws util::DecodeError "couldn't unmarshal body to <type>: <detail>".
void JsonToMessage(std::string_view json, google::protobuf::Message* message);

std::string EncodeRequest(std::string_view method, const google::protobuf::Message& params, const std::string& id);

// Parses a response envelope into result. An error object is thrown as
// util::NodeInvalid (kNodeInvalidCode) or util::RpcError; malformed bodies as
// util::DecodeError.
void DecodeResponse(std::string_view body, google::protobuf::Message* result);

std::string EncodeResultResponse(const google::protobuf::Message& result, const google::protobuf::Value& id);
std::string EncodeErrorResponse(int code, std::string_view message, const google::protobuf::Value& id);

// Params and results.
wire::EnrollmentParams EncodeEnrollmentParams(const service::EnrollmentRequest& request);
wire::NodeKeyParams    EncodeNodeKeyParams(const service::NodeKeyRequest& request);
wire::LogParams        EncodeLogParams(const service::LogCollection& request);
wire::ResultParams     EncodeResultParams(const service::ResultCollection& request);

service::Envelope<service::EnrollmentResult> DecodeEnrollmentResult(const wire::EnrollmentResult& result);
service::Envelope<service::ConfigResult>     DecodeConfigResult(const wire::ConfigResult& result);
service::Envelope<service::PublishResult>    DecodePublishResult(const wire::PublishResult& result);
service::Envelope<service::QueriesResult>    DecodeQueriesResult(const wire::QueriesResult& result);
service::Envelope<service::HealthStatus>     DecodeHealthResult(const wire::HealthResult& result);

service::EnrollmentRequest DecodeEnrollmentParams(const wire::EnrollmentParams& params);
service::LogCollection     DecodeLogParams(const wire::LogParams& params);
service::ResultCollection  DecodeResultParams(const wire::ResultParams& params);

wire::EnrollmentResult EncodeEnrollmentResult(const service::EnrollmentResult& result);
wire::ConfigResult     EncodeConfigResult(const service::ConfigResult& result);
wire::PublishResult    EncodePublishResult(const service::PublishResult& result);
wire::QueriesResult    EncodeQueriesResult(const service::QueriesResult& result);
wire::HealthResult     EncodeHealthResult(service::HealthStatus status);

} // namespace launcher::jsonrpc
