#pragma once

#include <memory>

#include "internal/grpc/grpc_connection.hpp"
#include "internal/service/endpoints.hpp"

namespace launcher::grpc {

// Endpoint sets bound to kolide.agent.Api over the shared connection. The
// correlation id travels as "uuid" call metadata.
service::EndpointFactory MakeGrpcEndpointFactory(std::shared_ptr<GrpcConnection> connection);

inline constexpr const char* kCorrelationMetadataKey = "uuid";

} // namespace launcher::grpc
