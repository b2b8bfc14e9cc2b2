#pragma once

#include <memory>

#include "internal/jsonrpc/http_client.hpp"
#include "internal/service/endpoints.hpp"

namespace launcher::jsonrpc {

// Endpoint sets posting JSON-RPC 2.0 requests to the server URL. The
// correlation id is sent as the request id.
service::EndpointFactory MakeJsonRpcEndpointFactory(std::shared_ptr<HttpClient> client, bool insecure_transport);

} // namespace launcher::jsonrpc
