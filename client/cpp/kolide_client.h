#pragma once

#include <memory>

#include "internal/config/flags.hpp"
#include "internal/grpc/grpc_connection.hpp"
#include "internal/jsonrpc/http_client.hpp"
#include "internal/service/kolide_service.hpp"

namespace launcher::client {

grpc::DialOptions          DialOptionsFromFlags(const config::Flags& flags);
jsonrpc::HttpClientOptions HttpClientOptionsFromFlags(const config::Flags& flags);

/*
  NewGRPCClient / NewJSONRPCClient

  A KolideService backed by the given transport handle, bound to the server
  URL in flags and re-bound whenever it changes. Calls carry a correlation id
  and are logged.
*/
std::shared_ptr<service::KolideService> NewGRPCClient(std::shared_ptr<config::Flags>       flags,
                                                      std::shared_ptr<grpc::GrpcConnection> connection);

std::shared_ptr<service::KolideService> NewJSONRPCClient(std::shared_ptr<config::Flags>      flags,
                                                         std::shared_ptr<jsonrpc::HttpClient> client);

// Dials the transport selected by flags.Transport().
std::shared_ptr<service::KolideService> NewClient(std::shared_ptr<config::Flags> flags);

} // namespace launcher::client
