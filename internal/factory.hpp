#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"
#include "internal/devserver/memory_service.hpp"
#include "internal/jsonrpc/http_server.hpp"

namespace launcher::factory {

/*
  Application

  Everything the developer server runs. It lives for the lifetime of the
  process.
*/
struct Application {
  std::shared_ptr<devserver::MemoryService> service;

  std::vector<std::shared_ptr<::grpc::Service>> grpc_services;
  // Null when the gRPC listener should be plaintext.
  std::shared_ptr<::grpc::ServerCredentials> grpc_credentials;

  // Null when no JSON-RPC bind address is configured.
  std::unique_ptr<jsonrpc::HttpServer> jsonrpc_server;
};

/*
  Build

  Constructs the developer server from runtime config. TLS is enabled on both
  listeners when devserver.tls_cert_path and devserver.tls_key_path are set.
*/
Application Build(const launcher::runtime::config::RuntimeConfig& config);

} // namespace launcher::factory
