#include "factory.hpp"

#include <optional>
#include <stdexcept>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/grpc/api_server.hpp"
#include "internal/jsonrpc/jsonrpc_handler.hpp"
#include "internal/runtime/server.hpp"

namespace launcher::factory {

namespace {

std::optional<jsonrpc::TlsIdentity> LoadTlsIdentity(const launcher::runtime::config::DevServerConfig& config) {
  if (config.tls_cert_path().empty() && config.tls_key_path().empty()) {
    return std::nullopt;
  }
  if (config.tls_cert_path().empty() || config.tls_key_path().empty()) {
    throw std::runtime_error("devserver TLS needs both tls_cert_path and tls_key_path");
  }
  return jsonrpc::TlsIdentity{config::ReadFileContents(config.tls_cert_path(), "TLS certificate"),
                              config::ReadFileContents(config.tls_key_path(), "TLS key")};
}

} // namespace

Application Build(const launcher::runtime::config::RuntimeConfig& config) {
  Application app;

  const auto& devserver = config.devserver();
  const auto  identity  = LoadTlsIdentity(devserver);

  // ------------------------------------------------------------------
  // Service
  // ------------------------------------------------------------------
  app.service = std::make_shared<devserver::MemoryService>(devserver);

  // ------------------------------------------------------------------
  // gRPC
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_shared<grpc::ApiServer>(app.service));
  if (identity) {
    app.grpc_credentials = runtime::MakeServerCredentials(identity->cert_chain_pem, identity->private_key_pem);
  }

  // ------------------------------------------------------------------
  // JSON-RPC
  // ------------------------------------------------------------------
  if (!devserver.jsonrpc_bind_address().empty()) {
    auto handler       = std::make_shared<jsonrpc::JsonRpcHandler>(app.service);
    app.jsonrpc_server = std::make_unique<jsonrpc::HttpServer>(
        devserver.jsonrpc_bind_address(), [handler](const std::string& body) { return handler->Handle(body); },
        identity);
  }

  return app;
}

} // namespace launcher::factory
