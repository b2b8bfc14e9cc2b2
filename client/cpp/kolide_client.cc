#include "kolide_client.h"

#include "internal/grpc/grpc_endpoints.hpp"
#include "internal/jsonrpc/jsonrpc_endpoints.hpp"
#include "internal/service/endpoints.hpp"
#include "internal/service/uuid_middleware.hpp"
#include "internal/tls/cert_pool.hpp"

namespace launcher::client {

namespace {

std::shared_ptr<const tls::CertPool> RootPool(const config::Flags& flags) {
  if (flags.RootPEM().empty()) {
    return nullptr;
  }
  return tls::CertPool::FromPem(flags.RootPEM());
}

} // namespace

grpc::DialOptions DialOptionsFromFlags(const config::Flags& flags) {
  grpc::DialOptions options;
  options.insecure_transport = flags.InsecureTransport();
  options.insecure_tls       = flags.InsecureTLS();
  options.cert_pins          = flags.CertPins();
  options.root_pool          = RootPool(flags);
  return options;
}

jsonrpc::HttpClientOptions HttpClientOptionsFromFlags(const config::Flags& flags) {
  jsonrpc::HttpClientOptions options;
  options.insecure_tls = flags.InsecureTLS();
  options.cert_pins    = flags.CertPins();
  options.root_pool    = RootPool(flags);
  return options;
}

std::shared_ptr<service::KolideService> NewGRPCClient(std::shared_ptr<config::Flags>       flags,
                                                      std::shared_ptr<grpc::GrpcConnection> connection) {
  auto endpoints = std::make_shared<service::Endpoints>(flags, grpc::MakeGrpcEndpointFactory(std::move(connection)));
  return service::WithMiddleware(std::move(endpoints));
}

std::shared_ptr<service::KolideService> NewJSONRPCClient(std::shared_ptr<config::Flags>      flags,
                                                         std::shared_ptr<jsonrpc::HttpClient> client) {
  const bool insecure_transport = flags->InsecureTransport();
  auto       endpoints          = std::make_shared<service::Endpoints>(
      flags, jsonrpc::MakeJsonRpcEndpointFactory(std::move(client), insecure_transport));
  return service::WithMiddleware(std::move(endpoints));
}

std::shared_ptr<service::KolideService> NewClient(std::shared_ptr<config::Flags> flags) {
  if (flags->Transport() == "jsonrpc") {
    auto client = std::make_shared<jsonrpc::HttpClient>(HttpClientOptionsFromFlags(*flags));
    return NewJSONRPCClient(std::move(flags), std::move(client));
  }

  auto connection = grpc::DialGRPC(flags->KolideServerURL(), DialOptionsFromFlags(*flags));
  return NewGRPCClient(std::move(flags), std::move(connection));
}

} // namespace launcher::client
