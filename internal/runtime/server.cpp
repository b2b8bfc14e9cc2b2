#include "server.hpp"

#include <chrono>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace launcher::runtime {

Server::Server(std::string bind_address, std::vector<std::shared_ptr<::grpc::Service>> services,
               std::shared_ptr<::grpc::ServerCredentials> credentials)
    : bind_address_(std::move(bind_address)),
      services_(std::move(services)),
      credentials_(credentials ? std::move(credentials) : ::grpc::InsecureServerCredentials()) {}

Server::~Server() {
  Stop();
}

void Server::Start() {
  ::grpc::ServerBuilder builder;

  builder.AddListeningPort(bind_address_, credentials_, &selected_port_);

  for (const auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();

  if (!grpc_server_ || selected_port_ == 0) {
    grpc_server_.reset();
    throw std::runtime_error("Failed to start gRPC server on " + bind_address_);
  }

  LAUNCHER_LOG_INFO("grpc server listening", {observability::StringField("address", bind_address_),
                                              observability::IntField("port", selected_port_)});
}

void Server::Stop() {
  if (!grpc_server_) {
    return;
  }

  // In-flight calls get a grace period, then are cancelled.
  grpc_server_->Shutdown(std::chrono::system_clock::now() + kShutdownGracePeriod);
  grpc_server_.reset();
  LAUNCHER_LOG_INFO("grpc server stopped", {observability::IntField("port", selected_port_)});
}

std::shared_ptr<::grpc::ServerCredentials> MakeServerCredentials(const std::string& cert_chain_pem,
                                                               const std::string& private_key_pem) {
  ::grpc::SslServerCredentialsOptions options;
  options.pem_key_cert_pairs.push_back({private_key_pem, cert_chain_pem});
  return ::grpc::SslServerCredentials(options);
}

} // namespace launcher::runtime
