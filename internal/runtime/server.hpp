#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

namespace launcher::runtime {

inline constexpr std::chrono::seconds kShutdownGracePeriod{5};

/*
  Server

  gRPC server hosting the given services. Without credentials it listens in
  plaintext. A bind address ending in ":0" gets an ephemeral port, reported
  by port() after Start().
*/
class Server {
public:
  Server(std::string bind_address, std::vector<std::shared_ptr<::grpc::Service>> services,
         std::shared_ptr<::grpc::ServerCredentials> credentials = nullptr);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  // Throws std::runtime_error when the address cannot be bound.
  void Start();
  // Idempotent. Waits at most kShutdownGracePeriod for in-flight calls.
  void Stop();

  int port() const {
    return selected_port_;
  }

private:
  std::string bind_address_;
  std::vector<std::shared_ptr<::grpc::Service>> services_;
  std::shared_ptr<::grpc::ServerCredentials> credentials_;
  std::unique_ptr<::grpc::Server> grpc_server_;
  int selected_port_{0};
};

// Server credentials from a PEM certificate chain and private key.
std::shared_ptr<::grpc::ServerCredentials> MakeServerCredentials(const std::string& cert_chain_pem,
                                                               const std::string& private_key_pem);

} // namespace launcher::runtime
