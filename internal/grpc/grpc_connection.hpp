#pragma once

#include <grpcpp/grpcpp.h>

#include <chrono>
#include <exception>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/tls/cert_pool.hpp"
#include "internal/tls/tls_creds.hpp"

namespace launcher::grpc {

struct DialOptions {
  bool                                 insecure_transport{false};
  bool                                 insecure_tls{false};
  std::vector<std::string>             cert_pins;
  std::shared_ptr<const tls::CertPool> root_pool;

  std::chrono::milliseconds min_reconnect_backoff{1000};
  std::chrono::milliseconds max_reconnect_backoff{std::chrono::seconds(120)};
};

/*
  HandshakeRecorder

  gRPC reports a failed handshake as UNAVAILABLE with a generic message. The
  verifier records the real error here so calls can surface it. One recorder
  per target, so a rejected handshake with one server never explains a
  failure talking to another.
*/
class HandshakeRecorder {
 public:
  void Record(std::exception_ptr error);
  void Clear();

  std::exception_ptr Last() const;

 private:
  mutable std::mutex mutex_;
  std::exception_ptr last_;
};

// Throws the caller-facing error for a failed call: the recorded handshake
// error when the call was UNAVAILABLE and one exists, the mapped status
// otherwise.
[[noreturn]] void ThrowCallError(const HandshakeRecorder& recorder, const ::grpc::Status& status);

/*
  GrpcConnection

  Long-lived transport handle shared by every endpoint set built for this
  client. Channels are created lazily per target and cached, so switching
  servers and back reuses existing connections. Creating a channel performs
  no network I/O.
*/
class GrpcConnection {
 public:
  explicit GrpcConnection(DialOptions options);

  GrpcConnection(const GrpcConnection&)            = delete;
  GrpcConnection& operator=(const GrpcConnection&) = delete;

  std::shared_ptr<::grpc::Channel> Channel(const std::string& target);

  // Handshake errors seen on the channel to target.
  std::shared_ptr<HandshakeRecorder> Recorder(const std::string& target);

  const DialOptions& options() const {
    return options_;
  }

 private:
  struct Target {
    std::shared_ptr<::grpc::Channel>   channel;
    std::shared_ptr<HandshakeRecorder> recorder;
  };

  const Target& Open(const std::string& target);
  std::shared_ptr<::grpc::ChannelCredentials> Credentials(const std::string&                        target,
                                                          const std::shared_ptr<HandshakeRecorder>& recorder) const;

  DialOptions options_;

  std::mutex                    mutex_;
  std::map<std::string, Target> targets_;
};

// Returns the host part of a host:port target. gRPC authentication ignores the port.
std::string HostFromTarget(const std::string& target);

// Builds the connection and its channel to server_url. Does not block on the
// network.
std::shared_ptr<GrpcConnection> DialGRPC(const std::string& server_url, DialOptions options);

} // namespace launcher::grpc
