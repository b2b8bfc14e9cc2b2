#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace launcher::util {

/*
  Central error types.

  Client calls surface these to the caller. The server adapters translate
  them to wire errors (see grpc/grpc_error.hpp and jsonrpc/jsonrpc_handler.hpp).
*/

// Remote kill switch. Takes precedence over every other field of a response.
class DeviceDisabled : public std::runtime_error {
 public:
  DeviceDisabled() : std::runtime_error("device disabled") {
  }
};

// The node key was rejected; the agent must re-enroll.
class NodeInvalid : public std::runtime_error {
 public:
  explicit NodeInvalid(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Network, TLS, HTTP and decode failures.

  Temporary() reports whether the caller's retry logic should try again.
*/
class TransportError : public std::runtime_error {
 public:
  explicit TransportError(const std::string& msg) : std::runtime_error(msg) {
  }

  virtual bool Temporary() const {
    return false;
  }
};

class TemporaryError : public TransportError {
 public:
  explicit TemporaryError(const std::string& msg) : TransportError(msg) {
  }

  bool Temporary() const override {
    return true;
  }
};

class PinMismatch : public TransportError {
 public:
  explicit PinMismatch(const std::string& msg) : TransportError(msg) {
  }
};

class DecodeError : public TransportError {
 public:
  explicit DecodeError(const std::string& msg) : TransportError(msg) {
  }
};

class DeadlineExceeded : public TransportError {
 public:
  DeadlineExceeded() : TransportError("context deadline exceeded") {
  }
};

class Cancelled : public TransportError {
 public:
  Cancelled() : TransportError("context canceled") {
  }
};

enum class RpcProtocol { kGrpc, kJsonRpc };

// Error status returned by the peer.
class RpcError : public std::runtime_error {
 public:
  RpcError(RpcProtocol protocol, int code, const std::string& msg);

  RpcProtocol protocol() const {
    return protocol_;
  }

  int code() const {
    return code_;
  }

 private:
  RpcProtocol protocol_;
  int         code_;
};

bool IsTemporary(const std::exception& e);
bool IsTransportError(const std::exception& e);

} // namespace launcher::util
