#include "errors.hpp"

namespace launcher::util {

namespace {

std::string ProtocolName(RpcProtocol protocol) {
  return protocol == RpcProtocol::kGrpc ? "grpc" : "jsonrpc";
}

} // namespace

RpcError::RpcError(RpcProtocol protocol, int code, const std::string& msg)
    : std::runtime_error(ProtocolName(protocol) + " error: code = " + std::to_string(code) + " desc = " + msg),
      protocol_(protocol),
      code_(code) {
}

bool IsTemporary(const std::exception& e) {
  const auto* transport = dynamic_cast<const TransportError*>(&e);
  return transport != nullptr && transport->Temporary();
}

bool IsTransportError(const std::exception& e) {
  return dynamic_cast<const TransportError*>(&e) != nullptr;
}

} // namespace launcher::util
