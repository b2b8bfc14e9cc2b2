#include "types.hpp"

#include "internal/util/errors.hpp"

namespace launcher::service {

std::string_view ToString(LogType type) {
  switch (type) {
    case LogType::kString:
      return "string";
    case LogType::kSnapshot:
      return "snapshot";
    case LogType::kHealth:
      return "health";
    case LogType::kInit:
      return "init";
    case LogType::kStatus:
      return "status";
    case LogType::kAgent:
      return "agent";
  }
  return "unknown";
}

std::string_view ToString(HealthStatus status) {
  switch (status) {
    case HealthStatus::kUnknown:
      return "unknown";
    case HealthStatus::kServing:
      return "serving";
    case HealthStatus::kNotServing:
      return "not_serving";
  }
  return "unknown";
}

bool IsNodeInvalidError(const std::exception& e) {
  if (dynamic_cast<const util::NodeInvalid*>(&e)) {
    return true;
  }
  const auto* rpc = dynamic_cast<const util::RpcError*>(&e);
  if (rpc == nullptr) {
    return false;
  }
  // grpc::StatusCode::UNAUTHENTICATED
  return (rpc->protocol() == util::RpcProtocol::kGrpc && rpc->code() == 16) ||
         (rpc->protocol() == util::RpcProtocol::kJsonRpc && rpc->code() == -32001);
}

} // namespace launcher::service
