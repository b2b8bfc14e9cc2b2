#pragma once

#include <memory>
#include <string>

#include "internal/service/kolide_service.hpp"

namespace launcher::jsonrpc {

inline constexpr const char* kNodeInvalidMessage    = "Node Invalid";
inline constexpr const char* kServerErrorMessage    = "Server Error";
inline constexpr const char* kMethodNotFoundMessage = "Method not found";

/*
  JsonRpcHandler

  Decodes one JSON-RPC 2.0 request body, dispatches it to the service and
  returns the response body. Error shaping matches the gRPC adapter:
  DeviceDisabled is a result with disable_device set, NodeInvalid is
  -32001 "Node Invalid", and anything else is logged and masked as -32603
  "Server Error". Bodies and params that fail to decode get -32000.
*/
class JsonRpcHandler {
 public:
  explicit JsonRpcHandler(std::shared_ptr<service::KolideService> svc);

  std::string Handle(const std::string& body) const;

 private:
  std::shared_ptr<service::KolideService> service_;
};

} // namespace launcher::jsonrpc
