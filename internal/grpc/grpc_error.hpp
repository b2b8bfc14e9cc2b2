#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

#include "internal/util/errors.hpp"

namespace launcher::grpc {

inline constexpr const char* kNodeInvalidMessage = "Node Invalid";
inline constexpr const char* kServerErrorMessage = "Server Error";

/*
  Server side: converts a service exception into the status sent to the
  agent. NodeInvalid becomes UNAUTHENTICATED; anything else is masked as an
  INTERNAL "Server Error" so internal error text never crosses the wire.
  DeviceDisabled is not an error on the wire and is handled by the adapter.
*/
::grpc::Status ToStatus(const std::exception& e);

/*
  Client side: throws the exception the caller sees for a failed call.
*/
[[noreturn]] void ThrowStatus(const ::grpc::Status& status);

} // namespace launcher::grpc
