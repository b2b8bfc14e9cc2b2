#include "grpc_error.hpp"

#include <string>

#include "internal/observability/logging.hpp"

namespace launcher::grpc {

namespace {

const char* CodeName(::grpc::StatusCode code) {
  switch (code) {
    case ::grpc::StatusCode::CANCELLED:
      return "Canceled";
    case ::grpc::StatusCode::DEADLINE_EXCEEDED:
      return "DeadlineExceeded";
    case ::grpc::StatusCode::UNAVAILABLE:
      return "Unavailable";
    case ::grpc::StatusCode::UNAUTHENTICATED:
      return "Unauthenticated";
    case ::grpc::StatusCode::INTERNAL:
      return "Internal";
    case ::grpc::StatusCode::UNIMPLEMENTED:
      return "Unimplemented";
    default:
      return "Unknown";
  }
}

std::string Describe(const ::grpc::Status& status) {
  return std::string("rpc error: code = ") + CodeName(status.error_code()) + " desc = " + status.error_message();
}

} // namespace

::grpc::Status ToStatus(const std::exception& e) {
  using namespace launcher::util;

  if (dynamic_cast<const NodeInvalid*>(&e)) {
    return {::grpc::StatusCode::UNAUTHENTICATED, kNodeInvalidMessage};
  }

  LAUNCHER_LOG_ERROR("request failed", {observability::StringField("err", e.what())});
  return {::grpc::StatusCode::INTERNAL, kServerErrorMessage};
}

void ThrowStatus(const ::grpc::Status& status) {
  switch (status.error_code()) {
    case ::grpc::StatusCode::DEADLINE_EXCEEDED:
      throw util::DeadlineExceeded();
    case ::grpc::StatusCode::CANCELLED:
      throw util::Cancelled();
    case ::grpc::StatusCode::UNAVAILABLE:
      throw util::TransportError(Describe(status));
    case ::grpc::StatusCode::UNAUTHENTICATED:
      throw util::NodeInvalid(status.error_message());
    default:
      throw util::RpcError(util::RpcProtocol::kGrpc, static_cast<int>(status.error_code()), status.error_message());
  }
}

} // namespace launcher::grpc
