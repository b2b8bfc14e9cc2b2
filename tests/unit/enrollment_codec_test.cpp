#include "internal/grpc/grpc_codec.hpp"

#include <cassert>
#include <iostream>

#include "internal/jsonrpc/jsonrpc_codec.hpp"

namespace {

launcher::service::EnrollmentDetails FullDetails() {
  launcher::service::EnrollmentDetails details;
  details.os_version       = "14.2.1";
  details.os_build         = "23C71";
  details.os_platform      = "darwin";
  details.os_name          = "macOS";
  details.os_platform_like = "darwin";
  details.hostname         = "endpoint-01";
  details.hardware_vendor  = "Apple Inc.";
  details.hardware_model   = "MacBookPro18,3";
  details.hardware_serial  = "C02XXXXXXX";
  details.osquery_version  = "5.10.2";
  details.launcher_version = "1.4.5";
  return details;
}

void TestGrpcCarriesEveryDetail() {
  const launcher::service::EnrollmentRequest request{"secret", "host-uuid", FullDetails()};

  const auto wire = launcher::grpc::EncodeEnrollmentRequest(request);
  assert(wire.enroll_secret() == "secret");
  assert(wire.host_identifier() == "host-uuid");
  assert(wire.enrollment_details().os_platform_like() == "darwin");
  assert(wire.enrollment_details().hardware_serial() == "C02XXXXXXX");

  const auto decoded = launcher::grpc::DecodeEnrollmentRequest(wire);
  assert(decoded.enroll_secret == request.enroll_secret);
  assert(decoded.host_identifier == request.host_identifier);
  assert(decoded.details == request.details);
}

void TestJsonRpcCarriesEveryDetail() {
  const launcher::service::EnrollmentRequest request{"secret", "host-uuid", FullDetails()};

  const auto json = launcher::jsonrpc::MessageToJson(launcher::jsonrpc::EncodeEnrollmentParams(request));
  assert(json.find("\"EnrollmentDetails\":{\"os_version\"") != std::string::npos);
  assert(json.find("enrollment_details") == std::string::npos);
  assert(json.find("\"launcher_version\":\"1.4.5\"") != std::string::npos);

  launcher::jsonrpc::wire::EnrollmentParams params;
  launcher::jsonrpc::JsonToMessage(json, &params);
  const auto decoded = launcher::jsonrpc::DecodeEnrollmentParams(params);
  assert(decoded.details == request.details);
}

void TestEnrollmentResponseFlags() {
  launcher::agent::v1::EnrollmentResponse response;
  response.set_node_key("nk");
  response.set_node_invalid(true);
  response.set_disable_device(true);

  const auto envelope = launcher::grpc::DecodeEnrollmentResponse(response);
  assert(envelope.result.node_key == "nk");
  assert(envelope.result.node_invalid);
  assert(envelope.disable_device);
}

} // namespace

int main() {
  TestGrpcCarriesEveryDetail();
  TestJsonRpcCarriesEveryDetail();
  TestEnrollmentResponseFlags();

  std::cout << "launcher_unit_enrollment_codec: pass\n";
  return 0;
}
