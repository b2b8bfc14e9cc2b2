#include "internal/grpc/grpc_codec.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/jsonrpc/jsonrpc_codec.hpp"
#include "internal/util/errors.hpp"

namespace {

using launcher::grpc::FromWireLogType;
using launcher::grpc::ToWireLogType;
using launcher::service::LogType;
namespace pb = launcher::agent::v1;

void TestEncodeToWire() {
  assert(ToWireLogType(LogType::kStatus) == pb::LogCollection::STATUS);
  assert(ToWireLogType(LogType::kString) == pb::LogCollection::RESULT);
  assert(ToWireLogType(LogType::kSnapshot) == pb::LogCollection::RESULT);
  assert(ToWireLogType(LogType::kHealth) == pb::LogCollection::AGENT);
  assert(ToWireLogType(LogType::kInit) == pb::LogCollection::AGENT);
  assert(ToWireLogType(LogType::kAgent) == pb::LogCollection::AGENT);
  assert(ToWireLogType(static_cast<LogType>(42)) == pb::LogCollection::AGENT);
}

void TestDecodeFromWire() {
  assert(FromWireLogType(pb::LogCollection::STATUS) == LogType::kStatus);
  assert(FromWireLogType(pb::LogCollection::RESULT) == LogType::kSnapshot);

  bool threw = false;
  try {
    (void)FromWireLogType(pb::LogCollection::AGENT);
  } catch (const launcher::util::DecodeError& e) {
    threw = std::string(e.what()) == "logType 2 not implemented";
  }
  assert(threw && "AGENT has no decode mapping.");
}

void TestStringLogsComeBackAsSnapshot() {
  launcher::service::LogCollection request{"node", LogType::kString, {"a", "b"}};

  const auto wire    = launcher::grpc::EncodeLogCollection(request);
  const auto decoded = launcher::grpc::DecodeLogCollection(wire);

  assert(decoded.log_type == LogType::kSnapshot);
  assert(decoded.logs.size() == 2 && decoded.logs[1] == "b");
}

void TestServerRejectsAgentLogs() {
  launcher::service::LogCollection request{"node", LogType::kInit, {"x"}};
  const auto                       wire = launcher::grpc::EncodeLogCollection(request);
  assert(wire.log_type() == pb::LogCollection::AGENT);

  bool threw = false;
  try {
    (void)launcher::grpc::DecodeLogCollection(wire);
  } catch (const launcher::util::DecodeError&) {
    threw = true;
  }
  assert(threw);
}

void TestJsonRpcKeepsFullLogType() {
  for (auto type : {LogType::kString, LogType::kSnapshot, LogType::kHealth, LogType::kInit, LogType::kStatus,
                    LogType::kAgent}) {
    const auto params = launcher::jsonrpc::EncodeLogParams({"node", type, {"line"}});
    assert(params.log_type() == static_cast<int>(type));
    assert(launcher::jsonrpc::DecodeLogParams(params).log_type == type);
  }
}

} // namespace

int main() {
  TestEncodeToWire();
  TestDecodeFromWire();
  TestStringLogsComeBackAsSnapshot();
  TestServerRejectsAgentLogs();
  TestJsonRpcKeepsFullLogType();

  std::cout << "launcher_unit_log_type_codec: pass\n";
  return 0;
}
