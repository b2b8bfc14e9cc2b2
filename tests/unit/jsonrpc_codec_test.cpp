#include "internal/jsonrpc/jsonrpc_codec.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

namespace jsonrpc = launcher::jsonrpc;
namespace wire    = launcher::jsonrpc::wire;

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

void TestRequestEnvelope() {
  const auto body = jsonrpc::EncodeRequest("RequestConfig", jsonrpc::EncodeNodeKeyParams({"nk-1"}), "corr-1");

  assert(Contains(body, "\"jsonrpc\":\"2.0\""));
  assert(Contains(body, "\"method\":\"RequestConfig\""));
  assert(Contains(body, "\"params\":{\"node_key\":\"nk-1\"}"));
  assert(Contains(body, "\"id\":\"corr-1\""));
}

void TestDecodeResult() {
  wire::ConfigResult result;
  jsonrpc::DecodeResponse(
      R"({"jsonrpc":"2.0","result":{"config":"{}","node_invalid":true,"disable_device":false,"extra":1},"id":"x"})",
      &result);

  const auto envelope = jsonrpc::DecodeConfigResult(result);
  assert(envelope.result.config == "{}");
  assert(envelope.result.node_invalid);
  assert(!envelope.disable_device);
}

void TestDecodeErrors() {
  wire::ConfigResult result;

  bool node_invalid = false;
  try {
    jsonrpc::DecodeResponse(R"({"jsonrpc":"2.0","error":{"code":-32001,"message":"Node Invalid"},"id":"x"})", &result);
  } catch (const launcher::util::NodeInvalid& e) {
    node_invalid = std::string(e.what()) == "Node Invalid";
  }
  assert(node_invalid);

  bool server_error = false;
  try {
    jsonrpc::DecodeResponse(R"({"jsonrpc":"2.0","error":{"code":-32603,"message":"Server Error"},"id":"x"})", &result);
  } catch (const launcher::util::RpcError& e) {
    server_error = e.code() == jsonrpc::kServerErrorCode && e.protocol() == launcher::util::RpcProtocol::kJsonRpc;
  }
  assert(server_error);

  bool malformed = false;
  try {
    jsonrpc::DecodeResponse("not json", &result);
  } catch (const launcher::util::DecodeError& e) {
    malformed = Contains(e.what(), "couldn't unmarshal body to Response");
  }
  assert(malformed);

  bool missing_result = false;
  try {
    jsonrpc::DecodeResponse(R"({"jsonrpc":"2.0","id":"x"})", &result);
  } catch (const launcher::util::DecodeError& e) {
    missing_result = Contains(e.what(), "couldn't unmarshal body to ConfigResult");
  }
  assert(missing_result);

  bool wrong_shape = false;
  try {
    jsonrpc::DecodeResponse(R"({"jsonrpc":"2.0","result":{"node_invalid":"maybe"},"id":"x"})", &result);
  } catch (const launcher::util::DecodeError&) {
    wrong_shape = true;
  }
  assert(wrong_shape);
}

void TestResultParamsKeepRowsAndStats() {
  launcher::service::DistributedResult result;
  result.query_name = "q1";
  result.status     = 0;
  result.rows       = {{{"pid", "1"}, {"name", "launchd"}}, {{"pid", "2"}, {"name", "kernel_task"}}};
  result.stats      = launcher::service::QueryStats{12, 3, 4, 4096};
  result.message    = "ok";

  const auto params = jsonrpc::EncodeResultParams({"nk", {result}});
  const auto json   = jsonrpc::MessageToJson(params);
  assert(Contains(json, R"("stats":{"wall_time_ms":12,"user_time":3,"system_time":4,"memory":4096})"));

  wire::ResultParams parsed;
  jsonrpc::JsonToMessage(json, &parsed);
  const auto decoded = jsonrpc::DecodeResultParams(parsed);

  assert(decoded.node_key == "nk");
  assert(decoded.results.size() == 1);
  assert(decoded.results[0].rows == result.rows);
  assert(decoded.results[0].stats.has_value());
  assert(decoded.results[0].stats->memory == 4096);
  assert(decoded.results[0].message == "ok");
}

// Key names and spelling match what deployed servers read.
void TestLogParamsWireKeys() {
  const auto params = jsonrpc::EncodeLogParams({"nk", launcher::service::LogType::kStatus, {"a", "b"}});
  assert(jsonrpc::MessageToJson(params) == R"({"node_key":"nk","LogType":4,"Logs":["a","b"]})");

  const auto body = jsonrpc::EncodeRequest("PublishLogs", params, "corr-2");
  assert(Contains(body, R"("LogType":4)"));
  assert(!Contains(body, "log_type"));
}

void TestResultParamsWireKeys() {
  const auto json = jsonrpc::MessageToJson(jsonrpc::EncodeResultParams({"nk", {}}));
  assert(json == R"({"node_key":"nk","Results":[]})");
}

void TestDecodeServerShapedQueries() {
  wire::QueriesResult result;
  jsonrpc::DecodeResponse(R"({"jsonrpc":"2.0","result":{"Queries":{"queries":{"q1":"select 1","q2":"select 2"},)"
                          R"("discovery":{"q2":"select 1 from os_version"}},"node_invalid":false,)"
                          R"("error_code":"","Err":null,"disable_device":false},"id":"x"})",
                          &result);

  const auto envelope = jsonrpc::DecodeQueriesResult(result);
  assert(envelope.result.queries.queries.size() == 2);
  assert(envelope.result.queries.queries.at("q1") == "select 1");
  assert(envelope.result.queries.discovery.at("q2") == "select 1 from os_version");
  assert(!envelope.result.node_invalid);

  const auto json = jsonrpc::MessageToJson(jsonrpc::EncodeQueriesResult(envelope.result));
  assert(Contains(json, R"("Queries":{)"));
}

void TestQueriesIncludeDiscovery() {
  launcher::service::QueriesResult queries;
  queries.queries.queries   = {{"q1", "select 1"}};
  queries.queries.discovery = {{"q1", "select 1 from os_version"}};

  const auto envelope = jsonrpc::DecodeQueriesResult(jsonrpc::EncodeQueriesResult(queries));
  assert(envelope.result.queries.queries == queries.queries.queries);
  assert(envelope.result.queries.discovery == queries.queries.discovery);
  assert(!envelope.disable_device);
}

void TestResponseWithoutIdGetsNull() {
  const auto body = jsonrpc::EncodeErrorResponse(jsonrpc::kDecodeErrorCode, "bad", google::protobuf::Value());
  assert(Contains(body, "\"id\":null"));
  assert(Contains(body, "\"code\":-32000"));
}

} // namespace

int main() {
  TestRequestEnvelope();
  TestDecodeResult();
  TestDecodeErrors();
  TestResultParamsKeepRowsAndStats();
  TestLogParamsWireKeys();
  TestResultParamsWireKeys();
  TestDecodeServerShapedQueries();
  TestQueriesIncludeDiscovery();
  TestResponseWithoutIdGetsNull();

  std::cout << "launcher_unit_jsonrpc_codec: pass\n";
  return 0;
}
