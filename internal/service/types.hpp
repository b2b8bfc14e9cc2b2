#pragma once

#include <cstdint>
#include <exception>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace launcher::service {

// Mirrors the osquery logger plugin log types.
enum class LogType : int {
  kString   = 0,
  kSnapshot = 1,
  kHealth   = 2,
  kInit     = 3,
  kStatus   = 4,
  kAgent    = 5,
};

std::string_view ToString(LogType type);

// Wire values are fixed.
enum class HealthStatus : int32_t {
  kUnknown    = 0,
  kServing    = 1,
  kNotServing = 2,
};

std::string_view ToString(HealthStatus status);

// Host identity sent once at enrollment.
struct EnrollmentDetails {
  std::string os_version;
  std::string os_build;
  std::string os_platform;
  std::string os_name;
  std::string os_platform_like;
  std::string hostname;
  std::string hardware_vendor;
  std::string hardware_model;
  std::string hardware_serial;
  std::string osquery_version;
  std::string launcher_version;

  bool operator==(const EnrollmentDetails&) const = default;
};

struct EnrollmentRequest {
  std::string       enroll_secret;
  std::string       host_identifier;
  EnrollmentDetails details;
};

struct NodeKeyRequest {
  std::string node_key;
};

struct LogCollection {
  std::string              node_key;
  LogType                  log_type{LogType::kString};
  std::vector<std::string> logs;
};

struct QueryStats {
  int64_t wall_time_ms{0};
  int64_t user_time{0};
  int64_t system_time{0};
  int64_t memory{0};
};

using ResultRow = std::map<std::string, std::string>;

struct DistributedResult {
  std::string               query_name;
  int                       status{0};
  std::vector<ResultRow>    rows;
  std::optional<QueryStats> stats;
  std::string               message;
};

struct ResultCollection {
  std::string                    node_key;
  std::vector<DistributedResult> results;
};

struct HealthCheckRequest {};

struct EnrollmentResult {
  std::string node_key;
  bool        node_invalid{false};
};

struct ConfigResult {
  std::string config;
  bool        node_invalid{false};
};

struct PublishResult {
  std::string message;
  std::string error_code;
  bool        node_invalid{false};
};

struct QueryCollection {
  std::map<std::string, std::string> queries;
  std::map<std::string, std::string> discovery;
};

struct QueriesResult {
  QueryCollection queries;
  bool            node_invalid{false};
};

// True for a rejected node key on either transport: util::NodeInvalid, gRPC
// UNAUTHENTICATED or JSON-RPC -32001.
bool IsNodeInvalidError(const std::exception& e);

// A decoded response before the device-disable check.
template <typename T>
struct Envelope {
  T    result{};
  bool disable_device{false};
};

} // namespace launcher::service
