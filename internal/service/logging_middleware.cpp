#include "logging_middleware.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <string_view>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace launcher::service {

namespace {

using observability::BoolField;
using observability::DurationField;
using observability::IntField;
using observability::LogField;
using observability::StringField;

class CallLog {
 public:
  CallLog(const char* method, const CallContext& ctx, const LoggingMiddleware::NowFn& now, std::vector<LogField> request)
      : method_(method), ctx_(ctx), now_(now), begin_(now()), fields_(std::move(request)) {
  }

  void Success(std::initializer_list<LogField> result, std::string_view message = "rpc call") {
    const auto took = util::TimeBucket(now_() - begin_);
    auto       fields = Header();
    fields.insert(fields.end(), result.begin(), result.end());
    fields.push_back(DurationField("took", took));
    observability::Log(spdlog::level::debug, message, fields);
  }

  void Failure(const std::exception& e, std::string_view message = "rpc call failed") {
    const auto took   = now_() - begin_;
    auto       fields = Header();
    fields.push_back(StringField("err", e.what()));
    fields.push_back(BoolField("temporary", util::IsTemporary(e)));
    fields.push_back(DurationField("took", took));

    const bool expected = util::IsTransportError(e) || dynamic_cast<const util::DeviceDisabled*>(&e) != nullptr;
    observability::Log(expected ? spdlog::level::warn : spdlog::level::err, message, fields);
  }

 private:
  std::vector<LogField> Header() const {
    std::vector<LogField> fields{StringField("method", method_), StringField("uuid", ctx_.correlation_id())};
    fields.insert(fields.end(), fields_.begin(), fields_.end());
    return fields;
  }

  const char*                         method_;
  const CallContext&                  ctx_;
  const LoggingMiddleware::NowFn&     now_;
  util::TimePoint                     begin_;
  std::vector<LogField>               fields_;
};

constexpr size_t  kResultsLogLimit      = 200;
constexpr int64_t kLongRunningWallTimeMs = 5000;

// Results in the JSON shape servers receive them in.
std::string ResultsJson(const std::vector<DistributedResult>& results) {
  google::protobuf::ListValue list;
  for (const auto& result : results) {
    auto& fields = *list.add_values()->mutable_struct_value()->mutable_fields();
    fields["query_name"].set_string_value(result.query_name);
    fields["status"].set_number_value(result.status);

    auto* rows = fields["rows"].mutable_list_value();
    for (const auto& row : result.rows) {
      auto& columns = *rows->add_values()->mutable_struct_value()->mutable_fields();
      for (const auto& [column, value] : row) {
        columns[column].set_string_value(value);
      }
    }

    if (result.stats) {
      auto& stats = *fields["stats"].mutable_struct_value()->mutable_fields();
      stats["wall_time_ms"].set_number_value(static_cast<double>(result.stats->wall_time_ms));
      stats["user_time"].set_number_value(static_cast<double>(result.stats->user_time));
      stats["system_time"].set_number_value(static_cast<double>(result.stats->system_time));
      stats["memory"].set_number_value(static_cast<double>(result.stats->memory));
    }
    fields["message"].set_string_value(result.message);
  }

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(list, &json);
  if (!status.ok()) {
    return "unprintable results: " + std::string(status.message());
  }
  return json;
}

std::string Truncate(const std::string& text, size_t limit) {
  if (text.size() <= limit) {
    return text;
  }
  return text.substr(0, limit) + "...";
}

void LogQueryStats(const CallContext& ctx, const std::vector<DistributedResult>& results) {
  for (const auto& result : results) {
    if (!result.stats) {
      continue;
    }
    const auto& stats = *result.stats;
    LAUNCHER_LOG_INFO("received distributed query stats",
                      {StringField("uuid", ctx.correlation_id()), StringField("query_name", result.query_name),
                       IntField("query_status", result.status), IntField("wall_time_ms", stats.wall_time_ms),
                       IntField("user_time", stats.user_time), IntField("system_time", stats.system_time),
                       IntField("memory", stats.memory),
                       BoolField("long_running", stats.wall_time_ms > kLongRunningWallTimeMs)});
  }
}

size_t CountRows(const std::vector<DistributedResult>& results) {
  size_t rows = 0;
  for (const auto& result : results) {
    rows += result.rows.size();
  }
  return rows;
}

size_t TotalSize(const std::vector<std::string>& logs) {
  size_t bytes = 0;
  for (const auto& log : logs) {
    bytes += log.size();
  }
  return bytes;
}

} // namespace

LoggingMiddleware::LoggingMiddleware(std::shared_ptr<KolideService> next, NowFn now)
    : next_(std::move(next)), now_(std::move(now)) {
}

EnrollmentResult LoggingMiddleware::RequestEnrollment(const CallContext& ctx, const std::string& enroll_secret,
                                                      const std::string& host_identifier,
                                                      const EnrollmentDetails& details) {
  CallLog log("RequestEnrollment", ctx, now_,
              {StringField("host_identifier", host_identifier), StringField("hostname", details.hostname),
               StringField("launcher_version", details.launcher_version)});
  try {
    auto result = next_->RequestEnrollment(ctx, enroll_secret, host_identifier, details);
    log.Success({BoolField("reauth", result.node_invalid)});
    return result;
  } catch (const std::exception& e) {
    log.Failure(e);
    throw;
  }
}

ConfigResult LoggingMiddleware::RequestConfig(const CallContext& ctx, const std::string& node_key) {
  CallLog log("RequestConfig", ctx, now_, {});
  try {
    auto result = next_->RequestConfig(ctx, node_key);
    log.Success({IntField("config_size", static_cast<int64_t>(result.config.size())),
                 BoolField("reauth", result.node_invalid)});
    return result;
  } catch (const std::exception& e) {
    log.Failure(e);
    throw;
  }
}

PublishResult LoggingMiddleware::PublishLogs(const CallContext& ctx, const std::string& node_key, LogType log_type,
                                             const std::vector<std::string>& logs) {
  CallLog log("PublishLogs", ctx, now_,
              {StringField("log_type", ToString(log_type)), IntField("log_count", static_cast<int64_t>(logs.size())),
               IntField("log_bytes", static_cast<int64_t>(TotalSize(logs)))});
  try {
    auto result = next_->PublishLogs(ctx, node_key, log_type, logs);
    log.Success({StringField("message", result.message), StringField("errcode", result.error_code),
                 BoolField("reauth", result.node_invalid)});
    return result;
  } catch (const std::exception& e) {
    log.Failure(e);
    throw;
  }
}

QueriesResult LoggingMiddleware::RequestQueries(const CallContext& ctx, const std::string& node_key) {
  CallLog log("RequestQueries", ctx, now_, {});
  try {
    auto result = next_->RequestQueries(ctx, node_key);
    log.Success({IntField("query_count", static_cast<int64_t>(result.queries.queries.size())),
                 IntField("discovery_count", static_cast<int64_t>(result.queries.discovery.size())),
                 BoolField("reauth", result.node_invalid)});
    return result;
  } catch (const std::exception& e) {
    log.Failure(e);
    throw;
  }
}

PublishResult LoggingMiddleware::PublishResults(const CallContext& ctx, const std::string& node_key,
                                                const std::vector<DistributedResult>& results) {
  const auto json = ResultsJson(results);
  CallLog    log("PublishResults", ctx, now_,
                 {StringField("results_truncated", Truncate(json, kResultsLogLimit)),
                  IntField("result_count", static_cast<int64_t>(results.size())),
                  IntField("result_size", static_cast<int64_t>(json.size())),
                  IntField("row_count", static_cast<int64_t>(CountRows(results)))});
  try {
    auto result = next_->PublishResults(ctx, node_key, results);
    log.Success({StringField("errcode", result.error_code), BoolField("reauth", result.node_invalid)},
                result.message.empty() ? "success" : result.message);
    LogQueryStats(ctx, results);
    return result;
  } catch (const std::exception& e) {
    log.Failure(e, "failure publishing results");
    LogQueryStats(ctx, results);
    throw;
  }
}

HealthStatus LoggingMiddleware::CheckHealth(const CallContext& ctx) {
  CallLog log("CheckHealth", ctx, now_, {});
  try {
    auto status = next_->CheckHealth(ctx);
    log.Success({StringField("status", ToString(status))});
    return status;
  } catch (const std::exception& e) {
    log.Failure(e);
    throw;
  }
}

} // namespace launcher::service
