#include "memory_service.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace launcher::devserver {

using service::CallContext;

MemoryService::MemoryService(const launcher::runtime::config::DevServerConfig& config)
    : enroll_secret_(config.enroll_secret()),
      config_json_(config.config_json().empty() ? "{}" : config.config_json()),
      disable_device_(config.disable_device()) {
  for (const auto& entry : config.queries()) {
    queries_[entry.first] = entry.second;
  }
}

void MemoryService::Begin(const CallContext& ctx) {
  last_correlation_id_ = ctx.correlation_id();
  if (disable_device_) {
    throw util::DeviceDisabled();
  }
}

void MemoryService::RequireNode(const std::string& node_key) const {
  if (nodes_.find(node_key) == nodes_.end()) {
    throw util::NodeInvalid("unknown node key");
  }
}

service::EnrollmentResult MemoryService::RequestEnrollment(const CallContext& ctx, const std::string& enroll_secret,
                                                           const std::string&                host_identifier,
                                                           const service::EnrollmentDetails& details) {
  std::lock_guard lock(mutex_);
  Begin(ctx);

  if (!enroll_secret_.empty() && enroll_secret != enroll_secret_) {
    LAUNCHER_LOG_INFO("enrollment rejected", {observability::StringField("host_identifier", host_identifier)});
    return {"", true};
  }

  const std::string node_key = util::ToString(util::GenerateUUID());
  nodes_[node_key]           = Node{host_identifier, details};

  LAUNCHER_LOG_INFO("node enrolled", {observability::StringField("host_identifier", host_identifier),
                                      observability::StringField("hostname", details.hostname)});
  return {node_key, false};
}

service::ConfigResult MemoryService::RequestConfig(const CallContext& ctx, const std::string& node_key) {
  std::lock_guard lock(mutex_);
  Begin(ctx);
  RequireNode(node_key);
  return {config_json_, false};
}

service::PublishResult MemoryService::PublishLogs(const CallContext& ctx, const std::string& node_key,
                                                  service::LogType log_type, const std::vector<std::string>& logs) {
  std::lock_guard lock(mutex_);
  Begin(ctx);
  RequireNode(node_key);
  logs_[log_type] += logs.size();
  return {};
}

service::QueriesResult MemoryService::RequestQueries(const CallContext& ctx, const std::string& node_key) {
  std::lock_guard lock(mutex_);
  Begin(ctx);
  RequireNode(node_key);

  service::QueriesResult result;
  result.queries.queries = queries_;
  return result;
}

service::PublishResult MemoryService::PublishResults(const CallContext& ctx, const std::string& node_key,
                                                     const std::vector<service::DistributedResult>& results) {
  std::lock_guard lock(mutex_);
  Begin(ctx);
  RequireNode(node_key);

  results_ += results.size();
  for (const auto& result : results) {
    queries_.erase(result.query_name);
  }
  return {};
}

service::HealthStatus MemoryService::CheckHealth(const CallContext& ctx) {
  std::lock_guard lock(mutex_);
  Begin(ctx);
  return service::HealthStatus::kServing;
}

void MemoryService::SetDisableDevice(bool disabled) {
  std::lock_guard lock(mutex_);
  disable_device_ = disabled;
}

bool MemoryService::DisableDevice() const {
  std::lock_guard lock(mutex_);
  return disable_device_;
}

void MemoryService::SetConfig(std::string config_json) {
  std::lock_guard lock(mutex_);
  config_json_ = std::move(config_json);
}

void MemoryService::SetQueries(std::map<std::string, std::string> queries) {
  std::lock_guard lock(mutex_);
  queries_ = std::move(queries);
}

size_t MemoryService::LogCount(service::LogType type) const {
  std::lock_guard lock(mutex_);
  auto            it = logs_.find(type);
  return it == logs_.end() ? 0 : it->second;
}

size_t MemoryService::ResultCount() const {
  std::lock_guard lock(mutex_);
  return results_;
}

size_t MemoryService::EnrolledCount() const {
  std::lock_guard lock(mutex_);
  return nodes_.size();
}

std::string MemoryService::LastCorrelationId() const {
  std::lock_guard lock(mutex_);
  return last_correlation_id_;
}

service::EnrollmentDetails MemoryService::DetailsFor(const std::string& node_key) const {
  std::lock_guard lock(mutex_);
  auto            it = nodes_.find(node_key);
  if (it == nodes_.end()) {
    throw util::NodeInvalid("unknown node key");
  }
  return it->second.details;
}

} // namespace launcher::devserver
