#include "endpoints.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace launcher::service {

namespace {

// The kill switch wins over node_invalid and the payload of the same response.
template <typename Result>
Result CheckDisabled(Envelope<Result> response) {
  if (response.disable_device) {
    throw util::DeviceDisabled();
  }
  return std::move(response.result);
}

} // namespace

Endpoints::Endpoints(std::shared_ptr<config::Flags> flags, EndpointFactory factory)
    : flags_(std::move(flags)), factory_(std::move(factory)), endpoints_(factory_(flags_->KolideServerURL())) {
  flags_->RegisterChangeObserver(this, {config::FlagKey::kKolideServerURL});
}

Endpoints::~Endpoints() {
  flags_->DeregisterChangeObserver(this);
}

EnrollmentResult Endpoints::RequestEnrollment(const CallContext& ctx, const std::string& enroll_secret,
                                              const std::string& host_identifier, const EnrollmentDetails& details) {
  const auto call_ctx = ctx.WithTimeout(kRequestTimeout);
  const auto endpoint = Snapshot(&EndpointSet::request_enrollment);

  EnrollmentRequest request{enroll_secret, host_identifier, details};
  return CheckDisabled(endpoint(call_ctx, request));
}

ConfigResult Endpoints::RequestConfig(const CallContext& ctx, const std::string& node_key) {
  const auto call_ctx = ctx.WithTimeout(kRequestTimeout);
  const auto endpoint = Snapshot(&EndpointSet::request_config);

  return CheckDisabled(endpoint(call_ctx, NodeKeyRequest{node_key}));
}

PublishResult Endpoints::PublishLogs(const CallContext& ctx, const std::string& node_key, LogType log_type,
                                     const std::vector<std::string>& logs) {
  const auto call_ctx = ctx.WithTimeout(kRequestTimeout);
  const auto endpoint = Snapshot(&EndpointSet::publish_logs);

  return CheckDisabled(endpoint(call_ctx, LogCollection{node_key, log_type, logs}));
}

QueriesResult Endpoints::RequestQueries(const CallContext& ctx, const std::string& node_key) {
  const auto call_ctx = ctx.WithTimeout(kRequestTimeout);
  const auto endpoint = Snapshot(&EndpointSet::request_queries);

  return CheckDisabled(endpoint(call_ctx, NodeKeyRequest{node_key}));
}

PublishResult Endpoints::PublishResults(const CallContext& ctx, const std::string& node_key,
                                        const std::vector<DistributedResult>& results) {
  const auto call_ctx = ctx.WithTimeout(kRequestTimeout);
  const auto endpoint = Snapshot(&EndpointSet::publish_results);

  return CheckDisabled(endpoint(call_ctx, ResultCollection{node_key, results}));
}

HealthStatus Endpoints::CheckHealth(const CallContext& ctx) {
  const auto call_ctx = ctx.WithTimeout(kRequestTimeout);
  const auto endpoint = Snapshot(&EndpointSet::check_health);

  return CheckDisabled(endpoint(call_ctx, HealthCheckRequest{}));
}

void Endpoints::FlagsChanged(const std::vector<config::FlagKey>& changed) {
  if (std::find(changed.begin(), changed.end(), config::FlagKey::kKolideServerURL) == changed.end()) {
    return;
  }

  std::lock_guard rebuild(rebuild_mutex_);
  const auto      server_url = flags_->KolideServerURL();

  EndpointSet rebuilt;
  try {
    rebuilt = factory_(server_url);
  } catch (const std::exception& e) {
    LAUNCHER_LOG_ERROR("rebuilding endpoints failed, keeping previous server",
                       {observability::StringField("server_url", server_url), observability::StringField("err", e.what())});
    return;
  }

  {
    std::unique_lock lock(mutex_);
    std::swap(endpoints_, rebuilt);
  }
  // The previous set is released here, outside the lock.

  LAUNCHER_LOG_INFO("endpoints rebuilt", {observability::StringField("server_url", server_url)});
}

} // namespace launcher::service
