#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>

#include "internal/config/flags.hpp"
#include "internal/service/kolide_service.hpp"

namespace launcher::service {

// Every call is bounded by this on top of the caller's own deadline.
inline constexpr std::chrono::seconds kRequestTimeout{60};

template <typename Request, typename Result>
using Endpoint = std::function<Envelope<Result>(const CallContext&, const Request&)>;

// One binding per operation, all pointing at the same server.
struct EndpointSet {
  Endpoint<EnrollmentRequest, EnrollmentResult> request_enrollment;
  Endpoint<NodeKeyRequest, ConfigResult>        request_config;
  Endpoint<LogCollection, PublishResult>        publish_logs;
  Endpoint<NodeKeyRequest, QueriesResult>       request_queries;
  Endpoint<ResultCollection, PublishResult>     publish_results;
  Endpoint<HealthCheckRequest, HealthStatus>    check_health;
};

// Builds the six bindings for a server URL. Must not perform network I/O.
// The factory owns the transport handle, so every set it builds shares it.
using EndpointFactory = std::function<EndpointSet(const std::string& server_url)>;

/*
  Endpoints

  The live binding of the six operations to a transport. Accessors copy the
  binding they need under the read lock and release it before any network
  I/O. A server URL change builds a complete new set outside the lock and
  swaps it in under the write lock, so a caller never sees a mix of old and
  new bindings and in-flight calls keep their original target.
*/
class Endpoints final : public KolideService, public config::FlagsChangeObserver {
 public:
  Endpoints(std::shared_ptr<config::Flags> flags, EndpointFactory factory);
  ~Endpoints() override;

  Endpoints(const Endpoints&)            = delete;
  Endpoints& operator=(const Endpoints&) = delete;

  EnrollmentResult RequestEnrollment(const CallContext& ctx, const std::string& enroll_secret,
                                     const std::string& host_identifier, const EnrollmentDetails& details) override;
  ConfigResult     RequestConfig(const CallContext& ctx, const std::string& node_key) override;
  PublishResult    PublishLogs(const CallContext& ctx, const std::string& node_key, LogType log_type,
                               const std::vector<std::string>& logs) override;
  QueriesResult    RequestQueries(const CallContext& ctx, const std::string& node_key) override;
  PublishResult    PublishResults(const CallContext& ctx, const std::string& node_key,
                                  const std::vector<DistributedResult>& results) override;
  HealthStatus     CheckHealth(const CallContext& ctx) override;

  void FlagsChanged(const std::vector<config::FlagKey>& changed) override;

 private:
  template <typename Binding>
  Binding Snapshot(Binding EndpointSet::*member) const {
    std::shared_lock lock(mutex_);
    return endpoints_.*member;
  }

  std::shared_ptr<config::Flags> flags_;
  EndpointFactory                factory_;

  // Held across reading the URL, building and swapping, so the installed set
  // always matches the most recent URL.
  std::mutex rebuild_mutex_;

  mutable std::shared_mutex mutex_;
  EndpointSet               endpoints_;
};

} // namespace launcher::service
