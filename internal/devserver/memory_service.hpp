#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/service/kolide_service.hpp"

namespace launcher::devserver {

/*
  MemoryService

  In-memory management service used by kolide-devserver and the integration
  tests. Enrollment requires the configured secret (any secret when none is
  configured) and issues random node keys. Every other call requires a known
  node key and throws util::NodeInvalid otherwise. With disable_device set,
  every call throws util::DeviceDisabled.
*/
class MemoryService final : public service::KolideService {
 public:
  explicit MemoryService(const launcher::runtime::config::DevServerConfig& config);

  service::EnrollmentResult RequestEnrollment(const service::CallContext& ctx, const std::string& enroll_secret,
                                              const std::string&                host_identifier,
                                              const service::EnrollmentDetails& details) override;
  service::ConfigResult     RequestConfig(const service::CallContext& ctx, const std::string& node_key) override;
  service::PublishResult    PublishLogs(const service::CallContext& ctx, const std::string& node_key,
                                        service::LogType log_type, const std::vector<std::string>& logs) override;
  service::QueriesResult    RequestQueries(const service::CallContext& ctx, const std::string& node_key) override;
  service::PublishResult    PublishResults(const service::CallContext& ctx, const std::string& node_key,
                                           const std::vector<service::DistributedResult>& results) override;
  service::HealthStatus     CheckHealth(const service::CallContext& ctx) override;

  void SetDisableDevice(bool disabled);
  bool DisableDevice() const;
  void SetConfig(std::string config_json);
  void SetQueries(std::map<std::string, std::string> queries);

  size_t LogCount(service::LogType type) const;
  size_t ResultCount() const;
  size_t EnrolledCount() const;

  // Correlation id of the most recent call, empty when none was sent.
  std::string LastCorrelationId() const;

  // Host details recorded at enrollment.
  service::EnrollmentDetails DetailsFor(const std::string& node_key) const;

 private:
  struct Node {
    std::string                host_identifier;
    service::EnrollmentDetails details;
  };

  // Both expect mutex_ held.
  void Begin(const service::CallContext& ctx);
  void RequireNode(const std::string& node_key) const;

  mutable std::mutex mutex_;

  std::string                        enroll_secret_;
  std::string                        config_json_;
  std::map<std::string, std::string> queries_;
  bool                               disable_device_{false};

  std::map<std::string, Node>        nodes_;
  std::map<service::LogType, size_t> logs_;
  size_t                             results_{0};
  std::string                        last_correlation_id_;
};

} // namespace launcher::devserver
