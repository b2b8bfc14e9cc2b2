#pragma once

#include <memory>

#include "internal/service/kolide_service.hpp"

namespace launcher::service {

// Gives every call a fresh correlation id before it reaches the next layer.
class UuidMiddleware final : public KolideService {
 public:
  explicit UuidMiddleware(std::shared_ptr<KolideService> next);

  EnrollmentResult RequestEnrollment(const CallContext& ctx, const std::string& enroll_secret,
                                     const std::string& host_identifier, const EnrollmentDetails& details) override;
  ConfigResult     RequestConfig(const CallContext& ctx, const std::string& node_key) override;
  PublishResult    PublishLogs(const CallContext& ctx, const std::string& node_key, LogType log_type,
                               const std::vector<std::string>& logs) override;
  QueriesResult    RequestQueries(const CallContext& ctx, const std::string& node_key) override;
  PublishResult    PublishResults(const CallContext& ctx, const std::string& node_key,
                                  const std::vector<DistributedResult>& results) override;
  HealthStatus     CheckHealth(const CallContext& ctx) override;

 private:
  std::shared_ptr<KolideService> next_;
};

// Wraps a base client in the fixed middleware order: logging innermost,
// correlation outermost, so the logger sees the injected id.
std::shared_ptr<KolideService> WithMiddleware(std::shared_ptr<KolideService> base);

} // namespace launcher::service
