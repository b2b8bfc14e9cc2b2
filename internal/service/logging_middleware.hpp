#pragma once

#include <functional>
#include <memory>

#include "internal/service/kolide_service.hpp"
#include "internal/util/time.hpp"

namespace launcher::service {

/*
  LoggingMiddleware

  Logs one record per call: method, correlation id, request shape, result and
  elapsed time. Successful calls log at debug with a bucketed elapsed time so
  identical calls aggregate. Failures log the exact elapsed time at warn
  (transport errors, device disabled) or error (everything else). Secrets and
  raw payloads are never logged.
*/
class LoggingMiddleware final : public KolideService {
 public:
  using NowFn = std::function<util::TimePoint()>;

  explicit LoggingMiddleware(std::shared_ptr<KolideService> next, NowFn now = util::Now);

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
  NowFn                          now_;
};

} // namespace launcher::service
