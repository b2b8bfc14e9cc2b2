#include "uuid_middleware.hpp"

#include "internal/service/logging_middleware.hpp"
#include "internal/util/uuid.hpp"

namespace launcher::service {

namespace {

CallContext WithRequestId(const CallContext& ctx) {
  return ctx.WithCorrelationId(util::NewCorrelationId());
}

} // namespace

UuidMiddleware::UuidMiddleware(std::shared_ptr<KolideService> next) : next_(std::move(next)) {
}

EnrollmentResult UuidMiddleware::RequestEnrollment(const CallContext& ctx, const std::string& enroll_secret,
                                                   const std::string& host_identifier,
                                                   const EnrollmentDetails& details) {
  return next_->RequestEnrollment(WithRequestId(ctx), enroll_secret, host_identifier, details);
}

ConfigResult UuidMiddleware::RequestConfig(const CallContext& ctx, const std::string& node_key) {
  return next_->RequestConfig(WithRequestId(ctx), node_key);
}

PublishResult UuidMiddleware::PublishLogs(const CallContext& ctx, const std::string& node_key, LogType log_type,
                                          const std::vector<std::string>& logs) {
  return next_->PublishLogs(WithRequestId(ctx), node_key, log_type, logs);
}

QueriesResult UuidMiddleware::RequestQueries(const CallContext& ctx, const std::string& node_key) {
  return next_->RequestQueries(WithRequestId(ctx), node_key);
}

PublishResult UuidMiddleware::PublishResults(const CallContext& ctx, const std::string& node_key,
                                             const std::vector<DistributedResult>& results) {
  return next_->PublishResults(WithRequestId(ctx), node_key, results);
}

HealthStatus UuidMiddleware::CheckHealth(const CallContext& ctx) {
  return next_->CheckHealth(WithRequestId(ctx));
}

std::shared_ptr<KolideService> WithMiddleware(std::shared_ptr<KolideService> base) {
  auto logged = std::make_shared<LoggingMiddleware>(std::move(base));
  return std::make_shared<UuidMiddleware>(std::move(logged));
}

} // namespace launcher::service
