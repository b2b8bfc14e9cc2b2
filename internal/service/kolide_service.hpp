#pragma once

#include <string>
#include <vector>

#include "internal/service/types.hpp"
#include "internal/util/call_context.hpp"

namespace launcher::service {

using util::CallContext;

/*
  KolideService

  The operations an agent performs against the management service. Client
  implementations throw util::DeviceDisabled when the server set the kill
  switch, util::TransportError (and subclasses) for network, TLS and decode
  failures, and util::RpcError / util::NodeInvalid for errors the server
  returned. node_invalid in a result means the agent must re-enroll.

  Server implementations throw util::NodeInvalid and util::DeviceDisabled to
  shape the wire response; anything else is reported as a server error.
*/
class KolideService {
 public:
  virtual ~KolideService() = default;

  virtual EnrollmentResult RequestEnrollment(const CallContext& ctx, const std::string& enroll_secret,
                                             const std::string& host_identifier, const EnrollmentDetails& details) = 0;

  virtual ConfigResult RequestConfig(const CallContext& ctx, const std::string& node_key) = 0;

  virtual PublishResult PublishLogs(const CallContext& ctx, const std::string& node_key, LogType log_type,
                                    const std::vector<std::string>& logs) = 0;

  virtual QueriesResult RequestQueries(const CallContext& ctx, const std::string& node_key) = 0;

  virtual PublishResult PublishResults(const CallContext& ctx, const std::string& node_key,
                                       const std::vector<DistributedResult>& results) = 0;

  virtual HealthStatus CheckHealth(const CallContext& ctx) = 0;
};

} // namespace launcher::service
