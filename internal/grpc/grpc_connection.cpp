#include "grpc_connection.hpp"

#include <grpcpp/security/tls_certificate_verifier.h>
#include <grpcpp/security/tls_credentials_options.h>

#include "internal/grpc/grpc_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace launcher::grpc {

namespace {

/*
  Runs the agent's own certificate checks (hostname, chain, pins) inside the
  gRPC handshake. Core verification is disabled so this is the single source
  of truth for both transports.
*/
class PinnedCertificateVerifier final : public ::grpc::experimental::ExternalCertificateVerifier {
 public:
  PinnedCertificateVerifier(std::shared_ptr<const tls::HandshakeVerifier> verifier,
                            std::shared_ptr<HandshakeRecorder>            recorder)
      : verifier_(std::move(verifier)), recorder_(std::move(recorder)) {
  }

  bool Verify(::grpc::experimental::TlsCustomVerificationCheckRequest* request,
              std::function<void(::grpc::Status)>, ::grpc::Status* sync_status) override {
    try {
      auto chain_pem = request->peer_cert_full_chain();
      if (chain_pem.empty()) {
        chain_pem = request->peer_cert();
      }
      const auto peer = tls::PeerCertificates::FromPem(std::string_view(chain_pem.data(), chain_pem.size()));

      verifier_->ClientHandshake(peer);
      recorder_->Clear();
      *sync_status = ::grpc::Status::OK;
    } catch (const std::exception& e) {
      LAUNCHER_LOG_WARN("tls handshake rejected",
                        {observability::StringField("target", std::string(request->target_name().data(),
                                                                          request->target_name().size())),
                         observability::StringField("err", e.what())});
      recorder_->Record(std::current_exception());
      *sync_status = ::grpc::Status(::grpc::StatusCode::UNAUTHENTICATED, e.what());
    }
    return true;
  }

  void Cancel(::grpc::experimental::TlsCustomVerificationCheckRequest*) override {
  }

 private:
  std::shared_ptr<const tls::HandshakeVerifier> verifier_;
  std::shared_ptr<HandshakeRecorder>            recorder_;
};

} // namespace

void HandshakeRecorder::Record(std::exception_ptr error) {
  std::lock_guard lock(mutex_);
  last_ = std::move(error);
}

void HandshakeRecorder::Clear() {
  std::lock_guard lock(mutex_);
  last_ = nullptr;
}

std::exception_ptr HandshakeRecorder::Last() const {
  std::lock_guard lock(mutex_);
  return last_;
}

std::string HostFromTarget(const std::string& target) {
  if (!target.empty() && target.front() == '[') {
    const auto close = target.find(']');
    if (close != std::string::npos) {
      return target.substr(1, close - 1);
    }
  }
  const auto colon = target.rfind(':');
  if (colon == std::string::npos || target.find(':') != colon) {
    return target;
  }
  return target.substr(0, colon);
}

void ThrowCallError(const HandshakeRecorder& recorder, const ::grpc::Status& status) {
  if (status.error_code() == ::grpc::StatusCode::UNAVAILABLE) {
    if (auto handshake_error = recorder.Last()) {
      std::rethrow_exception(handshake_error);
    }
  }
  ThrowStatus(status);
}

GrpcConnection::GrpcConnection(DialOptions options) : options_(std::move(options)) {
}

std::shared_ptr<::grpc::ChannelCredentials> GrpcConnection::Credentials(
    const std::string& target, const std::shared_ptr<HandshakeRecorder>& recorder) const {
  if (options_.insecure_transport) {
    return ::grpc::InsecureChannelCredentials();
  }

  auto tls_config = tls::MakeTlsConfig(HostFromTarget(target), options_.insecure_tls, options_.cert_pins,
                                       options_.root_pool);

  ::grpc::experimental::TlsChannelCredentialsOptions tls_options;
  tls_options.set_verify_server_certs(false);
  tls_options.set_check_call_host(false);
  tls_options.set_certificate_verifier(::grpc::experimental::ExternalCertificateVerifier::Create<PinnedCertificateVerifier>(
      tls::NewTlsCreds(std::move(tls_config)), recorder));

  return ::grpc::experimental::TlsCredentials(tls_options);
}

std::shared_ptr<::grpc::Channel> GrpcConnection::Channel(const std::string& target) {
  std::lock_guard lock(mutex_);
  return Open(target).channel;
}

std::shared_ptr<HandshakeRecorder> GrpcConnection::Recorder(const std::string& target) {
  std::lock_guard lock(mutex_);
  return Open(target).recorder;
}

// Requires mutex_.
const GrpcConnection::Target& GrpcConnection::Open(const std::string& target) {
  auto it = targets_.find(target);
  if (it != targets_.end()) {
    return it->second;
  }

  ::grpc::ChannelArguments args;
  args.SetInt(GRPC_ARG_INITIAL_RECONNECT_BACKOFF_MS, static_cast<int>(options_.min_reconnect_backoff.count()));
  args.SetInt(GRPC_ARG_MIN_RECONNECT_BACKOFF_MS, static_cast<int>(options_.min_reconnect_backoff.count()));
  args.SetInt(GRPC_ARG_MAX_RECONNECT_BACKOFF_MS, static_cast<int>(options_.max_reconnect_backoff.count()));

  auto recorder = std::make_shared<HandshakeRecorder>();
  auto channel  = ::grpc::CreateCustomChannel(target, Credentials(target, recorder), args);
  const auto& opened = targets_.emplace(target, Target{std::move(channel), std::move(recorder)}).first->second;

  LAUNCHER_LOG_DEBUG("grpc channel created", {observability::StringField("target", target),
                                              observability::BoolField("insecure_transport", options_.insecure_transport),
                                              observability::BoolField("insecure_tls", options_.insecure_tls),
                                              observability::IntField("cert_pins", static_cast<int64_t>(options_.cert_pins.size()))});
  return opened;
}

std::shared_ptr<GrpcConnection> DialGRPC(const std::string& server_url, DialOptions options) {
  LAUNCHER_LOG_INFO("dialing grpc server", {observability::StringField("server", server_url),
                                            observability::BoolField("tls_secure", !options.insecure_tls),
                                            observability::BoolField("transport_secure", !options.insecure_transport),
                                            observability::IntField("cert_pins", static_cast<int64_t>(options.cert_pins.size()))});

  auto connection = std::make_shared<GrpcConnection>(std::move(options));
  connection->Channel(server_url);
  return connection;
}

} // namespace launcher::grpc
