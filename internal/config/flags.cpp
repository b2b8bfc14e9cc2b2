#include "flags.hpp"

#include <algorithm>

#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/tls/cert_pins.hpp"
#include "internal/util/errors.hpp"

namespace launcher::config {

namespace {

std::string NormalizeTransport(const std::string& transport) {
  if (transport.empty()) {
    return "grpc";
  }
  if (transport != "grpc" && transport != "jsonrpc") {
    throw util::InvalidArgument("unknown transport: " + transport);
  }
  return transport;
}

} // namespace

const char* ToString(FlagKey key) {
  switch (key) {
    case FlagKey::kKolideServerURL:
      return "kolide_server_url";
    case FlagKey::kTransport:
      return "transport";
    case FlagKey::kInsecureTLS:
      return "insecure_tls";
    case FlagKey::kInsecureTransport:
      return "insecure_transport";
    case FlagKey::kCertPins:
      return "cert_pins";
    case FlagKey::kRootPEM:
      return "root_pem";
  }
  return "unknown";
}

Flags::Flags(const launcher::runtime::config::RuntimeConfig& config)
    : kolide_server_url_(config.server().kolide_server_url()),
      transport_(NormalizeTransport(config.server().transport())),
      insecure_tls_(config.server().insecure_tls()),
      insecure_transport_(config.server().insecure_transport()),
      cert_pins_(tls::ParseCertPins({config.server().cert_pins().begin(), config.server().cert_pins().end()})) {
  if (!config.server().root_pem_path().empty()) {
    root_pem_ = ReadFileContents(config.server().root_pem_path(), "root PEM");
  }
}

std::string Flags::KolideServerURL() const {
  std::shared_lock lock(mutex_);
  return kolide_server_url_;
}

void Flags::SetKolideServerURL(const std::string& url) {
  {
    std::unique_lock lock(mutex_);
    if (kolide_server_url_ == url) {
      return;
    }
    kolide_server_url_ = url;
  }

  LAUNCHER_LOG_INFO("flag changed", {observability::StringField("key", ToString(FlagKey::kKolideServerURL)),
                                     observability::StringField("value", url)});
  Notify(FlagKey::kKolideServerURL);
}

void Flags::RegisterChangeObserver(FlagsChangeObserver* observer, std::initializer_list<FlagKey> keys) {
  std::unique_lock lock(mutex_);
  observers_.push_back({observer, std::vector<FlagKey>(keys)});
}

void Flags::DeregisterChangeObserver(FlagsChangeObserver* observer) {
  std::unique_lock lock(mutex_);
  observers_.erase(std::remove_if(observers_.begin(), observers_.end(),
                                  [observer](const Registration& r) { return r.observer == observer; }),
                   observers_.end());
}

void Flags::Notify(FlagKey key) {
  std::vector<FlagsChangeObserver*> targets;
  {
    std::shared_lock lock(mutex_);
    for (const auto& registration : observers_) {
      if (std::find(registration.keys.begin(), registration.keys.end(), key) != registration.keys.end()) {
        targets.push_back(registration.observer);
      }
    }
  }

  // Called outside the lock so observers may read flags.
  for (auto* observer : targets) {
    observer->FlagsChanged({key});
  }
}

} // namespace launcher::config
