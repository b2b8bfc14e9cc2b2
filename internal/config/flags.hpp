#pragma once

#include <initializer_list>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

#include "config/config.pb.h"

namespace launcher::config {

// Only kKolideServerURL is ever notified; the other keys name settings that
// are fixed at construction and exist so observers can say what they read.
enum class FlagKey {
  kKolideServerURL,
  kTransport,
  kInsecureTLS,
  kInsecureTransport,
  kCertPins,
  kRootPEM,
};

const char* ToString(FlagKey key);

/*
  FlagsChangeObserver

  Notified synchronously, on the thread that changed the flag, after the new
  value is visible. Observers must deregister before they are destroyed.
*/
class FlagsChangeObserver {
 public:
  virtual ~FlagsChangeObserver() = default;

  virtual void FlagsChanged(const std::vector<FlagKey>& changed) = 0;
};

/*
  Flags

  Runtime settings consumed by the RPC layer. Everything except the server
  URL is fixed at construction.
*/
class Flags {
 public:
  explicit Flags(const launcher::runtime::config::RuntimeConfig& config);

  Flags(const Flags&)            = delete;
  Flags& operator=(const Flags&) = delete;

  std::string KolideServerURL() const;
  void        SetKolideServerURL(const std::string& url);

  const std::string& Transport() const {
    return transport_;
  }
  bool InsecureTLS() const {
    return insecure_tls_;
  }
  bool InsecureTransport() const {
    return insecure_transport_;
  }
  // Raw SHA-256 digests, already decoded from hex.
  const std::vector<std::string>& CertPins() const {
    return cert_pins_;
  }
  // PEM bundle from root_pem_path; empty means system roots.
  const std::string& RootPEM() const {
    return root_pem_;
  }

  void RegisterChangeObserver(FlagsChangeObserver* observer, std::initializer_list<FlagKey> keys);
  void DeregisterChangeObserver(FlagsChangeObserver* observer);

 private:
  struct Registration {
    FlagsChangeObserver* observer;
    std::vector<FlagKey> keys;
  };

  void Notify(FlagKey key);

  mutable std::shared_mutex mutex_;
  std::string               kolide_server_url_;
  std::vector<Registration> observers_;

  std::string              transport_;
  bool                     insecure_tls_{false};
  bool                     insecure_transport_{false};
  std::vector<std::string> cert_pins_;
  std::string              root_pem_;
};

} // namespace launcher::config
