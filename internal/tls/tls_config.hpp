#pragma once

#include <openssl/ssl.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/tls/cert_pool.hpp"

namespace launcher::tls {

/*
  TlsConfig

  Client TLS settings for one dial. Immutable once built.
*/
struct TlsConfig {
  std::string server_name;
  bool        insecure_skip_verify{false};
  // Null means the system roots.
  std::shared_ptr<const CertPool> root_cas;
  // Raw SHA-256 digests of SubjectPublicKeyInfo. Empty disables pinning.
  std::vector<std::string> cert_pins;
};

TlsConfig MakeTlsConfig(std::string host, bool insecure_tls, std::vector<std::string> cert_pins,
                        std::shared_ptr<const CertPool> root_pool);

// Certificates presented by the server, leaf first.
struct PeerCertificates {
  std::vector<X509Ptr> chain;

  static PeerCertificates FromPem(std::string_view pem_chain);
  static PeerCertificates FromSsl(SSL* ssl);
};

using VerifiedChain = std::vector<X509Ptr>;

// Returns the hostname mismatch error text for leaf, or nullopt when host is
// covered by its subject alternative names.
std::optional<std::string> CheckHostname(X509* leaf, const std::string& host);

VerifiedChain BuildVerifiedChain(const CertPool& roots, const PeerCertificates& peer);

// A single pinned digest anywhere in any verified chain accepts the peer.
// Throws PinMismatch otherwise. No pins accepts everything.
void VerifyPinnedChains(const std::vector<std::string>& pins, const std::vector<VerifiedChain>& verified_chains);

// Hostname, chain and pin checks in that order. With insecure_skip_verify
// there are no verified chains, so configured pins always fail.
void VerifyServerCertificate(const TlsConfig& config, const PeerCertificates& peer);

} // namespace launcher::tls
