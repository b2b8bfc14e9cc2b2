#pragma once

#include <memory>
#include <string_view>

#include "internal/tls/tls_config.hpp"

namespace launcher::tls {

// Substring of the error a hostname mismatch produces.
inline constexpr std::string_view kHostnameMismatchMarker = "certificate is valid for ";

/*
  HandshakeVerifier

  Runs once the server's certificates are known and before any request data
  is sent. Throws to abort the connection.
*/
class HandshakeVerifier {
 public:
  virtual ~HandshakeVerifier() = default;

  virtual void ClientHandshake(const PeerCertificates& peer) const = 0;
};

class TlsHandshakeVerifier final : public HandshakeVerifier {
 public:
  explicit TlsHandshakeVerifier(TlsConfig config);

  void ClientHandshake(const PeerCertificates& peer) const override;

  const TlsConfig& config() const {
    return config_;
  }

 private:
  TlsConfig config_;
};

/*
  TlsCreds

  Captive portals and intercepting proxies answer with their own certificate,
  which fails as a hostname mismatch. That error is rethrown as
  util::TemporaryError so the caller's retry logic keeps trying until the
  network clears. Every other error propagates unchanged.
*/
class TlsCreds final : public HandshakeVerifier {
 public:
  explicit TlsCreds(std::shared_ptr<const HandshakeVerifier> inner);

  void ClientHandshake(const PeerCertificates& peer) const override;

 private:
  std::shared_ptr<const HandshakeVerifier> inner_;
};

std::shared_ptr<const HandshakeVerifier> NewTlsCreds(TlsConfig config);

} // namespace launcher::tls
