#include "tls_creds.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace launcher::tls {

TlsHandshakeVerifier::TlsHandshakeVerifier(TlsConfig config) : config_(std::move(config)) {
}

void TlsHandshakeVerifier::ClientHandshake(const PeerCertificates& peer) const {
  VerifyServerCertificate(config_, peer);
}

TlsCreds::TlsCreds(std::shared_ptr<const HandshakeVerifier> inner) : inner_(std::move(inner)) {
}

void TlsCreds::ClientHandshake(const PeerCertificates& peer) const {
  try {
    inner_->ClientHandshake(peer);
  } catch (const util::TemporaryError&) {
    throw;
  } catch (const std::exception& e) {
    if (std::string_view(e.what()).find(kHostnameMismatchMarker) != std::string_view::npos) {
      throw util::TemporaryError(e.what());
    }
    throw;
  }
}

std::shared_ptr<const HandshakeVerifier> NewTlsCreds(TlsConfig config) {
  return std::make_shared<TlsCreds>(std::make_shared<TlsHandshakeVerifier>(std::move(config)));
}

} // namespace launcher::tls
