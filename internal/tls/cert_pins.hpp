#pragma once

#include <openssl/x509.h>

#include <string>
#include <string_view>
#include <vector>

namespace launcher::tls {

// Decodes hex encoded pins into raw digests. Throws InvalidArgument on
// malformed hex. Values of the wrong length are kept; they never match.
std::vector<std::string> ParseCertPins(const std::vector<std::string>& hex_pins);

// SHA-256 over the DER encoded SubjectPublicKeyInfo of cert.
std::string SpkiSha256(X509* cert);

std::string ToHex(std::string_view bytes);

} // namespace launcher::tls
