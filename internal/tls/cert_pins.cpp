#include "cert_pins.hpp"

#include <openssl/evp.h>

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace launcher::tls {

namespace {

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::string DecodeHex(const std::string& hex) {
  if (hex.size() % 2 != 0) {
    throw util::InvalidArgument("decoding cert pin " + hex + ": odd length hex string");
  }

  std::string out;
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    const int hi = HexValue(hex[i]);
    const int lo = HexValue(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      throw util::InvalidArgument("decoding cert pin " + hex + ": invalid byte");
    }
    out.push_back(static_cast<char>((hi << 4) | lo));
  }
  return out;
}

} // namespace

std::vector<std::string> ParseCertPins(const std::vector<std::string>& hex_pins) {
  std::vector<std::string> pins;
  pins.reserve(hex_pins.size());
  for (const auto& hex : hex_pins) {
    pins.push_back(DecodeHex(hex));
  }
  return pins;
}

std::string SpkiSha256(X509* cert) {
  unsigned char* der = nullptr;
  const int      len = i2d_X509_PUBKEY(X509_get_X509_PUBKEY(cert), &der);
  if (len <= 0) {
    throw std::runtime_error("failed to encode SubjectPublicKeyInfo");
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int  digest_len = 0;
  const int     ok         = EVP_Digest(der, static_cast<size_t>(len), digest, &digest_len, EVP_sha256(), nullptr);
  OPENSSL_free(der);
  if (ok != 1) {
    throw std::runtime_error("SHA-256 digest failed");
  }

  return std::string(reinterpret_cast<const char*>(digest), digest_len);
}

std::string ToHex(std::string_view bytes) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           result;
  result.reserve(bytes.size() * 2);
  for (unsigned char c : bytes) {
    result.push_back(kHex[(c >> 4) & 0x0F]);
    result.push_back(kHex[c & 0x0F]);
  }
  return result;
}

} // namespace launcher::tls
