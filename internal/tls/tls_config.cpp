#include "tls_config.hpp"

#include <openssl/err.h>
#include <openssl/x509v3.h>

#include <algorithm>
#include <cstdio>

#include "internal/observability/logging.hpp"
#include "internal/tls/cert_pins.hpp"
#include "internal/util/errors.hpp"

namespace launcher::tls {

namespace {

struct StoreCtxDeleter {
  void operator()(X509_STORE_CTX* ctx) const {
    X509_STORE_CTX_free(ctx);
  }
};

struct StackDeleter {
  void operator()(STACK_OF(X509) * stack) const {
    sk_X509_free(stack);
  }
};

struct GeneralNamesDeleter {
  void operator()(GENERAL_NAMES* names) const {
    GENERAL_NAMES_free(names);
  }
};

struct OctetStringDeleter {
  void operator()(ASN1_OCTET_STRING* s) const {
    ASN1_OCTET_STRING_free(s);
  }
};

std::string FormatIp(const unsigned char* data, int length) {
  char buffer[64];
  if (length == 4) {
    std::snprintf(buffer, sizeof(buffer), "%u.%u.%u.%u", data[0], data[1], data[2], data[3]);
    return buffer;
  }

  std::string out;
  for (int i = 0; i + 1 < length; i += 2) {
    if (i > 0) out += ':';
    std::snprintf(buffer, sizeof(buffer), "%x", (data[i] << 8) | data[i + 1]);
    out += buffer;
  }
  return out;
}

std::vector<std::string> SubjectAltNames(X509* cert) {
  std::vector<std::string> names;
  std::unique_ptr<GENERAL_NAMES, GeneralNamesDeleter> sans(
      static_cast<GENERAL_NAMES*>(X509_get_ext_d2i(cert, NID_subject_alt_name, nullptr, nullptr)));
  if (!sans) {
    return names;
  }

  for (int i = 0; i < sk_GENERAL_NAME_num(sans.get()); ++i) {
    const GENERAL_NAME* name = sk_GENERAL_NAME_value(sans.get(), i);
    if (name->type == GEN_DNS) {
      const auto* dns = name->d.dNSName;
      names.emplace_back(reinterpret_cast<const char*>(ASN1_STRING_get0_data(dns)), ASN1_STRING_length(dns));
    } else if (name->type == GEN_IPADD) {
      const auto* ip = name->d.iPAddress;
      names.push_back(FormatIp(ASN1_STRING_get0_data(ip), ASN1_STRING_length(ip)));
    }
  }
  return names;
}

} // namespace

TlsConfig MakeTlsConfig(std::string host, bool insecure_tls, std::vector<std::string> cert_pins,
                        std::shared_ptr<const CertPool> root_pool) {
  TlsConfig config;
  config.server_name          = std::move(host);
  config.insecure_skip_verify = insecure_tls;
  config.root_cas             = std::move(root_pool);
  config.cert_pins            = std::move(cert_pins);
  return config;
}

PeerCertificates PeerCertificates::FromPem(std::string_view pem_chain) {
  PeerCertificates peer;
  peer.chain = ParsePemCertificates(pem_chain);
  return peer;
}

PeerCertificates PeerCertificates::FromSsl(SSL* ssl) {
  PeerCertificates peer;
  // On the client side the peer chain includes the leaf.
  STACK_OF(X509)* chain = SSL_get_peer_cert_chain(ssl);
  if (chain == nullptr) {
    return peer;
  }
  for (int i = 0; i < sk_X509_num(chain); ++i) {
    peer.chain.push_back(Retain(sk_X509_value(chain, i)));
  }
  return peer;
}

std::optional<std::string> CheckHostname(X509* leaf, const std::string& host) {
  int rc = 0;
  std::unique_ptr<ASN1_OCTET_STRING, OctetStringDeleter> ip(a2i_IPADDRESS(host.c_str()));
  if (ip) {
    rc = X509_check_ip(leaf, ASN1_STRING_get0_data(ip.get()), static_cast<size_t>(ASN1_STRING_length(ip.get())), 0);
  } else {
    ERR_clear_error();
    rc = X509_check_host(leaf, host.data(), host.size(), 0, nullptr);
  }
  if (rc == 1) {
    return std::nullopt;
  }

  const auto names = SubjectAltNames(leaf);
  if (names.empty()) {
    return "x509: certificate is not valid for any names, but wanted to match " + host;
  }

  std::string valid;
  for (const auto& name : names) {
    if (!valid.empty()) valid += ", ";
    valid += name;
  }
  return "x509: certificate is valid for " + valid + ", not " + host;
}

VerifiedChain BuildVerifiedChain(const CertPool& roots, const PeerCertificates& peer) {
  if (peer.chain.empty()) {
    throw util::TransportError("tls: server presented no certificates");
  }

  std::unique_ptr<STACK_OF(X509), StackDeleter> untrusted(sk_X509_new_null());
  for (size_t i = 1; i < peer.chain.size(); ++i) {
    sk_X509_push(untrusted.get(), peer.chain[i].get());
  }

  std::unique_ptr<X509_STORE_CTX, StoreCtxDeleter> ctx(X509_STORE_CTX_new());
  if (!ctx || X509_STORE_CTX_init(ctx.get(), roots.store(), peer.chain.front().get(), untrusted.get()) != 1) {
    throw std::runtime_error("X509_STORE_CTX_init failed");
  }
  X509_STORE_CTX_set_purpose(ctx.get(), X509_PURPOSE_SSL_SERVER);

  if (X509_verify_cert(ctx.get()) != 1) {
    const int err = X509_STORE_CTX_get_error(ctx.get());
    ERR_clear_error();
    throw util::TransportError("x509: " + std::string(X509_verify_cert_error_string(err)));
  }

  VerifiedChain   verified;
  STACK_OF(X509)* chain = X509_STORE_CTX_get0_chain(ctx.get());
  for (int i = 0; i < sk_X509_num(chain); ++i) {
    verified.push_back(Retain(sk_X509_value(chain, i)));
  }
  return verified;
}

void VerifyPinnedChains(const std::vector<std::string>& pins, const std::vector<VerifiedChain>& verified_chains) {
  if (pins.empty()) {
    return;
  }

  for (const auto& chain : verified_chains) {
    for (const auto& cert : chain) {
      const auto digest = SpkiSha256(cert.get());
      if (std::find(pins.begin(), pins.end(), digest) != pins.end()) {
        return;
      }
    }
  }

  LAUNCHER_LOG_INFO("no match found with pinned cert",
                    {observability::IntField("pins", static_cast<int64_t>(pins.size())),
                     observability::IntField("verified_chains", static_cast<int64_t>(verified_chains.size()))});
  throw util::PinMismatch("no match found with pinned cert");
}

void VerifyServerCertificate(const TlsConfig& config, const PeerCertificates& peer) {
  std::vector<VerifiedChain> verified_chains;

  if (!config.insecure_skip_verify) {
    if (peer.chain.empty()) {
      throw util::TransportError("tls: server presented no certificates");
    }
    if (auto mismatch = CheckHostname(peer.chain.front().get(), config.server_name)) {
      throw util::TransportError(*mismatch);
    }
    const auto& roots = config.root_cas ? *config.root_cas : *CertPool::System();
    verified_chains.push_back(BuildVerifiedChain(roots, peer));
  }

  VerifyPinnedChains(config.cert_pins, verified_chains);
}

} // namespace launcher::tls
