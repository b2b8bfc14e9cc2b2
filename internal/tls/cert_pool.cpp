#include "cert_pool.hpp"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>

#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace launcher::tls {

namespace {

struct BioDeleter {
  void operator()(BIO* bio) const {
    BIO_free(bio);
  }
};

} // namespace

std::vector<X509Ptr> ParsePemCertificates(std::string_view pem) {
  std::unique_ptr<BIO, BioDeleter> bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
  if (!bio) {
    throw std::runtime_error("BIO_new_mem_buf failed");
  }

  std::vector<X509Ptr> certs;
  while (X509* cert = PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr)) {
    certs.emplace_back(cert);
  }
  // PEM_read_bio_X509 leaves "no start line" on the error queue at end of input.
  ERR_clear_error();

  if (certs.empty()) {
    throw util::InvalidArgument("no certificates found in PEM data");
  }
  return certs;
}

X509Ptr Retain(X509* cert) {
  X509_up_ref(cert);
  return X509Ptr(cert);
}

CertPool::CertPool() : store_(X509_STORE_new()) {
  if (!store_) {
    throw std::runtime_error("X509_STORE_new failed");
  }
}

std::shared_ptr<const CertPool> CertPool::System() {
  static const std::shared_ptr<const CertPool> system = [] {
    std::shared_ptr<CertPool> pool(new CertPool());
    if (X509_STORE_set_default_paths(pool->store()) != 1) {
      throw std::runtime_error("failed to load system root certificates");
    }
    return std::shared_ptr<const CertPool>(std::move(pool));
  }();
  return system;
}

std::shared_ptr<CertPool> CertPool::Empty() {
  return std::shared_ptr<CertPool>(new CertPool());
}

std::shared_ptr<CertPool> CertPool::FromPem(std::string_view pem) {
  auto pool = Empty();
  pool->AppendPem(pem);
  return pool;
}

void CertPool::AppendPem(std::string_view pem) {
  for (auto& cert : ParsePemCertificates(pem)) {
    if (X509_STORE_add_cert(store_.get(), cert.get()) != 1) {
      const unsigned long err = ERR_get_error();
      // Duplicates are harmless.
      if (ERR_GET_REASON(err) != X509_R_CERT_ALREADY_IN_HASH_TABLE) {
        throw util::InvalidArgument("failed to add certificate to pool");
      }
      ERR_clear_error();
      continue;
    }
    ++count_;
  }
}

} // namespace launcher::tls
