#pragma once

#include <openssl/x509.h>

#include <memory>
#include <string_view>
#include <vector>

namespace launcher::tls {

struct X509Deleter {
  void operator()(X509* cert) const {
    X509_free(cert);
  }
};

using X509Ptr = std::unique_ptr<X509, X509Deleter>;

// Parses every certificate in a PEM bundle. Throws InvalidArgument when the
// bundle holds none.
std::vector<X509Ptr> ParsePemCertificates(std::string_view pem);

// Returns an owning reference to cert.
X509Ptr Retain(X509* cert);

/*
  CertPool

  Trust anchors for chain verification. A pool is filled once and then shared
  read-only between handshakes.
*/
class CertPool {
 public:
  // Roots from the OpenSSL default locations. Loaded once per process.
  static std::shared_ptr<const CertPool> System();
  static std::shared_ptr<CertPool>       Empty();
  static std::shared_ptr<CertPool>       FromPem(std::string_view pem);

  void AppendPem(std::string_view pem);

  X509_STORE* store() const {
    return store_.get();
  }

  size_t size() const {
    return count_;
  }

 private:
  struct StoreDeleter {
    void operator()(X509_STORE* store) const {
      X509_STORE_free(store);
    }
  };

  CertPool();

  std::unique_ptr<X509_STORE, StoreDeleter> store_;
  size_t                                    count_{0};
};

} // namespace launcher::tls
