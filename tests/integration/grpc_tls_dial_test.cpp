#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "client/cpp/kolide_client.h"
#include "internal/runtime/server.hpp"
#include "internal/tls/cert_pins.hpp"
#include "internal/tls/cert_pool.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/mock_api_server.hpp"
#include "tests/support/test_certs.hpp"

namespace {

using namespace launcher;

std::shared_ptr<config::Flags> FlagsFor(const std::string& url) {
  launcher::runtime::config::RuntimeConfig config;
  config.mutable_server()->set_kolide_server_url(url);
  return std::make_shared<config::Flags>(config);
}

std::shared_ptr<service::KolideService> Dial(const std::string& url, launcher::grpc::DialOptions options) {
  auto flags      = FlagsFor(url);
  auto connection = launcher::grpc::DialGRPC(url, std::move(options));
  return client::NewGRPCClient(flags, connection);
}

launcher::grpc::DialOptions TrustRoot(const std::string& root_pem) {
  launcher::grpc::DialOptions options;
  options.root_pool = tls::CertPool::FromPem(root_pem);
  return options;
}

// Returns the message of the exception the health check threw, or "" on success.
template <typename Expected>
std::string HealthError(service::KolideService& client) {
  try {
    (void)client.CheckHealth(service::CallContext::Background().WithTimeout(std::chrono::seconds(10)));
  } catch (const Expected& e) {
    return e.what();
  }
  return "";
}

class TlsFixture {
 public:
  explicit TlsFixture(bool wrong_host)
      : pki_(testing::GenerateTestPki()),
        mock_(std::make_shared<testing::MockApiService>()),
        server_("127.0.0.1:0", {mock_},
                runtime::MakeServerCredentials(wrong_host ? pki_.WrongHostChainPem() : pki_.LeafChainPem(),
                                               wrong_host ? pki_.wrong_host_leaf.key_pem : pki_.leaf.key_pem)) {
    server_.Start();
  }

  ~TlsFixture() {
    server_.Stop();
  }

  std::string Url() const {
    return "localhost:" + std::to_string(server_.port());
  }

  const testing::TestPki& pki() const {
    return pki_;
  }

  const testing::MockApiService& mock() const {
    return *mock_;
  }

 private:
  testing::TestPki                          pki_;
  std::shared_ptr<testing::MockApiService> mock_;
  runtime::Server                          server_;
};

void TestTrustedRoot() {
  TlsFixture fixture(false);

  auto client = Dial(fixture.Url(), TrustRoot(fixture.pki().root.cert_pem));
  assert(client->CheckHealth(service::CallContext::Background()) == service::HealthStatus::kServing);
  assert(fixture.mock().Calls() == 1);
}

void TestUnknownRootIsRejected() {
  TlsFixture fixture(false);

  auto       client = Dial(fixture.Url(), TrustRoot(testing::GenerateUnrelatedRoot().cert_pem));
  const auto err    = HealthError<util::TransportError>(*client);
  assert(err.rfind("x509: ", 0) == 0);
  assert(fixture.mock().Calls() == 0);
}

void TestPins() {
  TlsFixture fixture(false);

  // Any certificate in the verified chain may be pinned.
  for (const auto* pinned : {&fixture.pki().leaf, &fixture.pki().intermediate, &fixture.pki().root}) {
    auto options      = TrustRoot(fixture.pki().root.cert_pem);
    options.cert_pins = tls::ParseCertPins({pinned->spki_sha256});
    auto client       = Dial(fixture.Url(), options);
    assert(client->CheckHealth(service::CallContext::Background()) == service::HealthStatus::kServing);
  }

  auto options      = TrustRoot(fixture.pki().root.cert_pem);
  options.cert_pins = tls::ParseCertPins({testing::GenerateUnrelatedRoot().spki_sha256});
  auto client       = Dial(fixture.Url(), options);
  assert(HealthError<util::PinMismatch>(*client) == "no match found with pinned cert");

  // Without chain verification there is no verified chain to match, so
  // pinning fails closed even for the right key.
  launcher::grpc::DialOptions insecure;
  insecure.insecure_tls = true;
  insecure.cert_pins    = tls::ParseCertPins({fixture.pki().leaf.spki_sha256});
  client                = Dial(fixture.Url(), insecure);
  assert(HealthError<util::PinMismatch>(*client) == "no match found with pinned cert");

  insecure.cert_pins.clear();
  client = Dial(fixture.Url(), insecure);
  assert(client->CheckHealth(service::CallContext::Background()) == service::HealthStatus::kServing);
}

void TestHostnameMismatchIsTemporary() {
  TlsFixture fixture(true);

  auto client = Dial(fixture.Url(), TrustRoot(fixture.pki().root.cert_pem));

  bool temporary = false;
  try {
    (void)client->CheckHealth(service::CallContext::Background().WithTimeout(std::chrono::seconds(10)));
  } catch (const util::TransportError& e) {
    temporary = util::IsTemporary(e) &&
                std::string(e.what()) == "x509: certificate is valid for not-localhost.example, not localhost";
  }
  assert(temporary);
}

} // namespace

int main() {
  TestTrustedRoot();
  TestUnknownRootIsRejected();
  TestPins();
  TestHostnameMismatchIsTemporary();

  std::cout << "launcher_integration_grpc_tls_dial: pass\n";
  return 0;
}
