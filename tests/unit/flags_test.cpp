#include "internal/config/flags.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using namespace launcher;

class RecordingObserver final : public config::FlagsChangeObserver {
 public:
  explicit RecordingObserver(config::Flags* flags) : flags_(flags) {
  }

  void FlagsChanged(const std::vector<config::FlagKey>& changed) override {
    for (auto key : changed) {
      keys.push_back(key);
    }
    // Observers run outside the flags lock.
    seen_urls.push_back(flags_->KolideServerURL());
  }

  std::vector<config::FlagKey> keys;
  std::vector<std::string>     seen_urls;

 private:
  config::Flags* flags_;
};

launcher::runtime::config::RuntimeConfig BaseConfig() {
  launcher::runtime::config::RuntimeConfig config;
  config.mutable_server()->set_kolide_server_url("a.example.com:443");
  return config;
}

void TestDefaults() {
  config::Flags flags(BaseConfig());
  assert(flags.KolideServerURL() == "a.example.com:443");
  assert(flags.Transport() == "grpc");
  assert(!flags.InsecureTLS());
  assert(!flags.InsecureTransport());
  assert(flags.CertPins().empty());
  assert(flags.RootPEM().empty());
}

void TestCertPinsAreDecoded() {
  auto config = BaseConfig();
  config.mutable_server()->add_cert_pins("00ff10");
  config::Flags flags(config);

  assert(flags.CertPins().size() == 1);
  assert(flags.CertPins()[0] == std::string("\x00\xff\x10", 3));
}

void TestInvalidSettingsAreRejected() {
  auto config = BaseConfig();
  config.mutable_server()->set_transport("osquery");
  bool threw = false;
  try {
    config::Flags flags(config);
  } catch (const util::InvalidArgument& e) {
    threw = std::string(e.what()) == "unknown transport: osquery";
  }
  assert(threw);

  config = BaseConfig();
  config.mutable_server()->add_cert_pins("abc");
  threw = false;
  try {
    config::Flags flags(config);
  } catch (const util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  config = BaseConfig();
  config.mutable_server()->set_root_pem_path("/nonexistent/roots.pem");
  threw = false;
  try {
    config::Flags flags(config);
  } catch (const util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestObserversSeeServerUrlChanges() {
  config::Flags     flags(BaseConfig());
  RecordingObserver observer(&flags);
  RecordingObserver unrelated(&flags);

  flags.RegisterChangeObserver(&observer, {config::FlagKey::kKolideServerURL});
  flags.RegisterChangeObserver(&unrelated, {config::FlagKey::kCertPins});

  flags.SetKolideServerURL("b.example.com:443");
  // Same value: no notification.
  flags.SetKolideServerURL("b.example.com:443");

  assert(observer.keys.size() == 1);
  assert(observer.keys[0] == config::FlagKey::kKolideServerURL);
  assert(observer.seen_urls[0] == "b.example.com:443");
  assert(unrelated.keys.empty());

  flags.DeregisterChangeObserver(&observer);
  flags.SetKolideServerURL("c.example.com:443");
  assert(observer.keys.size() == 1);
  assert(flags.KolideServerURL() == "c.example.com:443");
}

} // namespace

int main() {
  TestDefaults();
  TestCertPinsAreDecoded();
  TestInvalidSettingsAreRejected();
  TestObserversSeeServerUrlChanges();

  std::cout << "launcher_unit_flags: pass\n";
  return 0;
}
