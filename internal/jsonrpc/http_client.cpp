#include "http_client.hpp"

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <algorithm>
#include <functional>

#include "internal/observability/logging.hpp"
#include "internal/tls/tls_creds.hpp"
#include "internal/util/errors.hpp"

namespace launcher::jsonrpc {

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
namespace ssl   = net::ssl;
using tcp       = net::ip::tcp;

namespace {

constexpr auto        kPollInterval = std::chrono::milliseconds(50);
constexpr const char* kUserAgent    = "launcher";

bool IsIpAddress(const std::string& host) {
  boost::system::error_code ec;
  net::ip::make_address(host, ec);
  return !ec;
}

/*
  Runs asynchronous operations on a private io_context one at a time, so the
  caller's cancellation and the deadline are observed while blocked.
*/
class Driver {
 public:
  Driver(net::io_context& ioc, const util::CallContext& ctx, util::TimePoint deadline)
      : ioc_(ioc), ctx_(ctx), deadline_(deadline) {
  }

  util::TimePoint deadline() const {
    return deadline_;
  }

  void Run(const bool& done, const std::function<void()>& cancel) {
    ioc_.restart();
    bool cancel_requested = false;
    while (!done) {
      if (!cancel_requested && (ctx_.Cancelled() || util::Now() >= deadline_)) {
        cancel();
        cancel_requested = true;
      }
      ioc_.run_one_for(kPollInterval);
    }
  }

  [[noreturn]] void Fail(const char* stage, const beast::error_code& ec) const {
    if (ctx_.Cancelled()) {
      throw util::Cancelled();
    }
    if (ctx_.Expired()) {
      throw util::DeadlineExceeded();
    }
    if (ec == beast::error::timeout || ec == net::error::operation_aborted) {
      throw util::TransportError(std::string("Post: ") + stage + ": client timeout exceeded");
    }
    throw util::TransportError(std::string("Post: ") + stage + ": " + ec.message());
  }

 private:
  net::io_context&         ioc_;
  const util::CallContext& ctx_;
  util::TimePoint          deadline_;
};

tcp::resolver::results_type Resolve(Driver& driver, net::io_context& ioc, const ServerAddress& address) {
  tcp::resolver               resolver(ioc);
  tcp::resolver::results_type results;
  beast::error_code           ec;
  bool                        done = false;

  resolver.async_resolve(address.host, address.port, [&](beast::error_code e, tcp::resolver::results_type r) {
    ec      = e;
    results = std::move(r);
    done    = true;
  });
  driver.Run(done, [&] { resolver.cancel(); });
  if (ec) {
    driver.Fail("dial", ec);
  }
  return results;
}

void Connect(Driver& driver, beast::tcp_stream& stream, const tcp::resolver::results_type& endpoints) {
  beast::error_code ec;
  bool              done = false;

  stream.expires_at(driver.deadline());
  stream.async_connect(endpoints, [&](beast::error_code e, const tcp::endpoint&) {
    ec   = e;
    done = true;
  });
  driver.Run(done, [&] { stream.cancel(); });
  if (ec) {
    driver.Fail("dial", ec);
  }
}

void Handshake(Driver& driver, beast::ssl_stream<beast::tcp_stream>& stream) {
  auto&             lowest = beast::get_lowest_layer(stream);
  beast::error_code ec;
  bool              done = false;

  lowest.expires_at(driver.deadline());
  stream.async_handshake(ssl::stream_base::client, [&](beast::error_code e) {
    ec   = e;
    done = true;
  });
  driver.Run(done, [&] { lowest.cancel(); });
  if (ec) {
    driver.Fail("tls handshake", ec);
  }
}

template <typename Stream>
void Exchange(Driver& driver, Stream& stream, http::request<http::string_body>& req,
              http::response<http::string_body>& res) {
  auto&             lowest = beast::get_lowest_layer(stream);
  beast::error_code ec;
  bool              done = false;

  lowest.expires_at(driver.deadline());
  http::async_write(stream, req, [&](beast::error_code e, std::size_t) {
    ec   = e;
    done = true;
  });
  driver.Run(done, [&] { lowest.cancel(); });
  if (ec) {
    driver.Fail("write", ec);
  }

  beast::flat_buffer buffer;
  done = false;
  lowest.expires_at(driver.deadline());
  http::async_read(stream, buffer, res, [&](beast::error_code e, std::size_t) {
    ec   = e;
    done = true;
  });
  driver.Run(done, [&] { lowest.cancel(); });
  if (ec) {
    driver.Fail("read", ec);
  }
}

} // namespace

std::string ServerAddress::HostHeader() const {
  const bool  default_port = (tls && port == "443") || (!tls && port == "80");
  std::string bracketed    = host.find(':') != std::string::npos ? "[" + host + "]" : host;
  return default_port ? bracketed : bracketed + ":" + port;
}

std::string ServerAddress::ToString() const {
  return std::string(tls ? "https://" : "http://") + HostHeader() + target;
}

ServerAddress ParseServerAddress(const std::string& server_url, bool insecure_transport) {
  ServerAddress address;
  address.tls = !insecure_transport;

  std::string rest = server_url;
  if (rest.rfind("https://", 0) == 0) {
    address.tls = true;
    rest        = rest.substr(8);
  } else if (rest.rfind("http://", 0) == 0) {
    address.tls = false;
    rest        = rest.substr(7);
  }

  const auto slash     = rest.find('/');
  std::string host_port = rest.substr(0, slash);
  if (slash != std::string::npos) {
    address.target = rest.substr(slash);
  }

  if (!host_port.empty() && host_port.front() == '[') {
    const auto close = host_port.find(']');
    if (close == std::string::npos) {
      throw util::InvalidArgument("invalid server address: " + server_url);
    }
    address.host = host_port.substr(1, close - 1);
    if (close + 1 < host_port.size() && host_port[close + 1] == ':') {
      address.port = host_port.substr(close + 2);
    }
  } else {
    const auto colon = host_port.rfind(':');
    address.host     = host_port.substr(0, colon);
    if (colon != std::string::npos) {
      address.port = host_port.substr(colon + 1);
    }
  }

  if (address.host.empty()) {
    throw util::InvalidArgument("invalid server address: " + server_url);
  }
  if (address.port.empty()) {
    address.port = address.tls ? "443" : "80";
  }
  if (!std::all_of(address.port.begin(), address.port.end(), [](char c) { return c >= '0' && c <= '9'; })) {
    throw util::InvalidArgument("invalid port in server address: " + server_url);
  }
  return address;
}

HttpClient::HttpClient(HttpClientOptions options)
    : options_(std::move(options)), ssl_ctx_(std::make_unique<ssl::context>(ssl::context::tls_client)) {
  // Peer verification runs after the handshake through tls::TlsCreds.
  ssl_ctx_->set_verify_mode(ssl::verify_none);
  SSL_CTX_set_min_proto_version(ssl_ctx_->native_handle(), TLS1_2_VERSION);
}

std::string HttpClient::Post(const util::CallContext& ctx, const ServerAddress& address, const std::string& body) const {
  ctx.ThrowIfDone();

  const auto client_deadline = util::Now() + options_.timeout;
  const auto deadline        = ctx.deadline() ? std::min(*ctx.deadline(), client_deadline) : client_deadline;

  http::request<http::string_body> req{http::verb::post, address.target, 11};
  req.set(http::field::host, address.HostHeader());
  req.set(http::field::user_agent, kUserAgent);
  req.set(http::field::content_type, "application/json");
  req.set(http::field::accept, "application/json");
  req.keep_alive(false);
  req.body() = body;
  req.prepare_payload();

  net::io_context                   ioc;
  Driver                            driver(ioc, ctx, deadline);
  http::response<http::string_body> res;

  const auto endpoints = Resolve(driver, ioc, address);

  if (address.tls) {
    beast::ssl_stream<beast::tcp_stream> stream(ioc, *ssl_ctx_);
    if (!IsIpAddress(address.host) && !SSL_set_tlsext_host_name(stream.native_handle(), address.host.c_str())) {
      throw util::TransportError("Post: tls: failed to set server name");
    }

    Connect(driver, beast::get_lowest_layer(stream), endpoints);
    Handshake(driver, stream);

    const auto verifier = tls::NewTlsCreds(
        tls::MakeTlsConfig(address.host, options_.insecure_tls, options_.cert_pins, options_.root_pool));
    verifier->ClientHandshake(tls::PeerCertificates::FromSsl(stream.native_handle()));

    Exchange(driver, stream, req, res);
  } else {
    beast::tcp_stream stream(ioc);
    Connect(driver, stream, endpoints);
    Exchange(driver, stream, req, res);
  }

  if (res.result() != http::status::ok) {
    LAUNCHER_LOG_DEBUG("jsonrpc unexpected http status", {observability::StringField("url", address.ToString()),
                                                          observability::IntField("status", res.result_int())});
    throw util::TransportError("Post: unexpected HTTP status " + std::to_string(res.result_int()));
  }
  return std::move(res.body());
}

} // namespace launcher::jsonrpc
