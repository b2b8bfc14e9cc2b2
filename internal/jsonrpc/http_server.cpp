#include "http_server.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <chrono>
#include <stdexcept>
#include <type_traits>

#include "internal/observability/logging.hpp"

namespace launcher::jsonrpc {

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
namespace ssl   = net::ssl;
using tcp       = net::ip::tcp;

namespace {

constexpr auto kSessionTimeout = std::chrono::seconds(30);

http::response<http::string_body> BuildResponse(const http::request<http::string_body>& req,
                                                const HttpServer::Handler&              handler) {
  http::response<http::string_body> res;
  res.version(req.version());
  res.keep_alive(req.keep_alive());
  res.set(http::field::server, "launcher");

  if (req.method() != http::verb::post) {
    res.result(http::status::method_not_allowed);
    res.set(http::field::allow, "POST");
  } else {
    try {
      res.body() = handler(req.body());
      res.result(http::status::ok);
      res.set(http::field::content_type, "application/json");
    } catch (const std::exception& e) {
      LAUNCHER_LOG_ERROR("http handler failed", {observability::StringField("err", e.what())});
      res.result(http::status::internal_server_error);
      res.body().clear();
    }
  }

  res.prepare_payload();
  return res;
}

template <typename Stream>
class Session : public std::enable_shared_from_this<Session<Stream>> {
  static constexpr bool kIsTls = !std::is_same_v<Stream, beast::tcp_stream>;

 public:
  template <typename... Args>
  Session(tcp::socket&& socket, std::shared_ptr<const HttpServer::Handler> handler, Args&... args)
      : stream_(std::move(socket), args...), handler_(std::move(handler)) {
  }

  void Run() {
    net::dispatch(stream_.get_executor(), beast::bind_front_handler(&Session::Begin, this->shared_from_this()));
  }

 private:
  void Begin() {
    if constexpr (kIsTls) {
      beast::get_lowest_layer(stream_).expires_after(kSessionTimeout);
      stream_.async_handshake(ssl::stream_base::server,
                              beast::bind_front_handler(&Session::OnHandshake, this->shared_from_this()));
    } else {
      Read();
    }
  }

  void OnHandshake(beast::error_code ec) {
    if (ec) {
      LAUNCHER_LOG_DEBUG("http tls handshake failed", {observability::StringField("err", ec.message())});
      return;
    }
    Read();
  }

  void Read() {
    request_ = {};
    beast::get_lowest_layer(stream_).expires_after(kSessionTimeout);
    http::async_read(stream_, buffer_, request_, beast::bind_front_handler(&Session::OnRead, this->shared_from_this()));
  }

  void OnRead(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
      Close();
      return;
    }
    if (ec) {
      LAUNCHER_LOG_DEBUG("http read failed", {observability::StringField("err", ec.message())});
      return;
    }

    response_ = BuildResponse(request_, *handler_);
    http::async_write(stream_, response_, beast::bind_front_handler(&Session::OnWrite, this->shared_from_this()));
  }

  void OnWrite(beast::error_code ec, std::size_t) {
    if (ec) {
      LAUNCHER_LOG_DEBUG("http write failed", {observability::StringField("err", ec.message())});
      return;
    }
    if (!response_.keep_alive()) {
      Close();
      return;
    }
    Read();
  }

  void Close() {
    if constexpr (kIsTls) {
      beast::get_lowest_layer(stream_).expires_after(kSessionTimeout);
      stream_.async_shutdown(beast::bind_front_handler(&Session::OnShutdown, this->shared_from_this()));
    } else {
      beast::error_code ec;
      stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
      OnShutdown(ec);
    }
  }

  void OnShutdown(beast::error_code ec) {
    // Peers commonly close without a TLS close_notify.
    if (ec && ec != net::ssl::error::stream_truncated && ec != net::error::eof) {
      LAUNCHER_LOG_DEBUG("http shutdown failed", {observability::StringField("err", ec.message())});
    }
  }

  Stream                                     stream_;
  std::shared_ptr<const HttpServer::Handler> handler_;
  beast::flat_buffer                         buffer_;
  http::request<http::string_body>           request_;
  http::response<http::string_body>          response_;
};

tcp::endpoint ParseBindAddress(const std::string& bind_address) {
  const auto colon = bind_address.rfind(':');
  if (colon == std::string::npos) {
    throw std::runtime_error("invalid bind address: " + bind_address);
  }

  std::string host = bind_address.substr(0, colon);
  if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
    host = host.substr(1, host.size() - 2);
  }
  if (host.empty()) {
    host = "0.0.0.0";
  } else if (host == "localhost") {
    host = "127.0.0.1";
  }

  beast::error_code ec;
  const auto        address = net::ip::make_address(host, ec);
  if (ec) {
    throw std::runtime_error("invalid bind address: " + bind_address);
  }

  int port = 0;
  try {
    port = std::stoi(bind_address.substr(colon + 1));
  } catch (const std::exception&) {
    throw std::runtime_error("invalid bind address: " + bind_address);
  }
  if (port < 0 || port > 65535) {
    throw std::runtime_error("invalid bind address: " + bind_address);
  }
  return {address, static_cast<unsigned short>(port)};
}

} // namespace

HttpServer::HttpServer(std::string bind_address, Handler handler, std::optional<TlsIdentity> tls)
    : bind_address_(std::move(bind_address)),
      handler_(std::make_shared<const Handler>(std::move(handler))),
      acceptor_(ioc_) {
  if (tls) {
    ssl_ctx_ = std::make_unique<ssl::context>(ssl::context::tls_server);
    ssl_ctx_->set_options(ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3);
    ssl_ctx_->use_certificate_chain(net::buffer(tls->cert_chain_pem));
    ssl_ctx_->use_private_key(net::buffer(tls->private_key_pem), ssl::context::pem);
  }
}

HttpServer::~HttpServer() {
  Stop();
}

void HttpServer::Start() {
  const tcp::endpoint endpoint = ParseBindAddress(bind_address_);

  beast::error_code ec;
  acceptor_.open(endpoint.protocol(), ec);
  if (!ec) {
    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
  }
  if (!ec) {
    acceptor_.bind(endpoint, ec);
  }
  if (!ec) {
    acceptor_.listen(net::socket_base::max_listen_connections, ec);
  }
  if (ec) {
    throw std::runtime_error("Failed to start JSON-RPC server on " + bind_address_ + ": " + ec.message());
  }

  port_ = acceptor_.local_endpoint().port();
  Accept();
  thread_ = std::thread([this] { ioc_.run(); });

  LAUNCHER_LOG_INFO("jsonrpc server listening", {observability::StringField("address", bind_address_),
                                                 observability::IntField("port", port_),
                                                 observability::BoolField("tls", ssl_ctx_ != nullptr)});
}

void HttpServer::Stop() {
  if (!thread_.joinable()) {
    return;
  }
  ioc_.stop();
  thread_.join();

  beast::error_code ec;
  acceptor_.close(ec);
  if (ec) {
    LAUNCHER_LOG_DEBUG("http acceptor close failed", {observability::StringField("err", ec.message())});
  }
}

void HttpServer::Accept() {
  acceptor_.async_accept(net::make_strand(ioc_), [this](beast::error_code ec, tcp::socket socket) {
    if (ec == net::error::operation_aborted) {
      return;
    }
    if (ec) {
      LAUNCHER_LOG_WARN("http accept failed", {observability::StringField("err", ec.message())});
    } else if (ssl_ctx_) {
      std::make_shared<Session<beast::ssl_stream<beast::tcp_stream>>>(std::move(socket), handler_, *ssl_ctx_)->Run();
    } else {
      std::make_shared<Session<beast::tcp_stream>>(std::move(socket), handler_)->Run();
    }
    Accept();
  });
}

} // namespace launcher::jsonrpc
