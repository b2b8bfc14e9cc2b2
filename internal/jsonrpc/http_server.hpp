#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace launcher::jsonrpc {

struct TlsIdentity {
  std::string cert_chain_pem;
  std::string private_key_pem;
};

/*
  HttpServer

  Minimal HTTP/1.1 server over Boost.Beast. Every POST body is passed to the
  handler and its return value sent back as application/json; other methods
  get 405. Connections are served on a single io thread.
*/
class HttpServer {
 public:
  using Handler = std::function<std::string(const std::string& body)>;

  HttpServer(std::string bind_address, Handler handler, std::optional<TlsIdentity> tls = std::nullopt);
  ~HttpServer();

  HttpServer(const HttpServer&)            = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Binds and starts serving. Throws std::runtime_error when the address
  // cannot be bound.
  void Start();
  void Stop();

  // Bound port, valid after Start(). Resolves ":0" to the ephemeral port.
  uint16_t port() const {
    return port_;
  }

 private:
  void Accept();

  std::string                                bind_address_;
  std::shared_ptr<const Handler>             handler_;
  std::unique_ptr<boost::asio::ssl::context> ssl_ctx_;

  boost::asio::io_context        ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::thread                    thread_;
  uint16_t                       port_{0};
};

} // namespace launcher::jsonrpc
