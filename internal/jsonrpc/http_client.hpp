#pragma once

#include <boost/asio/ssl/context.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "internal/tls/cert_pool.hpp"
#include "internal/util/call_context.hpp"

namespace launcher::jsonrpc {

// Bounds one HTTP round trip regardless of the call deadline.
inline constexpr std::chrono::seconds kHttpClientTimeout{30};

struct ServerAddress {
  bool        tls{true};
  std::string host;
  std::string port;
  std::string target{"/"};

  std::string HostHeader() const;
  std::string ToString() const;
};

// Accepts "host:port", "host" or an http(s) URL. Without a scheme,
// insecure_transport selects plain HTTP. Throws util::InvalidArgument.
ServerAddress ParseServerAddress(const std::string& server_url, bool insecure_transport);

struct HttpClientOptions {
  bool                                 insecure_tls{false};
  std::vector<std::string>             cert_pins;
  std::shared_ptr<const tls::CertPool> root_pool;
  std::chrono::milliseconds            timeout{kHttpClientTimeout};
};

/*
  HttpClient

  Buffered HTTP/1.1 POST over Boost.Beast, one connection per request.
  The body is sent with an explicit Content-Length (some backends reject
  chunked encoding) and "Connection: close". TLS peers go through the same
  hostname, chain and pin checks as the gRPC transport, before any request
  data is written. Safe for concurrent use.
*/
class HttpClient {
 public:
  explicit HttpClient(HttpClientOptions options);

  HttpClient(const HttpClient&)            = delete;
  HttpClient& operator=(const HttpClient&) = delete;

  // Returns the body of a 200 response. Throws util::TransportError (or a
  // subclass) for anything else.
  std::string Post(const util::CallContext& ctx, const ServerAddress& address, const std::string& body) const;

  const HttpClientOptions& options() const {
    return options_;
  }

 private:
  HttpClientOptions                           options_;
  std::unique_ptr<boost::asio::ssl::context> ssl_ctx_;
};

} // namespace launcher::jsonrpc
