#pragma once

#include "banana/client/http/http_types.hpp"
#include "banana/core/coroutine.hpp"
#include "banana/core/error.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/stream.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>
#include <variant>

namespace banana::http {

struct HttpClientConfig {
  std::chrono::milliseconds connect_timeout{30000};
  std::chrono::milliseconds read_timeout{120000};
  std::size_t max_response_size{64UL * 1024UL * 1024UL};
};

// One HTTP/1.1 connection, plain or TLS. Transport failures come back as
// error codes (boost::system / asio categories) so callers can tell them
// apart from HTTP error statuses.
class HttpClient {
public:
  using TlsStream = boost::asio::ssl::stream<boost::asio::ip::tcp::socket>;
  using SocketVariant = std::variant<boost::asio::ip::tcp::socket, TlsStream>;

  HttpClient(SocketVariant socket, HttpClientConfig config = {});
  ~HttpClient();

  HttpClient(const HttpClient &) = delete;
  auto operator=(const HttpClient &) -> HttpClient & = delete;
  HttpClient(HttpClient &&) noexcept;
  auto operator=(HttpClient &&) noexcept -> HttpClient &;

  static auto connect_tcp(boost::asio::any_io_executor ex,
                          std::string_view host, std::uint16_t port,
                          HttpClientConfig config = {})
      -> task<Result<std::unique_ptr<HttpClient>>>;

  /// Connects and completes a verified TLS handshake (SNI + hostname check).
  static auto connect_tls(boost::asio::any_io_executor ex,
                          boost::asio::ssl::context &ssl_ctx,
                          std::string_view host, std::uint16_t port,
                          HttpClientConfig config = {})
      -> task<Result<std::unique_ptr<HttpClient>>>;

  auto request(HttpRequest req) -> task<Result<HttpResponse>>;

  auto post_json(std::string_view target, std::string_view json,
                 const HttpHeaders &headers = {})
      -> task<Result<HttpResponse>>;

  [[nodiscard]] auto is_connected() const noexcept -> bool;
  auto close() -> void;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

/// TLS client context that trusts the system CA store.
[[nodiscard]] auto make_client_tls_context() -> Result<boost::asio::ssl::context>;

} // namespace banana::http
