#include "banana/client/http/http_client.hpp"

#include "banana/core/asio_awaitable.hpp"
#include "banana/util/log.hpp"

#include <boost/asio/cancel_after.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>

#include <openssl/ssl.h>

#include <string>

namespace banana::http {

namespace {

namespace beast = boost::beast;
namespace beast_http = beast::http;
using tcp = boost::asio::ip::tcp;

[[nodiscard]] auto to_std_error(const boost::system::error_code &ec)
    -> std::error_code {
  return ec;
}

auto to_response(beast_http::response<beast_http::string_body> &&msg)
    -> HttpResponse {
  HttpResponse out;
  out.status = static_cast<int>(msg.result_int());
  for (const auto &field : msg.base()) {
    out.headers.emplace_back(std::string(field.name_string()),
                             std::string(field.value()));
  }
  out.body = std::move(msg.body());
  return out;
}

template <typename Stream>
auto request_over_stream(Stream &stream, HttpRequest req,
                         const HttpClientConfig &config,
                         const std::string &host)
    -> task<Result<HttpResponse>> {
  beast_http::request<beast_http::string_body> msg{
      req.method == HttpMethod::POST ? beast_http::verb::post
                                     : beast_http::verb::get,
      req.target, 11};
  msg.set(beast_http::field::host, host);
  msg.set(beast_http::field::user_agent, "banana/1.0");
  for (auto &[name, value] : req.headers) {
    msg.set(name, value);
  }
  msg.body() = std::move(req.body);
  msg.prepare_payload();

  auto [write_ec, written] = co_await beast_http::async_write(
      stream, msg, boost::asio::cancel_after(config.read_timeout, use_nothrow));
  (void)written;
  if (write_ec) {
    log::debug("Failed to write request to {}: {}", host, write_ec.message());
    co_return fail(to_std_error(write_ec));
  }

  beast::flat_buffer read_buffer;
  beast_http::response_parser<beast_http::string_body> parser;
  parser.header_limit(256 * 1024);
  parser.body_limit(config.max_response_size);

  auto [read_ec, read_n] = co_await beast_http::async_read(
      stream, read_buffer, parser,
      boost::asio::cancel_after(config.read_timeout, use_nothrow));
  (void)read_n;
  if (read_ec) {
    log::debug("Failed to read response from {}: {}", host, read_ec.message());
    co_return fail(to_std_error(read_ec));
  }

  co_return to_response(parser.release());
}

auto resolve_and_connect(tcp::socket &socket, std::string_view host,
                         std::uint16_t port, const HttpClientConfig &config)
    -> task<Result<void>> {
  tcp::resolver resolver(socket.get_executor());
  auto [resolve_ec, endpoints] = co_await resolver.async_resolve(
      std::string(host), std::to_string(port),
      boost::asio::cancel_after(config.connect_timeout, use_nothrow));
  if (resolve_ec) {
    log::debug("Failed to resolve {}:{} - {}", host, port,
               resolve_ec.message());
    co_return fail(to_std_error(resolve_ec));
  }

  auto connected = as_result(co_await boost::asio::async_connect(
      socket, endpoints,
      boost::asio::cancel_after(config.connect_timeout, use_nothrow)));
  if (!connected) {
    log::debug("Failed to connect to {}:{} - {}", host, port,
               connected.error().message());
    co_return fail(connected.error());
  }
  co_return ok();
}

} // namespace

auto HttpResponse::header(std::string_view name) const -> std::string_view {
  for (const auto &[key, value] : headers) {
    if (beast::iequals(key, name)) {
      return value;
    }
  }
  return {};
}

struct HttpClient::Impl {
  SocketVariant socket;
  HttpClientConfig config;
  std::string host;

  Impl(SocketVariant socket_in, HttpClientConfig cfg)
      : socket(std::move(socket_in)), config(cfg) {}
};

HttpClient::HttpClient(SocketVariant socket, HttpClientConfig config)
    : impl_(std::make_unique<Impl>(std::move(socket), config)) {}

HttpClient::~HttpClient() = default;

HttpClient::HttpClient(HttpClient &&) noexcept = default;
auto HttpClient::operator=(HttpClient &&) noexcept -> HttpClient & = default;

auto HttpClient::connect_tcp(boost::asio::any_io_executor ex,
                             std::string_view host, std::uint16_t port,
                             HttpClientConfig config)
    -> task<Result<std::unique_ptr<HttpClient>>> {
  tcp::socket socket(ex);
  if (auto r = co_await resolve_and_connect(socket, host, port, config); !r) {
    co_return fail(r.error());
  }

  auto client = std::make_unique<HttpClient>(std::move(socket), config);
  client->impl_->host = std::string(host);
  co_return ok(std::move(client));
}

auto HttpClient::connect_tls(boost::asio::any_io_executor ex,
                             boost::asio::ssl::context &ssl_ctx,
                             std::string_view host, std::uint16_t port,
                             HttpClientConfig config)
    -> task<Result<std::unique_ptr<HttpClient>>> {
  TlsStream stream(ex, ssl_ctx);
  const std::string host_str(host);

  if (::SSL_set_tlsext_host_name(stream.native_handle(), host_str.c_str()) !=
      1) {
    log::debug("Failed to set SNI host name {}", host);
    co_return fail(Error::TlsHandshakeFailed);
  }
  stream.set_verify_mode(boost::asio::ssl::verify_peer);
  stream.set_verify_callback(
      boost::asio::ssl::host_name_verification(host_str));

  if (auto r =
          co_await resolve_and_connect(stream.next_layer(), host, port, config);
      !r) {
    co_return fail(r.error());
  }

  auto [hs_ec] = co_await stream.async_handshake(
      boost::asio::ssl::stream_base::client,
      boost::asio::cancel_after(config.connect_timeout, use_nothrow));
  if (hs_ec) {
    log::debug("TLS handshake with {} failed: {}", host, hs_ec.message());
    co_return fail(Error::TlsHandshakeFailed);
  }

  auto client = std::make_unique<HttpClient>(std::move(stream), config);
  client->impl_->host = host_str;
  co_return ok(std::move(client));
}

auto HttpClient::request(HttpRequest req) -> task<Result<HttpResponse>> {
  if (!is_connected()) {
    co_return fail(Error::ConnectionFailed);
  }

  if (auto *plain = std::get_if<tcp::socket>(&impl_->socket)) {
    co_return co_await request_over_stream(*plain, std::move(req),
                                           impl_->config, impl_->host);
  }
  auto *tls = std::get_if<TlsStream>(&impl_->socket);
  co_return co_await request_over_stream(*tls, std::move(req), impl_->config,
                                         impl_->host);
}

auto HttpClient::post_json(std::string_view target, std::string_view json,
                           const HttpHeaders &headers)
    -> task<Result<HttpResponse>> {
  HttpRequest req;
  req.method = HttpMethod::POST;
  req.target = std::string(target);
  req.body = std::string(json);
  req.headers = headers;
  req.headers.emplace_back("Content-Type", "application/json");
  co_return co_await request(std::move(req));
}

auto HttpClient::is_connected() const noexcept -> bool {
  if (auto *plain = std::get_if<tcp::socket>(&impl_->socket)) {
    return plain->is_open();
  }
  if (auto *tls = std::get_if<TlsStream>(&impl_->socket)) {
    return tls->next_layer().is_open();
  }
  return false;
}

auto HttpClient::close() -> void {
  boost::system::error_code ec;
  if (auto *plain = std::get_if<tcp::socket>(&impl_->socket)) {
    plain->shutdown(tcp::socket::shutdown_both, ec);
    plain->close(ec);
    return;
  }
  if (auto *tls = std::get_if<TlsStream>(&impl_->socket)) {
    tls->next_layer().close(ec);
  }
}

auto make_client_tls_context() -> Result<boost::asio::ssl::context> {
  boost::asio::ssl::context ctx(boost::asio::ssl::context::tls_client);
  boost::system::error_code ec;
  ctx.set_default_verify_paths(ec);
  if (ec) {
    log::error("Failed to load system CA certificates: {}", ec.message());
    return fail(Error::TlsHandshakeFailed);
  }
  ctx.set_options(boost::asio::ssl::context::default_workarounds |
                  boost::asio::ssl::context::no_sslv2 |
                  boost::asio::ssl::context::no_sslv3);
  return ok(std::move(ctx));
}

} // namespace banana::http
