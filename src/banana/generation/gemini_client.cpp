#include "banana/generation/gemini_client.hpp"

#include "banana/generation/gemini_protocol.hpp"
#include "banana/util/encoding.hpp"
#include "banana/util/log.hpp"

#include <format>

namespace banana {

namespace {

[[nodiscard]] auto permanent(std::string detail) -> GenerationFailure {
  return GenerationFailure{.error_class = ErrorClass::Permanent,
                           .detail = std::move(detail),
                           .http_status = 0};
}

auto load_input_image(const std::string &path)
    -> std::expected<gemini::ImagePart, GenerationFailure> {
  auto bytes = read_binary_file(path);
  if (!bytes) {
    return std::unexpected(permanent(std::format(
        "Cannot read input image {}: {}", path, bytes.error().message())));
  }
  return gemini::ImagePart{
      .mime_type = std::string(gemini::mime_type_for_path(path)),
      .data_base64 = util::base64_encode(*bytes)};
}

} // namespace

GeminiClient::GeminiClient(boost::asio::any_io_executor executor,
                           GeminiClientConfig config, util::ParsedUrl endpoint,
                           std::unique_ptr<boost::asio::ssl::context> ssl_ctx)
    : executor_(std::move(executor)), config_(std::move(config)),
      endpoint_(std::move(endpoint)), ssl_ctx_(std::move(ssl_ctx)) {}

auto GeminiClient::create(boost::asio::any_io_executor executor,
                          GeminiClientConfig config)
    -> Result<std::unique_ptr<GeminiClient>> {
  if (config.api_key.empty()) {
    return fail(Error::MissingApiKey);
  }
  auto endpoint = util::parse_base_url(config.base_url);
  if (!endpoint) {
    log::error("Invalid Gemini base URL '{}'", config.base_url);
    return fail(endpoint.error());
  }

  std::unique_ptr<boost::asio::ssl::context> ssl_ctx;
  if (endpoint->tls) {
    auto ctx = http::make_client_tls_context();
    if (!ctx) {
      return fail(ctx.error());
    }
    ssl_ctx = std::make_unique<boost::asio::ssl::context>(std::move(*ctx));
  }

  return ok(std::make_unique<GeminiClient>(std::move(executor),
                                          std::move(config),
                                          std::move(*endpoint),
                                          std::move(ssl_ctx)));
}

auto GeminiClient::connect()
    -> task<Result<std::unique_ptr<http::HttpClient>>> {
  http::HttpClientConfig http_cfg;
  http_cfg.read_timeout = config_.timeout;
  if (ssl_ctx_) {
    co_return co_await http::HttpClient::connect_tls(
        executor_, *ssl_ctx_, endpoint_.host, endpoint_.port, http_cfg);
  }
  co_return co_await http::HttpClient::connect_tcp(executor_, endpoint_.host,
                                                   endpoint_.port, http_cfg);
}

auto GeminiClient::generate(const GenerationRequest &request)
    -> task<GenerationOutcome> {
  std::optional<gemini::ImagePart> input;
  if (request.input_reference) {
    auto loaded = load_input_image(*request.input_reference);
    if (!loaded) {
      co_return std::unexpected(std::move(loaded.error()));
    }
    input = std::move(*loaded);
  }

  auto body = gemini::build_request_body(request.prompt, request.params, input);
  if (!body) {
    co_return std::unexpected(permanent("Failed to encode request"));
  }

  auto conn = co_await connect();
  if (!conn) {
    if (conn.error() == make_error_code(Error::TlsHandshakeFailed)) {
      // Certificate problems do not fix themselves between attempts.
      co_return std::unexpected(permanent(std::format(
          "TLS handshake with {} failed", endpoint_.host)));
    }
    co_return std::unexpected(gemini::classify_transport_error(conn.error()));
  }
  auto &client = **conn;

  const auto target =
      gemini::endpoint_target(endpoint_.base_path, request.params.model);
  log::debug("[{}] POST {}{}", request.job_id, endpoint_.host, target);

  auto resp = co_await client.post_json(
      target, *body, {{"x-goog-api-key", config_.api_key}});
  client.close();
  if (!resp) {
    co_return std::unexpected(gemini::classify_transport_error(resp.error()));
  }

  log::debug("[{}] Response status {}", request.job_id, resp->status);
  if (!resp->is_success()) {
    co_return std::unexpected(
        gemini::classify_http_error(resp->status, resp->body));
  }

  auto images = gemini::parse_response(resp->body);
  if (!images) {
    auto failure = std::move(images.error());
    failure.http_status = resp->status;
    co_return std::unexpected(std::move(failure));
  }

  std::vector<std::string> refs;
  refs.reserve(images->size());
  for (const auto &image : *images) {
    auto bytes = util::base64_decode(image.data_base64);
    if (!bytes) {
      co_return std::unexpected(GenerationFailure{
          .error_class = ErrorClass::Unknown,
          .detail = "Failed to decode image data",
          .http_status = resp->status});
    }
    auto path = artifacts_.store(request.params.output_directory, *bytes,
                                 image.mime_type);
    if (!path) {
      co_return std::unexpected(permanent(
          std::format("Cannot write artifact to {}: {}",
                      request.params.output_directory,
                      path.error().message())));
    }
    refs.push_back(std::move(*path));
  }
  co_return refs;
}

} // namespace banana
