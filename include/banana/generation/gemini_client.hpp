#pragma once

#include "banana/client/http/http_client.hpp"
#include "banana/generation/artifact_store.hpp"
#include "banana/generation/generation_client.hpp"
#include "banana/util/url.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/ssl/context.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace banana {

struct GeminiClientConfig {
  std::string api_key;
  std::string base_url{"https://generativelanguage.googleapis.com/v1beta"};
  std::chrono::seconds timeout{120};
};

// GenerationClient for Google's generateContent endpoint. Opens one
// connection per attempt; decoded images go through an ArtifactStore into the
// job's output directory.
class GeminiClient final : public GenerationClient {
public:
  /// MissingApiKey without a key, InvalidUrl for a bad base_url.
  [[nodiscard]] static auto create(boost::asio::any_io_executor executor,
                                   GeminiClientConfig config)
      -> Result<std::unique_ptr<GeminiClient>>;

  GeminiClient(boost::asio::any_io_executor executor, GeminiClientConfig config,
               util::ParsedUrl endpoint,
               std::unique_ptr<boost::asio::ssl::context> ssl_ctx);

  auto generate(const GenerationRequest &request)
      -> task<GenerationOutcome> override;

private:

  auto connect() -> task<Result<std::unique_ptr<http::HttpClient>>>;

  boost::asio::any_io_executor executor_;
  GeminiClientConfig config_;
  util::ParsedUrl endpoint_;
  std::unique_ptr<boost::asio::ssl::context> ssl_ctx_;
  ArtifactStore artifacts_;
};

} // namespace banana
