#pragma once

#include "banana/core/error.hpp"
#include "banana/generation/generation_client.hpp"

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

// Wire format of the Gemini generateContent endpoint and the mapping of its
// responses onto ErrorClass. Pure functions; no I/O.
namespace banana::gemini {

struct InlineData {
  std::string mime_type;
  std::string data; // base64
};

struct Part {
  std::optional<InlineData> inline_data;
  std::optional<std::string> text;
};

struct Content {
  std::vector<Part> parts;
  std::optional<std::string> role;
};

struct ImageConfig {
  std::optional<std::string> aspect_ratio;
  std::optional<std::string> image_size;
};

struct GenerationConfig {
  std::vector<std::string> response_modalities{"TEXT", "IMAGE"};
  ImageConfig image_config;
};

struct GenerateRequest {
  std::vector<Content> contents;
  GenerationConfig generation_config;
};

struct Candidate {
  std::optional<Content> content;
  std::optional<std::string> finish_reason;
  std::optional<std::string> finish_message;
};

struct PromptFeedback {
  std::optional<std::string> block_reason;
};

struct GenerateResponse {
  std::optional<std::vector<Candidate>> candidates;
  std::optional<PromptFeedback> prompt_feedback;
};

struct ApiError {
  int code{0};
  std::string message;
  std::string status;
};

struct ApiErrorResponse {
  ApiError error;
};

struct ImagePart {
  std::string mime_type;
  std::string data_base64;
};

/// "{base_path}/models/{model}:generateContent"
[[nodiscard]] auto endpoint_target(std::string_view base_path,
                                   std::string_view model) -> std::string;

/// Prompt text with the negative prompt and seed folded in; the endpoint has
/// no dedicated fields for either.
[[nodiscard]] auto compose_prompt_text(std::string_view prompt,
                                       const GenerationParams &params)
    -> std::string;

[[nodiscard]] auto build_request_body(std::string_view prompt,
                                      const GenerationParams &params,
                                      const std::optional<ImagePart> &input)
    -> Result<std::string>;

/// Images of a 2xx body, or the failure it represents.
[[nodiscard]] auto parse_response(std::string_view body)
    -> std::expected<std::vector<ImagePart>, GenerationFailure>;

[[nodiscard]] auto classify_http_error(int status, std::string_view body)
    -> GenerationFailure;

[[nodiscard]] auto classify_transport_error(std::error_code ec)
    -> GenerationFailure;

/// image/png for unknown extensions.
[[nodiscard]] auto mime_type_for_path(std::string_view path)
    -> std::string_view;

/// png for unknown mime types.
[[nodiscard]] auto extension_for_mime(std::string_view mime_type)
    -> std::string_view;

} // namespace banana::gemini
