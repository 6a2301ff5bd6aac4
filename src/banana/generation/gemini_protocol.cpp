#include "banana/generation/gemini_protocol.hpp"

#include "banana/util/json.hpp"
#include "banana/util/log.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <utility>

namespace glz {
template <> struct meta<banana::gemini::InlineData> {
  using T = banana::gemini::InlineData;
  static constexpr auto value =
      object("mimeType", &T::mime_type, "data", &T::data);
};

template <> struct meta<banana::gemini::Part> {
  using T = banana::gemini::Part;
  static constexpr auto value =
      object("inlineData", &T::inline_data, "text", &T::text);
};

template <> struct meta<banana::gemini::Content> {
  using T = banana::gemini::Content;
  static constexpr auto value = object("parts", &T::parts, "role", &T::role);
};

template <> struct meta<banana::gemini::ImageConfig> {
  using T = banana::gemini::ImageConfig;
  static constexpr auto value =
      object("aspectRatio", &T::aspect_ratio, "imageSize", &T::image_size);
};

template <> struct meta<banana::gemini::GenerationConfig> {
  using T = banana::gemini::GenerationConfig;
  static constexpr auto value =
      object("responseModalities", &T::response_modalities, "imageConfig",
             &T::image_config);
};

template <> struct meta<banana::gemini::GenerateRequest> {
  using T = banana::gemini::GenerateRequest;
  static constexpr auto value = object("contents", &T::contents,
                                       "generationConfig",
                                       &T::generation_config);
};

template <> struct meta<banana::gemini::Candidate> {
  using T = banana::gemini::Candidate;
  static constexpr auto value =
      object("content", &T::content, "finishReason", &T::finish_reason,
             "finishMessage", &T::finish_message);
};

template <> struct meta<banana::gemini::PromptFeedback> {
  using T = banana::gemini::PromptFeedback;
  static constexpr auto value = object("blockReason", &T::block_reason);
};

template <> struct meta<banana::gemini::GenerateResponse> {
  using T = banana::gemini::GenerateResponse;
  static constexpr auto value =
      object("candidates", &T::candidates, "promptFeedback",
             &T::prompt_feedback);
};

template <> struct meta<banana::gemini::ApiError> {
  using T = banana::gemini::ApiError;
  static constexpr auto value =
      object("code", &T::code, "message", &T::message, "status", &T::status);
};

template <> struct meta<banana::gemini::ApiErrorResponse> {
  using T = banana::gemini::ApiErrorResponse;
  static constexpr auto value = object("error", &T::error);
};
} // namespace glz

namespace banana::gemini {
namespace {

constexpr std::size_t kMaxDetailLength = 300;

constexpr std::array<std::pair<std::string_view, std::string_view>, 5>
    kMimeByExtension = {{{"png", "image/png"},
                         {"jpg", "image/jpeg"},
                         {"jpeg", "image/jpeg"},
                         {"webp", "image/webp"},
                         {"gif", "image/gif"}}};

// Markers Google puts in a 429 body when the daily quota (or a zero quota on
// free-tier models) is used up. Retrying those cannot succeed today.
constexpr std::array<std::string_view, 3> kQuotaExhaustedMarkers = {
    "per day", "PerDay", "limit: 0"};

[[nodiscard]] auto truncate(std::string_view text) -> std::string {
  if (text.size() <= kMaxDetailLength) {
    return std::string(text);
  }
  return std::format("{}...", text.substr(0, kMaxDetailLength));
}

[[nodiscard]] auto api_error_message(std::string_view body) -> std::string {
  if (auto parsed = read_json_as<ApiErrorResponse>(body);
      parsed && !parsed->error.message.empty()) {
    return parsed->error.message;
  }
  return truncate(body);
}

[[nodiscard]] auto failure(ErrorClass cls, std::string detail, int status = 0)
    -> GenerationFailure {
  return GenerationFailure{
      .error_class = cls, .detail = std::move(detail), .http_status = status};
}

} // namespace

auto endpoint_target(std::string_view base_path, std::string_view model)
    -> std::string {
  return std::format("{}/models/{}:generateContent", base_path, model);
}

auto compose_prompt_text(std::string_view prompt,
                         const GenerationParams &params) -> std::string {
  std::string text(prompt);
  if (params.negative_prompt && !params.negative_prompt->empty()) {
    text += std::format("\n\nAvoid: {}", *params.negative_prompt);
  }
  if (params.seed) {
    text += std::format("\n\nSeed: {}", *params.seed);
  }
  return text;
}

auto build_request_body(std::string_view prompt,
                        const GenerationParams &params,
                        const std::optional<ImagePart> &input)
    -> Result<std::string> {
  Content content;
  if (input) {
    content.parts.push_back(Part{
        .inline_data = InlineData{.mime_type = input->mime_type,
                                  .data = input->data_base64},
        .text = std::nullopt});
  }
  content.parts.push_back(
      Part{.inline_data = std::nullopt,
           .text = compose_prompt_text(prompt, params)});

  GenerateRequest req;
  req.contents.push_back(std::move(content));
  req.generation_config.image_config.aspect_ratio = params.aspect_ratio;
  req.generation_config.image_config.image_size = params.size;
  return write_json_of(req);
}

auto parse_response(std::string_view body)
    -> std::expected<std::vector<ImagePart>, GenerationFailure> {
  auto parsed = read_json_as<GenerateResponse>(body);
  if (!parsed) {
    return std::unexpected(
        failure(ErrorClass::Unknown, "Unparseable response from Gemini API"));
  }

  if (parsed->prompt_feedback && parsed->prompt_feedback->block_reason) {
    return std::unexpected(failure(
        ErrorClass::Permanent,
        std::format("Prompt blocked: {}",
                    *parsed->prompt_feedback->block_reason)));
  }

  std::vector<ImagePart> images;
  for (auto &candidate : parsed->candidates.value_or(std::vector<Candidate>{})) {
    if (candidate.finish_reason && *candidate.finish_reason != "STOP" &&
        *candidate.finish_reason != "MAX_TOKENS") {
      auto message = candidate.finish_message.value_or(
          "Image generation was refused by the API");
      log::warn("Generation refused: {} - {}", *candidate.finish_reason,
                message);
      return std::unexpected(failure(ErrorClass::Permanent, message));
    }
    if (!candidate.content) {
      continue;
    }
    for (auto &part : candidate.content->parts) {
      if (part.inline_data) {
        images.push_back(ImagePart{
            .mime_type = std::move(part.inline_data->mime_type),
            .data_base64 = std::move(part.inline_data->data)});
      } else if (part.text) {
        log::debug("Response text: {}", *part.text);
      }
    }
  }

  if (images.empty()) {
    return std::unexpected(failure(ErrorClass::Unknown, "No images generated"));
  }
  return images;
}

auto classify_http_error(int status, std::string_view body)
    -> GenerationFailure {
  auto message = api_error_message(body);
  auto detail = std::format("HTTP {}: {}", status, message);

  if (status == 429) {
    const bool quota_exhausted =
        std::ranges::any_of(kQuotaExhaustedMarkers, [&](std::string_view m) {
          return body.find(m) != std::string_view::npos;
        });
    return failure(quota_exhausted ? ErrorClass::Permanent
                                   : ErrorClass::Transient,
                   std::move(detail), status);
  }
  if (status == 408 || (status >= 500 && status < 600)) {
    return failure(ErrorClass::Transient, std::move(detail), status);
  }
  if (status >= 400 && status < 500) {
    return failure(ErrorClass::Permanent, std::move(detail), status);
  }
  return failure(ErrorClass::Unknown, std::move(detail), status);
}

auto classify_transport_error(std::error_code ec) -> GenerationFailure {
  // cancel_after surfaces as operation_aborted (ECANCELED).
  if (ec == std::errc::operation_canceled || ec == std::errc::timed_out) {
    return failure(ErrorClass::Transient, "Request timed out");
  }
  return failure(ErrorClass::Transient,
                 std::format("Transport error: {}", ec.message()));
}

auto mime_type_for_path(std::string_view path) -> std::string_view {
  const auto dot = path.rfind('.');
  if (dot == std::string_view::npos) {
    return "image/png";
  }
  std::string ext;
  for (char c : path.substr(dot + 1)) {
    ext.push_back(
        static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  for (const auto &[e, mime] : kMimeByExtension) {
    if (e == ext) {
      return mime;
    }
  }
  return "image/png";
}

auto extension_for_mime(std::string_view mime_type) -> std::string_view {
  for (const auto &[ext, mime] : kMimeByExtension) {
    if (mime == mime_type) {
      return ext; // first match, so image/jpeg -> jpg
    }
  }
  return "png";
}

} // namespace banana::gemini
