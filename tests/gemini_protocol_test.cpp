#include "banana/generation/gemini_protocol.hpp"
#include "banana/util/encoding.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <format>
#include <system_error>

using namespace banana;
using namespace banana::gemini;
using ::testing::HasSubstr;

TEST(GeminiProtocolTest, EndpointTarget) {
  EXPECT_EQ(endpoint_target("/v1beta", "gemini-2.5-flash-image"),
            "/v1beta/models/gemini-2.5-flash-image:generateContent");
}

TEST(GeminiProtocolTest, PromptFoldsNegativePromptAndSeed) {
  GenerationParams params;
  EXPECT_EQ(compose_prompt_text("a cat", params), "a cat");

  params.negative_prompt = "dogs";
  params.seed = 7;
  EXPECT_EQ(compose_prompt_text("a cat", params),
            "a cat\n\nAvoid: dogs\n\nSeed: 7");
}

TEST(GeminiProtocolTest, RequestBodyCarriesImageConfig) {
  GenerationParams params;
  params.aspect_ratio = "16:9";
  params.size = "2K";

  auto body = build_request_body("a banana", params, std::nullopt);
  ASSERT_TRUE(body.has_value());
  EXPECT_THAT(*body, HasSubstr("\"aspectRatio\":\"16:9\""));
  EXPECT_THAT(*body, HasSubstr("\"imageSize\":\"2K\""));
  EXPECT_THAT(*body, HasSubstr("\"text\":\"a banana\""));
  EXPECT_THAT(*body, HasSubstr("IMAGE"));
  EXPECT_THAT(*body, ::testing::Not(HasSubstr("inlineData")));
}

TEST(GeminiProtocolTest, EditRequestPutsImageBeforeText) {
  auto body = build_request_body(
      "make it red", GenerationParams{},
      ImagePart{.mime_type = "image/jpeg", .data_base64 = "QUJD"});
  ASSERT_TRUE(body.has_value());
  const auto image_pos = body->find("inlineData");
  const auto text_pos = body->find("make it red");
  ASSERT_NE(image_pos, std::string::npos);
  ASSERT_NE(text_pos, std::string::npos);
  EXPECT_LT(image_pos, text_pos);
  EXPECT_THAT(*body, HasSubstr("image/jpeg"));
}

TEST(GeminiProtocolTest, ParsesInlineImages) {
  const auto png = util::base64_encode(std::string_view{"fake-png-bytes"});
  const auto body = std::format(R"({{
    "candidates": [{{
      "content": {{"parts": [
        {{"text": "Here you go"}},
        {{"inlineData": {{"mimeType": "image/png", "data": "{}"}}}}
      ]}},
      "finishReason": "STOP"
    }}]
  }})",
                                png);

  auto images = parse_response(body);
  ASSERT_TRUE(images.has_value()) << images.error().detail;
  ASSERT_EQ(images->size(), 1u);
  EXPECT_EQ((*images)[0].mime_type, "image/png");
  EXPECT_EQ((*images)[0].data_base64, png);
}

TEST(GeminiProtocolTest, BlockedPromptIsPermanent) {
  auto images = parse_response(
      R"({"promptFeedback": {"blockReason": "SAFETY"}})");
  ASSERT_FALSE(images.has_value());
  EXPECT_EQ(images.error().error_class, ErrorClass::Permanent);
  EXPECT_EQ(images.error().detail, "Prompt blocked: SAFETY");
}

TEST(GeminiProtocolTest, RefusedCandidateIsPermanent) {
  auto images = parse_response(R"({"candidates": [{
      "finishReason": "IMAGE_SAFETY",
      "finishMessage": "Unable to show the generated image"}]})");
  ASSERT_FALSE(images.has_value());
  EXPECT_EQ(images.error().error_class, ErrorClass::Permanent);
  EXPECT_EQ(images.error().detail, "Unable to show the generated image");
}

TEST(GeminiProtocolTest, TextOnlyResponseIsUnknown) {
  auto images = parse_response(R"({"candidates": [{
      "content": {"parts": [{"text": "I cannot draw that"}]},
      "finishReason": "STOP"}]})");
  ASSERT_FALSE(images.has_value());
  EXPECT_EQ(images.error().error_class, ErrorClass::Unknown);
  EXPECT_EQ(images.error().detail, "No images generated");
}

TEST(GeminiProtocolTest, GarbageBodyIsUnknown) {
  auto images = parse_response("<html>oops</html>");
  ASSERT_FALSE(images.has_value());
  EXPECT_EQ(images.error().error_class, ErrorClass::Unknown);
}

TEST(GeminiProtocolTest, RateLimitIsTransient) {
  auto f = classify_http_error(
      429, R"({"error": {"code": 429, "message": "Resource exhausted",
               "status": "RESOURCE_EXHAUSTED"}})");
  EXPECT_EQ(f.error_class, ErrorClass::Transient);
  EXPECT_EQ(f.http_status, 429);
  EXPECT_EQ(f.detail, "HTTP 429: Resource exhausted");
  EXPECT_TRUE(f.is_retryable());
}

TEST(GeminiProtocolTest, DailyQuotaIsPermanent) {
  auto f = classify_http_error(
      429, R"({"error": {"code": 429, "message": "Quota exceeded for metric
               GenerateRequestsPerDayPerProjectPerModel, limit: 0"}})");
  EXPECT_EQ(f.error_class, ErrorClass::Permanent);
  EXPECT_FALSE(f.is_retryable());
}

TEST(GeminiProtocolTest, ServerErrorsAndTimeoutsAreTransient) {
  EXPECT_EQ(classify_http_error(500, "").error_class, ErrorClass::Transient);
  EXPECT_EQ(classify_http_error(503, "").error_class, ErrorClass::Transient);
  EXPECT_EQ(classify_http_error(408, "").error_class, ErrorClass::Transient);
}

TEST(GeminiProtocolTest, ClientErrorsArePermanent) {
  auto f = classify_http_error(
      400, R"({"error": {"code": 400, "message": "API key not valid"}})");
  EXPECT_EQ(f.error_class, ErrorClass::Permanent);
  EXPECT_EQ(f.detail, "HTTP 400: API key not valid");
  EXPECT_EQ(classify_http_error(403, "denied").error_class,
            ErrorClass::Permanent);
}

TEST(GeminiProtocolTest, UnexpectedStatusIsUnknown) {
  EXPECT_EQ(classify_http_error(302, "").error_class, ErrorClass::Unknown);
}

TEST(GeminiProtocolTest, LongErrorBodiesAreTruncated) {
  auto f = classify_http_error(502, std::string(1000, 'x'));
  EXPECT_LT(f.detail.size(), 320u);
  EXPECT_TRUE(f.detail.ends_with("..."));
}

TEST(GeminiProtocolTest, TransportErrorsAreTransient) {
  auto timeout =
      classify_transport_error(std::make_error_code(std::errc::timed_out));
  EXPECT_EQ(timeout.error_class, ErrorClass::Transient);
  EXPECT_EQ(timeout.detail, "Request timed out");

  auto refused = classify_transport_error(
      std::make_error_code(std::errc::connection_refused));
  EXPECT_EQ(refused.error_class, ErrorClass::Transient);
  EXPECT_THAT(refused.detail, HasSubstr("Transport error"));
}

TEST(GeminiProtocolTest, MimeTypes) {
  EXPECT_EQ(mime_type_for_path("/x/photo.JPG"), "image/jpeg");
  EXPECT_EQ(mime_type_for_path("a.webp"), "image/webp");
  EXPECT_EQ(mime_type_for_path("noext"), "image/png");
  EXPECT_EQ(extension_for_mime("image/jpeg"), "jpg");
  EXPECT_EQ(extension_for_mime("image/unknown"), "png");
}
