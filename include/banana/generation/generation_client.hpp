#pragma once

#include "banana/core/coroutine.hpp"
#include "banana/job/job.hpp"
#include "banana/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace banana {

// How a failed generation call should be treated by the retry loop.
enum class ErrorClass : std::uint8_t { Transient, Permanent, Unknown };
BOOST_DESCRIBE_ENUM(ErrorClass, Transient, Permanent, Unknown)
BANANA_DEFINE_ENUM_SERDE(ErrorClass, ErrorClass::Unknown)

struct GenerationFailure {
  ErrorClass error_class{ErrorClass::Unknown};
  std::string detail;
  int http_status{0}; // 0 when no response was received

  [[nodiscard]] auto is_retryable() const noexcept -> bool {
    return error_class == ErrorClass::Transient;
  }
};

struct GenerationRequest {
  JobId job_id;
  JobKind kind{JobKind::Generate};
  std::string prompt;
  GenerationParams params;
  std::optional<std::string> input_reference; // path of the image to edit
};

/// Artifact references (file paths) in the order the service returned them.
using GenerationOutcome = std::expected<std::vector<std::string>, GenerationFailure>;

// Performs one remote generation attempt. Stateless with respect to jobs:
// implementations never read or write the job store.
class GenerationClient {
public:
  virtual ~GenerationClient() = default;

  virtual auto generate(const GenerationRequest &request)
      -> task<GenerationOutcome> = 0;
};

} // namespace banana
