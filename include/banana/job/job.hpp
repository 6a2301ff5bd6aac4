#pragma once

#include "banana/core/error.hpp"
#include "banana/util/enum.hpp"
#include "banana/util/id.hpp"
#include "banana/util/time.hpp"

#include <boost/describe/enum.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace banana {

enum class JobKind : std::uint8_t { Generate, Edit };
BOOST_DESCRIBE_ENUM(JobKind, Generate, Edit)
BANANA_DEFINE_ENUM_SERDE(JobKind, JobKind::Generate)

enum class JobStatus : std::uint8_t { Queued, Running, Completed, Failed };
BOOST_DESCRIBE_ENUM(JobStatus, Queued, Running, Completed, Failed)
BANANA_DEFINE_ENUM_SERDE(JobStatus, JobStatus::Queued)

// Why a job ended in Failed.
enum class FailureKind : std::uint8_t { TransientExhausted, Permanent, Cancelled };
BOOST_DESCRIBE_ENUM(FailureKind, TransientExhausted, Permanent, Cancelled)
BANANA_DEFINE_ENUM_SERDE(FailureKind, FailureKind::Permanent)

[[nodiscard]] constexpr auto is_terminal(JobStatus s) noexcept -> bool {
  return s == JobStatus::Completed || s == JobStatus::Failed;
}

inline constexpr std::array<std::string_view, 10> kAspectRatios = {
    "1:1", "2:3", "3:2", "3:4", "4:3", "4:5", "5:4", "9:16", "16:9", "21:9"};
inline constexpr std::array<std::string_view, 3> kImageSizes = {"1K", "2K",
                                                                "4K"};
inline constexpr std::array<std::string_view, 3> kModels = {
    "gemini-3-pro-image-preview", "gemini-2.5-flash-image",
    "imagen-4.0-generate-001"};

inline constexpr int kMinImages = 1;
inline constexpr int kMaxImages = 4;

[[nodiscard]] auto is_supported_aspect_ratio(std::string_view v) noexcept
    -> bool;
[[nodiscard]] auto is_supported_size(std::string_view v) noexcept -> bool;
[[nodiscard]] auto is_supported_model(std::string_view v) noexcept -> bool;

// Immutable snapshot of everything the remote call needs besides the prompt.
// Taken from configuration and flags at submission time.
struct GenerationParams {
  std::string model{"gemini-3-pro-image-preview"};
  std::string aspect_ratio{"1:1"};
  std::string size{"1K"};
  int num_images{1};
  std::optional<std::int64_t> seed;
  std::optional<std::string> negative_prompt;
  std::string output_directory{"./banana-output"};

  auto operator==(const GenerationParams &) const -> bool = default;
};

[[nodiscard]] auto validate_params(const GenerationParams &params)
    -> Result<void>;

[[nodiscard]] auto params_to_json(const GenerationParams &params)
    -> std::string;
[[nodiscard]] auto params_from_json(std::string_view json)
    -> Result<GenerationParams>;

struct ErrorSummary {
  FailureKind kind{FailureKind::Permanent};
  std::string detail;

  auto operator==(const ErrorSummary &) const -> bool = default;
};

struct Job {
  JobId id;
  JobKind kind{JobKind::Generate};
  std::string prompt;
  std::optional<std::string> input_reference;
  std::optional<JobId> parent_id;
  GenerationParams params;
  JobStatus status{JobStatus::Queued};
  int attempt_count{0};
  util::TimePoint created_at{};
  util::TimePoint updated_at{};
  std::vector<std::string> output_references;
  std::optional<ErrorSummary> error;

  auto operator==(const Job &) const -> bool = default;
};

/// Checks the field/status invariants a persisted record must satisfy:
/// outputs present iff Completed, error present iff Failed, Queued jobs have
/// no attempts.
[[nodiscard]] auto check_invariants(const Job &job) -> Result<void>;

/// Whether the state machine allows `from -> to`. Queued -> Failed is only
/// legal for cancellation and is checked separately by the store.
[[nodiscard]] constexpr auto is_allowed_edge(JobStatus from,
                                             JobStatus to) noexcept -> bool {
  switch (from) {
  case JobStatus::Queued:
    return to == JobStatus::Running || to == JobStatus::Failed;
  case JobStatus::Running:
    return to != JobStatus::Queued;
  case JobStatus::Completed:
  case JobStatus::Failed:
    return false;
  }
  return false;
}

// Fields written alongside a status change. The store rejects combinations
// that would break check_invariants().
struct JobTransition {
  // Extends the compare-and-swap guard; required on Running -> Running so
  // two drivers of the same retry cannot both advance it.
  std::optional<int> expected_attempt_count;
  int attempt_count{0};
  std::vector<std::string> output_references;
  std::optional<ErrorSummary> error;
  util::TimePoint updated_at{util::Clock::now()};
};

/// The record a transition produces from `current`, before the store adds
/// its own timestamp ordering. Fails with InvalidState for illegal edges.
[[nodiscard]] auto apply_transition(const Job &current, JobStatus new_status,
                                    const JobTransition &fields)
    -> Result<Job>;

struct JobFilter {
  std::optional<JobStatus> status;
  std::string id_prefix;
  std::size_t limit{0}; // 0 = unlimited

  [[nodiscard]] auto matches(const Job &job) const -> bool {
    if (status && job.status != *status) {
      return false;
    }
    return job.id.value().starts_with(id_prefix);
  }
};

/// First `max_len` characters of the prompt, on one line, with "..." when cut.
[[nodiscard]] auto prompt_preview(std::string_view prompt, std::size_t max_len)
    -> std::string;

} // namespace banana
