#include "banana/job/job.hpp"

#include "banana/util/json.hpp"
#include "banana/util/log.hpp"

#include <algorithm>

template <> struct glz::meta<banana::GenerationParams> {
  using T = banana::GenerationParams;
  static constexpr auto value =
      object("model", &T::model, "aspect_ratio", &T::aspect_ratio, "size",
             &T::size, "num_images", &T::num_images, "seed", &T::seed,
             "negative_prompt", &T::negative_prompt, "output_directory",
             &T::output_directory);
};

namespace banana {

auto is_supported_aspect_ratio(std::string_view v) noexcept -> bool {
  return std::ranges::contains(kAspectRatios, v);
}

auto is_supported_size(std::string_view v) noexcept -> bool {
  return std::ranges::contains(kImageSizes, v);
}

auto is_supported_model(std::string_view v) noexcept -> bool {
  return std::ranges::contains(kModels, v);
}

auto validate_params(const GenerationParams &params) -> Result<void> {
  if (!is_supported_model(params.model)) {
    log::debug("Rejecting unsupported model '{}'", params.model);
    return fail(Error::InvalidArgument);
  }
  if (!is_supported_aspect_ratio(params.aspect_ratio) ||
      !is_supported_size(params.size)) {
    return fail(Error::InvalidArgument);
  }
  if (params.num_images < kMinImages || params.num_images > kMaxImages) {
    return fail(Error::InvalidArgument);
  }
  if (params.output_directory.empty()) {
    return fail(Error::InvalidArgument);
  }
  return ok();
}

auto params_to_json(const GenerationParams &params) -> std::string {
  auto out = glz::write_json(params);
  return out ? *out : "{}";
}

auto params_from_json(std::string_view json) -> Result<GenerationParams> {
  return read_json_as<GenerationParams>(json);
}

auto check_invariants(const Job &job) -> Result<void> {
  const bool completed = job.status == JobStatus::Completed;
  const bool failed = job.status == JobStatus::Failed;
  if (completed != !job.output_references.empty()) {
    return fail(Error::InvalidState);
  }
  if (failed != job.error.has_value()) {
    return fail(Error::InvalidState);
  }
  if (job.status == JobStatus::Queued && job.attempt_count != 0) {
    return fail(Error::InvalidState);
  }
  if (job.status != JobStatus::Queued && !failed && job.attempt_count < 1) {
    return fail(Error::InvalidState);
  }
  return ok();
}

auto apply_transition(const Job &current, JobStatus new_status,
                      const JobTransition &fields) -> Result<Job> {
  if (!is_allowed_edge(current.status, new_status)) {
    return fail(Error::InvalidState);
  }
  if (current.status == JobStatus::Queued && new_status == JobStatus::Failed &&
      (!fields.error || fields.error->kind != FailureKind::Cancelled)) {
    return fail(Error::InvalidState);
  }
  if (fields.attempt_count < current.attempt_count) {
    return fail(Error::InvalidState);
  }

  Job next = current;
  next.status = new_status;
  next.attempt_count = fields.attempt_count;
  next.output_references = fields.output_references;
  next.error = fields.error;
  next.updated_at = std::max(fields.updated_at,
                             current.updated_at + std::chrono::milliseconds{1});
  if (auto r = check_invariants(next); !r) {
    return fail(r.error());
  }
  return next;
}

auto prompt_preview(std::string_view prompt, std::size_t max_len)
    -> std::string {
  std::string flat;
  flat.reserve(std::min(prompt.size(), max_len + 3));
  for (char c : prompt) {
    flat.push_back(c == '\n' || c == '\r' || c == '\t' ? ' ' : c);
    if (flat.size() > max_len) {
      break;
    }
  }
  if (flat.size() <= max_len) {
    return flat;
  }
  flat.resize(max_len > 3 ? max_len - 3 : max_len);
  flat += "...";
  return flat;
}

} // namespace banana
