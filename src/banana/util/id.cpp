#include "banana/util/id.hpp"

#include <algorithm>
#include <cstdint>
#include <format>
#include <random>

namespace banana {

namespace detail {

auto generate_short_uuid() -> std::string {
  thread_local std::mt19937_64 gen(std::random_device{}());
  thread_local std::uniform_int_distribution<std::uint32_t> dis;
  return std::format("{:08x}", dis(gen));
}

} // namespace detail

auto generate_job_id() -> JobId {
  return JobId{std::format("{}{}", kJobIdPrefix, detail::generate_short_uuid())};
}

auto is_valid_job_id(std::string_view text) noexcept -> bool {
  if (!text.starts_with(kJobIdPrefix)) {
    return false;
  }
  auto suffix = text.substr(kJobIdPrefix.size());
  return suffix.size() == kJobIdSuffixLength &&
         std::ranges::all_of(suffix, [](char c) {
           return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
         });
}

auto expand_job_id_prefix(std::string_view input) -> std::string {
  if (input.starts_with(kJobIdPrefix) || kJobIdPrefix.starts_with(input)) {
    return std::string(input);
  }
  return std::format("{}{}", kJobIdPrefix, input);
}

} // namespace banana
