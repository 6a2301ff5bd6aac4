#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <string>

namespace banana::util {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

[[nodiscard]] inline auto to_unix_millis(TimePoint tp) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

[[nodiscard]] inline auto from_unix_millis(std::int64_t millis) -> TimePoint {
  return TimePoint{std::chrono::milliseconds{millis}};
}

/// The precision the job store keeps.
[[nodiscard]] inline auto truncate_to_millis(TimePoint tp) -> TimePoint {
  return from_unix_millis(to_unix_millis(tp));
}

// Formats time point to ISO 8601 (YYYY-MM-DDTHH:MM:SSZ)
[[nodiscard]] inline auto format_iso8601(TimePoint tp) -> std::string {
  if (tp == TimePoint{}) {
    return {};
  }
  return std::format("{:%Y-%m-%dT%H:%M:%SZ}",
                     std::chrono::floor<std::chrono::seconds>(tp));
}

// Local wall-clock rendering for tables (YYYY-MM-DD HH:MM)
[[nodiscard]] inline auto format_local_timestamp_short(TimePoint tp)
    -> std::string {
  if (tp == TimePoint{}) {
    return "-";
  }
  const auto local = std::chrono::current_zone()->to_local(
      std::chrono::floor<std::chrono::minutes>(tp));
  return std::format("{:%Y-%m-%d %H:%M}", local);
}

[[nodiscard]] inline auto format_local_timestamp(TimePoint tp) -> std::string {
  if (tp == TimePoint{}) {
    return "-";
  }
  const auto local = std::chrono::current_zone()->to_local(
      std::chrono::floor<std::chrono::seconds>(tp));
  return std::format("{:%Y-%m-%d %H:%M:%S}", local);
}

} // namespace banana::util
