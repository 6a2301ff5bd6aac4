#pragma once

#include "banana/job/job.hpp"
#include "banana/util/json.hpp"
#include "banana/util/time.hpp"

#include <cstdio>
#include <format>
#include <print>
#include <string>
#include <string_view>
#include <unistd.h>
#include <vector>

namespace banana::cli::fmt {

namespace ansi {

inline auto is_tty() noexcept -> bool {
  static const bool tty = ::isatty(::fileno(stdout)) != 0;
  return tty;
}

inline constexpr std::string_view kReset = "\033[0m";
inline constexpr std::string_view kBold = "\033[1m";
inline constexpr std::string_view kDim = "\033[2m";
inline constexpr std::string_view kGreen = "\033[32m";
inline constexpr std::string_view kRed = "\033[31m";
inline constexpr std::string_view kYellow = "\033[33m";
inline constexpr std::string_view kCyan = "\033[36m";

inline auto colorize(std::string_view text, std::string_view color)
    -> std::string {
  if (!is_tty()) {
    return std::string(text);
  }
  return std::format("{}{}{}", color, text, kReset);
}

inline auto bold(std::string_view text) -> std::string {
  return colorize(text, kBold);
}
inline auto dim(std::string_view text) -> std::string {
  return colorize(text, kDim);
}
inline auto green(std::string_view text) -> std::string {
  return colorize(text, kGreen);
}
inline auto red(std::string_view text) -> std::string {
  return colorize(text, kRed);
}
inline auto yellow(std::string_view text) -> std::string {
  return colorize(text, kYellow);
}
inline auto cyan(std::string_view text) -> std::string {
  return colorize(text, kCyan);
}

/// Printed width of `s`, skipping escape sequences.
inline auto visible_width(std::string_view s) -> std::size_t {
  std::size_t width = 0;
  bool in_escape = false;
  for (char c : s) {
    if (in_escape) {
      if (c == 'm')
        in_escape = false;
    } else if (c == '\033') {
      in_escape = true;
    } else if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
      ++width; // count UTF-8 lead bytes only
    }
  }
  return width;
}

inline constexpr std::string_view kClearScreen = "\033[H\033[2J";

} // namespace ansi

inline auto colorize_job_status(JobStatus status) -> std::string {
  const auto text = to_string_view(status);
  switch (status) {
  case JobStatus::Queued:
    return ansi::dim(text);
  case JobStatus::Running:
    return ansi::yellow(text);
  case JobStatus::Completed:
    return ansi::green(text);
  case JobStatus::Failed:
    return ansi::red(text);
  }
  return std::string(text);
}

class Table {
public:
  struct Column {
    std::string header;
    std::size_t width;
    bool right_align{false};
  };

  explicit Table(std::vector<Column> columns) : columns_(std::move(columns)) {}

  [[nodiscard]] auto render_header() const -> std::string {
    std::string out;
    std::size_t total_width = 0;
    for (std::size_t i = 0; i < columns_.size(); ++i) {
      if (i > 0)
        out.push_back(' ');
      const auto &col = columns_[i];
      out += col.right_align ? std::format("{:>{}}", col.header, col.width)
                             : std::format("{:<{}}", col.header, col.width);
      total_width += col.width + (i > 0 ? 1 : 0);
    }
    out.push_back('\n');
    out.append(total_width, '-');
    out.push_back('\n');
    return out;
  }

  [[nodiscard]] auto render_row(const std::vector<std::string> &values) const
      -> std::string {
    std::string out;
    for (std::size_t i = 0; i < columns_.size() && i < values.size(); ++i) {
      if (i > 0)
        out.push_back(' ');
      const auto &col = columns_[i];
      const auto &val = values[i];
      const auto visible = ansi::visible_width(val);
      const std::string pad(visible < col.width ? col.width - visible : 0,
                            ' ');
      out += col.right_align ? pad + val : val + pad;
    }
    out.push_back('\n');
    return out;
  }

  auto print_header() const -> void { std::print("{}", render_header()); }
  auto print_row(const std::vector<std::string> &values) const -> void {
    std::print("{}", render_row(values));
  }

private:
  std::vector<Column> columns_;
};

inline constexpr std::size_t kPromptPreviewWidth = 38;

/// ID, ACTION, STATUS, TRIES, PROMPT, CREATED
inline auto job_table() -> Table {
  return Table({{.header = "ID", .width = 11},
                {.header = "ACTION", .width = 8},
                {.header = "STATUS", .width = 9},
                {.header = "TRIES", .width = 5, .right_align = true},
                {.header = "PROMPT", .width = kPromptPreviewWidth},
                {.header = "CREATED", .width = 16}});
}

inline auto job_row(const Job &job) -> std::vector<std::string> {
  return {job.id.str(),
          std::string(to_string_view(job.kind)),
          colorize_job_status(job.status),
          std::format("{}", job.attempt_count),
          prompt_preview(job.prompt, kPromptPreviewWidth),
          util::format_local_timestamp_short(job.created_at)};
}

inline auto job_to_json(const Job &job) -> JsonValue {
  JsonValue outputs = std::vector<JsonValue>{};
  for (const auto &ref : job.output_references) {
    outputs.get_array().emplace_back(ref);
  }
  JsonValue obj{
      {"id", job.id.str()},
      {"kind", std::string(to_string_view(job.kind))},
      {"status", std::string(to_string_view(job.status))},
      {"prompt", job.prompt},
      {"attempt_count", static_cast<std::int64_t>(job.attempt_count)},
      {"model", job.params.model},
      {"aspect_ratio", job.params.aspect_ratio},
      {"size", job.params.size},
      {"num_images", static_cast<std::int64_t>(job.params.num_images)},
      {"output_directory", job.params.output_directory},
      {"created_at", util::format_iso8601(job.created_at)},
      {"updated_at", util::format_iso8601(job.updated_at)},
      {"outputs", std::move(outputs)},
  };
  if (job.input_reference) {
    obj["input"] = *job.input_reference;
  }
  if (job.parent_id) {
    obj["parent_id"] = job.parent_id->str();
  }
  if (job.params.seed) {
    obj["seed"] = *job.params.seed;
  }
  if (job.params.negative_prompt) {
    obj["negative_prompt"] = *job.params.negative_prompt;
  }
  if (job.error) {
    obj["error"] = JsonValue{
        {"kind", std::string(to_string_view(job.error->kind))},
        {"detail", job.error->detail},
    };
  }
  return obj;
}

} // namespace banana::cli::fmt
