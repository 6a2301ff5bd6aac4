#pragma once

#include "banana/job/job.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace banana::cli {

struct CommonOptions {
  std::string config_file; // empty = default location
  std::optional<std::string> log_level;
};

struct GenerateOptions {
  CommonOptions common;
  bool edit{false};
  std::string prompt;
  std::optional<std::string> image;    // edit: input image path
  std::optional<std::string> from_job; // edit: first output of this job
  std::optional<std::string> aspect_ratio;
  std::optional<std::string> size;
  std::optional<std::string> model;
  std::optional<int> num_images;
  std::optional<std::int64_t> seed;
  std::optional<std::string> negative_prompt;
  std::optional<std::string> output;
  std::string format{"text"}; // text|json|quiet
  bool no_wait{false};
};

struct JobsListOptions {
  CommonOptions common;
  std::size_t limit{20};
  std::string status;
  std::string prefix;
  std::string format{"table"}; // table|json
};

struct JobRefOptions {
  CommonOptions common;
  std::string job_id; // full id or unique prefix
  bool json{false};
};

struct JobsClearOptions {
  CommonOptions common;
  bool force{false};
};

struct JobsResumeOptions {
  CommonOptions common;
  bool json{false};
};

struct WatchOptions {
  CommonOptions common;
  int interval_ms{1000};
  std::size_t limit{20};
  std::string status;
  bool once{false};
  bool resume{false}; // also drive recoverable jobs from this process
};

struct ConfigOptions {
  CommonOptions common;
  std::string key;
  std::string value;
  bool reveal{false};
  bool force{false};
};

auto cmd_generate(const GenerateOptions &opts) -> int;

/// Prints a finished job as text, json or quiet (paths only). Returns the
/// command's exit status: 0 only for a completed job.
auto print_job_result(const Job &job, std::string_view format) -> int;

auto cmd_jobs_list(const JobsListOptions &opts) -> int;
auto cmd_jobs_show(const JobRefOptions &opts) -> int;
auto cmd_jobs_cancel(const JobRefOptions &opts) -> int;
auto cmd_jobs_delete(const JobRefOptions &opts) -> int;
auto cmd_jobs_clear(const JobsClearOptions &opts) -> int;
auto cmd_jobs_resume(const JobsResumeOptions &opts) -> int;

auto cmd_watch(const WatchOptions &opts) -> int;

auto cmd_config_show(const ConfigOptions &opts) -> int;
auto cmd_config_get(const ConfigOptions &opts) -> int;
auto cmd_config_set(const ConfigOptions &opts) -> int;
auto cmd_config_path(const ConfigOptions &opts) -> int;
auto cmd_config_reset(const ConfigOptions &opts) -> int;

} // namespace banana::cli
