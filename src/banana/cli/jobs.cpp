#include "banana/cli/commands.hpp"
#include "banana/cli/formatting.hpp"
#include "banana/cli/session.hpp"
#include "banana/util/log.hpp"
#include "banana/util/signal.hpp"

#include <chrono>
#include <print>
#include <thread>

namespace banana::cli {

namespace {

auto open_or_print(const CommonOptions &common, Session::Mode mode)
    -> std::unique_ptr<Session> {
  auto config_res = load_config_or_print(common);
  if (!config_res) {
    return nullptr;
  }
  auto session = Session::open(std::move(*config_res), mode);
  if (!session) {
    std::println(stderr, "Error: {}", session.error().message());
    return nullptr;
  }
  return std::move(*session);
}

auto parse_status_filter(std::string_view text)
    -> Result<std::optional<JobStatus>> {
  if (text.empty()) {
    return ok(std::optional<JobStatus>{});
  }
  auto status = util::try_parse_enum<JobStatus>(text);
  if (!status) {
    std::println(stderr,
                 "Error: unknown status '{}' (queued, running, completed, "
                 "failed)",
                 text);
    return fail(Error::InvalidArgument);
  }
  return ok(std::optional<JobStatus>{*status});
}

auto print_job_detail(const Job &job) -> void {
  std::println("{}  {}", fmt::ansi::bold(job.id.str()),
               fmt::colorize_job_status(job.status));
  std::println("  Action:     {}", to_string_view(job.kind));
  std::println("  Prompt:     {}", job.prompt);
  if (job.input_reference) {
    std::println("  Input:      {}", *job.input_reference);
  }
  if (job.parent_id) {
    std::println("  Edited from {}", *job.parent_id);
  }
  std::println("  Model:      {}", job.params.model);
  std::println("  Aspect:     {}   Size: {}   Images: {}",
               job.params.aspect_ratio, job.params.size,
               job.params.num_images);
  if (job.params.seed) {
    std::println("  Seed:       {}", *job.params.seed);
  }
  if (job.params.negative_prompt) {
    std::println("  Negative:   {}", *job.params.negative_prompt);
  }
  std::println("  Output dir: {}", job.params.output_directory);
  std::println("  Attempts:   {}", job.attempt_count);
  std::println("  Created:    {}", util::format_local_timestamp(job.created_at));
  std::println("  Updated:    {}", util::format_local_timestamp(job.updated_at));
  if (job.error) {
    std::println("  Error:      {} ({})", fmt::ansi::red(job.error->detail),
                 to_string_view(job.error->kind));
  }
  if (!job.output_references.empty()) {
    std::println("  Outputs:");
    for (const auto &ref : job.output_references) {
      std::println("    {}", ref);
    }
  }
}

} // namespace

auto cmd_jobs_list(const JobsListOptions &opts) -> int {
  auto status = parse_status_filter(opts.status);
  if (!status) {
    return 1;
  }
  auto session = open_or_print(opts.common, Session::Mode::QueryOnly);
  if (!session) {
    return 1;
  }

  JobFilter filter{.status = *status,
                   .id_prefix = opts.prefix.empty()
                                    ? std::string{}
                                    : expand_job_id_prefix(opts.prefix),
                   .limit = opts.limit};
  auto jobs = session->query().list_blocking(filter);
  if (!jobs) {
    std::println(stderr, "Error: {}", jobs.error().message());
    return 1;
  }

  if (opts.format == "json") {
    JsonValue arr = std::vector<JsonValue>{};
    for (const auto &job : *jobs) {
      arr.get_array().emplace_back(fmt::job_to_json(job));
    }
    std::println("{}", dump_json(arr));
    return 0;
  }

  if (jobs->empty()) {
    std::println("No jobs found.");
    return 0;
  }

  auto total = session->query().count_blocking(filter);
  const auto table = fmt::job_table();
  table.print_header();
  for (const auto &job : *jobs) {
    table.print_row(fmt::job_row(job));
  }
  std::println("\nShowing {} of {} jobs", jobs->size(),
               total ? *total : jobs->size());
  return 0;
}

auto cmd_jobs_show(const JobRefOptions &opts) -> int {
  auto session = open_or_print(opts.common, Session::Mode::QueryOnly);
  if (!session) {
    return 1;
  }
  auto id = session->resolve_job_id(opts.job_id);
  if (!id) {
    return 1;
  }
  auto job = session->query().get_blocking(std::move(*id));
  if (!job) {
    std::println(stderr, "Error: {}", job.error().message());
    return 1;
  }
  if (opts.json) {
    std::println("{}", dump_json(fmt::job_to_json(*job)));
  } else {
    print_job_detail(*job);
  }
  return 0;
}

auto cmd_jobs_cancel(const JobRefOptions &opts) -> int {
  auto session = open_or_print(opts.common, Session::Mode::Control);
  if (!session) {
    return 1;
  }
  auto id = session->resolve_job_id(opts.job_id);
  if (!id) {
    return 1;
  }
  auto job = session->block_on(session->engine()->cancel(std::move(*id)));
  if (!job) {
    if (job.error() == make_error_code(Error::InvalidState)) {
      std::println(stderr, "Error: job {} already finished", opts.job_id);
    } else {
      std::println(stderr, "Error: {}", job.error().message());
    }
    return 1;
  }
  if (opts.json) {
    std::println("{}", dump_json(fmt::job_to_json(*job)));
  } else {
    std::println("Cancelled {}", job->id);
  }
  return 0;
}

auto cmd_jobs_delete(const JobRefOptions &opts) -> int {
  auto session = open_or_print(opts.common, Session::Mode::QueryOnly);
  if (!session) {
    return 1;
  }
  auto id = session->resolve_job_id(opts.job_id);
  if (!id) {
    return 1;
  }
  auto r = session->block_on(session->store().purge(*id));
  if (!r) {
    if (r.error() == make_error_code(Error::InvalidState)) {
      std::println(stderr, "Error: job {} is still active; cancel it first",
                   *id);
    } else {
      std::println(stderr, "Error: {}", r.error().message());
    }
    return 1;
  }
  std::println("Deleted {}", *id);
  return 0;
}

auto cmd_jobs_clear(const JobsClearOptions &opts) -> int {
  auto session = open_or_print(opts.common, Session::Mode::QueryOnly);
  if (!session) {
    return 1;
  }
  if (!opts.force) {
    auto counts = session->query().status_counts_blocking();
    if (!counts) {
      std::println(stderr, "Error: {}", counts.error().message());
      return 1;
    }
    std::println("This would delete {} finished job(s). Re-run with --force.",
                 counts->completed + counts->failed);
    return 1;
  }
  auto removed = session->block_on(session->store().purge_terminal());
  if (!removed) {
    std::println(stderr, "Error: {}", removed.error().message());
    return 1;
  }
  std::println("Deleted {} finished job(s)", *removed);
  return 0;
}

auto cmd_jobs_resume(const JobsResumeOptions &opts) -> int {
  auto session = open_or_print(opts.common, Session::Mode::Worker);
  if (!session) {
    return 1;
  }
  auto &engine = *session->engine();

  // Opening a worker session already ran recovery.
  const auto scheduled = session->recovered();
  if (scheduled == 0) {
    if (opts.json) {
      std::println("{{\"resumed\":0}}");
    } else {
      std::println("Nothing to resume.");
    }
    return 0;
  }
  if (!opts.json) {
    std::println("Resuming {} job(s)...", scheduled);
  }

  install_interrupt_handlers();
  while (!engine.is_idle()) {
    if (interrupt_requested()) {
      std::println(stderr, "Interrupted; remaining jobs stay resumable.");
      return 130;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds{200});
  }

  auto counts = session->query().status_counts_blocking();
  if (!counts) {
    std::println(stderr, "Error: {}", counts.error().message());
    return 1;
  }
  if (opts.json) {
    std::println("{{\"resumed\":{},\"completed\":{},\"failed\":{}}}",
                 scheduled, counts->completed, counts->failed);
  } else {
    std::println("Done. History: {} completed, {} failed.", counts->completed,
                 counts->failed);
  }
  return 0;
}

} // namespace banana::cli
