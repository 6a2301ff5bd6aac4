#include "banana/cli/commands.hpp"
#include "banana/cli/formatting.hpp"
#include "banana/cli/session.hpp"
#include "banana/util/log.hpp"
#include "banana/util/signal.hpp"

#include <filesystem>
#include <print>

namespace banana::cli {

namespace {

constexpr auto kWaitSlice = std::chrono::milliseconds{500};

auto build_params(const AppConfig &cfg, const GenerateOptions &opts)
    -> GenerationParams {
  GenerationParams params;
  params.model = opts.model.value_or(cfg.api.model);
  params.aspect_ratio = opts.aspect_ratio.value_or(cfg.defaults.aspect_ratio);
  params.size = opts.size.value_or(cfg.defaults.size);
  params.num_images = opts.num_images.value_or(cfg.defaults.num_images);
  params.seed = opts.seed;
  params.negative_prompt = opts.negative_prompt;

  // Absolute, so a later `jobs resume` from another directory writes to the
  // same place.
  std::error_code ec;
  auto dir = std::filesystem::absolute(
      opts.output.value_or(cfg.output.directory), ec);
  params.output_directory =
      ec ? opts.output.value_or(cfg.output.directory) : dir.string();
  return params;
}

auto print_param_error(const GenerationParams &params) -> void {
  if (!is_supported_model(params.model)) {
    std::println(stderr, "Error: unsupported model '{}'", params.model);
  } else if (!is_supported_aspect_ratio(params.aspect_ratio)) {
    std::println(stderr, "Error: unsupported aspect ratio '{}'",
                 params.aspect_ratio);
  } else if (!is_supported_size(params.size)) {
    std::println(stderr, "Error: unsupported size '{}' (1K, 2K or 4K)",
                 params.size);
  } else if (params.num_images < kMinImages || params.num_images > kMaxImages) {
    std::println(stderr, "Error: --num-images must be between {} and {}",
                 kMinImages, kMaxImages);
  } else {
    std::println(stderr, "Error: invalid request");
  }
}

/// Edit input: an explicit image path, or the first output of --from.
auto resolve_edit_source(Session &session, const GenerateOptions &opts,
                         SubmitRequest &req) -> Result<void> {
  if (opts.from_job) {
    auto id = session.resolve_job_id(*opts.from_job);
    if (!id) {
      return fail(id.error());
    }
    auto parent = session.block_on(session.query().get(id->clone()));
    if (!parent) {
      std::println(stderr, "Error: {}", parent.error().message());
      return fail(parent.error());
    }
    if (parent->status != JobStatus::Completed ||
        parent->output_references.empty()) {
      std::println(stderr, "Error: job {} has no output to edit ({})",
                   parent->id, to_string_view(parent->status));
      return fail(Error::InvalidState);
    }
    req.input_reference = parent->output_references.front();
    req.parent_id = parent->id.clone();
    return ok();
  }

  if (!opts.image) {
    std::println(stderr, "Error: edit needs an image path or --from <job>");
    return fail(Error::InvalidArgument);
  }
  std::error_code ec;
  if (!std::filesystem::is_regular_file(*opts.image, ec)) {
    std::println(stderr, "Error: image not found: {}", *opts.image);
    return fail(Error::FileNotFound);
  }
  req.input_reference =
      std::filesystem::absolute(*opts.image, ec).string();
  return ok();
}

} // namespace

auto print_job_result(const Job &job, std::string_view format) -> int {
  if (format == "json") {
    std::println("{}", dump_json(fmt::job_to_json(job)));
  } else if (job.status == JobStatus::Completed) {
    if (format != "quiet") {
      std::println("{} Generated {} image(s) [{}]", fmt::ansi::green("✓"),
                   job.output_references.size(), job.id);
    }
    for (const auto &ref : job.output_references) {
      std::println("{}", ref);
    }
  } else if (job.error) {
    std::println(stderr, "{} {} failed ({}): {}", fmt::ansi::red("✗"), job.id,
                 to_string_view(job.error->kind), job.error->detail);
  }
  return job.status == JobStatus::Completed ? 0 : 1;
}

auto cmd_generate(const GenerateOptions &opts) -> int {
  auto config_res = load_config_or_print(opts.common);
  if (!config_res) {
    return 1;
  }
  if (opts.format != "text" && opts.format != "json" &&
      opts.format != "quiet") {
    std::println(stderr, "Error: --format must be text, json or quiet");
    return 1;
  }

  SubmitRequest req;
  req.kind = opts.edit ? JobKind::Edit : JobKind::Generate;
  req.prompt = opts.prompt;
  req.params = build_params(*config_res, opts);
  if (!validate_params(req.params)) {
    print_param_error(req.params);
    return 1;
  }

  // --no-wait only records the job; a control session never starts it and
  // needs no API key.
  auto session_res = Session::open(std::move(*config_res),
                                    opts.no_wait ? Session::Mode::Control
                                                 : Session::Mode::Worker);
  if (!session_res) {
    std::println(stderr, "Error: {}", session_res.error().message());
    return 1;
  }
  auto &session = **session_res;
  auto &engine = *session.engine();

  if (opts.edit) {
    if (!resolve_edit_source(session, opts, req)) {
      return 1;
    }
  }

  const bool show_progress = opts.format == "text";
  const auto sub = engine.subscribe([show_progress](const JobEvent &e) {
    if (show_progress && e.status == JobStatus::Running) {
      std::println(stderr, "{} attempt {}...", fmt::ansi::dim(e.job_id.str()),
                   e.attempt_count);
    }
  });

  auto id = session.block_on(engine.submit(std::move(req)));
  if (!id) {
    engine.unsubscribe(sub);
    std::println(stderr, "Error: {}", id.error().message());
    return 1;
  }

  if (opts.no_wait) {
    engine.unsubscribe(sub);
    if (opts.format == "json") {
      std::println("{{\"id\":\"{}\",\"status\":\"queued\"}}", *id);
    } else {
      std::println("{}", *id);
    }
    return 0;
  }

  install_interrupt_handlers();
  for (;;) {
    auto job = session.block_on(engine.wait(id->clone(), kWaitSlice));
    if (job) {
      engine.unsubscribe(sub);
      return print_job_result(*job, opts.format);
    }
    if (job.error() != make_error_code(Error::Timeout)) {
      engine.unsubscribe(sub);
      std::println(stderr, "Error: {}", job.error().message());
      return 1;
    }
    if (interrupt_requested()) {
      engine.unsubscribe(sub);
      auto cancelled = session.block_on(engine.cancel(id->clone()));
      if (cancelled) {
        std::println(stderr, "Cancelled {}", *id);
      } else {
        std::println(stderr, "Interrupted; {} left as is: {}", *id,
                     cancelled.error().message());
      }
      return 130;
    }
  }
}

} // namespace banana::cli
