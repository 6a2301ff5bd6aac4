#include "banana/cli/app.hpp"

#include <cstdio>
#include <print>

namespace banana::cli {

namespace {

auto add_common_options(CLI::App *sub, CommonOptions &opts) -> void {
  sub->add_option("-c,--config", opts.config_file,
                  "Config file (default: $BANANA_CONFIG or "
                  "~/.config/banana/config.toml)");
  sub->add_option("--log-level", opts.log_level,
                  "Log level override: trace|debug|info|warn|error");
}

auto add_generation_options(CLI::App *sub, GenerateOptions &opts) -> void {
  add_common_options(sub, opts.common);
  sub->add_option("--aspect-ratio,--ar", opts.aspect_ratio,
                  "Aspect ratio, e.g. 1:1, 16:9, 9:16");
  sub->add_option("--size", opts.size, "Image size: 1K|2K|4K");
  sub->add_option("--model", opts.model, "Model name");
  sub->add_option("-n,--num-images", opts.num_images,
                  "Number of images to request");
  sub->add_option("--seed", opts.seed, "Seed hint");
  sub->add_option("--negative-prompt", opts.negative_prompt,
                  "What the image should avoid");
  sub->add_option("-o,--output", opts.output, "Output directory");
  sub->add_option("--format", opts.format, "Output format: text|json|quiet")
      ->check(CLI::IsMember({"text", "json", "quiet"}));
  sub->add_flag("--no-wait", opts.no_wait,
                "Queue the job and exit; run it later with 'jobs resume'");
}

// Shared by `jobs` and `jobs list`.
auto add_list_options(CLI::App *sub, JobsListOptions &opts) -> void {
  add_common_options(sub, opts.common);
  sub->add_option("-l,--limit", opts.limit, "Maximum jobs to show (0 = all)");
  sub->add_option("-s,--status", opts.status,
                  "Filter: queued|running|completed|failed");
  sub->add_option("-p,--prefix", opts.prefix,
                  "Only ids starting with this prefix");
  sub->add_option("--format", opts.format, "Output format: table|json")
      ->check(CLI::IsMember({"table", "json"}));
}

auto add_job_ref(CLI::App *jobs, std::string name, std::string description,
                 JobRefOptions &opts, Command command, Command &chosen,
                 bool json_flag) -> void {
  auto *sub = jobs->add_subcommand(std::move(name), std::move(description));
  add_common_options(sub, opts.common);
  sub->add_option("job_id", opts.job_id, "Job id or prefix")->required();
  if (json_flag) {
    sub->add_flag("--json", opts.json, "Output JSON");
  }
  sub->callback([&chosen, command] { chosen = command; });
}

auto add_jobs(CLI::App &app, CliOptions &opts) -> void {
  auto *jobs = app.add_subcommand("jobs", "Inspect and manage job history");
  jobs->footer("\nExamples:\n"
               "  banana jobs --status failed\n"
               "  banana jobs show 3f9a\n"
               "  banana jobs cancel 3f9a\n"
               "  banana jobs clear --force");
  add_list_options(jobs, opts.jobs_list);

  auto *list = jobs->add_subcommand("list", "List recent jobs");
  add_list_options(list, opts.jobs_list);
  list->callback([&opts] { opts.command = Command::JobsList; });

  add_job_ref(jobs, "show", "Show one job in detail", opts.jobs_ref,
              Command::JobsShow, opts.command, true);
  add_job_ref(jobs, "cancel", "Cancel a queued or running job", opts.jobs_ref,
              Command::JobsCancel, opts.command, true);
  add_job_ref(jobs, "delete", "Delete a finished job from history",
              opts.jobs_ref, Command::JobsDelete, opts.command, false);

  auto *clear =
      jobs->add_subcommand("clear", "Delete all finished jobs from history");
  add_common_options(clear, opts.jobs_clear.common);
  clear->add_flag("-f,--force", opts.jobs_clear.force, "Actually delete");
  clear->callback([&opts] { opts.command = Command::JobsClear; });

  auto *resume = jobs->add_subcommand(
      "resume", "Run queued and interrupted jobs to completion");
  add_common_options(resume, opts.jobs_resume.common);
  resume->add_flag("--json", opts.jobs_resume.json, "Output JSON");
  resume->callback([&opts] { opts.command = Command::JobsResume; });

  // Bare `banana jobs` lists. Subcommand callbacks have already run.
  jobs->callback([jobs, &opts] {
    if (jobs->get_subcommands().empty()) {
      opts.command = Command::JobsList;
    }
  });
}

auto add_config(CLI::App &app, CliOptions &opts) -> void {
  auto *config = app.add_subcommand("config", "Show or edit configuration");
  config->require_subcommand(1);
  config->footer("\nExamples:\n"
                 "  banana config show\n"
                 "  banana config set defaults.aspect_ratio 16:9\n"
                 "  banana config get api.key --reveal");
  auto &cfg = opts.config;

  auto *show =
      config->add_subcommand("show", "Print the effective configuration");
  add_common_options(show, cfg.common);
  show->add_flag("--reveal", cfg.reveal, "Print secrets in clear text");
  show->callback([&opts] { opts.command = Command::ConfigShow; });

  auto *get = config->add_subcommand("get", "Print one setting");
  add_common_options(get, cfg.common);
  get->add_option("key", cfg.key, "Dotted key")->required();
  get->add_flag("--reveal", cfg.reveal, "Print secrets in clear text");
  get->callback([&opts] { opts.command = Command::ConfigGet; });

  auto *set =
      config->add_subcommand("set", "Change one setting in the config file");
  add_common_options(set, cfg.common);
  set->add_option("key", cfg.key, "Dotted key")->required();
  set->add_option("value", cfg.value, "New value")->required();
  set->callback([&opts] { opts.command = Command::ConfigSet; });

  auto *path = config->add_subcommand("path", "Print the config file location");
  add_common_options(path, cfg.common);
  path->callback([&opts] { opts.command = Command::ConfigPath; });

  auto *reset =
      config->add_subcommand("reset", "Overwrite the config file with defaults");
  add_common_options(reset, cfg.common);
  reset->add_flag("-f,--force", cfg.force, "Actually overwrite");
  reset->callback([&opts] { opts.command = Command::ConfigReset; });
}

} // namespace

auto build_cli(CLI::App &app, CliOptions &opts) -> void {
  app.require_subcommand(1);
  app.footer("\nExamples:\n"
             "  banana generate \"a banana astronaut\" --ar 16:9\n"
             "  banana edit photo.png \"make it sunset\"\n"
             "  banana edit --from 3f9a \"add a hat\"\n"
             "  banana jobs\n"
             "  banana watch\n"
             "\nTip: Set GEMINI_API_KEY or run 'banana config set api.key "
             "<key>'.");

  auto *generate =
      app.add_subcommand("generate", "Generate images from a text prompt");
  generate->alias("g");
  generate->add_option("prompt", opts.generate.prompt, "Prompt text")
      ->required();
  add_generation_options(generate, opts.generate);
  generate->callback([&opts] { opts.command = Command::Generate; });

  opts.edit.edit = true;
  auto *edit = app.add_subcommand("edit", "Edit an image with a text prompt");
  edit->alias("e");
  edit->footer("\nExamples:\n"
               "  banana edit photo.png \"make it sunset\"\n"
               "  banana edit --from 3f9a \"add a hat\"");
  edit->add_option("args", opts.edit_args, "[image] prompt")
      ->required()
      ->expected(1, 2);
  edit->add_option("--from", opts.edit.from_job,
                   "Edit the first output of this job (id or prefix)");
  add_generation_options(edit, opts.edit);
  edit->callback([&opts] { opts.command = Command::Edit; });

  add_jobs(app, opts);

  auto *watch = app.add_subcommand("watch", "Live view of the job history");
  add_common_options(watch, opts.watch.common);
  watch->add_option("-i,--interval", opts.watch.interval_ms,
                    "Refresh interval in milliseconds");
  watch->add_option("-l,--limit", opts.watch.limit, "Maximum jobs to show");
  watch->add_option("-s,--status", opts.watch.status,
                    "Filter: queued|running|completed|failed");
  watch->add_flag("--once", opts.watch.once, "Print one frame and exit");
  watch->add_flag("--resume", opts.watch.resume,
                  "Also run queued and interrupted jobs");
  watch->callback([&opts] { opts.command = Command::Watch; });

  add_config(app, opts);
}

auto apply_edit_args(CliOptions &opts) -> bool {
  const auto &args = opts.edit_args;
  if (opts.edit.from_job) {
    if (args.size() != 1) {
      std::println(stderr, "Error: with --from, pass only the prompt");
      return false;
    }
    opts.edit.prompt = args[0];
    return true;
  }
  if (args.size() != 2) {
    std::println(stderr,
                 "Error: edit needs <image> <prompt> or --from <job> <prompt>");
    return false;
  }
  opts.edit.image = args[0];
  opts.edit.prompt = args[1];
  return true;
}

auto run_command(CliOptions &opts) -> int {
  switch (opts.command) {
  case Command::Generate:
    return cmd_generate(opts.generate);
  case Command::Edit:
    if (!apply_edit_args(opts)) {
      return 2;
    }
    return cmd_generate(opts.edit);
  case Command::JobsList:
    return cmd_jobs_list(opts.jobs_list);
  case Command::JobsShow:
    return cmd_jobs_show(opts.jobs_ref);
  case Command::JobsCancel:
    return cmd_jobs_cancel(opts.jobs_ref);
  case Command::JobsDelete:
    return cmd_jobs_delete(opts.jobs_ref);
  case Command::JobsClear:
    return cmd_jobs_clear(opts.jobs_clear);
  case Command::JobsResume:
    return cmd_jobs_resume(opts.jobs_resume);
  case Command::Watch:
    return cmd_watch(opts.watch);
  case Command::ConfigShow:
    return cmd_config_show(opts.config);
  case Command::ConfigGet:
    return cmd_config_get(opts.config);
  case Command::ConfigSet:
    return cmd_config_set(opts.config);
  case Command::ConfigPath:
    return cmd_config_path(opts.config);
  case Command::ConfigReset:
    return cmd_config_reset(opts.config);
  case Command::None:
    break;
  }
  std::println(stderr, "Error: no command given");
  return 2;
}

} // namespace banana::cli
