#pragma once

#include "banana/cli/commands.hpp"

#include <CLI/CLI.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace banana::cli {

enum class Command : std::uint8_t {
  None,
  Generate,
  Edit,
  JobsList,
  JobsShow,
  JobsCancel,
  JobsDelete,
  JobsClear,
  JobsResume,
  Watch,
  ConfigShow,
  ConfigGet,
  ConfigSet,
  ConfigPath,
  ConfigReset,
};

/// Parse targets for every subcommand. Only the chosen subcommand's fields
/// are written by a parse.
struct CliOptions {
  Command command{Command::None};
  GenerateOptions generate;
  GenerateOptions edit;
  std::vector<std::string> edit_args; // [image] prompt
  JobsListOptions jobs_list;
  JobRefOptions jobs_ref; // show, cancel, delete
  JobsClearOptions jobs_clear;
  JobsResumeOptions jobs_resume;
  WatchOptions watch;
  ConfigOptions config;
};

/// Registers the subcommand tree on `app`. Callbacks only record the chosen
/// command in `opts.command`; run_command() executes it.
auto build_cli(CLI::App &app, CliOptions &opts) -> void;

/// Splits `edit <image> <prompt>` / `edit --from <job> <prompt>` into
/// opts.edit. Prints usage and returns false on a bad combination.
[[nodiscard]] auto apply_edit_args(CliOptions &opts) -> bool;

/// Exit status of the chosen command.
auto run_command(CliOptions &opts) -> int;

} // namespace banana::cli
