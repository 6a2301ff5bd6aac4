#include "banana/cli/app.hpp"
#include "banana/util/log.hpp"

#include <CLI/CLI.hpp>

int main(int argc, char *argv[]) {
  // Keep command output clean by default.
  banana::log::set_output_stderr();
  banana::log::set_level(banana::log::Level::Warn);

  CLI::App app{"banana", "Generate and edit images with Gemini"};
  banana::cli::CliOptions opts;
  banana::cli::build_cli(app, opts);

  CLI11_PARSE(app, argc, argv);
  return banana::cli::run_command(opts);
}
