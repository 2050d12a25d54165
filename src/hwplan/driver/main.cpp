#include <exception>
#include <filesystem>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>

#include <argparse/argparse.hpp>

#include "commands.hpp"
#include "print.hpp"
#include "project.hpp"

auto main(int argc, char* argv[]) -> int {
  namespace fs = std::filesystem;

  int verbosity = 0;

  argparse::ArgumentParser program("hwplan", "0.1.0");
  program.add_description(
      "Plans hardware codegen and benchmark build actions from hwplan.toml");
  program.add_argument("-C").help("Run as if started in <dir>").metavar("dir");
  program.add_argument("--config")
      .help("Manifest to use instead of searching for hwplan.toml")
      .metavar("file");
  program.add_argument("-v", "--verbose")
      .help("Increase log verbosity (repeatable)")
      .action([&](const auto&) { ++verbosity; })
      .append()
      .default_value(false)
      .implicit_value(true)
      .nargs(0);

  // Subcommand: plan
  argparse::ArgumentParser plan_cmd("plan");
  plan_cmd.add_description("Print the planned build actions");
  plan_cmd.add_argument("--format")
      .default_value(std::string("text"))
      .help("Output format: text (default) or json");

  // Subcommand: check
  argparse::ArgumentParser check_cmd("check");
  check_cmd.add_description("Validate every target without printing actions");

  // Subcommand: emit
  argparse::ArgumentParser emit_cmd("emit");
  emit_cmd.add_description(
      "Write benchmark scripts and codegen metadata under the output "
      "directory");

  program.add_subparser(plan_cmd);
  program.add_subparser(check_cmd);
  program.add_subparser(emit_cmd);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    hwplan::driver::PrintError(err.what());
    std::cerr << program;
    return 1;
  }

  hwplan::driver::ConfigureLogging(verbosity);

  // Handle -C before dispatching subcommands
  if (auto dir = program.present("-C")) {
    std::error_code ec;
    fs::current_path(*dir, ec);
    if (ec) {
      hwplan::driver::PrintError(
          std::format("cannot change to '{}': {}", *dir, ec.message()));
      return 1;
    }
  }

  std::optional<std::string> config_path = program.present("--config");

  if (program.is_subcommand_used("plan")) {
    return hwplan::driver::PlanCommand(plan_cmd, config_path);
  }

  if (program.is_subcommand_used("check")) {
    return hwplan::driver::CheckCommand(check_cmd, config_path);
  }

  if (program.is_subcommand_used("emit")) {
    return hwplan::driver::EmitCommand(emit_cmd, config_path);
  }

  // No subcommand provided
  std::cout << program;
  return 0;
}
