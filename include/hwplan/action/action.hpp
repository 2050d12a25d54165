#pragma once

#include <string>
#include <variant>
#include <vector>

#include "hwplan/action/artifact.hpp"
#include "hwplan/action/command_line.hpp"

namespace hwplan::action {

// Runs one external tool. The tool itself is opaque to hwplan.
struct RunAction {
  std::string mnemonic;
  std::string progress_message;
  CommandLine command;
  std::vector<Artifact> inputs;
  std::vector<Artifact> tools;
  std::vector<Artifact> outputs;

  auto operator==(const RunAction&) const -> bool = default;
};

// Writes a file whose content is known at planning time.
struct WriteAction {
  Artifact output;
  std::string content;
  bool is_executable = false;

  auto operator==(const WriteAction&) const -> bool = default;
};

using Action = std::variant<RunAction, WriteAction>;

// Files the action produces.
auto OutputsOf(const Action& action) -> std::vector<Artifact>;

// Short human-readable kind ("Codegen", "FileWrite").
auto MnemonicOf(const Action& action) -> std::string;

}  // namespace hwplan::action
