#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "hwplan/codegen/artifact_plan.hpp"
#include "hwplan/codegen/codegen_args.hpp"

namespace hwplan::test {

struct ExpectedError {
  // DiagCode spelling, e.g. "unknown-option"
  std::string code;
  std::optional<std::string> subject;
  std::optional<std::string> message;
};

// One codegen target planned in isolation, optionally followed by a
// benchmark over its outputs. Tools are fixed: "tools/codegen_main" and
// "tools/benchmark_codegen_main", out_dir "out".
struct PlanCase {
  std::string name;
  std::string source_yaml;  // Path to YAML file for error reporting
  std::string src;
  std::string verilog_file;
  codegen::CodegenArgs codegen_args;
  codegen::OutputOverrides overrides;
  bool benchmark = false;

  std::optional<std::string> expected_command;
  // Output paths of the codegen action, in order
  std::optional<std::vector<std::string>> expected_outputs;
  std::optional<std::string> expected_script;
  std::vector<std::string> expected_ignored;
  std::optional<ExpectedError> expected_error;
};

// GTest printer for readable test names
inline void PrintTo(const PlanCase& plan_case, std::ostream* os) {
  *os << plan_case.source_yaml << ":" << plan_case.name;
}

}  // namespace hwplan::test
