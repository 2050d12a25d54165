#pragma once

#include <string>
#include <vector>

#include "hwplan/action/action_graph.hpp"
#include "hwplan/action/artifact.hpp"
#include "hwplan/action/command_line.hpp"
#include "hwplan/codegen/codegen_info.hpp"
#include "hwplan/common/diagnostic/diagnostic.hpp"
#include "hwplan/toolchain/toolchain.hpp"

namespace hwplan::benchmark {

// Optimized IR of a design, as fed to codegen.
struct OptIrInfo {
  action::Artifact opt_ir_file;

  auto operator==(const OptIrInfo&) const -> bool = default;
};

struct BenchmarkRequest {
  std::string target_name;
  // Target that produced the CodegenInfo, named in diagnostics.
  std::string verilog_target;
};

struct BenchmarkInfo {
  // Generated "<target>.sh".
  action::Artifact executable;
  // Tool closure plus the three consumed artifacts.
  std::vector<action::Artifact> runfiles;
};

// Command the script runs. Paths are short paths: the script runs from the
// runfiles tree, not from the execution root.
auto MakeBenchmarkCommand(
    const action::Artifact& tool, const codegen::CodegenInfo& codegen_info,
    const OptIrInfo& opt_ir_info) -> action::CommandLine;

// Full script text: shebang, "set -e", the command, "exit 0".
auto MakeBenchmarkScript(const action::CommandLine& command) -> std::string;

// Registers one write action producing an executable script that benchmarks
// the codegen outputs. Fails with kMissingTop, naming the verilog target,
// when `codegen_info` carries no top-level name. On failure nothing is
// registered.
auto BuildBenchmarkAction(
    const BenchmarkRequest& request, const codegen::CodegenInfo& codegen_info,
    const OptIrInfo& opt_ir_info,
    const Result<toolchain::ResolvedTool>& benchmark_tool,
    action::ActionGraph& graph) -> Result<BenchmarkInfo>;

}  // namespace hwplan::benchmark
