#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "hwplan/action/action_graph.hpp"
#include "hwplan/action/artifact.hpp"
#include "hwplan/benchmark/benchmark_action.hpp"
#include "hwplan/codegen/codegen_info.hpp"
#include "hwplan/common/diagnostic/diagnostic_sink.hpp"
#include "hwplan/config/project_config.hpp"
#include "hwplan/toolchain/toolchain.hpp"

namespace hwplan::workspace {

struct VerilogTargetResult {
  std::shared_ptr<const codegen::CodegenInfo> info;
  benchmark::OptIrInfo opt_ir;
  // Files the target builds, in plan order.
  std::vector<action::Artifact> built_files;
  std::vector<action::Artifact> runfiles;
};

struct WorkspacePlan {
  action::ActionGraph graph;
  // Successfully planned targets only.
  std::map<std::string, VerilogTargetResult> verilog_targets;
  std::map<std::string, benchmark::BenchmarkInfo> benchmark_targets;
};

// Plans every target of `config`: verilog targets first, in manifest order,
// then benchmark targets. A failing target is reported to `sink` and
// contributes no action; the others are still planned.
auto PlanWorkspace(
    const config::ProjectConfig& config, const toolchain::Toolchain& toolchain,
    DiagnosticSink& sink) -> WorkspacePlan;

}  // namespace hwplan::workspace
