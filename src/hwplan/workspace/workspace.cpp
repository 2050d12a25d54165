#include "hwplan/workspace/workspace.hpp"

#include <algorithm>
#include <format>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "hwplan/action/action_graph.hpp"
#include "hwplan/action/artifact.hpp"
#include "hwplan/benchmark/benchmark_action.hpp"
#include "hwplan/codegen/artifact_role.hpp"
#include "hwplan/codegen/codegen_action.hpp"
#include "hwplan/common/diagnostic/diagnostic.hpp"
#include "hwplan/common/diagnostic/diagnostic_sink.hpp"
#include "hwplan/config/project_config.hpp"
#include "hwplan/toolchain/toolchain.hpp"

namespace hwplan::workspace {

namespace {

void PlanVerilogTargets(
    const config::ProjectConfig& config, const toolchain::Toolchain& toolchain,
    DiagnosticSink& sink, WorkspacePlan& plan) {
  for (const auto& target : config.verilog_targets) {
    spdlog::debug("planning verilog target '{}'", target.name);

    codegen::CodegenRequest request{
        .target_name = target.name,
        .src = action::Artifact::Source(target.src),
        .codegen_args = target.codegen_args,
        .verilog_file = target.verilog_file,
        .overrides = target.overrides,
    };
    auto result = codegen::BuildCodegenAction(
        request, toolchain.codegen_tool, plan.graph);
    if (!result) {
      spdlog::debug("verilog target '{}' failed", target.name);
      sink.Report(std::move(result).error());
      continue;
    }

    for (auto role : result->plan.ignored_overrides) {
      sink.Warning(
          target.name,
          std::format(
              "target '{}': {} override ignored, the {} generator does not "
              "produce it",
              target.name, codegen::ToString(role),
              codegen::ToString(result->plan.mode)));
    }

    VerilogTargetResult entry{
        .info = result->info,
        .opt_ir = benchmark::OptIrInfo{.opt_ir_file = request.src},
        .built_files = {},
        .runfiles = std::move(result->runfiles),
    };
    for (const auto& output : result->outputs) {
      entry.built_files.push_back(output.artifact);
    }
    spdlog::trace(
        "verilog target '{}' declares {} outputs", target.name,
        entry.built_files.size());
    plan.verilog_targets.emplace(target.name, std::move(entry));
  }
}

void PlanBenchmarkTargets(
    const config::ProjectConfig& config, const toolchain::Toolchain& toolchain,
    DiagnosticSink& sink, WorkspacePlan& plan) {
  for (const auto& target : config.benchmark_targets) {
    spdlog::debug("planning benchmark target '{}'", target.name);

    auto upstream = plan.verilog_targets.find(target.verilog_target);
    if (upstream == plan.verilog_targets.end()) {
      bool declared = std::ranges::any_of(
          config.verilog_targets, [&](const auto& verilog) {
            return verilog.name == target.verilog_target;
          });
      sink.Report(
          Diagnostic::Error(
              DiagCode::kUnknownTarget, target.verilog_target,
              declared ? std::format(
                             "benchmark target '{}' depends on verilog target "
                             "'{}', which failed to plan",
                             target.name, target.verilog_target)
                       : std::format(
                             "benchmark target '{}' refers to unknown verilog "
                             "target '{}'",
                             target.name, target.verilog_target)));
      continue;
    }

    benchmark::BenchmarkRequest request{
        .target_name = target.name,
        .verilog_target = target.verilog_target,
    };
    auto result = benchmark::BuildBenchmarkAction(
        request, *upstream->second.info, upstream->second.opt_ir,
        toolchain.benchmark_codegen_tool, plan.graph);
    if (!result) {
      spdlog::debug("benchmark target '{}' failed", target.name);
      sink.Report(std::move(result).error());
      continue;
    }
    plan.benchmark_targets.emplace(target.name, std::move(*result));
  }
}

}  // namespace

auto PlanWorkspace(
    const config::ProjectConfig& config, const toolchain::Toolchain& toolchain,
    DiagnosticSink& sink) -> WorkspacePlan {
  WorkspacePlan plan{
      .graph = action::ActionGraph(config.out_dir),
      .verilog_targets = {},
      .benchmark_targets = {},
  };
  PlanVerilogTargets(config, toolchain, sink, plan);
  PlanBenchmarkTargets(config, toolchain, sink, plan);
  spdlog::debug(
      "planned {} actions, {} errors", plan.graph.Size(), sink.ErrorCount());
  return plan;
}

}  // namespace hwplan::workspace
