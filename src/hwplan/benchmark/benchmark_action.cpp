#include "hwplan/benchmark/benchmark_action.hpp"

#include <array>
#include <expected>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "hwplan/action/action.hpp"
#include "hwplan/action/action_graph.hpp"
#include "hwplan/action/artifact.hpp"
#include "hwplan/action/command_line.hpp"
#include "hwplan/codegen/codegen_info.hpp"
#include "hwplan/common/diagnostic/diagnostic.hpp"
#include "hwplan/toolchain/toolchain.hpp"

namespace hwplan::benchmark {

namespace {

void AddIfSet(
    action::CommandLine& command, std::string_view name,
    const std::optional<std::string>& value) {
  if (value && !value->empty()) {
    command.AddFlag(std::string(name), *value);
  }
}

}  // namespace

auto MakeBenchmarkCommand(
    const action::Artifact& tool, const codegen::CodegenInfo& codegen_info,
    const OptIrInfo& opt_ir_info) -> action::CommandLine {
  action::CommandLine command(tool.short_path);
  command.AddPositional(opt_ir_info.opt_ir_file.short_path);
  command.AddPositional(codegen_info.block_ir_file.short_path);
  command.AddPositional(codegen_info.verilog_file.short_path);
  command.AddFlag("top", codegen_info.top.value_or(""));
  AddIfSet(command, "delay_model", codegen_info.delay_model);
  AddIfSet(command, "pipeline_stages", codegen_info.pipeline_stages);
  AddIfSet(command, "clock_period_ps", codegen_info.clock_period_ps);
  return command;
}

auto MakeBenchmarkScript(const action::CommandLine& command) -> std::string {
  const std::array<std::string, 4> lines = {
      "#!/usr/bin/env bash",
      "set -e",
      command.ToShellString(),
      "exit 0",
  };
  std::string script;
  for (const auto& line : lines) {
    if (!script.empty()) {
      script += '\n';
    }
    script += line;
  }
  return script;
}

auto BuildBenchmarkAction(
    const BenchmarkRequest& request, const codegen::CodegenInfo& codegen_info,
    const OptIrInfo& opt_ir_info,
    const Result<toolchain::ResolvedTool>& benchmark_tool,
    action::ActionGraph& graph) -> Result<BenchmarkInfo> {
  if (!benchmark_tool) {
    return std::unexpected(
        Diagnostic(benchmark_tool.error())
            .WithNote(std::format(
                "while planning target '{}'", request.target_name)));
  }

  if (!codegen_info.top || codegen_info.top->empty()) {
    return std::unexpected(
        Diagnostic::Error(
            DiagCode::kMissingTop, request.verilog_target,
            std::format(
                "Verilog target '{}' does not provide a top value",
                request.verilog_target))
            .WithNote(
                "set 'top' or 'module_name' in the target's codegen_args"));
  }

  const auto& tool = *benchmark_tool;
  auto command =
      MakeBenchmarkCommand(tool.executable, codegen_info, opt_ir_info);
  auto script = graph.DeclareFile(request.target_name + ".sh");

  action::WriteAction write{
      .output = script,
      .content = MakeBenchmarkScript(command),
      .is_executable = true,
  };
  if (auto registered = graph.Register(request.target_name, std::move(write));
      !registered) {
    return std::unexpected(std::move(registered).error());
  }

  BenchmarkInfo info{.executable = std::move(script), .runfiles = {}};
  info.runfiles = tool.RunfileClosure();
  info.runfiles.push_back(opt_ir_info.opt_ir_file);
  info.runfiles.push_back(codegen_info.block_ir_file);
  info.runfiles.push_back(codegen_info.verilog_file);
  return info;
}

}  // namespace hwplan::benchmark
