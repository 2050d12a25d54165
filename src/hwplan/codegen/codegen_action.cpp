#include "hwplan/codegen/codegen_action.hpp"

#include <expected>
#include <format>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "hwplan/action/action.hpp"
#include "hwplan/action/action_graph.hpp"
#include "hwplan/action/artifact.hpp"
#include "hwplan/action/command_line.hpp"
#include "hwplan/codegen/artifact_plan.hpp"
#include "hwplan/codegen/artifact_role.hpp"
#include "hwplan/codegen/codegen_args.hpp"
#include "hwplan/codegen/codegen_info.hpp"
#include "hwplan/common/diagnostic/diagnostic.hpp"
#include "hwplan/toolchain/toolchain.hpp"

namespace hwplan::codegen {

namespace {

auto ForTarget(Diagnostic diag, const std::string& target) -> Diagnostic {
  return std::move(diag).WithNote(
      std::format("while planning target '{}'", target));
}

}  // namespace

auto MakeCodegenCommand(
    const action::Artifact& tool, const action::Artifact& src,
    const CodegenArgs& merged_args,
    const std::vector<DeclaredArtifact>& outputs) -> action::CommandLine {
  action::CommandLine command(tool.path);
  command.AddPositional(src.path);
  command.AddFlags(merged_args);
  for (const auto& output : outputs) {
    command.AddFlag(
        std::string(OutputPathFlag(output.role)), output.artifact.path);
  }
  return command;
}

auto BuildCodegenAction(
    const CodegenRequest& request,
    const Result<toolchain::ResolvedTool>& codegen_tool,
    action::ActionGraph& graph) -> Result<CodegenResult> {
  if (!codegen_tool) {
    return std::unexpected(
        ForTarget(codegen_tool.error(), request.target_name));
  }

  auto validated = ValidateCodegenArgs(request.codegen_args);
  if (!validated) {
    return std::unexpected(
        ForTarget(std::move(validated).error(), request.target_name));
  }

  bool use_system_verilog = UsesSystemVerilog(MergeDefaults(*validated));
  if (auto valid = ValidateVerilogFilename(
          request.verilog_file, use_system_verilog);
      !valid) {
    return std::unexpected(
        ForTarget(std::move(valid).error(), request.target_name));
  }

  if (auto valid =
          ValidateOutputNames(request.verilog_file, request.overrides);
      !valid) {
    return std::unexpected(
        ForTarget(std::move(valid).error(), request.target_name));
  }

  auto plan =
      PlanArtifacts(*validated, request.verilog_file, request.overrides);

  std::vector<DeclaredArtifact> outputs;
  outputs.reserve(plan.artifacts.size());
  for (const auto& descriptor : plan.artifacts) {
    outputs.push_back(
        DeclaredArtifact{
            .role = descriptor.role,
            .artifact = graph.DeclareFile(descriptor.filename),
        });
  }

  const auto& tool = *codegen_tool;
  auto info = std::make_shared<const CodegenInfo>(
      PackageCodegenInfo(outputs, plan.args));

  action::RunAction run{
      .mnemonic = std::string(kCodegenMnemonic),
      .progress_message =
          std::format("Building Verilog file: {}", info->verilog_file.path),
      .command = MakeCodegenCommand(
          tool.executable, request.src, plan.args, outputs),
      .inputs = {},
      .tools = {tool.executable},
      .outputs = {},
  };
  run.inputs.push_back(request.src);
  run.inputs.insert(
      run.inputs.end(), tool.runfiles.begin(), tool.runfiles.end());
  for (const auto& output : outputs) {
    run.outputs.push_back(output.artifact);
  }

  if (auto registered = graph.Register(request.target_name, std::move(run));
      !registered) {
    return std::unexpected(
        ForTarget(std::move(registered).error(), request.target_name));
  }

  std::vector<action::Artifact> runfiles{request.src};
  auto closure = tool.RunfileClosure();
  runfiles.insert(runfiles.end(), closure.begin(), closure.end());

  return CodegenResult{
      .info = std::move(info),
      .plan = std::move(plan),
      .outputs = std::move(outputs),
      .runfiles = std::move(runfiles),
  };
}

}  // namespace hwplan::codegen
