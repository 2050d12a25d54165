#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "hwplan/action/action.hpp"
#include "hwplan/action/action_graph.hpp"
#include "hwplan/action/artifact.hpp"
#include "hwplan/action/command_line.hpp"
#include "hwplan/codegen/artifact_plan.hpp"
#include "hwplan/codegen/codegen_args.hpp"
#include "hwplan/codegen/codegen_info.hpp"
#include "hwplan/common/diagnostic/diagnostic.hpp"
#include "hwplan/toolchain/toolchain.hpp"

namespace hwplan::codegen {

inline constexpr std::string_view kCodegenMnemonic = "Codegen";

// One request to lower an IR file to Verilog.
struct CodegenRequest {
  std::string target_name;
  action::Artifact src;
  CodegenArgs codegen_args;
  // Primary output; its extension must match use_system_verilog.
  std::string verilog_file;
  OutputOverrides overrides;
};

struct CodegenResult {
  std::shared_ptr<const CodegenInfo> info;
  ArtifactPlan plan;
  // Outputs of the registered action, in plan order.
  std::vector<DeclaredArtifact> outputs;
  // Source IR plus the tool's runfile closure.
  std::vector<action::Artifact> runfiles;
};

// Command line of the codegen action: tool, source, every merged arg as
// --key=value, then one --output_<role>_path flag per declared output.
auto MakeCodegenCommand(
    const action::Artifact& tool, const action::Artifact& src,
    const CodegenArgs& merged_args,
    const std::vector<DeclaredArtifact>& outputs) -> action::CommandLine;

// Validates `request`, plans its artifacts and registers exactly one codegen
// action in `graph`. On failure nothing is registered.
auto BuildCodegenAction(
    const CodegenRequest& request,
    const Result<toolchain::ResolvedTool>& codegen_tool,
    action::ActionGraph& graph) -> Result<CodegenResult>;

}  // namespace hwplan::codegen
