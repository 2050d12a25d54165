#include "hwplan/codegen/codegen_info.hpp"

#include <format>
#include <optional>
#include <span>
#include <utility>

#include "hwplan/action/artifact.hpp"
#include "hwplan/codegen/artifact_role.hpp"
#include "hwplan/codegen/codegen_args.hpp"
#include "hwplan/common/internal_error.hpp"

namespace hwplan::codegen {

namespace {

auto FindRole(std::span<const DeclaredArtifact> artifacts, ArtifactRole role)
    -> std::optional<action::Artifact> {
  for (const auto& declared : artifacts) {
    if (declared.role == role) {
      return declared.artifact;
    }
  }
  return std::nullopt;
}

auto RequireRole(std::span<const DeclaredArtifact> artifacts, ArtifactRole role)
    -> action::Artifact {
  auto artifact = FindRole(artifacts, role);
  if (!artifact) {
    common::ThrowInternalError(
        "PackageCodegenInfo",
        std::format("no '{}' artifact was declared", ToString(role)));
  }
  return *artifact;
}

}  // namespace

auto PackageCodegenInfo(
    std::span<const DeclaredArtifact> artifacts, const CodegenArgs& args)
    -> CodegenInfo {
  auto top = FindArg(args, "module_name");
  if (!top) {
    top = FindArg(args, "top");
  }

  return CodegenInfo{
      .verilog_file = RequireRole(artifacts, ArtifactRole::kVerilog),
      .module_sig_file = RequireRole(artifacts, ArtifactRole::kModuleSignature),
      .verilog_line_map_file =
          RequireRole(artifacts, ArtifactRole::kVerilogLineMap),
      .schedule_file = FindRole(artifacts, ArtifactRole::kSchedule),
      .block_ir_file = RequireRole(artifacts, ArtifactRole::kBlockIr),
      .delay_model = FindArg(args, "delay_model"),
      .top = std::move(top),
      .pipeline_stages = FindArg(args, "pipeline_stages"),
      .clock_period_ps = FindArg(args, "clock_period_ps"),
  };
}

}  // namespace hwplan::codegen
