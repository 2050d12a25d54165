#pragma once

#include <optional>
#include <span>
#include <string>

#include "hwplan/action/artifact.hpp"
#include "hwplan/codegen/artifact_role.hpp"
#include "hwplan/codegen/codegen_args.hpp"

namespace hwplan::codegen {

// An output file of a codegen action together with its role.
struct DeclaredArtifact {
  ArtifactRole role;
  action::Artifact artifact;

  auto operator==(const DeclaredArtifact&) const -> bool = default;
};

// What one codegen action produced, for rules that consume its outputs.
// Built once and shared read-only; never mutated after construction.
struct CodegenInfo {
  action::Artifact verilog_file;
  action::Artifact module_sig_file;
  action::Artifact verilog_line_map_file;
  // Empty for the combinational generator.
  std::optional<action::Artifact> schedule_file;
  action::Artifact block_ir_file;

  std::optional<std::string> delay_model;
  // "module_name" if set, else "top".
  std::optional<std::string> top;
  std::optional<std::string> pipeline_stages;
  std::optional<std::string> clock_period_ps;

  auto operator==(const CodegenInfo&) const -> bool = default;
};

// Assembles the record from the declared outputs and the merged args.
// Every role except kSchedule must be present in `artifacts`.
auto PackageCodegenInfo(
    std::span<const DeclaredArtifact> artifacts, const CodegenArgs& args)
    -> CodegenInfo;

}  // namespace hwplan::codegen
