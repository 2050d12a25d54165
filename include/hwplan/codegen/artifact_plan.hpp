#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "hwplan/codegen/artifact_role.hpp"
#include "hwplan/codegen/codegen_args.hpp"
#include "hwplan/common/diagnostic/diagnostic.hpp"

namespace hwplan::codegen {

// Explicit filenames for the companion artifacts. Unset entries fall back to
// the name derived from the Verilog basename.
struct OutputOverrides {
  std::optional<std::string> module_sig_file;
  std::optional<std::string> schedule_file;
  std::optional<std::string> verilog_line_map_file;
  std::optional<std::string> block_ir_file;

  [[nodiscard]] auto Get(ArtifactRole role) const
      -> const std::optional<std::string>&;

  auto operator==(const OutputOverrides&) const -> bool = default;
};

struct ArtifactDescriptor {
  ArtifactRole role;
  std::string filename;

  auto operator==(const ArtifactDescriptor&) const -> bool = default;
};

struct ArtifactPlan {
  // User args merged over DefaultCodegenArgs().
  CodegenArgs args;
  GeneratorMode mode;
  std::string verilog_basename;
  // Ordered as kAllArtifactRoles; kSchedule only outside combinational mode.
  std::vector<ArtifactDescriptor> artifacts;
  // Overrides given for roles the mode does not produce.
  std::vector<ArtifactRole> ignored_overrides;

  [[nodiscard]] auto Find(ArtifactRole role) const -> const ArtifactDescriptor*;
  [[nodiscard]] auto Filenames() const -> std::vector<std::string>;
};

// Fails with kBadOutputName, naming `field`, unless `filename` is a relative
// path to a file below the output directory: non-empty, not absolute, no
// ".." component and not ending in a directory separator.
auto ValidateOutputName(std::string_view field, std::string_view filename)
    -> Result<void>;

// ValidateOutputName over the Verilog filename and every set override.
auto ValidateOutputNames(
    std::string_view verilog_file, const OutputOverrides& overrides)
    -> Result<void>;

// Decides which artifacts one codegen action produces and what they are
// called. Pure: the result depends only on the arguments.
//
// `verilog_file` must be non-empty; the manifest loader enforces this for
// user input.
auto PlanArtifacts(
    const CodegenArgs& user_args, std::string_view verilog_file,
    const OutputOverrides& overrides = {}) -> ArtifactPlan;

}  // namespace hwplan::codegen
