#include "hwplan/codegen/artifact_plan.hpp"

#include <expected>
#include <filesystem>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "hwplan/codegen/artifact_role.hpp"
#include "hwplan/codegen/codegen_args.hpp"
#include "hwplan/common/diagnostic/diagnostic.hpp"
#include "hwplan/common/internal_error.hpp"
#include "hwplan/common/string_utils.hpp"

namespace hwplan::codegen {

namespace {

// Manifest key holding the override for `role`.
auto OverrideKey(ArtifactRole role) -> std::string_view {
  switch (role) {
    case ArtifactRole::kModuleSignature:
      return "module_sig_file";
    case ArtifactRole::kSchedule:
      return "schedule_file";
    case ArtifactRole::kVerilogLineMap:
      return "verilog_line_map_file";
    case ArtifactRole::kBlockIr:
      return "block_ir_file";
    case ArtifactRole::kVerilog:
      return "verilog_file";
  }
  common::ThrowInternalError("OverrideKey", "unknown role");
}

}  // namespace

auto OutputOverrides::Get(ArtifactRole role) const
    -> const std::optional<std::string>& {
  static const std::optional<std::string> kNone;
  switch (role) {
    case ArtifactRole::kModuleSignature:
      return module_sig_file;
    case ArtifactRole::kSchedule:
      return schedule_file;
    case ArtifactRole::kVerilogLineMap:
      return verilog_line_map_file;
    case ArtifactRole::kBlockIr:
      return block_ir_file;
    case ArtifactRole::kVerilog:
      // The Verilog filename is the plan's input, never an override.
      return kNone;
  }
  return kNone;
}

auto ArtifactPlan::Find(ArtifactRole role) const -> const ArtifactDescriptor* {
  for (const auto& artifact : artifacts) {
    if (artifact.role == role) {
      return &artifact;
    }
  }
  return nullptr;
}

auto ArtifactPlan::Filenames() const -> std::vector<std::string> {
  std::vector<std::string> names;
  names.reserve(artifacts.size());
  for (const auto& artifact : artifacts) {
    names.push_back(artifact.filename);
  }
  return names;
}

auto ValidateOutputName(std::string_view field, std::string_view filename)
    -> Result<void> {
  std::filesystem::path path(filename);
  std::string_view problem;
  if (filename.empty()) {
    problem = "is empty";
  } else if (path.is_absolute()) {
    problem = "is an absolute path";
  } else if (!path.has_filename() || path.filename() == ".") {
    problem = "does not name a file";
  } else {
    for (const auto& part : path) {
      if (part == "..") {
        problem = "leaves the output directory";
        break;
      }
    }
  }
  if (problem.empty()) {
    return {};
  }
  return std::unexpected(
      Diagnostic::Error(
          DiagCode::kBadOutputName, std::string(field),
          std::format("{} '{}' {}", field, filename, problem)));
}

auto ValidateOutputNames(
    std::string_view verilog_file, const OutputOverrides& overrides)
    -> Result<void> {
  if (auto valid = ValidateOutputName(
          OverrideKey(ArtifactRole::kVerilog), verilog_file);
      !valid) {
    return valid;
  }
  for (ArtifactRole role : kAllArtifactRoles) {
    const auto& override_name = overrides.Get(role);
    if (!override_name) {
      continue;
    }
    if (auto valid = ValidateOutputName(OverrideKey(role), *override_name);
        !valid) {
      return valid;
    }
  }
  return {};
}

auto PlanArtifacts(
    const CodegenArgs& user_args, std::string_view verilog_file,
    const OutputOverrides& overrides) -> ArtifactPlan {
  if (verilog_file.empty()) {
    common::ThrowInternalError(
        "PlanArtifacts", "verilog_file must name the primary output");
  }

  ArtifactPlan plan{
      .args = MergeDefaults(user_args),
      .mode = GeneratorMode::kOther,
      .verilog_basename = {},
      .artifacts = {},
      .ignored_overrides = {},
  };
  plan.mode = GetGeneratorMode(plan.args);

  auto split = common::SplitFilename(verilog_file);
  plan.verilog_basename = split.stem;

  for (ArtifactRole role : kAllArtifactRoles) {
    const auto& override_name = overrides.Get(role);
    if (role == ArtifactRole::kSchedule &&
        plan.mode == GeneratorMode::kCombinational) {
      if (override_name) {
        plan.ignored_overrides.push_back(role);
      }
      continue;
    }

    std::string filename;
    if (role == ArtifactRole::kVerilog) {
      filename = std::string(verilog_file);
    } else if (override_name) {
      filename = *override_name;
    } else {
      filename = DeriveFilename(plan.verilog_basename, role, split.extension);
    }
    plan.artifacts.push_back(
        ArtifactDescriptor{.role = role, .filename = std::move(filename)});
  }

  return plan;
}

}  // namespace hwplan::codegen
