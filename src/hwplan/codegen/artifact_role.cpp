#include "hwplan/codegen/artifact_role.hpp"

#include <optional>
#include <string>
#include <string_view>

#include "hwplan/common/internal_error.hpp"

namespace hwplan::codegen {

auto ToString(ArtifactRole role) -> std::string_view {
  switch (role) {
    case ArtifactRole::kModuleSignature:
      return "module_signature";
    case ArtifactRole::kSchedule:
      return "schedule";
    case ArtifactRole::kVerilogLineMap:
      return "verilog_line_map";
    case ArtifactRole::kBlockIr:
      return "block_ir";
    case ArtifactRole::kVerilog:
      return "verilog";
  }
  common::ThrowInternalError("ToString(ArtifactRole)", "unknown role");
}

auto OutputPathFlag(ArtifactRole role) -> std::string_view {
  switch (role) {
    case ArtifactRole::kModuleSignature:
      return "output_signature_path";
    case ArtifactRole::kSchedule:
      return "output_schedule_path";
    case ArtifactRole::kVerilogLineMap:
      return "output_verilog_line_map_path";
    case ArtifactRole::kBlockIr:
      return "output_block_ir_path";
    case ArtifactRole::kVerilog:
      return "output_verilog_path";
  }
  common::ThrowInternalError("OutputPathFlag", "unknown role");
}

auto RoleSuffix(ArtifactRole role, std::string_view verilog_extension)
    -> std::string {
  switch (role) {
    case ArtifactRole::kModuleSignature:
      return std::string(kSignatureSuffix);
    case ArtifactRole::kSchedule:
      return std::string(kScheduleSuffix);
    case ArtifactRole::kVerilogLineMap:
      return std::string(kVerilogLineMapSuffix);
    case ArtifactRole::kBlockIr:
      return std::string(kBlockIrSuffix);
    case ArtifactRole::kVerilog:
      return "." + std::string(verilog_extension);
  }
  common::ThrowInternalError("RoleSuffix", "unknown role");
}

auto DeriveFilename(
    std::string_view basename, ArtifactRole role,
    std::string_view verilog_extension) -> std::string {
  return std::string(basename) + RoleSuffix(role, verilog_extension);
}

auto StripRoleSuffix(
    std::string_view filename, ArtifactRole role,
    std::string_view verilog_extension) -> std::optional<std::string> {
  auto suffix = RoleSuffix(role, verilog_extension);
  if (filename.size() <= suffix.size() || !filename.ends_with(suffix)) {
    return std::nullopt;
  }
  return std::string(filename.substr(0, filename.size() - suffix.size()));
}

}  // namespace hwplan::codegen
