#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace hwplan::codegen {

// Logical role of a file produced by one codegen action.
enum class ArtifactRole : uint8_t {
  kModuleSignature,
  kSchedule,
  kVerilogLineMap,
  kBlockIr,
  kVerilog,
};

inline constexpr std::array<ArtifactRole, 5> kAllArtifactRoles = {
    ArtifactRole::kModuleSignature, ArtifactRole::kSchedule,
    ArtifactRole::kVerilogLineMap, ArtifactRole::kBlockIr,
    ArtifactRole::kVerilog,
};

inline constexpr std::string_view kSystemVerilogExtension = "sv";
inline constexpr std::string_view kVerilogExtension = "v";
inline constexpr std::string_view kSignatureSuffix = ".sig.textproto";
inline constexpr std::string_view kScheduleSuffix = ".schedule.textproto";
inline constexpr std::string_view kVerilogLineMapSuffix =
    ".verilog_line_map.textproto";
inline constexpr std::string_view kBlockIrSuffix = ".block.ir";

// Role name as used in manifests and JSON ("module_signature", ...).
auto ToString(ArtifactRole role) -> std::string_view;

// Name of the codegen tool flag that receives the role's output path,
// without the leading dashes ("output_signature_path", ...).
auto OutputPathFlag(ArtifactRole role) -> std::string_view;

// Suffix appended to the Verilog basename. For kVerilog this is
// "." + verilog_extension.
auto RoleSuffix(ArtifactRole role, std::string_view verilog_extension)
    -> std::string;

// Default filename for `role`: basename + RoleSuffix(role).
auto DeriveFilename(
    std::string_view basename, ArtifactRole role,
    std::string_view verilog_extension) -> std::string;

// Inverse of DeriveFilename. Returns nullopt when `filename` does not end in
// the role's suffix or nothing is left after stripping it.
auto StripRoleSuffix(
    std::string_view filename, ArtifactRole role,
    std::string_view verilog_extension) -> std::optional<std::string>;

}  // namespace hwplan::codegen
