#include <gtest/gtest.h>

#include <string>

#include "hwplan/codegen/artifact_role.hpp"

namespace hwplan::codegen {
namespace {

TEST(ArtifactRoleTest, DerivesCompanionFilenames) {
  EXPECT_EQ(
      DeriveFilename("a", ArtifactRole::kModuleSignature, "sv"),
      "a.sig.textproto");
  EXPECT_EQ(
      DeriveFilename("a", ArtifactRole::kSchedule, "sv"),
      "a.schedule.textproto");
  EXPECT_EQ(
      DeriveFilename("a", ArtifactRole::kVerilogLineMap, "sv"),
      "a.verilog_line_map.textproto");
  EXPECT_EQ(DeriveFilename("a", ArtifactRole::kBlockIr, "sv"), "a.block.ir");
}

TEST(ArtifactRoleTest, VerilogRoleUsesCallerExtension) {
  EXPECT_EQ(DeriveFilename("top", ArtifactRole::kVerilog, "sv"), "top.sv");
  EXPECT_EQ(DeriveFilename("top", ArtifactRole::kVerilog, "v"), "top.v");
}

TEST(ArtifactRoleTest, KeepsDirectoriesInBasename) {
  EXPECT_EQ(
      DeriveFilename("gen/top", ArtifactRole::kBlockIr, "v"),
      "gen/top.block.ir");
}

TEST(ArtifactRoleTest, StripRecoversBasenameForEveryRole) {
  for (const std::string basename : {"a", "dir/b", "c.d"}) {
    for (auto role : kAllArtifactRoles) {
      for (const std::string ext : {"v", "sv"}) {
        auto derived = DeriveFilename(basename, role, ext);
        auto stripped = StripRoleSuffix(derived, role, ext);
        ASSERT_TRUE(stripped.has_value()) << derived;
        EXPECT_EQ(*stripped, basename) << derived;
      }
    }
  }
}

TEST(ArtifactRoleTest, StripRejectsForeignSuffix) {
  EXPECT_FALSE(
      StripRoleSuffix("a.block.ir", ArtifactRole::kSchedule, "sv").has_value());
  EXPECT_FALSE(
      StripRoleSuffix("a.v", ArtifactRole::kVerilog, "sv").has_value());
  EXPECT_FALSE(
      StripRoleSuffix(".block.ir", ArtifactRole::kBlockIr, "sv").has_value());
}

TEST(ArtifactRoleTest, OutputPathFlags) {
  EXPECT_EQ(
      OutputPathFlag(ArtifactRole::kModuleSignature), "output_signature_path");
  EXPECT_EQ(OutputPathFlag(ArtifactRole::kSchedule), "output_schedule_path");
  EXPECT_EQ(
      OutputPathFlag(ArtifactRole::kVerilogLineMap),
      "output_verilog_line_map_path");
  EXPECT_EQ(OutputPathFlag(ArtifactRole::kBlockIr), "output_block_ir_path");
  EXPECT_EQ(OutputPathFlag(ArtifactRole::kVerilog), "output_verilog_path");
}

}  // namespace
}  // namespace hwplan::codegen
