#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "hwplan/codegen/artifact_plan.hpp"
#include "hwplan/codegen/artifact_role.hpp"
#include "hwplan/codegen/codegen_args.hpp"
#include "hwplan/common/diagnostic/diagnostic.hpp"
#include "hwplan/common/internal_error.hpp"

namespace hwplan::codegen {
namespace {

TEST(ArtifactPlanTest, DefaultsProduceAllFiveArtifacts) {
  auto plan = PlanArtifacts({}, "a.sv");

  EXPECT_EQ(plan.mode, GeneratorMode::kOther);
  EXPECT_EQ(plan.verilog_basename, "a");
  EXPECT_EQ(
      plan.Filenames(), (std::vector<std::string>{
                            "a.sig.textproto",
                            "a.schedule.textproto",
                            "a.verilog_line_map.textproto",
                            "a.block.ir",
                            "a.sv",
                        }));
  EXPECT_EQ(plan.args.at("use_system_verilog"), "True");
  EXPECT_EQ(plan.args.at("delay_model"), "unit");
}

TEST(ArtifactPlanTest, CombinationalOmitsSchedule) {
  auto plan = PlanArtifacts(
      {{"generator", "combinational"}, {"use_system_verilog", "False"}}, "b.v");

  EXPECT_EQ(plan.mode, GeneratorMode::kCombinational);
  EXPECT_EQ(plan.Find(ArtifactRole::kSchedule), nullptr);
  EXPECT_EQ(
      plan.Filenames(), (std::vector<std::string>{
                            "b.sig.textproto",
                            "b.verilog_line_map.textproto",
                            "b.block.ir",
                            "b.v",
                        }));
  EXPECT_TRUE(ValidateVerilogFilename("b.v", UsesSystemVerilog(plan.args))
                  .has_value());
}

TEST(ArtifactPlanTest, EveryNonCombinationalModeHasSchedule) {
  for (const std::string generator : {"pipeline", "other", ""}) {
    auto plan = PlanArtifacts({{"generator", generator}}, "a.sv");
    EXPECT_NE(plan.Find(ArtifactRole::kSchedule), nullptr) << generator;
  }
}

TEST(ArtifactPlanTest, OverridesReplaceDerivedNames) {
  OutputOverrides overrides{
      .module_sig_file = "custom/sig.textproto",
      .schedule_file = std::nullopt,
      .verilog_line_map_file = std::nullopt,
      .block_ir_file = "custom.block.ir",
  };

  auto plan = PlanArtifacts({}, "a.sv", overrides);

  EXPECT_EQ(
      plan.Find(ArtifactRole::kModuleSignature)->filename,
      "custom/sig.textproto");
  EXPECT_EQ(plan.Find(ArtifactRole::kBlockIr)->filename, "custom.block.ir");
  EXPECT_EQ(
      plan.Find(ArtifactRole::kSchedule)->filename, "a.schedule.textproto");
  EXPECT_TRUE(plan.ignored_overrides.empty());
}

TEST(ArtifactPlanTest, ScheduleOverrideIgnoredForCombinational) {
  OutputOverrides overrides;
  overrides.schedule_file = "forced.schedule.textproto";

  auto plan =
      PlanArtifacts({{"generator", "combinational"}}, "a.sv", overrides);

  EXPECT_EQ(plan.Find(ArtifactRole::kSchedule), nullptr);
  EXPECT_EQ(
      plan.ignored_overrides,
      std::vector<ArtifactRole>{ArtifactRole::kSchedule});
}

TEST(ArtifactPlanTest, BasenameStripsOnlyLastExtension) {
  auto plan = PlanArtifacts({}, "gen/top.opt.sv");
  EXPECT_EQ(plan.verilog_basename, "gen/top.opt");
  EXPECT_EQ(
      plan.Find(ArtifactRole::kBlockIr)->filename, "gen/top.opt.block.ir");
}

TEST(ArtifactPlanTest, PlanningIsDeterministic) {
  CodegenArgs args = {{"pipeline_stages", "2"}, {"top", "t"}};
  OutputOverrides overrides;
  overrides.verilog_line_map_file = "map.textproto";

  auto first = PlanArtifacts(args, "x.sv", overrides);
  auto second = PlanArtifacts(args, "x.sv", overrides);

  EXPECT_EQ(first.artifacts, second.artifacts);
  EXPECT_EQ(first.args, second.args);
}

TEST(ArtifactPlanTest, EmptyVerilogFileIsContractViolation) {
  EXPECT_THROW(PlanArtifacts({}, ""), common::InternalError);
}

TEST(ArtifactPlanTest, OutputNamesStayInsideOutDir) {
  EXPECT_TRUE(ValidateOutputName("block_ir_file", "gen/a.block.ir"));
  EXPECT_TRUE(ValidateOutputName("block_ir_file", "./a.block.ir"));

  const std::vector<std::string> rejected = {
      "", "/tmp/a.block.ir", "../a.block.ir", "a.sv.d/../a.sv", "gen/", ".",
  };
  for (const auto& name : rejected) {
    auto valid = ValidateOutputName("block_ir_file", name);
    ASSERT_FALSE(valid.has_value()) << name;
    EXPECT_EQ(valid.error().Code(), DiagCode::kBadOutputName);
    EXPECT_EQ(valid.error().Subject(), "block_ir_file");
  }
}

TEST(ArtifactPlanTest, OutputNameErrorNamesTheField) {
  OutputOverrides overrides;
  overrides.verilog_line_map_file = "map.textproto";
  overrides.module_sig_file = "";

  auto valid = ValidateOutputNames("a.sv", overrides);

  ASSERT_FALSE(valid.has_value());
  EXPECT_EQ(valid.error().Subject(), "module_sig_file");
  EXPECT_EQ(valid.error().Message(), "module_sig_file '' is empty");
}

TEST(ArtifactPlanTest, VerilogFileNameIsChecked) {
  auto valid = ValidateOutputNames("../a.sv", {});

  ASSERT_FALSE(valid.has_value());
  EXPECT_EQ(valid.error().Subject(), "verilog_file");
  EXPECT_EQ(
      valid.error().Message(),
      "verilog_file '../a.sv' leaves the output directory");
}

}  // namespace
}  // namespace hwplan::codegen
