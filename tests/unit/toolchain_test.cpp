#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

#include "hwplan/action/artifact.hpp"
#include "hwplan/common/diagnostic/diagnostic.hpp"
#include "hwplan/toolchain/toolchain.hpp"

namespace hwplan::toolchain {
namespace {

namespace fs = std::filesystem;

class ToolchainTest : public ::testing::Test {
 protected:
  void SetUp() override {
    std::random_device rd;
    std::uniform_int_distribution<> dis(0, 999999);
    root_ = fs::temp_directory_path() /
            ("hwplan_toolchain_test_" + std::to_string(dis(rd)));
    fs::create_directories(root_);
  }

  void TearDown() override {
    fs::remove_all(root_);
  }

  void WriteFile(const fs::path& relative, bool executable) {
    auto full = root_ / relative;
    fs::create_directories(full.parent_path());
    std::ofstream(full) << "#!/bin/sh\nexit 0\n";
    if (executable) {
      fs::permissions(
          full, fs::perms::owner_exec, fs::perm_options::add);
    }
  }

  fs::path root_;
};

TEST_F(ToolchainTest, RelativeExecutableResolves) {
  WriteFile("tools/codegen_main", true);
  WriteFile("tools/delay.textproto", false);

  auto tool = ResolveTool(
      "codegen_tool",
      ToolSpec{
          .executable = "tools/codegen_main",
          .runfiles = {"tools/delay.textproto"},
      },
      root_);

  ASSERT_TRUE(tool.has_value()) << tool.error().Message();
  EXPECT_EQ(tool->executable, action::Artifact::Source("tools/codegen_main"));
  EXPECT_EQ(
      tool->RunfileClosure(),
      (std::vector<action::Artifact>{
          action::Artifact::Source("tools/codegen_main"),
          action::Artifact::Source("tools/delay.textproto"),
      }));
}

TEST_F(ToolchainTest, NonExecutableFileIsRejected) {
  WriteFile("tools/codegen_main", false);

  auto tool = ResolveTool(
      "codegen_tool", ToolSpec{.executable = "tools/codegen_main"}, root_);

  ASSERT_FALSE(tool.has_value());
  EXPECT_EQ(tool.error().Code(), DiagCode::kToolResolution);
  EXPECT_EQ(tool.error().Subject(), "codegen_tool");
  EXPECT_EQ(
      tool.error().Message(),
      "codegen_tool 'tools/codegen_main' is not an executable file");
}

TEST_F(ToolchainTest, MissingFileIsRejected) {
  auto tool = ResolveTool(
      "codegen_tool", ToolSpec{.executable = "tools/absent"}, root_);
  ASSERT_FALSE(tool.has_value());
  EXPECT_EQ(tool.error().Code(), DiagCode::kToolResolution);
}

TEST_F(ToolchainTest, DirectoryIsNotExecutable) {
  fs::create_directories(root_ / "tools/dir");
  auto tool =
      ResolveTool("codegen_tool", ToolSpec{.executable = "tools/dir"}, root_);
  EXPECT_FALSE(tool.has_value());
}

TEST_F(ToolchainTest, BareNameSearchesPath) {
  auto tool = ResolveTool("codegen_tool", ToolSpec{.executable = "sh"}, root_);

  ASSERT_TRUE(tool.has_value()) << tool.error().Message();
  EXPECT_TRUE(tool->executable.path.ends_with("/sh"));
  EXPECT_TRUE(tool->executable.is_source);
}

TEST_F(ToolchainTest, BareNameNotOnPath) {
  auto tool = ResolveTool(
      "benchmark_codegen_tool",
      ToolSpec{.executable = "hwplan_no_such_tool_on_path"}, root_);

  ASSERT_FALSE(tool.has_value());
  EXPECT_EQ(
      tool.error().Message(),
      "benchmark_codegen_tool 'hwplan_no_such_tool_on_path' not found in "
      "PATH");
}

TEST_F(ToolchainTest, BareNameIsNeverPassedToShell) {
  auto marker = fs::current_path() / "hwplan_shell_marker";
  auto tool = ResolveTool(
      "codegen_tool",
      ToolSpec{.executable = "x'; touch hwplan_shell_marker; echo 'y"},
      root_);

  ASSERT_FALSE(tool.has_value());
  EXPECT_EQ(tool.error().Code(), DiagCode::kToolResolution);
  EXPECT_FALSE(fs::exists(marker));
}

TEST_F(ToolchainTest, BareNameFoundInPathDirectory) {
  WriteFile("bin/hwplan_fake_codegen", true);
  const char* saved = std::getenv("PATH");
  std::string saved_path = saved == nullptr ? "" : saved;
  auto search = "/nonexistent_dir::" + (root_ / "bin").string();
  setenv("PATH", search.c_str(), 1);

  auto tool = ResolveTool(
      "codegen_tool", ToolSpec{.executable = "hwplan_fake_codegen"}, root_);
  setenv("PATH", saved_path.c_str(), 1);

  ASSERT_TRUE(tool.has_value()) << tool.error().Message();
  EXPECT_EQ(
      tool->executable.path, (root_ / "bin/hwplan_fake_codegen").string());
}

TEST_F(ToolchainTest, UnconfiguredTool) {
  auto tool = ResolveTool("codegen_tool", ToolSpec{}, root_);

  ASSERT_FALSE(tool.has_value());
  EXPECT_EQ(
      tool.error().Message(), "toolchain does not configure 'codegen_tool'");
}

TEST_F(ToolchainTest, MissingRunfile) {
  WriteFile("tools/codegen_main", true);

  auto tool = ResolveTool(
      "codegen_tool",
      ToolSpec{
          .executable = "tools/codegen_main",
          .runfiles = {"tools/missing.textproto"},
      },
      root_);

  ASSERT_FALSE(tool.has_value());
  EXPECT_EQ(
      tool.error().Message(),
      "runfile 'tools/missing.textproto' of codegen_tool not found");
}

TEST_F(ToolchainTest, ToolsResolveIndependently) {
  WriteFile("tools/codegen_main", true);

  auto toolchain = ResolveToolchain(
      ToolchainConfig{
          .codegen_tool = {.executable = "tools/codegen_main"},
          .benchmark_codegen_tool = {},
      },
      root_);

  EXPECT_TRUE(toolchain.codegen_tool.has_value());
  ASSERT_FALSE(toolchain.benchmark_codegen_tool.has_value());
  EXPECT_EQ(
      toolchain.benchmark_codegen_tool.error().Subject(),
      "benchmark_codegen_tool");
}

}  // namespace
}  // namespace hwplan::toolchain
