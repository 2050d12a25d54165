#pragma once

#include <filesystem>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace hwplan::test {

// Result of running a CLI command
struct CliResult {
  int exit_code;
  std::string combined_output;  // stdout + stderr interleaved

  [[nodiscard]] auto Success() const -> bool {
    return exit_code == 0;
  }

  [[nodiscard]] auto Contains(const std::string& text) const -> bool {
    return combined_output.find(text) != std::string::npos;
  }
};

// Test fixture for CLI integration tests
//
// Each test gets a fresh project directory holding executable stand-ins for
// the codegen and benchmark tools. The tools are never run; they only have to
// resolve.
//
// Usage:
//   TEST_F(PlanTest, MyTest) {
//     WriteManifest(kAdderTargets);
//     auto result = Run({"plan"});
//     EXPECT_TRUE(result.Success());
//   }
//
class CliTestFixture : public ::testing::Test {
 protected:
  void SetUp() override;
  void TearDown() override;

  // Run hwplan with given arguments from the test directory
  auto Run(std::initializer_list<std::string> args) -> CliResult;
  auto Run(const std::vector<std::string>& args) -> CliResult;

  // Run hwplan from a specific directory
  auto RunIn(
      const std::filesystem::path& dir, const std::vector<std::string>& args)
      -> CliResult;

  // Create a file in the test directory
  void WriteFile(
      const std::filesystem::path& relative_path, const std::string& content);

  // Create an executable shell script in the test directory
  void WriteExecutable(const std::filesystem::path& relative_path);

  // hwplan.toml with the standard [toolchain] section followed by `targets`
  void WriteManifest(const std::string& targets);

  [[nodiscard]] auto TestDir() const -> const std::filesystem::path& {
    return test_dir_;
  }

  [[nodiscard]] auto FileExists(
      const std::filesystem::path& relative_path) const -> bool;

  [[nodiscard]] auto ReadFile(const std::filesystem::path& relative_path) const
      -> std::string;

  [[nodiscard]] auto IsExecutable(
      const std::filesystem::path& relative_path) const -> bool;

 private:
  std::filesystem::path test_dir_;
  std::filesystem::path hwplan_bin_;
};

}  // namespace hwplan::test
