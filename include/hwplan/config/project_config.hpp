#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "hwplan/codegen/artifact_plan.hpp"
#include "hwplan/codegen/codegen_args.hpp"
#include "hwplan/common/diagnostic/diagnostic.hpp"
#include "hwplan/toolchain/toolchain.hpp"

namespace hwplan::config {

inline constexpr std::string_view kConfigFileName = "hwplan.toml";

// [[verilog]] table: one IR file lowered to Verilog.
struct VerilogTargetConfig {
  std::string name;
  // IR input, relative to the project root.
  std::string src;
  std::string verilog_file;
  codegen::OutputOverrides overrides;
  codegen::CodegenArgs codegen_args;
};

// [[benchmark]] table: a benchmark script over a verilog target.
struct BenchmarkTargetConfig {
  std::string name;
  std::string verilog_target;
};

struct ProjectConfig {
  toolchain::ToolchainConfig toolchain;
  std::string out_dir = "hwplan-out";
  std::vector<VerilogTargetConfig> verilog_targets;
  std::vector<BenchmarkTargetConfig> benchmark_targets;

  // Directory where hwplan.toml was found
  std::filesystem::path root_dir;
};

// Search for hwplan.toml starting from dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindConfig(const std::filesystem::path& start_dir = ".")
    -> std::optional<std::filesystem::path>;

// Parse hwplan.toml file.
// Returns error Diagnostic on parse errors, unknown keys or missing required
// fields.
auto LoadConfig(const std::filesystem::path& config_path)
    -> Result<ProjectConfig>;

// Parse manifest text. `source_name` is used in messages only.
auto ParseConfig(
    std::string_view text, const std::filesystem::path& root_dir,
    std::string_view source_name) -> Result<ProjectConfig>;

}  // namespace hwplan::config
