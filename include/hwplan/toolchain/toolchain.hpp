#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "hwplan/action/artifact.hpp"
#include "hwplan/common/diagnostic/diagnostic.hpp"

namespace hwplan::toolchain {

// A tool as written in the manifest.
struct ToolSpec {
  // Path relative to the project root (contains '/') or a name on PATH.
  std::string executable;
  // Data files the tool reads at run time, relative to the project root.
  std::vector<std::string> runfiles;
};

struct ToolchainConfig {
  ToolSpec codegen_tool;
  ToolSpec benchmark_codegen_tool;
};

struct ResolvedTool {
  action::Artifact executable;
  std::vector<action::Artifact> runfiles;

  // Executable followed by its runfiles.
  [[nodiscard]] auto RunfileClosure() const -> std::vector<action::Artifact>;
};

// Outcome of resolving every tool once per manifest. A tool that fails to
// resolve only fails the targets that need it.
struct Toolchain {
  Result<ResolvedTool> codegen_tool;
  Result<ResolvedTool> benchmark_codegen_tool;
};

// Fails with kToolResolution naming `role` when the executable is unset,
// missing, not executable, or not on PATH, or when a runfile is missing.
auto ResolveTool(
    std::string_view role, const ToolSpec& spec,
    const std::filesystem::path& root_dir) -> Result<ResolvedTool>;

auto ResolveToolchain(
    const ToolchainConfig& config, const std::filesystem::path& root_dir)
    -> Toolchain;

}  // namespace hwplan::toolchain
