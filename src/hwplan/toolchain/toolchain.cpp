#include "hwplan/toolchain/toolchain.hpp"

#include <cstdlib>
#include <expected>
#include <filesystem>
#include <format>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "hwplan/action/artifact.hpp"
#include "hwplan/common/diagnostic/diagnostic.hpp"

namespace hwplan::toolchain {

namespace {

namespace fs = std::filesystem;

auto IsExecutableFile(const fs::path& path) -> bool {
  std::error_code ec;
  auto status = fs::status(path, ec);
  if (ec || !fs::is_regular_file(status)) {
    return false;
  }
  constexpr auto kAnyExec =
      fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec;
  return (status.permissions() & kAnyExec) != fs::perms::none;
}

// Searches each PATH entry in order. Empty entries mean the current directory.
auto FindExecutable(const std::string& name) -> std::string {
  const char* env = std::getenv("PATH");
  if (env == nullptr) {
    return "";
  }
  std::string_view remaining = env;
  while (true) {
    auto colon = remaining.find(':');
    std::string_view dir = remaining.substr(0, colon);
    fs::path candidate = dir.empty() ? fs::path(".") : fs::path(dir);
    candidate /= name;
    if (IsExecutableFile(candidate)) {
      return candidate.string();
    }
    if (colon == std::string_view::npos) {
      return "";
    }
    remaining.remove_prefix(colon + 1);
  }
}

auto ResolutionError(std::string_view role, std::string message)
    -> Diagnostic {
  return Diagnostic::Error(
      DiagCode::kToolResolution, std::string(role), std::move(message));
}

}  // namespace

auto ResolvedTool::RunfileClosure() const -> std::vector<action::Artifact> {
  std::vector<action::Artifact> closure;
  closure.reserve(runfiles.size() + 1);
  closure.push_back(executable);
  closure.insert(closure.end(), runfiles.begin(), runfiles.end());
  return closure;
}

auto ResolveTool(
    std::string_view role, const ToolSpec& spec, const fs::path& root_dir)
    -> Result<ResolvedTool> {
  if (spec.executable.empty()) {
    return std::unexpected(ResolutionError(
        role, std::format("toolchain does not configure '{}'", role)));
  }

  ResolvedTool tool;
  if (spec.executable.find('/') != std::string::npos) {
    fs::path candidate = spec.executable;
    if (candidate.is_relative()) {
      candidate = root_dir / candidate;
    }
    if (!IsExecutableFile(candidate)) {
      return std::unexpected(ResolutionError(
          role, std::format(
                    "{} '{}' is not an executable file", role,
                    spec.executable)));
    }
    tool.executable = action::Artifact::Source(spec.executable);
  } else {
    auto path = FindExecutable(spec.executable);
    if (path.empty()) {
      return std::unexpected(ResolutionError(
          role,
          std::format("{} '{}' not found in PATH", role, spec.executable)));
    }
    tool.executable = action::Artifact::Source(path);
  }

  for (const auto& runfile : spec.runfiles) {
    fs::path candidate = runfile;
    if (candidate.is_relative()) {
      candidate = root_dir / candidate;
    }
    std::error_code ec;
    if (!fs::exists(candidate, ec)) {
      return std::unexpected(ResolutionError(
          role, std::format("runfile '{}' of {} not found", runfile, role)));
    }
    tool.runfiles.push_back(action::Artifact::Source(runfile));
  }

  spdlog::debug(
      "resolved {} to '{}' with {} runfiles", role, tool.executable.path,
      tool.runfiles.size());
  return tool;
}

auto ResolveToolchain(const ToolchainConfig& config, const fs::path& root_dir)
    -> Toolchain {
  return Toolchain{
      .codegen_tool =
          ResolveTool("codegen_tool", config.codegen_tool, root_dir),
      .benchmark_codegen_tool = ResolveTool(
          "benchmark_codegen_tool", config.benchmark_codegen_tool, root_dir),
  };
}

}  // namespace hwplan::toolchain
