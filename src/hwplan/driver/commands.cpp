#include "commands.hpp"

#include <cstddef>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <variant>

#include <argparse/argparse.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "hwplan/action/action.hpp"
#include "hwplan/common/diagnostic/diagnostic_sink.hpp"
#include "hwplan/config/project_config.hpp"
#include "hwplan/report/json.hpp"
#include "hwplan/toolchain/toolchain.hpp"
#include "hwplan/workspace/workspace.hpp"
#include "print.hpp"
#include "project.hpp"

namespace hwplan::driver {
namespace {

namespace fs = std::filesystem;

struct PlannedProject {
  config::ProjectConfig config;
  workspace::WorkspacePlan plan;
  DiagnosticSink sink;
};

auto PlanProject(const std::optional<std::string>& config_path)
    -> std::optional<PlannedProject> {
  auto config = LoadProject(config_path);
  if (!config) {
    PrintDiagnostic(config.error());
    return std::nullopt;
  }

  auto tools = toolchain::ResolveToolchain(config->toolchain, config->root_dir);
  DiagnosticSink sink;
  auto plan = workspace::PlanWorkspace(*config, tools, sink);
  return PlannedProject{
      .config = std::move(*config),
      .plan = std::move(plan),
      .sink = std::move(sink),
  };
}

auto WriteFile(const fs::path& path, const std::string& content) -> bool {
  std::error_code ec;
  fs::create_directories(path.parent_path(), ec);
  if (ec) {
    PrintError(
        std::format(
            "cannot create directory '{}': {}", path.parent_path().string(),
            ec.message()));
    return false;
  }
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    PrintError(std::format("cannot write '{}'", path.string()));
    return false;
  }
  out << content;
  return static_cast<bool>(out);
}

}  // namespace

auto PlanCommand(
    const argparse::ArgumentParser& cmd,
    const std::optional<std::string>& config_path) -> int {
  auto format = cmd.get<std::string>("--format");
  if (format != "text" && format != "json") {
    PrintError("unknown format '" + format + "', use 'text' or 'json'");
    return 1;
  }

  auto project = PlanProject(config_path);
  if (!project) {
    return 1;
  }
  PrintDiagnostics(project->sink);

  if (format == "json") {
    auto j = report::ToJson(project->plan.graph);
    j["codegen_info"] = nlohmann::json::object();
    for (const auto& [name, target] : project->plan.verilog_targets) {
      j["codegen_info"][name] = report::ToJson(*target.info);
    }
    std::cout << j.dump(2) << "\n";
  } else {
    std::cout << FormatActionGraph(project->plan.graph);
  }
  return project->sink.HasErrors() ? 1 : 0;
}

auto CheckCommand(
    const argparse::ArgumentParser& /*cmd*/,
    const std::optional<std::string>& config_path) -> int {
  auto project = PlanProject(config_path);
  if (!project) {
    return 1;
  }
  PrintDiagnostics(project->sink);

  std::size_t targets = project->config.verilog_targets.size() +
                        project->config.benchmark_targets.size();
  std::cout << std::format(
      "checked {} targets: {} actions, {} errors\n", targets,
      project->plan.graph.Size(), project->sink.ErrorCount());
  return project->sink.HasErrors() ? 1 : 0;
}

auto EmitCommand(
    const argparse::ArgumentParser& /*cmd*/,
    const std::optional<std::string>& config_path) -> int {
  auto project = PlanProject(config_path);
  if (!project) {
    return 1;
  }
  PrintDiagnostics(project->sink);
  if (project->sink.HasErrors()) {
    PrintError("not emitting: planning reported errors");
    return 1;
  }

  const auto& root = project->config.root_dir;
  std::size_t written = 0;

  for (const auto& registered : project->plan.graph.Actions()) {
    const auto* write = std::get_if<action::WriteAction>(&registered.action);
    if (write == nullptr) {
      continue;
    }
    auto path = root / write->output.path;
    if (!WriteFile(path, write->content)) {
      return 1;
    }
    if (write->is_executable) {
      std::error_code ec;
      fs::permissions(
          path,
          fs::perms::owner_all | fs::perms::group_read |
              fs::perms::group_exec | fs::perms::others_read |
              fs::perms::others_exec,
          ec);
      if (ec) {
        PrintError(
            std::format(
                "cannot mark '{}' executable: {}", path.string(),
                ec.message()));
        return 1;
      }
    }
    spdlog::debug("wrote {}", path.string());
    ++written;
  }

  for (const auto& [name, target] : project->plan.verilog_targets) {
    auto path = root / project->config.out_dir / (name + ".codegen_info.json");
    if (!WriteFile(path, report::ToJson(*target.info).dump(2) + "\n")) {
      return 1;
    }
    spdlog::debug("wrote {}", path.string());
    ++written;
  }

  std::cout << std::format(
      "wrote {} files under {}\n", written,
      (root / project->config.out_dir).string());
  return 0;
}

}  // namespace hwplan::driver
