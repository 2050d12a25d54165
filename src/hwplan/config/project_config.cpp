#include "hwplan/config/project_config.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <format>
#include <fstream>
#include <initializer_list>
#include <optional>
#include <ranges>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "hwplan/common/diagnostic/diagnostic.hpp"

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-literal-operator"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-literal-operator"
#endif
#include <toml++/toml.hpp>
#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

namespace hwplan::config {

namespace fs = std::filesystem;

namespace {

auto CheckKeys(
    const toml::table& table, std::initializer_list<std::string_view> allowed,
    std::string_view context, std::string_view source) -> Result<void> {
  for (const auto& [key, node] : table) {
    if (std::ranges::find(allowed, key.str()) == allowed.end()) {
      return std::unexpected(
          Diagnostic::ConfigError(
              std::format(
                  "{}: unknown field '{}' in {}", source, key.str(), context)));
    }
  }
  return {};
}

// Absent keys yield nullopt; present keys must hold a string.
auto OptionalString(
    const toml::table& table, std::string_view key, std::string_view context,
    std::string_view source) -> Result<std::optional<std::string>> {
  const auto* node = table.get(key);
  if (node == nullptr) {
    return std::optional<std::string>{};
  }
  const auto* str = node->as_string();
  if (str == nullptr) {
    return std::unexpected(
        Diagnostic::ConfigError(
            std::format(
                "{}: '{}' in {} must be a string", source, key, context)));
  }
  return std::optional<std::string>{str->get()};
}

// Table-valued key such as [build]. Absent keys yield nullptr.
auto OptionalTable(
    const toml::table& root, std::string_view key, std::string_view source)
    -> Result<const toml::table*> {
  const auto* node = root.get(key);
  if (node == nullptr) {
    return nullptr;
  }
  const auto* table = node->as_table();
  if (table == nullptr) {
    return std::unexpected(
        Diagnostic::ConfigError(
            std::format("{}: '{}' must be a table ([{}])", source, key, key)));
  }
  return table;
}

auto RequireString(
    const toml::table& table, std::string_view key, std::string_view context,
    std::string_view source) -> Result<std::string> {
  auto value = OptionalString(table, key, context, source);
  if (!value) {
    return std::unexpected(value.error());
  }
  if (!*value || (*value)->empty()) {
    return std::unexpected(
        Diagnostic::ConfigError(
            std::format(
                "{}: missing required field '{}' in {}", source, key,
                context)));
  }
  return **value;
}

auto StringList(
    const toml::table& table, std::string_view key, std::string_view context,
    std::string_view source) -> Result<std::vector<std::string>> {
  std::vector<std::string> result;
  const auto* node = table.get(key);
  if (node == nullptr) {
    return result;
  }
  const auto* array = node->as_array();
  if (array == nullptr) {
    return std::unexpected(
        Diagnostic::ConfigError(
            std::format(
                "{}: '{}' in {} must be an array of strings", source, key,
                context)));
  }
  for (const auto& elem : *array) {
    auto str = elem.value<std::string>();
    if (!str) {
      return std::unexpected(
          Diagnostic::ConfigError(
              std::format(
                  "{}: '{}' in {} must be an array of strings", source, key,
                  context)));
    }
    result.push_back(*str);
  }
  return result;
}

auto ParseToolchain(const toml::table& table, std::string_view source)
    -> Result<toolchain::ToolchainConfig> {
  if (auto keys = CheckKeys(
          table,
          {"codegen_tool", "codegen_runfiles", "benchmark_codegen_tool",
           "benchmark_runfiles"},
          "[toolchain]", source);
      !keys) {
    return std::unexpected(keys.error());
  }

  toolchain::ToolchainConfig config;
  auto codegen_tool =
      OptionalString(table, "codegen_tool", "[toolchain]", source);
  if (!codegen_tool) {
    return std::unexpected(codegen_tool.error());
  }
  config.codegen_tool.executable = codegen_tool->value_or("");

  auto benchmark_tool =
      OptionalString(table, "benchmark_codegen_tool", "[toolchain]", source);
  if (!benchmark_tool) {
    return std::unexpected(benchmark_tool.error());
  }
  config.benchmark_codegen_tool.executable = benchmark_tool->value_or("");

  auto codegen_runfiles =
      StringList(table, "codegen_runfiles", "[toolchain]", source);
  if (!codegen_runfiles) {
    return std::unexpected(codegen_runfiles.error());
  }
  config.codegen_tool.runfiles = std::move(*codegen_runfiles);

  auto benchmark_runfiles =
      StringList(table, "benchmark_runfiles", "[toolchain]", source);
  if (!benchmark_runfiles) {
    return std::unexpected(benchmark_runfiles.error());
  }
  config.benchmark_codegen_tool.runfiles = std::move(*benchmark_runfiles);
  return config;
}

auto ParseCodegenArgs(
    const toml::table& table, std::string_view context,
    std::string_view source) -> Result<codegen::CodegenArgs> {
  codegen::CodegenArgs args;
  for (const auto& [key, node] : table) {
    if (auto str = node.value_exact<std::string>()) {
      args.emplace(std::string(key.str()), *str);
    } else if (auto integer = node.value_exact<int64_t>()) {
      args.emplace(std::string(key.str()), std::to_string(*integer));
    } else {
      return std::unexpected(
          Diagnostic::ConfigError(
              std::format(
                  "{}: codegen_args value '{}' in {} must be a string",
                  source, key.str(), context)));
    }
  }
  return args;
}

auto ParseVerilogTarget(const toml::table& table, std::string_view source)
    -> Result<VerilogTargetConfig> {
  auto name = RequireString(table, "name", "[[verilog]]", source);
  if (!name) {
    return std::unexpected(name.error());
  }
  auto context = std::format("verilog target '{}'", *name);

  if (auto keys = CheckKeys(
          table,
          {"name", "src", "verilog_file", "module_sig_file", "schedule_file",
           "verilog_line_map_file", "block_ir_file", "codegen_args"},
          context, source);
      !keys) {
    return std::unexpected(keys.error());
  }

  VerilogTargetConfig target;
  target.name = *name;

  auto src = RequireString(table, "src", context, source);
  if (!src) {
    return std::unexpected(src.error());
  }
  target.src = *src;

  auto verilog_file = OptionalString(table, "verilog_file", context, source);
  if (!verilog_file) {
    return std::unexpected(verilog_file.error());
  }
  if (!*verilog_file || (*verilog_file)->empty()) {
    return std::unexpected(
        Diagnostic::Error(
            DiagCode::kMissingOutput, target.name,
            std::format("{}: {} must set 'verilog_file'", source, context)));
  }
  target.verilog_file = **verilog_file;

  const std::array<std::pair<std::string_view, std::optional<std::string>*>, 4>
      overrides = {{
      {"module_sig_file", &target.overrides.module_sig_file},
      {"schedule_file", &target.overrides.schedule_file},
      {"verilog_line_map_file", &target.overrides.verilog_line_map_file},
      {"block_ir_file", &target.overrides.block_ir_file},
  }};
  for (const auto& [key, field] : overrides) {
    auto value = OptionalString(table, key, context, source);
    if (!value) {
      return std::unexpected(value.error());
    }
    *field = std::move(*value);
  }

  if (const auto* args_node = table.get("codegen_args")) {
    const auto* args_table = args_node->as_table();
    if (args_table == nullptr) {
      return std::unexpected(
          Diagnostic::ConfigError(
              std::format(
                  "{}: 'codegen_args' in {} must be a table", source,
                  context)));
    }
    auto args = ParseCodegenArgs(*args_table, context, source);
    if (!args) {
      return std::unexpected(args.error());
    }
    target.codegen_args = std::move(*args);
  }

  return target;
}

auto ParseBenchmarkTarget(const toml::table& table, std::string_view source)
    -> Result<BenchmarkTargetConfig> {
  auto name = RequireString(table, "name", "[[benchmark]]", source);
  if (!name) {
    return std::unexpected(name.error());
  }
  auto context = std::format("benchmark target '{}'", *name);

  if (auto keys = CheckKeys(table, {"name", "verilog_target"}, context, source);
      !keys) {
    return std::unexpected(keys.error());
  }

  auto verilog_target = RequireString(table, "verilog_target", context, source);
  if (!verilog_target) {
    return std::unexpected(verilog_target.error());
  }
  return BenchmarkTargetConfig{
      .name = *name,
      .verilog_target = *verilog_target,
  };
}

// Array of tables, e.g. [[verilog]]. Absent arrays yield no tables.
auto TablesOf(
    const toml::table& root, std::string_view key, std::string_view source)
    -> Result<std::vector<const toml::table*>> {
  std::vector<const toml::table*> tables;
  const auto* node = root.get(key);
  if (node == nullptr) {
    return tables;
  }
  const auto* array = node->as_array();
  if (array == nullptr) {
    return std::unexpected(
        Diagnostic::ConfigError(
            std::format(
                "{}: '{}' must be an array of tables ([[{}]])", source, key,
                key)));
  }
  for (const auto& elem : *array) {
    const auto* table = elem.as_table();
    if (table == nullptr) {
      return std::unexpected(
          Diagnostic::ConfigError(
              std::format(
                  "{}: '{}' must be an array of tables ([[{}]])", source, key,
                  key)));
    }
    tables.push_back(table);
  }
  return tables;
}

}  // namespace

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  std::error_code ec;
  fs::path dir = fs::absolute(start_dir, ec);
  if (ec) {
    return std::nullopt;
  }

  while (true) {
    fs::path config_path = dir / kConfigFileName;
    // Unreadable directories are skipped.
    if (fs::exists(config_path, ec)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto ParseConfig(
    std::string_view text, const fs::path& root_dir,
    std::string_view source_name) -> Result<ProjectConfig> {
  ProjectConfig config;
  config.root_dir = root_dir;

  toml::table tbl;
  try {
    tbl = toml::parse(text, source_name);
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        Diagnostic::ConfigError(
            std::format(
                "failed to parse {}:{}: {}", source_name,
                e.source().begin.line, e.description())));
  }

  if (auto keys = CheckKeys(
          tbl, {"toolchain", "build", "verilog", "benchmark"}, "manifest root",
          source_name);
      !keys) {
    return std::unexpected(keys.error());
  }

  auto toolchain_table = OptionalTable(tbl, "toolchain", source_name);
  if (!toolchain_table) {
    return std::unexpected(toolchain_table.error());
  }
  if (*toolchain_table != nullptr) {
    auto toolchain = ParseToolchain(**toolchain_table, source_name);
    if (!toolchain) {
      return std::unexpected(toolchain.error());
    }
    config.toolchain = std::move(*toolchain);
  }

  // [build] section (optional)
  auto build = OptionalTable(tbl, "build", source_name);
  if (!build) {
    return std::unexpected(build.error());
  }
  if (*build != nullptr) {
    if (auto keys = CheckKeys(**build, {"out_dir"}, "[build]", source_name);
        !keys) {
      return std::unexpected(keys.error());
    }
    auto out_dir = OptionalString(**build, "out_dir", "[build]", source_name);
    if (!out_dir) {
      return std::unexpected(out_dir.error());
    }
    if (*out_dir) {
      config.out_dir = **out_dir;
    }
  }

  std::set<std::string> names;
  auto claim_name = [&](const std::string& name) -> Result<void> {
    if (!names.insert(name).second) {
      return std::unexpected(
          Diagnostic::ConfigError(
              std::format(
                  "{}: target name '{}' is declared more than once",
                  source_name, name)));
    }
    return {};
  };

  auto verilog_tables = TablesOf(tbl, "verilog", source_name);
  if (!verilog_tables) {
    return std::unexpected(verilog_tables.error());
  }
  for (const auto* table : *verilog_tables) {
    auto target = ParseVerilogTarget(*table, source_name);
    if (!target) {
      return std::unexpected(target.error());
    }
    if (auto claimed = claim_name(target->name); !claimed) {
      return std::unexpected(claimed.error());
    }
    config.verilog_targets.push_back(std::move(*target));
  }

  auto benchmark_tables = TablesOf(tbl, "benchmark", source_name);
  if (!benchmark_tables) {
    return std::unexpected(benchmark_tables.error());
  }
  for (const auto* table : *benchmark_tables) {
    auto target = ParseBenchmarkTarget(*table, source_name);
    if (!target) {
      return std::unexpected(target.error());
    }
    if (auto claimed = claim_name(target->name); !claimed) {
      return std::unexpected(claimed.error());
    }
    config.benchmark_targets.push_back(std::move(*target));
  }

  return config;
}

auto LoadConfig(const fs::path& config_path) -> Result<ProjectConfig> {
  std::ifstream in(config_path);
  if (!in) {
    return std::unexpected(
        Diagnostic::ConfigError(
            std::format("cannot open {}", config_path.string())));
  }
  std::ostringstream text;
  text << in.rdbuf();
  return ParseConfig(
      text.str(), config_path.parent_path(), config_path.string());
}

}  // namespace hwplan::config
