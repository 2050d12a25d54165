#include "project.hpp"

#include <expected>
#include <filesystem>
#include <format>
#include <optional>
#include <string>
#include <system_error>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "hwplan/common/diagnostic/diagnostic.hpp"
#include "hwplan/config/project_config.hpp"

namespace hwplan::driver {

namespace fs = std::filesystem;

auto LoadProject(const std::optional<std::string>& config_path)
    -> Result<config::ProjectConfig> {
  if (config_path) {
    std::error_code ec;
    fs::path path = fs::absolute(*config_path, ec);
    if (ec || !fs::exists(path, ec)) {
      return std::unexpected(
          Diagnostic::ConfigError(
              std::format("config file '{}' does not exist", *config_path)));
    }
    spdlog::debug("using manifest {}", path.string());
    return config::LoadConfig(path);
  }

  auto found = config::FindConfig();
  if (!found) {
    std::error_code ec;
    return std::unexpected(
        Diagnostic::ConfigError(
            std::format(
                "no {} found in '{}' or any parent directory",
                config::kConfigFileName, fs::current_path(ec).string())));
  }
  spdlog::debug("using manifest {}", found->string());
  return config::LoadConfig(*found);
}

void ConfigureLogging(int verbosity) {
  auto logger = spdlog::stderr_color_mt("hwplan");
  logger->set_pattern("[%n][%H:%M:%S][%l] %v");
  spdlog::set_default_logger(logger);
  if (verbosity >= 2) {
    spdlog::set_level(spdlog::level::trace);
  } else if (verbosity == 1) {
    spdlog::set_level(spdlog::level::debug);
  } else {
    spdlog::set_level(spdlog::level::warn);
  }
}

}  // namespace hwplan::driver
