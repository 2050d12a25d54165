#pragma once

#include <optional>
#include <string>

#include "hwplan/common/diagnostic/diagnostic.hpp"
#include "hwplan/config/project_config.hpp"

namespace hwplan::driver {

// Load the manifest named by --config, or search for hwplan.toml from the
// current directory upward.
auto LoadProject(const std::optional<std::string>& config_path)
    -> Result<config::ProjectConfig>;

// Map -v count to a spdlog level: 0 warn, 1 debug, 2+ trace.
void ConfigureLogging(int verbosity);

}  // namespace hwplan::driver
