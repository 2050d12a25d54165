#pragma once

#include <optional>
#include <string>

#include <argparse/argparse.hpp>

namespace hwplan::driver {

auto PlanCommand(
    const argparse::ArgumentParser& cmd,
    const std::optional<std::string>& config_path) -> int;
auto CheckCommand(
    const argparse::ArgumentParser& cmd,
    const std::optional<std::string>& config_path) -> int;
auto EmitCommand(
    const argparse::ArgumentParser& cmd,
    const std::optional<std::string>& config_path) -> int;

}  // namespace hwplan::driver
