#include "hwplan/action/command_line.hpp"

#include <format>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "hwplan/common/string_utils.hpp"

namespace hwplan::action {

auto CommandLine::Arg::Render() const -> std::string {
  if (kind == Kind::kFlag) {
    return std::format("--{}={}", name, value);
  }
  return value;
}

auto CommandLine::AddPositional(std::string value) -> CommandLine& {
  args_.push_back(
      Arg{.kind = Arg::Kind::kPositional,
          .name = {},
          .value = std::move(value)});
  return *this;
}

auto CommandLine::AddFlag(std::string name, std::string value)
    -> CommandLine& {
  args_.push_back(
      Arg{.kind = Arg::Kind::kFlag,
          .name = std::move(name),
          .value = std::move(value)});
  return *this;
}

auto CommandLine::AddFlags(const std::map<std::string, std::string>& flags)
    -> CommandLine& {
  for (const auto& [name, value] : flags) {
    AddFlag(name, value);
  }
  return *this;
}

auto CommandLine::FindFlag(const std::string& name) const
    -> const std::string* {
  const std::string* found = nullptr;
  for (const auto& arg : args_) {
    if (arg.kind == Arg::Kind::kFlag && arg.name == name) {
      found = &arg.value;
    }
  }
  return found;
}

auto CommandLine::Argv() const -> std::vector<std::string> {
  std::vector<std::string> argv;
  argv.reserve(args_.size() + 1);
  argv.push_back(executable_);
  for (const auto& arg : args_) {
    argv.push_back(arg.Render());
  }
  return argv;
}

auto CommandLine::ToString() const -> std::string {
  std::string result = executable_;
  for (const auto& arg : args_) {
    result += ' ';
    result += arg.Render();
  }
  return result;
}

auto CommandLine::ToShellString() const -> std::string {
  std::string result;
  for (const auto& word : Argv()) {
    if (!result.empty()) {
      result += ' ';
    }
    result += common::ShellQuote(word);
  }
  return result;
}

}  // namespace hwplan::action
