#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace hwplan::action {

// Accumulates the arguments of one tool invocation and renders them once.
// Entries keep insertion order, so the rendering is deterministic.
class CommandLine {
 public:
  struct Arg {
    enum class Kind : uint8_t { kPositional, kFlag };

    Kind kind;
    // Flag name without dashes; empty for positional arguments.
    std::string name;
    std::string value;

    auto operator==(const Arg&) const -> bool = default;
    [[nodiscard]] auto Render() const -> std::string;
  };

  explicit CommandLine(std::string executable)
      : executable_(std::move(executable)) {
  }

  auto AddPositional(std::string value) -> CommandLine&;

  // Appends "--name=value".
  auto AddFlag(std::string name, std::string value) -> CommandLine&;

  // Appends one flag per entry, in map order.
  auto AddFlags(const std::map<std::string, std::string>& flags)
      -> CommandLine&;

  [[nodiscard]] auto Executable() const -> const std::string& {
    return executable_;
  }

  [[nodiscard]] auto Args() const -> const std::vector<Arg>& {
    return args_;
  }

  // Value of the last flag named `name`, or nullptr.
  [[nodiscard]] auto FindFlag(const std::string& name) const
      -> const std::string*;

  // Executable followed by every rendered argument.
  [[nodiscard]] auto Argv() const -> std::vector<std::string>;

  // Argv joined by single spaces.
  [[nodiscard]] auto ToString() const -> std::string;

  // Like ToString, with each word quoted for bash where needed.
  [[nodiscard]] auto ToShellString() const -> std::string;

  auto operator==(const CommandLine&) const -> bool = default;

 private:
  std::string executable_;
  std::vector<Arg> args_;
};

}  // namespace hwplan::action
