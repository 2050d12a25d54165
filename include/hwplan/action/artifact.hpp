#pragma once

#include <compare>
#include <string>
#include <utility>

namespace hwplan::action {

// Handle to a file the action graph reads or writes.
struct Artifact {
  // Name relative to the project root, as written in the manifest or declared
  // by a rule. Used by generated scripts, which run from the runfiles tree.
  std::string short_path;
  // Path relative to the execution root. Generated files live under the
  // output directory; source files are the same as short_path.
  std::string path;
  bool is_source = false;

  auto operator<=>(const Artifact&) const = default;

  static auto Source(std::string short_path) -> Artifact {
    std::string path = short_path;
    return Artifact{
        .short_path = std::move(short_path),
        .path = std::move(path),
        .is_source = true,
    };
  }
};

}  // namespace hwplan::action
