#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "hwplan/action/action.hpp"
#include "hwplan/action/artifact.hpp"
#include "hwplan/common/diagnostic/diagnostic.hpp"

namespace hwplan::action {

struct RegisteredAction {
  // Target that registered the action.
  std::string owner;
  Action action;
};

// Stand-in for the host build system: hands out output artifacts and records
// the actions that produce them. Each output path has exactly one producer.
class ActionGraph {
 public:
  static constexpr std::string_view kDefaultOutDir = "hwplan-out";

  explicit ActionGraph(std::string out_dir = std::string(kDefaultOutDir))
      : out_dir_(std::move(out_dir)) {
  }

  // Handle for a generated file. Nothing is recorded until an action that
  // outputs it is registered.
  [[nodiscard]] auto DeclareFile(std::string_view short_path) const
      -> Artifact;

  // Records `action`. Fails with kConflictingOutput, leaving the graph
  // unchanged, when one of its outputs already has a producer or is listed
  // twice.
  auto Register(std::string owner, Action action) -> Result<std::size_t>;

  [[nodiscard]] auto Actions() const -> const std::vector<RegisteredAction>& {
    return actions_;
  }

  [[nodiscard]] auto Size() const -> std::size_t {
    return actions_.size();
  }

  // Action producing `path`, or nullptr. Paths are compared after lexical
  // normalization.
  [[nodiscard]] auto ProducerOf(const std::string& path) const
      -> const RegisteredAction*;

  [[nodiscard]] auto OutDir() const -> const std::string& {
    return out_dir_;
  }

 private:
  std::string out_dir_;
  std::vector<RegisteredAction> actions_;
  std::unordered_map<std::string, std::size_t> producers_;
};

}  // namespace hwplan::action
