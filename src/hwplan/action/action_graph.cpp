#include "hwplan/action/action_graph.hpp"

#include <cstddef>
#include <expected>
#include <filesystem>
#include <format>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>

#include "hwplan/common/diagnostic/diagnostic.hpp"

namespace hwplan::action {

namespace {

// "out/a.sv.d/../a.sv" and "out/a.sv" name the same file.
auto ProducerKey(const std::string& path) -> std::string {
  return std::filesystem::path(path).lexically_normal().string();
}

}  // namespace

auto ActionGraph::DeclareFile(std::string_view short_path) const -> Artifact {
  std::string path = out_dir_.empty()
                         ? std::string(short_path)
                         : std::format("{}/{}", out_dir_, short_path);
  return Artifact{
      .short_path = std::string(short_path),
      .path = std::move(path),
      .is_source = false,
  };
}

auto ActionGraph::Register(std::string owner, Action action)
    -> Result<std::size_t> {
  auto outputs = OutputsOf(action);

  std::unordered_set<std::string> seen;
  for (const auto& output : outputs) {
    if (!seen.insert(ProducerKey(output.path)).second) {
      return std::unexpected(
          Diagnostic::Error(
              DiagCode::kConflictingOutput, output.path,
              std::format(
                  "target '{}' declares output '{}' more than once", owner,
                  output.path)));
    }
    if (const auto* producer = ProducerOf(output.path)) {
      return std::unexpected(
          Diagnostic::Error(
              DiagCode::kConflictingOutput, output.path,
              std::format(
                  "output '{}' of target '{}' is already produced by target "
                  "'{}'",
                  output.path, owner, producer->owner)));
    }
  }

  std::size_t index = actions_.size();
  for (const auto& output : outputs) {
    producers_.emplace(ProducerKey(output.path), index);
  }
  actions_.push_back(
      RegisteredAction{.owner = std::move(owner), .action = std::move(action)});
  return index;
}

auto ActionGraph::ProducerOf(const std::string& path) const
    -> const RegisteredAction* {
  auto it = producers_.find(ProducerKey(path));
  if (it == producers_.end()) {
    return nullptr;
  }
  return &actions_[it->second];
}

}  // namespace hwplan::action
