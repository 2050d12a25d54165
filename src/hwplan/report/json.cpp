#include "hwplan/report/json.hpp"

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "hwplan/action/action.hpp"
#include "hwplan/action/action_graph.hpp"
#include "hwplan/action/artifact.hpp"
#include "hwplan/codegen/codegen_info.hpp"
#include "hwplan/common/overloaded.hpp"

namespace hwplan::report {

namespace {

auto ArtifactsToJson(const std::vector<action::Artifact>& artifacts)
    -> nlohmann::json {
  auto array = nlohmann::json::array();
  for (const auto& artifact : artifacts) {
    array.push_back(ToJson(artifact));
  }
  return array;
}

auto OptionalToJson(const std::optional<std::string>& value)
    -> nlohmann::json {
  if (!value) {
    return nullptr;
  }
  return *value;
}

}  // namespace

auto ToJson(const action::Artifact& artifact) -> nlohmann::json {
  return nlohmann::json{
      {"short_path", artifact.short_path},
      {"path", artifact.path},
      {"is_source", artifact.is_source},
  };
}

auto ToJson(const action::RegisteredAction& registered) -> nlohmann::json {
  nlohmann::json j;
  j["owner"] = registered.owner;
  j["mnemonic"] = action::MnemonicOf(registered.action);
  std::visit(
      Overloaded{
          [&](const action::RunAction& run) {
            j["progress_message"] = run.progress_message;
            j["argv"] = run.command.Argv();
            j["inputs"] = ArtifactsToJson(run.inputs);
            j["tools"] = ArtifactsToJson(run.tools);
            j["outputs"] = ArtifactsToJson(run.outputs);
          },
          [&](const action::WriteAction& write) {
            j["content"] = write.content;
            j["is_executable"] = write.is_executable;
            j["outputs"] = ArtifactsToJson(std::vector{write.output});
          },
      },
      registered.action);
  return j;
}

auto ToJson(const action::ActionGraph& graph) -> nlohmann::json {
  auto actions = nlohmann::json::array();
  for (const auto& registered : graph.Actions()) {
    actions.push_back(ToJson(registered));
  }
  return nlohmann::json{
      {"out_dir", graph.OutDir()},
      {"actions", std::move(actions)},
  };
}

auto ToJson(const codegen::CodegenInfo& info) -> nlohmann::json {
  return nlohmann::json{
      {"verilog_file", ToJson(info.verilog_file)},
      {"module_sig_file", ToJson(info.module_sig_file)},
      {"verilog_line_map_file", ToJson(info.verilog_line_map_file)},
      {"schedule_file",
       info.schedule_file ? ToJson(*info.schedule_file) : nlohmann::json()},
      {"block_ir_file", ToJson(info.block_ir_file)},
      {"delay_model", OptionalToJson(info.delay_model)},
      {"top", OptionalToJson(info.top)},
      {"pipeline_stages", OptionalToJson(info.pipeline_stages)},
      {"clock_period_ps", OptionalToJson(info.clock_period_ps)},
  };
}

}  // namespace hwplan::report
