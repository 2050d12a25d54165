#pragma once

#include <nlohmann/json.hpp>

#include "hwplan/action/action_graph.hpp"
#include "hwplan/action/artifact.hpp"
#include "hwplan/codegen/codegen_info.hpp"

namespace hwplan::report {

// {"short_path": ..., "path": ..., "is_source": ...}
auto ToJson(const action::Artifact& artifact) -> nlohmann::json;

// One action with its owner, kind, command (argv) or content, inputs and
// outputs.
auto ToJson(const action::RegisteredAction& registered) -> nlohmann::json;

// {"out_dir": ..., "actions": [...]}, actions in registration order.
auto ToJson(const action::ActionGraph& graph) -> nlohmann::json;

// Metadata record for downstream consumers. Absent optionals are null.
auto ToJson(const codegen::CodegenInfo& info) -> nlohmann::json;

}  // namespace hwplan::report
