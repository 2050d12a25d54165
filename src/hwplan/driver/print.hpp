#pragma once

#include <string>

#include "hwplan/action/action_graph.hpp"
#include "hwplan/common/diagnostic/diagnostic.hpp"
#include "hwplan/common/diagnostic/diagnostic_sink.hpp"

namespace hwplan::driver {

void PrintError(const std::string& message);
void PrintDiagnostic(const Diagnostic& diag);
void PrintDiagnostics(const DiagnosticSink& sink);

// Human-readable listing of every registered action.
auto FormatActionGraph(const action::ActionGraph& graph) -> std::string;

}  // namespace hwplan::driver
