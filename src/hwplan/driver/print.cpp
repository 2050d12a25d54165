#include "print.hpp"

#include <cstddef>
#include <cstdio>
#include <string>
#include <variant>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include "hwplan/action/action.hpp"
#include "hwplan/action/action_graph.hpp"
#include "hwplan/action/artifact.hpp"
#include "hwplan/common/diagnostic/diagnostic.hpp"
#include "hwplan/common/diagnostic/diagnostic_sink.hpp"
#include "hwplan/common/overloaded.hpp"

namespace hwplan::driver {

namespace {

constexpr auto kToolColor = fmt::terminal_color::white;
constexpr auto kToolStyle = fmt::fg(kToolColor) | fmt::emphasis::bold;

auto DiagKindToString(DiagKind kind) -> const char* {
  switch (kind) {
    case DiagKind::kError:
      return "error:";
    case DiagKind::kWarning:
      return "warning:";
    case DiagKind::kNote:
      return "note:";
  }
  return "error:";
}

auto DiagKindToStyle(DiagKind kind) -> fmt::text_style {
  switch (kind) {
    case DiagKind::kError:
      return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
    case DiagKind::kWarning:
      return fmt::fg(fmt::terminal_color::bright_magenta) | fmt::emphasis::bold;
    case DiagKind::kNote:
      return fmt::fg(fmt::terminal_color::bright_cyan) | fmt::emphasis::bold;
  }
  return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
}

void PrintDiagItem(const DiagItem& item, bool is_primary) {
  std::string kind_str = DiagKindToString(item.kind);
  if (item.code != DiagCode::kNone) {
    kind_str = fmt::format("error[{}]:", ToString(item.code));
  }
  fmt::print(
      stderr, "{}{}: {} {}\n", is_primary ? "" : "  ",
      fmt::styled("hwplan", kToolStyle),
      fmt::styled(kind_str, DiagKindToStyle(item.kind)),
      fmt::styled(
          item.message, is_primary ? fmt::emphasis::bold : fmt::text_style{}));
}

auto JoinPaths(const std::vector<action::Artifact>& artifacts) -> std::string {
  std::vector<std::string> paths;
  paths.reserve(artifacts.size());
  for (const auto& artifact : artifacts) {
    paths.push_back(artifact.path);
  }
  return fmt::format("{}", fmt::join(paths, " "));
}

}  // namespace

void PrintError(const std::string& message) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("hwplan", kToolStyle),
      fmt::styled(
          "error:",
          fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold),
      fmt::styled(message, fmt::emphasis::bold));
}

void PrintDiagnostic(const Diagnostic& diag) {
  PrintDiagItem(diag.primary, true);
  for (const auto& note : diag.notes) {
    PrintDiagItem(note, false);
  }
}

void PrintDiagnostics(const DiagnosticSink& sink) {
  for (const auto& diag : sink.GetDiagnostics()) {
    PrintDiagnostic(diag);
  }
}

auto FormatActionGraph(const action::ActionGraph& graph) -> std::string {
  std::string out;
  std::size_t index = 0;
  for (const auto& registered : graph.Actions()) {
    out += fmt::format(
        "action {} [{}] {}\n", index++, action::MnemonicOf(registered.action),
        registered.owner);
    std::visit(
        Overloaded{
            [&](const action::RunAction& run) {
              out += fmt::format("  progress: {}\n", run.progress_message);
              out += fmt::format("  command:  {}\n", run.command.ToString());
              out += fmt::format("  inputs:   {}\n", JoinPaths(run.inputs));
              out += fmt::format("  tools:    {}\n", JoinPaths(run.tools));
              out += fmt::format("  outputs:  {}\n", JoinPaths(run.outputs));
            },
            [&](const action::WriteAction& write) {
              out += fmt::format(
                  "  output:   {}{}\n", write.output.path,
                  write.is_executable ? " (executable)" : "");
              out += "  content:\n";
              std::size_t start = 0;
              while (start <= write.content.size()) {
                auto end = write.content.find('\n', start);
                if (end == std::string::npos) {
                  end = write.content.size();
                }
                out += fmt::format(
                    "    {}\n", write.content.substr(start, end - start));
                start = end + 1;
              }
            },
        },
        registered.action);
  }
  return out;
}

}  // namespace hwplan::driver
