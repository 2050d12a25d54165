#include "hwplan/codegen/codegen_args.hpp"

#include <expected>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>

#include "hwplan/codegen/artifact_role.hpp"
#include "hwplan/common/diagnostic/diagnostic.hpp"
#include "hwplan/common/string_utils.hpp"

namespace hwplan::codegen {

auto ToString(GeneratorMode mode) -> std::string_view {
  switch (mode) {
    case GeneratorMode::kCombinational:
      return "combinational";
    case GeneratorMode::kPipeline:
      return "pipeline";
    case GeneratorMode::kOther:
      return "other";
  }
  return "other";
}

auto RecognizedCodegenFlags() -> const std::unordered_set<std::string>& {
  static const std::unordered_set<std::string> kFlags = {
      // Timing
      "clock_period_ps",
      "additional_input_delay_ps",
      "pipeline_stages",
      "clock_margin_percent",
      "period_relaxation_percent",
      // Reset
      "reset",
      "reset_active_low",
      "reset_asynchronous",
      "reset_data_path",
      // I/O signaling
      "input_valid_signal",
      "output_valid_signal",
      "manual_load_enable_signal",
      "flop_inputs",
      "flop_inputs_kind",
      "flop_outputs",
      "flop_outputs_kind",
      "flop_single_value_channels",
      "add_idle_output",
      "gate_recvs",
      "receives_first_sends_last",
      // Naming
      "top",
      "module_name",
      "streaming_channel_data_suffix",
      "streaming_channel_ready_suffix",
      "streaming_channel_valid_suffix",
      // Formatting
      "assert_format",
      "gate_format",
      "smulp_format",
      "umulp_format",
      // Structure
      "generator",
      "delay_model",
      "io_constraints",
      "ram_configurations",
      "use_system_verilog",
      "separate_lines",
      "array_index_bounds_checking",
  };
  return kFlags;
}

auto DefaultCodegenArgs() -> const CodegenArgs& {
  static const CodegenArgs kDefaults = {
      {"delay_model", "unit"},
      {"use_system_verilog", "True"},
  };
  return kDefaults;
}

auto MergeDefaults(const CodegenArgs& user_args) -> CodegenArgs {
  CodegenArgs merged = user_args;
  for (const auto& [key, value] : DefaultCodegenArgs()) {
    merged.try_emplace(key, value);
  }
  return merged;
}

auto ValidateCodegenArgs(const CodegenArgs& args) -> Result<CodegenArgs> {
  const auto& recognized = RecognizedCodegenFlags();
  for (const auto& [key, value] : args) {
    if (!recognized.contains(key)) {
      return std::unexpected(
          Diagnostic::Error(
              DiagCode::kUnknownOption, key,
              std::format("Unrecognized argument: {}.", key)));
    }
  }
  return args;
}

auto ValidateVerilogFilename(
    std::string_view verilog_filename, bool use_system_verilog)
    -> Result<void> {
  auto split = common::SplitFilename(verilog_filename);
  bool has_basename = !split.stem.empty() && !split.stem.ends_with('/');
  std::string_view expected =
      use_system_verilog ? kSystemVerilogExtension : kVerilogExtension;

  if (!has_basename || split.extension != expected) {
    return std::unexpected(
        Diagnostic::Error(
            DiagCode::kBadExtension, std::string(verilog_filename),
            std::format(
                "{} filename must contain the '{}' extension.",
                use_system_verilog ? "SystemVerilog" : "Verilog", expected))
            .WithNote(std::format("got '{}'", verilog_filename)));
  }
  return {};
}

auto GetGeneratorMode(const CodegenArgs& args) -> GeneratorMode {
  auto it = args.find("generator");
  if (it == args.end()) {
    return GeneratorMode::kOther;
  }
  if (it->second == "combinational") {
    return GeneratorMode::kCombinational;
  }
  if (it->second == "pipeline") {
    return GeneratorMode::kPipeline;
  }
  return GeneratorMode::kOther;
}

auto UsesSystemVerilog(const CodegenArgs& args) -> bool {
  auto it = args.find("use_system_verilog");
  return it != args.end() && common::ToLower(it->second) == "true";
}

auto FindArg(const CodegenArgs& args, std::string_view key)
    -> std::optional<std::string> {
  auto it = args.find(std::string(key));
  if (it == args.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace hwplan::codegen
