#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>

#include "hwplan/common/diagnostic/diagnostic.hpp"

namespace hwplan::codegen {

// Option name -> option value, passed to the codegen tool as --key=value.
// Ordered so that every rendering of the same mapping is identical.
using CodegenArgs = std::map<std::string, std::string>;

// How the codegen tool lowers the design. Only kCombinational suppresses the
// schedule artifact.
enum class GeneratorMode : uint8_t {
  kCombinational,
  kPipeline,
  kOther,
};

auto ToString(GeneratorMode mode) -> std::string_view;

// Flags the codegen tool recognizes.
auto RecognizedCodegenFlags() -> const std::unordered_set<std::string>&;

// Values applied when the user leaves the key unset.
auto DefaultCodegenArgs() -> const CodegenArgs&;

// Returns a new mapping: `user_args` laid over DefaultCodegenArgs().
auto MergeDefaults(const CodegenArgs& user_args) -> CodegenArgs;

// Returns `args` unchanged when every key is recognized. Otherwise fails with
// kUnknownOption naming the first unrecognized key in iteration order.
auto ValidateCodegenArgs(const CodegenArgs& args) -> Result<CodegenArgs>;

// Checks that `verilog_filename` carries "sv" when `use_system_verilog` is
// set and "v" otherwise. Fails with kBadExtension.
auto ValidateVerilogFilename(
    std::string_view verilog_filename, bool use_system_verilog)
    -> Result<void>;

auto GetGeneratorMode(const CodegenArgs& args) -> GeneratorMode;

// True when "use_system_verilog" is "true" in any letter case. Callers pass
// merged args, so the key is normally present.
auto UsesSystemVerilog(const CodegenArgs& args) -> bool;

// Value of `key`, or nullopt when absent.
auto FindArg(const CodegenArgs& args, std::string_view key)
    -> std::optional<std::string>;

}  // namespace hwplan::codegen
