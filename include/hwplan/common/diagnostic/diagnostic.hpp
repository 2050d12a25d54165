#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace hwplan {

// Severity of a diagnostic message
enum class DiagKind : uint8_t {
  kError,    // Fatal for the affected target
  kWarning,  // Non-fatal
  kNote,     // Auxiliary message
};

// What went wrong. Every error aborts planning of the affected target before
// any action is registered.
enum class DiagCode : uint8_t {
  kNone,               // Warnings and notes
  kUnknownOption,      // codegen_args key outside the allow-list
  kBadExtension,       // Verilog filename extension mismatches the mode
  kMissingTop,         // Benchmark requested without a top-level name
  kToolResolution,     // Toolchain executable unavailable
  kMissingOutput,      // Mandatory output filename not given
  kBadOutputName,      // Output filename escapes the output directory
  kConflictingOutput,  // Two actions declare the same output path
  kUnknownTarget,      // Reference to an undeclared target
  kConfig,             // Malformed manifest, I/O failure
};

auto ToString(DiagCode code) -> std::string_view;

// Single diagnostic item (primary or note)
struct DiagItem {
  DiagKind kind;
  DiagCode code;
  // Offending key, filename or target name. Empty when there is none.
  std::string subject;
  std::string message;

  auto operator==(const DiagItem&) const -> bool = default;
};

// Complete diagnostic with primary message and optional notes
struct Diagnostic {
  DiagItem primary;
  std::vector<DiagItem> notes;

  auto operator==(const Diagnostic&) const -> bool = default;

  [[nodiscard]] auto Code() const -> DiagCode {
    return primary.code;
  }

  [[nodiscard]] auto Subject() const -> const std::string& {
    return primary.subject;
  }

  [[nodiscard]] auto Message() const -> const std::string& {
    return primary.message;
  }

  // Factory: planning error about a named key, file or target
  static auto Error(DiagCode code, std::string subject, std::string msg)
      -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kError,
             .code = code,
             .subject = std::move(subject),
             .message = std::move(msg)},
        .notes = {},
    };
  }

  // Factory: malformed manifest or I/O failure
  static auto ConfigError(std::string msg) -> Diagnostic {
    return Error(DiagCode::kConfig, {}, std::move(msg));
  }

  // Factory: warning
  static auto Warning(std::string subject, std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kWarning,
             .code = DiagCode::kNone,
             .subject = std::move(subject),
             .message = std::move(msg)},
        .notes = {},
    };
  }

  // Add a note
  auto WithNote(std::string msg) && -> Diagnostic {
    notes.push_back(
        DiagItem{
            .kind = DiagKind::kNote,
            .code = DiagCode::kNone,
            .subject = {},
            .message = std::move(msg),
        });
    return std::move(*this);
  }
};

template <typename T>
using Result = std::expected<T, Diagnostic>;

}  // namespace hwplan
