#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "hwplan/common/diagnostic/diagnostic.hpp"

namespace hwplan {

// Collects diagnostics while planning a workspace. Not thread-safe.
// Diagnostics are stored in order of reporting; callers may rely on this.
class DiagnosticSink {
 public:
  void Report(Diagnostic diag) {
    if (diag.primary.kind == DiagKind::kError) {
      ++error_count_;
    }
    diagnostics_.push_back(std::move(diag));
  }

  void Warning(std::string subject, std::string msg) {
    Report(Diagnostic::Warning(std::move(subject), std::move(msg)));
  }

  [[nodiscard]] auto HasErrors() const -> bool {
    return error_count_ > 0;
  }

  [[nodiscard]] auto ErrorCount() const -> std::size_t {
    return error_count_;
  }

  [[nodiscard]] auto GetDiagnostics() const -> const std::vector<Diagnostic>& {
    return diagnostics_;
  }

 private:
  std::vector<Diagnostic> diagnostics_;
  std::size_t error_count_ = 0;
};

}  // namespace hwplan
