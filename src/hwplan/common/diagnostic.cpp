#include "hwplan/common/diagnostic/diagnostic.hpp"

#include <string_view>

namespace hwplan {

auto ToString(DiagCode code) -> std::string_view {
  switch (code) {
    case DiagCode::kNone:
      return "none";
    case DiagCode::kUnknownOption:
      return "unknown-option";
    case DiagCode::kBadExtension:
      return "bad-extension";
    case DiagCode::kMissingTop:
      return "missing-top";
    case DiagCode::kToolResolution:
      return "tool-resolution";
    case DiagCode::kMissingOutput:
      return "missing-output";
    case DiagCode::kBadOutputName:
      return "bad-output-name";
    case DiagCode::kConflictingOutput:
      return "conflicting-output";
    case DiagCode::kUnknownTarget:
      return "unknown-target";
    case DiagCode::kConfig:
      return "config";
  }
  return "unknown";
}

}  // namespace hwplan
