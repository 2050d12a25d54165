#pragma once

#include <format>
#include <stdexcept>
#include <string>

namespace hwplan::common {

// Exception type for internal hwplan errors (caller-contract violations and
// planner bugs, not user errors)
class InternalError : public std::runtime_error {
 public:
  InternalError(const char* context, const std::string& detail)
      : std::runtime_error(
            std::format(
                "Internal error in {}: {}\n"
                "This is a bug in hwplan or in the code calling it.",
                context, detail)) {
  }
};

// Helper function to throw internal error (marked [[noreturn]] for
// optimization)
[[noreturn]] inline void ThrowInternalError(
    const char* context, const std::string& detail) {
  throw InternalError(context, detail);
}

}  // namespace hwplan::common
