#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace hwplan::common {

// Filename split at the last '.' of its final path component.
// "out/a.b.sv" -> {"out/a.b", "sv"}; "out/a" -> {"out/a", ""}.
struct SplitName {
  std::string stem;
  std::string extension;
};

inline auto SplitFilename(std::string_view filename) -> SplitName {
  auto slash = filename.find_last_of('/');
  auto dot = filename.find_last_of('.');
  if (dot == std::string_view::npos ||
      (slash != std::string_view::npos && dot < slash)) {
    return SplitName{.stem = std::string(filename), .extension = {}};
  }
  return SplitName{
      .stem = std::string(filename.substr(0, dot)),
      .extension = std::string(filename.substr(dot + 1)),
  };
}

// Single-quotes `word` for a POSIX shell unless every character is safe
// unquoted. Embedded quotes become '\''.
inline auto ShellQuote(std::string_view word) -> std::string {
  auto is_safe = [](unsigned char c) {
    return std::isalnum(c) != 0 ||
           std::string_view("_-./=:,+@%").find(static_cast<char>(c)) !=
               std::string_view::npos;
  };
  if (!word.empty() && std::ranges::all_of(word, is_safe)) {
    return std::string(word);
  }
  std::string quoted = "'";
  for (char c : word) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }
  quoted += '\'';
  return quoted;
}

inline auto ToLower(std::string_view s) -> std::string {
  std::string result(s);
  std::ranges::transform(result, result.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return result;
}

}  // namespace hwplan::common
