#pragma once

#include <string>

namespace rulestack::cli {

/// ANSI codes used to paint token styles and diagnostics.
/// MUST stay ASCII-only; "none" in a config maps to an empty code.
struct Color {
  const char* reset = "\033[0m";
  const char* red = "\033[31m";
  const char* green = "\033[32m";
  const char* yellow = "\033[33m";
  const char* blue = "\033[34m";
  const char* magenta = "\033[35m";
  const char* cyan = "\033[36m";
  const char* dim = "\033[2m";
  const char* bold = "\033[1m";

  /// Looks up a code by its config name ("red", "dim", "none", ...).
  /// Returns nullptr for unknown names.
  const char* by_name(const std::string& name) const;
};

extern Color kColor;

}  // namespace rulestack::cli
