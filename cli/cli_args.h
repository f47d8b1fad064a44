#pragma once

#include <optional>
#include <ostream>
#include <string>

namespace rulestack::cli {

/// Captures CLI arguments so main can dispatch without re-parsing raw argv.
/// Optional fields stay unset unless given so config values can fill them.
/// Inputs are argv; outputs are populated fields with no side effects by itself.
struct CliOptions {
  std::string grammar_file;
  std::string input;
  std::string config_path;
  std::string definitions_kind;
  bool interactive = false;
  std::optional<bool> color;
  std::optional<std::string> output_mode;
  std::optional<int> tab_size;
  std::optional<int> indent_unit;
  std::optional<size_t> max_depth;
  std::optional<std::string> line_comment;
  int timeout_ms = 5000;
  bool show_help = false;
};

/// Prints the brief startup help shown when no arguments are provided.
/// MUST remain user-facing and MUST not throw on stream failures.
void print_startup_help(std::ostream& os);
/// Prints the full help text for explicit --help.
/// MUST remain accurate to supported flags.
void print_help(std::ostream& os);
/// Parses CLI flags into options and reports a user-facing error string.
/// MUST return false on unknown flags, missing values, or invalid numbers.
/// Inputs are argc/argv; outputs are options/error with no external side effects.
bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error);

/// True when mode names a supported output mode (color, plain, json).
bool is_valid_output_mode(const std::string& mode);

}  // namespace rulestack::cli
