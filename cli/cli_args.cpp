#include "cli_args.h"

#include <limits>
#include <optional>
#include <string>

#include "util/string_util.h"

namespace rulestack::cli {

namespace {

/// Parses a positive number that also fits an int-typed option.
std::optional<int> parse_positive_int(const std::string& raw) {
  auto value = util::parse_positive(raw);
  if (!value || *value > static_cast<size_t>(std::numeric_limits<int>::max())) return std::nullopt;
  return static_cast<int>(*value);
}

bool takes_value(const std::string& arg) {
  return arg == "--grammar" || arg == "--input" || arg == "--config" || arg == "--definitions" ||
         arg == "--mode" || arg == "--tab-size" || arg == "--indent-unit" || arg == "--max-depth" ||
         arg == "--timeout-ms" || arg == "--line-comment";
}

}  // namespace

/// Prints the startup help so users see baseline usage without flags.
/// MUST keep examples aligned with current CLI.
void print_startup_help(std::ostream& os) {
  os << "rulestack - grammar-driven incremental highlighter\n\n";
  os << "Usage:\n";
  os << "  rulestack --grammar <file.json> [--input <path|url>]\n";
  os << "  rulestack --grammar <file.json> --interactive\n";
  os << "  rulestack --mode color|plain|json\n";
  os << "  rulestack --definitions <kind>\n";
  os << "  rulestack --color=disabled\n\n";
  os << "Notes:\n";
  os << "  - If --input is omitted, text is read from stdin.\n";
  os << "  - URLs are supported when libcurl is available.\n";
  os << "  - Defaults are read from $RULESTACK_CONFIG or ~/.config/rulestack/config.toml.\n\n";
  os << "Examples:\n";
  os << "  rulestack --grammar grammars/graphql.json --input query.graphql\n";
  os << "  rulestack --grammar grammars/graphql.json --mode json < query.graphql\n";
  os << "  rulestack --grammar grammars/graphql.json --definitions FragmentDefinition --input query.graphql\n";
}

void print_help(std::ostream& os) {
  os << "Usage: rulestack --grammar <file.json> [--input <path|url>]\n";
  os << "       rulestack --grammar <file.json> --interactive\n";
  os << "Options:\n";
  os << "  --grammar <file>        JSON grammar to highlight with (required)\n";
  os << "  --input <path|url>      text to highlight (default: stdin)\n";
  os << "  --mode color|plain|json output format (default: color)\n";
  os << "  --interactive           highlight stdin line by line as it arrives\n";
  os << "  --definitions <kind>    list frames of <kind> that captured a name and a type\n";
  os << "  --tab-size <n>          columns per tab stop\n";
  os << "  --indent-unit <n>       columns per suggested indent level\n";
  os << "  --max-depth <n>         rule stack depth limit\n";
  os << "  --line-comment <text>   line comment prefix (overrides the grammar)\n";
  os << "  --config <path>         config file to read instead of the default\n";
  os << "  --timeout-ms <n>        URL fetch timeout\n";
  os << "  --color=disabled        never emit ANSI colors\n";
}

bool is_valid_output_mode(const std::string& mode) {
  return mode == "color" || mode == "plain" || mode == "json";
}

/// Parses argv into typed options so main can dispatch consistently.
/// MUST return false for invalid flags.
bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    bool has_value = i + 1 < argc;
    if (arg == "--grammar" && has_value) {
      options.grammar_file = argv[++i];
    } else if (arg == "--input" && has_value) {
      options.input = argv[++i];
    } else if (arg == "--config" && has_value) {
      options.config_path = argv[++i];
    } else if (arg == "--definitions" && has_value) {
      options.definitions_kind = argv[++i];
    } else if (arg == "--interactive") {
      options.interactive = true;
    } else if (arg == "--mode" && has_value) {
      std::string value = argv[++i];
      if (!is_valid_output_mode(value)) {
        error = "Invalid --mode value (use color|plain|json)";
        return false;
      }
      options.output_mode = value;
    } else if ((arg == "--tab-size" || arg == "--indent-unit" || arg == "--max-depth" ||
                arg == "--timeout-ms") && has_value) {
      auto parsed = parse_positive_int(argv[++i]);
      if (!parsed) {
        // WHY: a silently ignored number would leave the parser in an unexpected layout.
        error = "Invalid " + arg + " value (use a positive integer)";
        return false;
      }
      int value = *parsed;
      if (arg == "--tab-size") {
        options.tab_size = value;
      } else if (arg == "--indent-unit") {
        options.indent_unit = value;
      } else if (arg == "--max-depth") {
        options.max_depth = static_cast<size_t>(value);
      } else {
        options.timeout_ms = value;
      }
    } else if (arg == "--line-comment" && has_value) {
      options.line_comment = argv[++i];
    } else if (arg == "--color=disabled") {
      options.color = false;
    } else if (arg == "--help") {
      options.show_help = true;
    } else if (takes_value(arg)) {
      error = "Missing value for " + arg;
      return false;
    } else {
      error = "Unknown argument: " + arg;
      return false;
    }
  }
  return true;
}

}  // namespace rulestack::cli
