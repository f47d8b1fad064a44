#include <cstdio>
#include <iostream>
#include <memory>
#include <regex>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <utility>
#include <vector>

#include "cli_args.h"
#include "cli_utils.h"
#include "config.h"
#include "render/token_renderer.h"
#include "rulestack/document.h"
#include "rulestack/grammar_json.h"
#include "rulestack/indentation.h"
#include "rulestack/online_parser.h"
#include "ui/color.h"

namespace {

using namespace rulestack;
using namespace rulestack::cli;

void print_error(const std::string& message, bool color) {
  if (color) {
    std::cerr << kColor.red << "Error: " << message << kColor.reset << "\n";
  } else {
    std::cerr << "Error: " << message << "\n";
  }
}

void print_definitions(const std::vector<NamedFrame>& frames, const std::string& mode) {
  if (mode == "json") {
    std::cout << build_definitions_json(frames) << "\n";
    return;
  }
  for (const auto& frame : frames) {
    std::cout << frame.line + 1 << "\t" << frame.name << "\t" << frame.type << "\n";
  }
}

/// Highlights a whole document in the requested output mode.
void print_document(DocumentHighlighter& document, const TokenRenderer& renderer, const std::string& mode) {
  if (mode == "json") {
    std::vector<StyledToken> all;
    for (size_t i = 0; i < document.line_count(); ++i) {
      const auto& tokens = document.line_tokens(i);
      all.insert(all.end(), tokens.begin(), tokens.end());
    }
    std::cout << build_tokens_json(all) << "\n";
    return;
  }
  for (size_t i = 0; i < document.line_count(); ++i) {
    if (mode == "plain") {
      std::cout << renderer.render_plain(document.line_tokens(i));
    } else {
      std::cout << renderer.render_line(document.line_tokens(i)) << "\n";
    }
  }
}

/// Highlights stdin one line at a time, carrying the parser state across lines.
/// The prompt shows the active rule and the suggested indent for the next line.
int run_interactive(OnlineParser& parser,
                    const TokenRenderer& renderer,
                    const std::string& mode,
                    int indent_unit,
                    bool color) {
  DocumentHighlighter document(parser);
  bool prompt = isatty(fileno(stdin)) != 0;
  bool first = true;
  std::string line;
  while (true) {
    if (prompt) {
      const ParserState& state = first ? parser.start_state() : document.state_after(document.line_count() - 1);
      int indent = suggested_indent(state, "", indent_unit);
      std::string kind = state.empty() ? std::string() : state.current().kind;
      std::cerr << (color ? kColor.dim : "") << kind << "> " << (color ? kColor.reset : "")
                << std::string(static_cast<size_t>(indent), ' ') << std::flush;
    }
    if (!std::getline(std::cin, line)) break;
    size_t index = first ? 0 : document.line_count();
    if (first) {
      document.replace_line(0, line);
      first = false;
    } else {
      document.insert_line(index, line);
    }
    const auto& tokens = document.line_tokens(index);
    if (mode == "json") {
      std::cout << build_tokens_json(tokens) << "\n";
    } else if (mode == "plain") {
      std::cout << renderer.render_plain(tokens);
    } else {
      std::cout << renderer.render_line(tokens) << "\n";
    }
    std::cout << std::flush;
  }
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc == 1) {
    print_startup_help(std::cout);
    return 0;
  }

  CliOptions options;
  std::string error;
  bool tty = isatty(fileno(stderr)) != 0;
  if (!parse_cli_args(argc, argv, options, error)) {
    print_error(error, tty);
    return 1;
  }
  if (options.show_help) {
    print_help(std::cout);
    return 0;
  }

  HighlightSettings settings;
  std::string config_path = options.config_path.empty() ? resolve_config_path() : options.config_path;
  if (!load_config(config_path, settings, error)) {
    if (!error.empty()) {
      print_error(error, tty);
      return 1;
    }
    if (!options.config_path.empty()) {
      print_error("Config not found: " + options.config_path, tty);
      return 1;
    }
  }

  bool color = options.color.value_or(settings.color.value_or(true));
  if (!isatty(fileno(stdout))) {
    // WHY: escape codes corrupt piped output.
    color = false;
  }
  std::string mode = options.output_mode.value_or(settings.output_mode.value_or("color"));
  if (options.grammar_file.empty()) {
    print_error("Missing --grammar <file.json>", tty);
    return 1;
  }

  try {
    GrammarLoadResult loaded = load_grammar_file(options.grammar_file);
    if (loaded.error) {
      std::string where = loaded.error->path.empty() ? "" : " at " + loaded.error->path;
      print_error("Invalid grammar" + where + ": " + loaded.error->message, tty);
      return 1;
    }

    ParserOptions parser_options;
    parser_options.tab_size = options.tab_size.value_or(settings.tab_size.value_or(2));
    parser_options.max_depth = options.max_depth.value_or(settings.max_depth.value_or(256));
    if (options.line_comment) {
      parser_options.line_comment = *options.line_comment;
    } else if (settings.line_comment) {
      parser_options.line_comment = *settings.line_comment;
    } else {
      parser_options.line_comment = loaded.line_comment.value_or("");
    }
    if (loaded.whitespace) {
      std::regex pattern = *loaded.whitespace;
      parser_options.eat_whitespace = [pattern](StringStream& stream) { return stream.match(pattern); };
    }
    int indent_unit = options.indent_unit.value_or(settings.indent_unit.value_or(2));

    auto grammar = std::make_shared<const Grammar>(std::move(*loaded.grammar));
    OnlineParser parser(grammar, parser_options);

    TokenRenderer renderer(color);
    for (const auto& entry : settings.styles) {
      renderer.set_style_color(entry.first, entry.second);
    }

    if (options.interactive) {
      return run_interactive(parser, renderer, mode, indent_unit, color);
    }

    std::string text = options.input.empty() ? read_stdin()
                                             : load_text_input(options.input, options.timeout_ms);
    if (!text.empty() && text.back() == '\n') {
      // A final newline terminates the last line rather than opening an empty one.
      text.pop_back();
    }
    if (!options.definitions_kind.empty()) {
      print_definitions(collect_named_frames(parser, text, options.definitions_kind), mode);
      return 0;
    }
    DocumentHighlighter document(parser);
    document.set_text(text);
    print_document(document, renderer, mode);
  } catch (const std::exception& ex) {
    print_error(ex.what(), tty);
    return 1;
  }
  return 0;
}
