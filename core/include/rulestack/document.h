#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "rulestack/online_parser.h"
#include "rulestack/parser_state.h"

namespace rulestack {

/// One classified span of a line.
/// MUST use byte offsets within the line; kind/step/depth describe the active frame after the token.
struct StyledToken {
  size_t line = 0;
  size_t start = 0;
  size_t end = 0;
  std::string text;
  std::string style;
  std::string kind;
  size_t step = 0;
  size_t depth = 0;
};

/// A frame that captured both a name and a type, e.g. a named definition.
struct NamedFrame {
  std::string kind;
  std::string name;
  std::string type;
  size_t line = 0;
};

/// Keeps per-line parser states so edits only re-highlight from the edited line on.
/// A line whose entry state is unchanged reuses its cached tokens.
/// MUST produce the same tokens as a fresh full pass over the same text.
/// Inputs are line edits; outputs are styled tokens and states per line.
class DocumentHighlighter {
 public:
  /// Binds the highlighter to a parser; the parser MUST outlive it.
  explicit DocumentHighlighter(OnlineParser& parser);

  /// Replaces the whole document; lines are split on '\n' (a trailing '\r' is dropped).
  void set_text(const std::string& text);
  /// Replaces one line's text and invalidates it and every line after it.
  void replace_line(size_t line, const std::string& text);
  /// Inserts a line before index line (line == line_count() appends).
  void insert_line(size_t line, const std::string& text);
  /// Removes one line.
  void erase_line(size_t line);

  size_t line_count() const { return lines_.size(); }
  const std::string& line_text(size_t line) const { return lines_.at(line).text; }

  /// Tokens of one line, highlighting lazily up to it.
  const std::vector<StyledToken>& line_tokens(size_t line);
  /// State at the start of a line.
  const ParserState& state_before(size_t line);
  /// State at the end of a line.
  const ParserState& state_after(size_t line);
  /// Suggested indentation, in columns, for a line.
  int suggested_indent(size_t line, int indent_unit);

  /// Number of leading lines whose tokens are known to be current.
  size_t highlighted_lines() const { return frontier_; }
  /// Lines tokenized since construction; lets callers observe reuse after edits.
  size_t lines_tokenized() const { return lines_tokenized_; }

 private:
  struct LineCache {
    std::string text;
    // State the cached tokens were computed from, and the state they led to.
    ParserState entry;
    ParserState exit;
    std::vector<StyledToken> tokens;
    bool fresh = false;
  };

  void highlight_through(size_t line);
  void touch(size_t line);

  OnlineParser& parser_;
  std::vector<LineCache> lines_;
  size_t frontier_ = 0;
  size_t lines_tokenized_ = 0;
};

/// Tokenizes one line from state, appending to out and mutating state in place.
/// Inputs are parser/state/line; outputs are tokens in line order.
void tokenize_line(OnlineParser& parser,
                   ParserState& state,
                   const std::string& line,
                   size_t line_number,
                   std::vector<StyledToken>& out);

/// Runs the parser over a whole text from a fresh state, calling visit per token.
/// Inputs are parser/text; outputs are all tokens; side effects are visit calls.
std::vector<StyledToken> tokenize_text(
    OnlineParser& parser,
    const std::string& text,
    const std::function<void(const ParserState&, const StyledToken&)>& visit = {});

/// Collects frames of kind that captured both name and type anywhere in text.
/// Each definition is reported once, with the line where its type was captured.
std::vector<NamedFrame> collect_named_frames(OnlineParser& parser,
                                             const std::string& text,
                                             const std::string& kind);

/// Splits text into lines on '\n', dropping a trailing '\r' from each line.
std::vector<std::string> split_lines(const std::string& text);

}  // namespace rulestack
