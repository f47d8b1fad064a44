#pragma once

#include <cstddef>
#include <functional>
#include <regex>
#include <string>

namespace rulestack {

/// Cursor over one line of host text, consumed token by token.
/// MUST only move forward and MUST keep start() <= pos() <= size.
/// Inputs are the line text; outputs are matches and position metadata.
class StringStream {
 public:
  /// Wraps a line of text (without its trailing newline).
  /// tab_size is used only to measure indentation.
  explicit StringStream(std::string line, size_t line_number = 0, int tab_size = 2);

  size_t pos() const { return pos_; }
  size_t start() const { return start_; }
  size_t line_number() const { return line_number_; }
  const std::string& text() const { return line_; }

  /// True when the cursor is at column zero.
  bool sol() const { return pos_ == 0; }
  /// True when the whole line has been consumed.
  bool eol() const { return pos_ >= line_.size(); }

  /// Returns the next character without consuming it, or '\0' at eol.
  char peek() const;
  /// Consumes and returns the next character, or '\0' at eol.
  char next();

  /// Consumes ASCII spaces and tabs; returns true if any were consumed.
  bool eat_space();
  /// Consumes characters while predicate holds; returns true if any were consumed.
  bool eat_while(const std::function<bool(char)>& predicate);

  /// Matches pattern anchored at the cursor and consumes it.
  /// MUST reject empty matches so callers always make progress.
  /// Inputs are a compiled regex; outputs are the matched text via out when non-null.
  bool match(const std::regex& pattern, std::string* out = nullptr);
  /// Matches a literal prefix at the cursor and consumes it.
  bool match(const std::string& literal);

  /// Consumes the rest of the line.
  void skip_to_end() { pos_ = line_.size(); }

  /// Width of the line's leading whitespace with tabs expanded to tab stops.
  int indentation() const;

  /// Text between start() and pos(): the token just consumed.
  std::string current() const { return line_.substr(start_, pos_ - start_); }
  /// Marks the cursor as the start of the next token.
  void set_start() { start_ = pos_; }

 private:
  std::string line_;
  size_t line_number_ = 0;
  int tab_size_ = 2;
  size_t pos_ = 0;
  size_t start_ = 0;
};

}  // namespace rulestack
