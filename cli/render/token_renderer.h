#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "rulestack/document.h"

namespace rulestack::cli {

/// Maps a color name from the config ("red", "dim", ...) to its ANSI code.
/// Returns nullptr for unknown names; "none" maps to an empty code.
const char* color_by_name(const std::string& name);

/// Turns styled tokens into terminal output.
/// MUST reproduce the line text byte for byte when color is disabled.
/// Inputs are tokens of one line; outputs are text with no side effects.
class TokenRenderer {
 public:
  explicit TokenRenderer(bool color);

  /// Overrides the color of one style; unknown color names are ignored.
  void set_style_color(const std::string& style, const std::string& color_name);
  /// ANSI code used for style, empty when the style is rendered uncolored.
  std::string color_for(const std::string& style) const;

  /// Renders one line by concatenating its tokens, coloring each by style.
  std::string render_line(const std::vector<StyledToken>& tokens) const;
  /// Renders one token per output line as "line:start-end<TAB>style<TAB>text", skipping whitespace.
  std::string render_plain(const std::vector<StyledToken>& tokens) const;

 private:
  bool color_;
  std::unordered_map<std::string, std::string> palette_;
};

}  // namespace rulestack::cli
