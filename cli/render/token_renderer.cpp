#include "render/token_renderer.h"

#include <sstream>

#include "ui/color.h"

namespace rulestack::cli {

const char* color_by_name(const std::string& name) {
  return kColor.by_name(name);
}

TokenRenderer::TokenRenderer(bool color) : color_(color) {
  palette_ = {
      {"keyword", kColor.magenta},
      {"def", kColor.blue},
      {"builtin", kColor.blue},
      {"property", kColor.cyan},
      {"attribute", kColor.cyan},
      {"variable", kColor.yellow},
      {"atom", kColor.yellow},
      {"number", kColor.green},
      {"string", kColor.green},
      {"meta", kColor.magenta},
      {"qualifier", kColor.dim},
      {kStyleComment, kColor.dim},
      {kStyleInvalid, kColor.red},
  };
}

void TokenRenderer::set_style_color(const std::string& style, const std::string& color_name) {
  const char* code = color_by_name(color_name);
  if (!code) return;
  palette_[style] = code;
}

std::string TokenRenderer::color_for(const std::string& style) const {
  auto it = palette_.find(style);
  return it == palette_.end() ? std::string() : it->second;
}

std::string TokenRenderer::render_line(const std::vector<StyledToken>& tokens) const {
  std::string out;
  for (const auto& token : tokens) {
    std::string code = color_ ? color_for(token.style) : std::string();
    if (code.empty()) {
      out += token.text;
      continue;
    }
    out += code;
    out += token.text;
    out += kColor.reset;
  }
  return out;
}

std::string TokenRenderer::render_plain(const std::vector<StyledToken>& tokens) const {
  std::ostringstream oss;
  for (const auto& token : tokens) {
    if (token.style == kStyleWhitespace) continue;
    oss << token.line + 1 << ":" << token.start << "-" << token.end << "\t" << token.style << "\t"
        << token.text << "\n";
  }
  return oss.str();
}

}  // namespace rulestack::cli
