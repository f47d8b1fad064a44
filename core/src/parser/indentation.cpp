#include "rulestack/indentation.h"

#include <cctype>

namespace rulestack {

namespace {

bool is_opening(char c) {
  return c == '{' || c == '(' || c == '[';
}

bool is_closing(char c) {
  return c == '}' || c == ')' || c == ']';
}

}  // namespace

void begin_line(ParserState& state, int indentation, int tab_size) {
  if (tab_size <= 0) tab_size = 1;
  state.indent_level = indentation / tab_size;
}

void track_brackets(ParserState& state, const Token& token) {
  if (token.kind != kPunctuationKind || token.value.empty()) return;
  char c = token.value[0];
  if (is_opening(c)) {
    state.levels.push_back(state.indent_level + 1);
  } else if (is_closing(c)) {
    if (!state.levels.empty()) {
      state.levels.pop_back();
    }
    if (!state.levels.empty() && state.levels.back() < state.indent_level) {
      state.indent_level = state.levels.back();
    }
  }
}

int suggested_indent(const ParserState& state, const std::string& text_after, int indent_unit) {
  size_t i = 0;
  while (i < text_after.size() && std::isspace(static_cast<unsigned char>(text_after[i]))) {
    ++i;
  }
  bool electric = i < text_after.size() && is_closing(text_after[i]);
  int level = state.indent_level;
  if (!state.levels.empty()) {
    level = state.levels.back() - (electric ? 1 : 0);
  }
  if (level < 0) level = 0;
  return level * indent_unit;
}

}  // namespace rulestack
