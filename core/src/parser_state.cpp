#include "rulestack/parser_state.h"

#include <algorithm>
#include <sstream>

namespace rulestack {

bool operator==(const Frame& lhs, const Frame& rhs) {
  return lhs.kind == rhs.kind && lhs.rule == rhs.rule && lhs.step == rhs.step &&
         lhs.name == rhs.name && lhs.type == rhs.type &&
         lhs.needs_separator == rhs.needs_separator;
}

bool operator!=(const Frame& lhs, const Frame& rhs) {
  return !(lhs == rhs);
}

bool operator==(const ParserState& lhs, const ParserState& rhs) {
  return lhs.frames == rhs.frames && lhs.needs_advance == rhs.needs_advance &&
         lhs.levels == rhs.levels && lhs.indent_level == rhs.indent_level;
}

bool operator!=(const ParserState& lhs, const ParserState& rhs) {
  return !(lhs == rhs);
}

const Frame* previous_frame(const ParserState& state) {
  if (state.frames.size() < 2) return nullptr;
  return &state.frames[state.frames.size() - 2];
}

void for_each_frame(const ParserState& state, const std::function<void(const Frame&)>& visit) {
  for (const auto& frame : state.frames) {
    visit(frame);
  }
}

const Frame* find_frame(const ParserState& state, const std::vector<std::string>& kinds) {
  for (const auto& frame : state.frames) {
    if (std::find(kinds.begin(), kinds.end(), frame.kind) != kinds.end()) {
      return &frame;
    }
  }
  return nullptr;
}

std::string describe_state(const ParserState& state) {
  std::ostringstream oss;
  for (size_t i = 0; i < state.frames.size(); ++i) {
    if (i > 0) oss << " > ";
    oss << state.frames[i].kind << "[" << state.frames[i].step << "]";
  }
  return oss.str();
}

}  // namespace rulestack
