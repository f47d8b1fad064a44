#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "rulestack/grammar.h"

namespace rulestack {

/// One activation of a rule definition on the parse stack.
/// MUST point at a definition owned by the grammar that created the state.
/// Inputs are pushes by the machine; outputs are the cursor and scratch fields.
struct Frame {
  std::string kind;
  const RuleDefinition* rule = nullptr;
  size_t step = 0;
  std::optional<std::string> name;
  std::optional<std::string> type;
  bool needs_separator = false;
};

bool operator==(const Frame& lhs, const Frame& rhs);
bool operator!=(const Frame& lhs, const Frame& rhs);

/// Resumable parse state: a frame stack plus indentation bookkeeping.
/// MUST stay a plain value so hosts can copy it at every line boundary.
/// Inputs are tokens fed through OnlineParser; outputs are the frame stack and levels.
struct ParserState {
  // back() is the active frame; the frame below it is its enclosing rule.
  std::vector<Frame> frames;
  bool needs_advance = false;
  std::vector<int> levels;
  int indent_level = 0;

  bool empty() const { return frames.empty(); }
  size_t depth() const { return frames.size(); }
  Frame& current() { return frames.back(); }
  const Frame& current() const { return frames.back(); }
};

bool operator==(const ParserState& lhs, const ParserState& rhs);
bool operator!=(const ParserState& lhs, const ParserState& rhs);

/// Returns the frame enclosing the active one, or nullptr at the root.
const Frame* previous_frame(const ParserState& state);

/// Visits every frame from the root to the active frame.
/// MUST NOT mutate the state. Inputs are the state and a visitor.
void for_each_frame(const ParserState& state, const std::function<void(const Frame&)>& visit);

/// Finds the outermost frame whose kind is one of kinds.
/// Used to locate the enclosing definition of a token (e.g. a fragment).
/// Inputs are state/kinds; outputs are nullptr when no frame matches.
const Frame* find_frame(const ParserState& state, const std::vector<std::string>& kinds);

/// Renders the frame stack as "Root[0] > Child[2]" for diagnostics and tests.
std::string describe_state(const ParserState& state);

}  // namespace rulestack
