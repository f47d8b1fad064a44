#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "rulestack/grammar.h"
#include "rulestack/parser_state.h"

namespace rulestack::detail {

/// Resolves the item the active frame expects next.
/// Fork frames are consulted only at step 0; the chosen item is stored in fork_choice.
/// Inputs are the frame/token; outputs are nullptr when nothing is expected.
const RuleItem* expected_item(const Frame& frame,
                              const Token& token,
                              std::optional<RuleItem>& fork_choice);

/// True when the active slot of frame is a List.
bool is_list(const Frame& frame);
/// True when the active slot of frame tolerates zero occurrences (Optional or List).
bool is_tolerant(const Frame& frame);
/// True when frame has no slot left to match (past the sequence, or a fork already used).
/// A completed root stays on the stack in this state until the next token restarts it.
bool is_exhausted(const Frame& frame);

/// Pushes a frame for rule name; returns false if the rule is unknown or max_depth is reached.
/// MUST reset step, scratch fields and needs_separator on the new frame.
bool push_rule(ParserState& state, const Grammar& grammar, const std::string& name, size_t max_depth);

/// Resets the root frame to its first slot.
void restart_root(ParserState& state);

/// Advances the active frame after a match (successful) or a skipped slot.
/// Completed frames are popped and their parents advanced, cascading upward;
/// the root is never popped and is left completed instead.
void advance_rule(ParserState& state, bool successful);

/// Discards frames that cannot tolerate a failed match, then skips the
/// nearest tolerant slot. Returns false when no frame could absorb the failure.
bool unwind(ParserState& state);

}  // namespace rulestack::detail
