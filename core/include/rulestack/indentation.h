#pragma once

#include <string>

#include "rulestack/grammar.h"
#include "rulestack/parser_state.h"

namespace rulestack {

/// Recomputes the line's indent level from its measured indentation.
/// MUST be called only at the start of a line. Inputs are columns/tab size.
void begin_line(ParserState& state, int indentation, int tab_size);

/// Updates the bracket-nesting stack for an opening or closing punctuator.
/// MUST ignore non-punctuation tokens and MUST tolerate unbalanced closers.
/// Inputs are the token; side effects are on levels and indent_level only.
void track_brackets(ParserState& state, const Token& token);

/// Suggests the indentation, in columns, for a line whose text is text_after.
/// A leading closing bracket dedents one level. Never negative.
/// Inputs are the state before the line and the line text; outputs are columns.
int suggested_indent(const ParserState& state, const std::string& text_after, int indent_unit);

}  // namespace rulestack
