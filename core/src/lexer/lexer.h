#pragma once

#include <optional>
#include <vector>

#include "rulestack/grammar.h"
#include "rulestack/string_stream.h"

namespace rulestack {

/// Lexes the next token at the stream cursor using the grammar's lexical rules.
/// MUST try rules in declaration order, take the first match, and advance the stream.
/// Inputs are lexical rules/stream; outputs are a token or nullopt with the stream untouched.
std::optional<Token> lex(const std::vector<LexRule>& rules, StringStream& stream);

}  // namespace rulestack
