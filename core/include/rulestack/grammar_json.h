#pragma once

#include <optional>
#include <regex>
#include <string>

#include "rulestack/grammar.h"

namespace rulestack {

/// Describes why a grammar file was rejected.
/// path names the offending element, e.g. "rules.Query[2].separator".
struct GrammarLoadError {
  std::string message;
  std::string path;
};

/// Wraps either a loaded grammar or the first load error.
/// MUST contain exactly one of grammar or error.
struct GrammarLoadResult {
  std::optional<Grammar> grammar;
  std::optional<std::string> line_comment;
  // Pattern of characters to skip between tokens, e.g. "[\\s,]+" for GraphQL.
  std::optional<std::regex> whitespace;
  std::optional<GrammarLoadError> error;
};

/// Builds a grammar from its JSON description.
/// MUST return errors without throwing on malformed JSON, bad patterns, or unknown rules.
/// Inputs are JSON text; outputs are GrammarLoadResult with optional error.
GrammarLoadResult load_grammar_json(const std::string& text);

/// Reads a grammar file from disk and loads it.
/// MUST report unreadable files through the error field.
GrammarLoadResult load_grammar_file(const std::string& path);

}  // namespace rulestack
