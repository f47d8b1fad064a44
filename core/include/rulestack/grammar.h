#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <regex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace rulestack {

/// Lexical kind reserved for punctuators; its matches commit immediately.
inline const char* const kPunctuationKind = "Punctuation";
/// Style reported for whitespace runs.
inline const char* const kStyleWhitespace = "ws";
/// Style reported for line comments.
inline const char* const kStyleComment = "comment";
/// Style reported for tokens the lexer or the grammar cannot place.
inline const char* const kStyleInvalid = "invalidchar";

/// Represents a single lexical match produced by the lexer.
/// MUST be created fresh per match and MUST NOT be mutated afterwards.
/// Inputs are lexer output; outputs are consumed by terminal predicates.
struct Token {
  std::string kind;
  std::string value;
};

struct Frame;

using MatchFn = std::function<bool(const Token&)>;
using UpdateFn = std::function<void(Frame&, const Token&)>;

/// Matches one token by predicate and reports a style on success.
/// MUST have a predicate; update is optional and only touches the active frame.
/// Inputs are tokens; side effects are limited to update on the frame.
struct Terminal {
  std::string style;
  MatchFn match;
  UpdateFn update;
};

/// One slot of a rule sequence.
/// MUST carry the payload that matches kind: terminal, rule name, or inner item.
/// Inputs are grammar authoring calls; outputs are immutable grammar data.
struct RuleItem {
  enum class Kind { Terminal, NonTerminal, Optional, List } kind = Kind::Terminal;
  Terminal terminal;
  std::string rule;
  std::shared_ptr<const RuleItem> inner;
  std::optional<Terminal> separator;

  RuleItem() = default;
  // Terminals convert implicitly so sequences read like the grammar they encode.
  RuleItem(Terminal value);
};

using ChooseFn = std::function<std::optional<RuleItem>(const Token&)>;

/// Dispatches to a sub-rule based on the first token of the frame.
/// MUST list every rule name choose() may return in candidates for validation.
/// Inputs are the current token; outputs are the chosen item or nullopt.
struct ForkRule {
  ChooseFn choose;
  std::vector<std::string> candidates;
};

/// A whole rule: an ordered sequence of items, or a fork.
struct RuleDefinition {
  enum class Kind { Sequence, Fork } kind = Kind::Sequence;
  std::vector<RuleItem> items;
  ForkRule fork;
};

/// Named lexical pattern; rules are tried in declaration order.
struct LexRule {
  std::string kind;
  std::string source;
  std::regex pattern;
};

/// Immutable grammar table handed to the parser.
/// MUST contain the root rule and a Punctuation lexical rule.
/// Inputs are authored rules; outputs are read-only lookups during parsing.
struct Grammar {
  std::string root = "Document";
  std::vector<LexRule> lex_rules;
  std::unordered_map<std::string, RuleDefinition> rules;

  /// Looks up a rule definition by name.
  /// Inputs are rule names; outputs are nullptr when the rule is unknown.
  const RuleDefinition* find(const std::string& name) const;
};

/// Raised when a grammar fails validation at parser construction.
class GrammarError : public std::runtime_error {
 public:
  explicit GrammarError(const std::string& message) : std::runtime_error(message) {}
};

/// Builds a terminal matching tokens of the given kind.
Terminal t(const std::string& kind, const std::string& style);
/// Builds a terminal matching a punctuator by exact value.
Terminal p(const std::string& value, const std::string& style = "punctuation");
/// Builds a terminal matching a token by both kind and exact value.
Terminal word(const std::string& kind, const std::string& value, const std::string& style);
/// Narrows a terminal so it also rejects tokens any exclusion matches.
/// MUST keep the wrapped rule's style and update.
/// Inputs are a terminal and exclusions; outputs are the narrowed terminal.
Terminal but_not(Terminal rule, std::vector<Terminal> exclusions);
/// Attaches a frame side effect run when the terminal matches.
Terminal with_update(Terminal rule, UpdateFn update);
/// Update storing the token value into the frame's name field.
UpdateFn capture_name();
/// Update storing the token value into the frame's type field.
UpdateFn capture_type();

/// Builds a reference to another rule by name.
RuleItem ref(const std::string& name);
/// Wraps an item as zero-or-one occurrence.
RuleItem opt(RuleItem inner);
/// Wraps an item as zero-or-more occurrences.
RuleItem list(RuleItem inner);
/// Wraps an item as zero-or-more occurrences delimited by separator.
RuleItem list(RuleItem inner, Terminal separator);

/// Builds a sequence definition.
RuleDefinition seq(std::vector<RuleItem> items);
/// Builds a fork definition evaluated against the first token of the frame.
RuleDefinition fork_rule(ChooseFn choose, std::vector<std::string> candidates = {});

/// Compiles a lexical rule; patterns are matched anchored at the stream position.
/// MUST throw std::regex_error on invalid patterns.
LexRule lex_rule(const std::string& kind, const std::string& pattern);

/// Checks a grammar for authoring errors before any token is parsed.
/// MUST report every defect found, in a deterministic order.
/// Inputs are grammars; outputs are human-readable messages (empty when valid).
std::vector<std::string> validate_grammar(const Grammar& grammar);

}  // namespace rulestack
