#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "rulestack/grammar.h"
#include "rulestack/parser_state.h"
#include "rulestack/string_stream.h"

namespace rulestack {

class SnapshotCache;

/// Tunables for one parser instance.
/// MUST keep tab_size > 0 and max_depth > 0; eat_whitespace may be empty for the default.
/// Inputs are host preferences; outputs are read by OnlineParser only.
struct ParserOptions {
  int tab_size = 2;
  // Empty disables line comments.
  std::string line_comment;
  // Frames beyond this depth are refused so cyclic grammars cannot recurse forever.
  size_t max_depth = 256;
  // Consumes ignored characters; defaults to spaces and tabs.
  std::function<bool(StringStream&)> eat_whitespace;
};

/// Incremental rule-stack interpreter producing one style per token.
/// MUST hold no state across documents except its private rollback slot.
/// Inputs are streams/states owned by the host; outputs are style tags and mutated states.
class OnlineParser {
 public:
  /// Validates the grammar and prepares the parser.
  /// MUST throw GrammarError on the first authoring defect found.
  /// Inputs are the grammar and options; side effects are none.
  explicit OnlineParser(std::shared_ptr<const Grammar> grammar, ParserOptions options = {});
  ~OnlineParser();

  OnlineParser(const OnlineParser&) = delete;
  OnlineParser& operator=(const OnlineParser&) = delete;

  /// Produces a fresh state positioned at step 0 of the root rule.
  ParserState start_state() const;

  /// Consumes one token from the stream and classifies it.
  /// MUST advance the stream by at least one character when not at eol,
  /// and MUST leave state untouched (beyond a committed deferred advance
  /// for whitespace/comments) when the token is unrecognized.
  /// Inputs are the stream and state; outputs are the style tag.
  std::string get_token(StringStream& stream, ParserState& state);

  const Grammar& grammar() const { return *grammar_; }
  const ParserOptions& options() const { return options_; }

 private:
  std::optional<std::string> interpret(const Token& token, ParserState& state);

  std::shared_ptr<const Grammar> grammar_;
  ParserOptions options_;
  std::unique_ptr<SnapshotCache> snapshot_;
};

}  // namespace rulestack
