#include "rulestack/online_parser.h"

#include <cctype>
#include <optional>
#include <utility>

#include "lexer/lexer.h"
#include "parser/rule_stack.h"
#include "parser/snapshot_cache.h"
#include "rulestack/indentation.h"

namespace rulestack {

namespace {

bool is_unwrappable(const RuleItem& item) {
  return (item.kind == RuleItem::Kind::Optional || item.kind == RuleItem::Kind::List) && item.inner;
}

}  // namespace

OnlineParser::OnlineParser(std::shared_ptr<const Grammar> grammar, ParserOptions options)
    : grammar_(std::move(grammar)), options_(std::move(options)), snapshot_(std::make_unique<SnapshotCache>()) {
  if (!grammar_) {
    throw GrammarError("grammar is null");
  }
  std::vector<std::string> errors = validate_grammar(*grammar_);
  if (!errors.empty()) {
    throw GrammarError("invalid grammar: " + errors.front());
  }
  if (options_.tab_size <= 0) options_.tab_size = 1;
  if (options_.max_depth == 0) options_.max_depth = 1;
  if (!options_.eat_whitespace) {
    options_.eat_whitespace = [](StringStream& stream) { return stream.eat_space(); };
  }
}

OnlineParser::~OnlineParser() = default;

ParserState OnlineParser::start_state() const {
  ParserState state;
  detail::push_rule(state, *grammar_, grammar_->root, options_.max_depth);
  return state;
}

std::string OnlineParser::get_token(StringStream& stream, ParserState& state) {
  if (stream.sol()) {
    begin_line(state, stream.indentation(), options_.tab_size);
  }

  snapshot_->save(state);

  // Commit the previous non-punctuation match now that a new token has started.
  if (state.needs_advance) {
    state.needs_advance = false;
    detail::advance_rule(state, true);
  }

  if (options_.eat_whitespace(stream)) {
    return kStyleWhitespace;
  }

  if (!options_.line_comment.empty() && stream.match(options_.line_comment)) {
    stream.skip_to_end();
    return kStyleComment;
  }

  std::optional<Token> token = lex(grammar_->lex_rules, stream);
  if (!token) {
    if (!stream.eat_while([](char c) { return !std::isspace(static_cast<unsigned char>(c)); })) {
      stream.next();
    }
    snapshot_->restore(state);
    return kStyleInvalid;
  }

  track_brackets(state, *token);

  std::optional<std::string> style = interpret(*token, state);
  if (!style) {
    // Nothing on the stack accepts this token; leave no trace of it.
    snapshot_->restore(state);
    return kStyleInvalid;
  }
  return *style;
}

std::optional<std::string> OnlineParser::interpret(const Token& token, ParserState& state) {
  bool root_restarted = false;
  while (!state.empty()) {
    // A completed root starts over; twice for one token means nothing fits.
    if (state.depth() == 1 && detail::is_exhausted(state.current())) {
      if (root_restarted) break;
      detail::restart_root(state);
      root_restarted = true;
    }

    std::optional<RuleItem> fork_choice;
    const RuleItem* expected = detail::expected_item(state.current(), token, fork_choice);
    const Terminal* terminal = nullptr;

    if (expected && state.current().needs_separator) {
      if (expected->separator) terminal = &*expected->separator;
    } else if (expected) {
      const RuleItem* item = is_unwrappable(*expected) ? expected->inner.get() : expected;
      if (item->kind == RuleItem::Kind::NonTerminal) {
        if (detail::push_rule(state, *grammar_, item->rule, options_.max_depth)) {
          continue;
        }
      } else if (item->kind == RuleItem::Kind::Terminal) {
        terminal = &item->terminal;
      }
    }

    if (terminal && terminal->match && terminal->match(token)) {
      if (terminal->update) {
        terminal->update(state.current(), token);
      }
      // Punctuators cannot grow, so they commit at once; anything else may
      // still be mid-typing and commits when the next token arrives.
      if (token.kind == kPunctuationKind) {
        detail::advance_rule(state, true);
      } else {
        state.needs_advance = true;
      }
      return terminal->style;
    }

    if (!detail::unwind(state)) break;
  }
  return std::nullopt;
}

}  // namespace rulestack
