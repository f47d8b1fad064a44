#include "test_harness.h"

#include <memory>
#include <optional>
#include <regex>
#include <utility>

#include "parser/snapshot_cache.h"
#include "rulestack/document.h"
#include "rulestack/online_parser.h"
#include "test_utils.h"

namespace {

using namespace rulestack;

struct Step {
  StyledToken token;
  ParserState state;
};

/// Tokenizes text and records the state after every token.
std::vector<Step> trace(OnlineParser& parser, const std::string& text) {
  std::vector<Step> steps;
  tokenize_text(parser, text, [&](const ParserState& state, const StyledToken& token) {
    steps.push_back(Step{token, state});
  });
  return steps;
}

ParserState state_after_all(OnlineParser& parser, const std::string& text) {
  auto steps = trace(parser, text);
  return steps.empty() ? parser.start_state() : steps.back().state;
}

void test_start_state_has_root_frame() {
  OnlineParser parser(make_list_grammar());
  ParserState state = parser.start_state();
  expect_eq(state.depth(), 1, "one frame");
  expect_eq(state.current().kind, "Document", "root kind");
  expect_eq(state.current().step, 0, "step zero");
  expect_true(state.levels.empty(), "no bracket levels");
  expect_eq(static_cast<size_t>(state.indent_level), 0, "indent level zero");
  expect_true(!state.needs_advance, "no pending advance");
}

void test_bracketed_list_styles() {
  OnlineParser parser(make_list_grammar());
  expect_eq(join(styles_of(parser, "[ 1 , 2 , 3 ]")),
            "punctuation number punctuation number punctuation number punctuation",
            "list styles");
  ParserState state = state_after_all(parser, "[ 1 , 2 , 3 ]");
  expect_eq(state.depth(), 1, "back at root");
  expect_eq(state.current().step, 3, "root sequence completed");
}

void test_punctuation_commits_immediately() {
  OnlineParser parser(make_list_grammar());
  ParserState state = parser.start_state();
  feed_line(parser, state, "[");
  expect_eq(state.current().step, 1, "advanced past [");
  expect_true(!state.needs_advance, "nothing deferred");
}

void test_non_punctuation_advance_is_deferred() {
  OnlineParser parser(make_list_grammar());
  auto steps = trace(parser, "[ 1 ,");
  // [ ws 1 ws ,
  expect_eq(steps.size(), 5, "five tokens");
  if (steps.size() != 5) return;
  const ParserState& after_number = steps[2].state;
  expect_true(after_number.needs_advance, "number match waits for the next token");
  expect_true(!after_number.current().needs_separator, "separator not yet required");
  const ParserState& after_space = steps[3].state;
  expect_true(!after_space.needs_advance, "whitespace committed the match");
  expect_true(after_space.current().needs_separator, "list now expects a separator");
  expect_eq(steps[4].token.style, "punctuation", "separator matched");
  expect_true(!steps[4].state.current().needs_separator, "separator toggles back");
}

void test_unlexable_input_restores_state() {
  OnlineParser parser(make_list_grammar());
  auto steps = trace(parser, "[1&");
  expect_eq(steps.size(), 3, "three tokens");
  if (steps.size() != 3) return;
  expect_eq(steps[2].token.style, kStyleInvalid, "unlexable char is invalid");
  expect_eq(steps[2].token.text, "&", "consumed one run");
  expect_true(steps[2].state == steps[1].state, "state identical to before the bad token");
  expect_true(steps[2].state.needs_advance, "pending advance survives rollback");
}

void test_unexpected_token_is_rolled_back() {
  OnlineParser parser(make_list_grammar());
  auto steps = trace(parser, "[ 1 2 ]");
  // [ ws 1 ws 2 ws ]
  expect_eq(steps.size(), 7, "seven tokens");
  if (steps.size() != 7) return;
  expect_eq(steps[4].token.style, kStyleInvalid, "missing separator makes 2 invalid");
  expect_true(steps[4].state == steps[3].state, "rejected token leaves no trace");
  expect_eq(steps[6].token.style, "punctuation", "closing bracket still accepted");
  expect_eq(steps[6].state.current().step, 3, "root completed");
}

void test_empty_list_is_accepted() {
  OnlineParser parser(make_list_grammar());
  auto steps = trace(parser, "[ ]");
  expect_eq(join(styles_of(parser, "[ ]")), "punctuation punctuation", "no elements needed");
  expect_eq(steps.size(), 3, "[ ws ]");
  if (steps.size() != 3) return;
  expect_eq(steps[2].state.depth(), 1, "back at root");
  expect_eq(steps[2].state.current().step, 3, "root completed");
}

void test_doubled_separator_is_rejected() {
  OnlineParser parser(make_list_grammar());
  auto steps = trace(parser, "[ 1 , , 2 ]");
  // [ ws 1 ws , ws , ws 2 ws ]
  expect_eq(steps.size(), 11, "eleven tokens");
  if (steps.size() != 11) return;
  expect_eq(steps[4].token.style, "punctuation", "first separator accepted");
  expect_eq(steps[6].token.style, kStyleInvalid, "second separator rejected");
  expect_true(steps[6].state == steps[5].state, "rejected separator leaves no trace");
  expect_eq(steps[8].token.style, "number", "element after the separator accepted");
  expect_eq(steps[10].token.style, "punctuation", "closing bracket accepted");
  expect_eq(steps[10].state.current().step, 3, "root completed");
}

void test_unexpected_punctuation_recovers() {
  OnlineParser parser(make_list_grammar());
  expect_eq(join(styles_of(parser, "[ 1 @ 2 ]")),
            "punctuation number invalidchar invalidchar punctuation",
            "element after a stray token waits for a separator");
}

void test_optional_item_skipped() {
  auto grammar = std::make_shared<Grammar>();
  grammar->lex_rules = make_lex_rules();
  grammar->rules["Document"] = seq({opt(p("!")), t("Name", "name")});
  OnlineParser parser(grammar);

  auto steps = trace(parser, "foo bar");
  expect_eq(steps.size(), 3, "foo ws bar");
  if (steps.size() != 3) return;
  expect_eq(steps[0].token.style, "name", "optional slot skipped");
  expect_eq(steps[0].state.current().step, 1, "on the name slot");
  expect_true(steps[0].state.needs_advance, "advance pending");
  expect_eq(steps[1].state.current().step, 2, "root completed after commit");
  expect_eq(steps[2].token.style, "name", "root restarts for the next name");

  expect_eq(join(styles_of(parser, "! foo")), "punctuation name", "optional slot taken");
}

void test_query_styles() {
  OnlineParser parser(make_query_grammar());
  std::string text = "query Q { a b { c } }";
  expect_eq(join(styles_of(parser, text)),
            "keyword def punctuation property property punctuation property punctuation punctuation",
            "query styles");
  ParserState state = state_after_all(parser, text);
  expect_eq(state.depth(), 1, "all frames closed");
  expect_eq(state.current().step, 0, "document list stays open");
}

void test_separated_arguments() {
  OnlineParser parser(make_query_grammar());
  expect_eq(join(styles_of(parser, "{ f(x: 1, y: 2) }")),
            "punctuation property punctuation attribute punctuation number punctuation "
            "attribute punctuation number punctuation punctuation",
            "argument list styles");
}

void test_fragment_captures_name_and_type() {
  OnlineParser parser(make_query_grammar());
  auto steps = trace(parser, "fragment F on User { id }");
  expect_eq(join(styles_of(parser, "fragment F on User { id }")),
            "keyword def keyword atom punctuation property punctuation",
            "fragment styles");
  bool saw = false;
  for (const auto& step : steps) {
    if (step.token.text != "User") continue;
    saw = true;
    const Frame& frame = step.state.current();
    expect_eq(frame.kind, "FragmentDefinition", "active frame is the definition");
    expect_true(frame.name && *frame.name == "F", "name captured");
    expect_true(frame.type && *frame.type == "User", "type captured");
  }
  expect_true(saw, "type token seen");
}

void test_but_not_excludes_keyword() {
  OnlineParser parser(make_query_grammar());
  expect_eq(join(styles_of(parser, "fragment on User { id }")),
            "keyword keyword atom punctuation property punctuation",
            "'on' is not taken as the fragment name");
}

void test_fork_dispatches_on_first_token() {
  OnlineParser parser(make_query_grammar());
  expect_eq(join(styles_of(parser, "{ ...F }")), "punctuation punctuation def punctuation",
            "spread chosen by fork");
}

void test_unplaceable_token_at_root() {
  OnlineParser parser(make_query_grammar());
  auto steps = trace(parser, "}");
  expect_eq(steps.size(), 1, "one token");
  if (steps.empty()) return;
  expect_eq(steps[0].token.style, kStyleInvalid, "closing brace has nowhere to go");
  expect_true(steps[0].state == parser.start_state(), "state untouched");
}

void test_frame_queries() {
  OnlineParser parser(make_query_grammar());
  ParserState state = state_after_all(parser, "query Q { a");
  expect_eq(describe_state(state),
            "Document[0] > Definition[0] > Query[2] > SelectionSet[1] > Selection[0] > Field[0]",
            "stack description");
  const Frame* previous = previous_frame(state);
  expect_true(previous && previous->kind == "Selection", "previous frame");
  const Frame* definition = find_frame(state, {"Query", "FragmentDefinition"});
  expect_true(definition && definition->name && *definition->name == "Q", "enclosing definition");
  size_t count = 0;
  std::string first;
  for_each_frame(state, [&](const Frame& frame) {
    if (count++ == 0) first = frame.kind;
  });
  expect_eq(count, 6, "visits every frame");
  expect_eq(first, "Document", "root first");
}

void test_depth_guard_turns_into_failed_slot() {
  auto grammar = std::make_shared<Grammar>();
  grammar->lex_rules = make_lex_rules();
  grammar->rules["Document"] = seq({ref("Nest")});
  grammar->rules["Nest"] = seq({opt(ref("Nest")), p("!")});
  ParserOptions options;
  options.max_depth = 8;
  OnlineParser parser(grammar, options);
  auto steps = trace(parser, "!");
  expect_eq(steps.size(), 1, "one token");
  if (steps.empty()) return;
  expect_eq(steps[0].token.style, "punctuation", "matched at the depth limit");
  expect_eq(steps[0].state.depth(), 7, "innermost frame completed and popped");
  expect_eq(steps[0].state.current().step, 1, "parent advanced past its optional slot");
}

void test_fork_choosing_unknown_rule_fails_softly() {
  auto grammar = std::make_shared<Grammar>();
  grammar->lex_rules = make_lex_rules();
  grammar->rules["Document"] = seq({list(ref("Pick"))});
  grammar->rules["Pick"] = fork_rule([](const Token& token) -> std::optional<RuleItem> {
    if (token.kind == "Name") return ref("Ghost");
    if (token.kind == kPunctuationKind) return RuleItem(p("!"));
    return std::nullopt;
  });
  OnlineParser parser(grammar);
  expect_eq(join(styles_of(parser, "x !")), "invalidchar punctuation", "unknown rule is a failed slot");
}

void test_line_comment() {
  ParserOptions options;
  options.line_comment = "#";
  OnlineParser parser(make_list_grammar(), options);
  auto steps = trace(parser, "[ 1 # two");
  expect_eq(steps.size(), 5, "[ ws 1 ws comment");
  if (steps.size() != 5) return;
  expect_eq(steps[4].token.style, kStyleComment, "comment style");
  expect_eq(steps[4].token.text, "# two", "comment runs to end of line");
  expect_true(steps[4].state.current().needs_separator, "list still expects a separator");
}

void test_custom_whitespace() {
  ParserOptions options;
  std::regex pattern("[\\s,]+");
  options.eat_whitespace = [pattern](StringStream& stream) { return stream.match(pattern); };
  OnlineParser parser(make_query_grammar(), options);
  expect_eq(join(styles_of(parser, "{ a, b }")), "punctuation property property punctuation",
            "commas skipped as whitespace");
}

void test_parsing_is_deterministic() {
  OnlineParser first(make_query_grammar());
  OnlineParser second(make_query_grammar());
  std::string text = "query Q { a(x: 1) { b } ...F }\nfragment F on T { c }";
  auto a = tokenize_text(first, text);
  auto b = tokenize_text(second, text);
  expect_eq(a.size(), b.size(), "same token count");
  bool same = a.size() == b.size();
  for (size_t i = 0; same && i < a.size(); ++i) {
    same = a[i].style == b[i].style && a[i].start == b[i].start && a[i].depth == b[i].depth;
  }
  expect_true(same, "same styles and positions");
  expect_true(state_after_all(first, text) == state_after_all(second, text), "same final state");
}

void test_line_by_line_matches_whole_text() {
  OnlineParser parser(make_query_grammar());
  std::string text = "query Q {\n  a(x: 1,\n    y: 2)\n}";
  std::vector<std::string> whole;
  for (const auto& token : tokenize_text(parser, text)) whole.push_back(token.style);

  std::vector<std::string> pieced;
  ParserState state = parser.start_state();
  for (const auto& line : split_lines(text)) {
    ParserState saved = state;
    auto styles = feed_line(parser, saved, line);
    pieced.insert(pieced.end(), styles.begin(), styles.end());
    state = saved;
  }
  expect_eq(join(pieced), join(whole), "resuming from saved states gives the same styles");
}

void test_snapshot_cache_copies() {
  SnapshotCache cache;
  ParserState state;
  expect_true(!cache.restore(state), "nothing to restore yet");
  state.indent_level = 3;
  cache.save(state);
  state.indent_level = 5;
  expect_true(cache.restore(state), "restored");
  expect_eq(static_cast<size_t>(state.indent_level), 3, "saved copy is independent");
}

}  // namespace

void register_online_parser_tests(std::vector<TestCase>& tests) {
  tests.push_back({"start_state_has_root_frame", test_start_state_has_root_frame});
  tests.push_back({"bracketed_list_styles", test_bracketed_list_styles});
  tests.push_back({"punctuation_commits_immediately", test_punctuation_commits_immediately});
  tests.push_back({"non_punctuation_advance_is_deferred", test_non_punctuation_advance_is_deferred});
  tests.push_back({"unlexable_input_restores_state", test_unlexable_input_restores_state});
  tests.push_back({"unexpected_token_is_rolled_back", test_unexpected_token_is_rolled_back});
  tests.push_back({"empty_list_is_accepted", test_empty_list_is_accepted});
  tests.push_back({"doubled_separator_is_rejected", test_doubled_separator_is_rejected});
  tests.push_back({"unexpected_punctuation_recovers", test_unexpected_punctuation_recovers});
  tests.push_back({"optional_item_skipped", test_optional_item_skipped});
  tests.push_back({"query_styles", test_query_styles});
  tests.push_back({"separated_arguments", test_separated_arguments});
  tests.push_back({"fragment_captures_name_and_type", test_fragment_captures_name_and_type});
  tests.push_back({"but_not_excludes_keyword", test_but_not_excludes_keyword});
  tests.push_back({"fork_dispatches_on_first_token", test_fork_dispatches_on_first_token});
  tests.push_back({"unplaceable_token_at_root", test_unplaceable_token_at_root});
  tests.push_back({"frame_queries", test_frame_queries});
  tests.push_back({"depth_guard_turns_into_failed_slot", test_depth_guard_turns_into_failed_slot});
  tests.push_back({"fork_choosing_unknown_rule_fails_softly", test_fork_choosing_unknown_rule_fails_softly});
  tests.push_back({"line_comment", test_line_comment});
  tests.push_back({"custom_whitespace", test_custom_whitespace});
  tests.push_back({"parsing_is_deterministic", test_parsing_is_deterministic});
  tests.push_back({"line_by_line_matches_whole_text", test_line_by_line_matches_whole_text});
  tests.push_back({"snapshot_cache_copies", test_snapshot_cache_copies});
}
