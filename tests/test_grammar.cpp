#include "test_harness.h"

#include <algorithm>
#include <memory>
#include <regex>
#include <stdexcept>

#include "rulestack/grammar.h"
#include "rulestack/online_parser.h"
#include "test_utils.h"

namespace {

using namespace rulestack;

bool contains_message(const std::vector<std::string>& errors, const std::string& needle) {
  return std::any_of(errors.begin(), errors.end(),
                     [&](const std::string& error) { return error.find(needle) != std::string::npos; });
}

void test_fixture_grammars_validate() {
  expect_eq(validate_grammar(*make_list_grammar()).size(), 0, "list grammar is valid");
  expect_eq(validate_grammar(*make_query_grammar()).size(), 0, "query grammar is valid");
}

void test_missing_root_rule() {
  Grammar grammar;
  grammar.lex_rules = make_lex_rules();
  grammar.rules["Other"] = seq({p("!")});
  auto errors = validate_grammar(grammar);
  expect_true(contains_message(errors, "missing root rule 'Document'"), "missing root reported");
}

void test_missing_punctuation_lex_rule() {
  Grammar grammar;
  grammar.lex_rules = {lex_rule("Name", "[a-z]+")};
  grammar.rules["Document"] = seq({t("Name", "name")});
  auto errors = validate_grammar(grammar);
  expect_eq(errors.size(), 1, "one error");
  expect_true(contains_message(errors, "missing lexical rule 'Punctuation'"), "punctuation rule required");
}

void test_unknown_rule_reference() {
  Grammar grammar;
  grammar.lex_rules = make_lex_rules();
  grammar.rules["Document"] = seq({p("{"), opt(ref("Missing")), p("}")});
  auto errors = validate_grammar(grammar);
  expect_eq(errors.size(), 1, "one error");
  if (!errors.empty()) {
    expect_eq(errors[0], "Document[1]: unknown rule 'Missing'", "error names slot and rule");
  }
}

void test_nested_wrapper_rejected() {
  Grammar grammar;
  grammar.lex_rules = make_lex_rules();
  grammar.rules["Document"] = seq({list(opt(p("!")))});
  auto errors = validate_grammar(grammar);
  expect_true(contains_message(errors, "cannot wrap another optional/list"), "nested wrapper rejected");
}

void test_empty_sequence_rejected() {
  Grammar grammar;
  grammar.lex_rules = make_lex_rules();
  grammar.rules["Document"] = seq({ref("Empty")});
  grammar.rules["Empty"] = seq({});
  auto errors = validate_grammar(grammar);
  expect_true(contains_message(errors, "Empty: empty sequence"), "empty sequence rejected");
}

void test_fork_candidate_must_exist() {
  Grammar grammar;
  grammar.lex_rules = make_lex_rules();
  grammar.rules["Document"] = fork_rule([](const Token&) { return std::optional<RuleItem>(ref("Nowhere")); },
                                        {"Nowhere"});
  auto errors = validate_grammar(grammar);
  expect_true(contains_message(errors, "fork candidate 'Nowhere' is not a rule"), "fork candidate checked");
}

void test_errors_are_sorted_by_rule() {
  Grammar grammar;
  grammar.lex_rules = make_lex_rules();
  grammar.rules["Document"] = seq({ref("B"), ref("A")});
  grammar.rules["B"] = seq({ref("Y")});
  grammar.rules["A"] = seq({ref("X")});
  auto errors = validate_grammar(grammar);
  expect_eq(errors.size(), 2, "two errors");
  if (errors.size() == 2) {
    expect_eq(errors[0], "A[0]: unknown rule 'X'", "A first");
    expect_eq(errors[1], "B[0]: unknown rule 'Y'", "B second");
  }
}

void test_parser_construction_throws_grammar_error() {
  Grammar grammar;
  grammar.lex_rules = make_lex_rules();
  grammar.rules["Document"] = seq({ref("Missing")});
  bool threw = false;
  try {
    OnlineParser parser(std::make_shared<const Grammar>(grammar));
  } catch (const GrammarError& ex) {
    threw = true;
    expect_true(std::string(ex.what()).find("unknown rule 'Missing'") != std::string::npos,
                "message carries first defect");
  }
  expect_true(threw, "construction throws");

  bool caught_as_exception = false;
  try {
    OnlineParser parser(std::make_shared<const Grammar>(grammar));
  } catch (const std::exception&) {
    caught_as_exception = true;
  }
  expect_true(caught_as_exception, "reaches a generic exception handler");
}

void test_but_not_keeps_style_and_update() {
  Terminal name = with_update(t("Name", "def"), capture_name());
  Terminal narrowed = but_not(name, {word("Name", "on", "keyword")});
  expect_eq(narrowed.style, "def", "style preserved");
  expect_true(static_cast<bool>(narrowed.update), "update preserved");
  expect_true(narrowed.match(Token{"Name", "Frag"}), "plain name matches");
  expect_true(!narrowed.match(Token{"Name", "on"}), "excluded word rejected");
  expect_true(!narrowed.match(Token{"Number", "1"}), "base predicate still applies");
}

void test_punctuator_builder_defaults() {
  Terminal brace = p("{");
  expect_eq(brace.style, "punctuation", "default punctuation style");
  expect_true(brace.match(Token{"Punctuation", "{"}), "matches punctuator");
  expect_true(!brace.match(Token{"Name", "{"}), "kind must be Punctuation");
}

void test_lex_rule_rejects_bad_pattern() {
  bool threw = false;
  try {
    lex_rule("Broken", "[a-");
  } catch (const std::regex_error&) {
    threw = true;
  }
  expect_true(threw, "invalid pattern throws regex_error");
}

}  // namespace

void register_grammar_tests(std::vector<TestCase>& tests) {
  tests.push_back({"fixture_grammars_validate", test_fixture_grammars_validate});
  tests.push_back({"missing_root_rule", test_missing_root_rule});
  tests.push_back({"missing_punctuation_lex_rule", test_missing_punctuation_lex_rule});
  tests.push_back({"unknown_rule_reference", test_unknown_rule_reference});
  tests.push_back({"nested_wrapper_rejected", test_nested_wrapper_rejected});
  tests.push_back({"empty_sequence_rejected", test_empty_sequence_rejected});
  tests.push_back({"fork_candidate_must_exist", test_fork_candidate_must_exist});
  tests.push_back({"errors_are_sorted_by_rule", test_errors_are_sorted_by_rule});
  tests.push_back({"parser_construction_throws_grammar_error", test_parser_construction_throws_grammar_error});
  tests.push_back({"but_not_keeps_style_and_update", test_but_not_keeps_style_and_update});
  tests.push_back({"punctuator_builder_defaults", test_punctuator_builder_defaults});
  tests.push_back({"lex_rule_rejects_bad_pattern", test_lex_rule_rejects_bad_pattern});
}
