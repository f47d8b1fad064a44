#include "rulestack/grammar.h"

#include <algorithm>
#include <utility>

#include "rulestack/parser_state.h"

namespace rulestack {

RuleItem::RuleItem(Terminal value) : kind(Kind::Terminal), terminal(std::move(value)) {}

const RuleDefinition* Grammar::find(const std::string& name) const {
  auto it = rules.find(name);
  if (it == rules.end()) return nullptr;
  return &it->second;
}

Terminal t(const std::string& kind, const std::string& style) {
  Terminal out;
  out.style = style;
  out.match = [kind](const Token& token) { return token.kind == kind; };
  return out;
}

Terminal p(const std::string& value, const std::string& style) {
  Terminal out;
  out.style = style;
  out.match = [value](const Token& token) {
    return token.kind == kPunctuationKind && token.value == value;
  };
  return out;
}

Terminal word(const std::string& kind, const std::string& value, const std::string& style) {
  Terminal out;
  out.style = style;
  out.match = [kind, value](const Token& token) {
    return token.kind == kind && token.value == value;
  };
  return out;
}

Terminal but_not(Terminal rule, std::vector<Terminal> exclusions) {
  MatchFn base = std::move(rule.match);
  rule.match = [base, exclusions = std::move(exclusions)](const Token& token) {
    if (!base || !base(token)) return false;
    return std::none_of(exclusions.begin(), exclusions.end(), [&](const Terminal& exclusion) {
      return exclusion.match && exclusion.match(token);
    });
  };
  return rule;
}

Terminal with_update(Terminal rule, UpdateFn update) {
  rule.update = std::move(update);
  return rule;
}

UpdateFn capture_name() {
  return [](Frame& frame, const Token& token) { frame.name = token.value; };
}

UpdateFn capture_type() {
  return [](Frame& frame, const Token& token) { frame.type = token.value; };
}

RuleItem ref(const std::string& name) {
  RuleItem out;
  out.kind = RuleItem::Kind::NonTerminal;
  out.rule = name;
  return out;
}

RuleItem opt(RuleItem inner) {
  RuleItem out;
  out.kind = RuleItem::Kind::Optional;
  out.inner = std::make_shared<const RuleItem>(std::move(inner));
  return out;
}

RuleItem list(RuleItem inner) {
  RuleItem out;
  out.kind = RuleItem::Kind::List;
  out.inner = std::make_shared<const RuleItem>(std::move(inner));
  return out;
}

RuleItem list(RuleItem inner, Terminal separator) {
  RuleItem out = list(std::move(inner));
  out.separator = std::move(separator);
  return out;
}

RuleDefinition seq(std::vector<RuleItem> items) {
  RuleDefinition out;
  out.kind = RuleDefinition::Kind::Sequence;
  out.items = std::move(items);
  return out;
}

RuleDefinition fork_rule(ChooseFn choose, std::vector<std::string> candidates) {
  RuleDefinition out;
  out.kind = RuleDefinition::Kind::Fork;
  out.fork.choose = std::move(choose);
  out.fork.candidates = std::move(candidates);
  return out;
}

LexRule lex_rule(const std::string& kind, const std::string& pattern) {
  LexRule out;
  out.kind = kind;
  out.source = pattern;
  out.pattern = std::regex(pattern, std::regex::ECMAScript);
  return out;
}

namespace {

bool is_wrapper(const RuleItem& item) {
  return item.kind == RuleItem::Kind::Optional || item.kind == RuleItem::Kind::List;
}

void validate_item(const Grammar& grammar,
                   const RuleItem& item,
                   const std::string& where,
                   std::vector<std::string>& errors) {
  switch (item.kind) {
    case RuleItem::Kind::Terminal:
      if (!item.terminal.match) {
        errors.push_back(where + ": terminal has no match predicate");
      }
      break;
    case RuleItem::Kind::NonTerminal:
      if (!grammar.find(item.rule)) {
        errors.push_back(where + ": unknown rule '" + item.rule + "'");
      }
      break;
    case RuleItem::Kind::Optional:
    case RuleItem::Kind::List:
      if (!item.inner) {
        errors.push_back(where + ": optional/list has no inner item");
        break;
      }
      if (is_wrapper(*item.inner)) {
        errors.push_back(where + ": optional/list cannot wrap another optional/list");
        break;
      }
      validate_item(grammar, *item.inner, where, errors);
      if (item.separator && !item.separator->match) {
        errors.push_back(where + ": list separator has no match predicate");
      }
      break;
  }
}

}  // namespace

std::vector<std::string> validate_grammar(const Grammar& grammar) {
  std::vector<std::string> errors;
  if (!grammar.find(grammar.root)) {
    errors.push_back("missing root rule '" + grammar.root + "'");
  }
  bool has_punctuation = std::any_of(grammar.lex_rules.begin(), grammar.lex_rules.end(),
                                     [](const LexRule& rule) { return rule.kind == kPunctuationKind; });
  if (!has_punctuation) {
    errors.push_back(std::string("missing lexical rule '") + kPunctuationKind + "'");
  }

  std::vector<std::string> names;
  names.reserve(grammar.rules.size());
  for (const auto& kv : grammar.rules) {
    names.push_back(kv.first);
  }
  std::sort(names.begin(), names.end());

  for (const auto& name : names) {
    const RuleDefinition& def = grammar.rules.at(name);
    if (def.kind == RuleDefinition::Kind::Fork) {
      if (!def.fork.choose) {
        errors.push_back(name + ": fork has no choose function");
      }
      for (const auto& candidate : def.fork.candidates) {
        if (!grammar.find(candidate)) {
          errors.push_back(name + ": fork candidate '" + candidate + "' is not a rule");
        }
      }
      continue;
    }
    if (def.items.empty()) {
      errors.push_back(name + ": empty sequence");
      continue;
    }
    for (size_t i = 0; i < def.items.size(); ++i) {
      validate_item(grammar, def.items[i], name + "[" + std::to_string(i) + "]", errors);
    }
  }
  return errors;
}

}  // namespace rulestack
