#include "rulestack/grammar_json.h"

#include <fstream>
#include <regex>
#include <sstream>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace rulestack {

namespace {

using nlohmann::json;

/// Token condition of one fork branch; unset fields match anything.
struct ForkCondition {
  std::optional<std::string> kind;
  std::optional<std::string> value;

  bool matches(const Token& token) const {
    if (kind && token.kind != *kind) return false;
    if (value && token.value != *value) return false;
    return true;
  }
};

/// Converts the JSON grammar description into Grammar structures.
/// MUST stop at the first error and MUST record the JSON path of that error.
class GrammarBuilder {
 public:
  GrammarLoadResult build(const json& root);

 private:
  bool parse_lex_rules(const json& node, Grammar& grammar);
  bool parse_rule(const std::string& name, const json& node, Grammar& grammar);
  bool parse_fork(const json& node, const std::string& path, RuleDefinition& out);
  bool parse_item(const json& node, const std::string& path, RuleItem& out);
  bool parse_terminal(const json& node, const std::string& path, Terminal& out);
  bool read_string(const json& node, const char* key, const std::string& path,
                   std::optional<std::string>& out);
  bool set_error(const std::string& message, const std::string& path);

  std::optional<GrammarLoadError> error_;
};

bool GrammarBuilder::set_error(const std::string& message, const std::string& path) {
  if (!error_) {
    error_ = GrammarLoadError{message, path};
  }
  return false;
}

bool GrammarBuilder::read_string(const json& node,
                                 const char* key,
                                 const std::string& path,
                                 std::optional<std::string>& out) {
  auto it = node.find(key);
  if (it == node.end()) return true;
  if (!it->is_string()) {
    return set_error(std::string("'") + key + "' must be a string", path + "." + key);
  }
  out = it->get<std::string>();
  return true;
}

bool GrammarBuilder::parse_terminal(const json& node, const std::string& path, Terminal& out) {
  if (!node.is_object()) {
    return set_error("terminal must be an object", path);
  }
  std::optional<std::string> punct;
  std::optional<std::string> kind;
  std::optional<std::string> value;
  std::optional<std::string> style;
  std::optional<std::string> capture;
  if (!read_string(node, "punct", path, punct) || !read_string(node, "kind", path, kind) ||
      !read_string(node, "value", path, value) || !read_string(node, "style", path, style) ||
      !read_string(node, "capture", path, capture)) {
    return false;
  }

  if (punct) {
    out = p(*punct, style.value_or("punctuation"));
  } else if (kind) {
    if (!style) {
      return set_error("terminal of kind '" + *kind + "' needs a style", path);
    }
    out = value ? word(*kind, *value, *style) : t(*kind, *style);
  } else {
    return set_error("terminal needs 'punct' or 'kind'", path);
  }

  auto exclusions_it = node.find("butNot");
  if (exclusions_it != node.end()) {
    if (!exclusions_it->is_array()) {
      return set_error("'butNot' must be an array", path + ".butNot");
    }
    std::vector<Terminal> exclusions;
    for (size_t i = 0; i < exclusions_it->size(); ++i) {
      Terminal exclusion;
      if (!parse_terminal((*exclusions_it)[i], path + ".butNot[" + std::to_string(i) + "]", exclusion)) {
        return false;
      }
      exclusions.push_back(std::move(exclusion));
    }
    out = but_not(std::move(out), std::move(exclusions));
  }

  if (capture) {
    if (*capture == "name") {
      out = with_update(std::move(out), capture_name());
    } else if (*capture == "type") {
      out = with_update(std::move(out), capture_type());
    } else {
      return set_error("'capture' must be \"name\" or \"type\"", path + ".capture");
    }
  }
  return true;
}

bool GrammarBuilder::parse_item(const json& node, const std::string& path, RuleItem& out) {
  if (node.is_string()) {
    out = rulestack::ref(node.get<std::string>());
    return true;
  }
  if (!node.is_object()) {
    return set_error("rule item must be a string or an object", path);
  }
  auto opt_it = node.find("opt");
  if (opt_it != node.end()) {
    RuleItem inner;
    if (!parse_item(*opt_it, path + ".opt", inner)) return false;
    out = opt(std::move(inner));
    return true;
  }
  auto list_it = node.find("list");
  if (list_it != node.end()) {
    RuleItem inner;
    if (!parse_item(*list_it, path + ".list", inner)) return false;
    auto sep_it = node.find("separator");
    if (sep_it == node.end()) {
      out = list(std::move(inner));
      return true;
    }
    Terminal separator;
    if (!parse_terminal(*sep_it, path + ".separator", separator)) return false;
    out = list(std::move(inner), std::move(separator));
    return true;
  }
  Terminal terminal;
  if (!parse_terminal(node, path, terminal)) return false;
  out = RuleItem(std::move(terminal));
  return true;
}

bool GrammarBuilder::parse_fork(const json& node, const std::string& path, RuleDefinition& out) {
  if (!node.is_array() || node.empty()) {
    return set_error("'fork' must be a non-empty array", path);
  }
  std::vector<std::pair<ForkCondition, RuleItem>> branches;
  std::vector<std::string> candidates;
  for (size_t i = 0; i < node.size(); ++i) {
    const json& branch = node[i];
    std::string branch_path = path + "[" + std::to_string(i) + "]";
    if (!branch.is_object() || !branch.contains("then")) {
      return set_error("fork branch needs 'then'", branch_path);
    }
    ForkCondition condition;
    auto when_it = branch.find("when");
    if (when_it != branch.end()) {
      if (!when_it->is_object()) {
        return set_error("'when' must be an object", branch_path + ".when");
      }
      if (!read_string(*when_it, "kind", branch_path + ".when", condition.kind) ||
          !read_string(*when_it, "value", branch_path + ".when", condition.value)) {
        return false;
      }
    }
    RuleItem item;
    if (!parse_item(branch["then"], branch_path + ".then", item)) return false;
    if (item.kind == RuleItem::Kind::NonTerminal) {
      candidates.push_back(item.rule);
    }
    branches.emplace_back(std::move(condition), std::move(item));
  }
  out = fork_rule(
      [branches = std::move(branches)](const Token& token) -> std::optional<RuleItem> {
        for (const auto& branch : branches) {
          if (branch.first.matches(token)) return branch.second;
        }
        return std::nullopt;
      },
      std::move(candidates));
  return true;
}

bool GrammarBuilder::parse_rule(const std::string& name, const json& node, Grammar& grammar) {
  std::string path = "rules." + name;
  RuleDefinition def;
  if (node.is_object()) {
    auto fork_it = node.find("fork");
    if (fork_it == node.end()) {
      return set_error("rule object must contain 'fork'", path);
    }
    if (!parse_fork(*fork_it, path + ".fork", def)) return false;
  } else if (node.is_array()) {
    std::vector<RuleItem> items;
    for (size_t i = 0; i < node.size(); ++i) {
      RuleItem item;
      if (!parse_item(node[i], path + "[" + std::to_string(i) + "]", item)) return false;
      items.push_back(std::move(item));
    }
    def = seq(std::move(items));
  } else {
    return set_error("rule must be an array or a fork object", path);
  }
  grammar.rules.emplace(name, std::move(def));
  return true;
}

bool GrammarBuilder::parse_lex_rules(const json& node, Grammar& grammar) {
  if (!node.is_array() || node.empty()) {
    return set_error("'lex' must be a non-empty array", "lex");
  }
  for (size_t i = 0; i < node.size(); ++i) {
    std::string path = "lex[" + std::to_string(i) + "]";
    const json& entry = node[i];
    if (!entry.is_object()) {
      return set_error("lexical rule must be an object", path);
    }
    std::optional<std::string> kind;
    std::optional<std::string> pattern;
    if (!read_string(entry, "kind", path, kind) || !read_string(entry, "pattern", path, pattern)) {
      return false;
    }
    if (!kind || !pattern) {
      return set_error("lexical rule needs 'kind' and 'pattern'", path);
    }
    try {
      grammar.lex_rules.push_back(lex_rule(*kind, *pattern));
    } catch (const std::regex_error& ex) {
      return set_error(std::string("invalid pattern: ") + ex.what(), path + ".pattern");
    }
  }
  return true;
}

GrammarLoadResult GrammarBuilder::build(const json& root) {
  GrammarLoadResult result;
  if (!root.is_object()) {
    set_error("grammar must be a JSON object", "");
    result.error = error_;
    return result;
  }
  Grammar grammar;
  std::optional<std::string> root_name;
  std::optional<std::string> line_comment;
  std::optional<std::string> whitespace;
  bool ok = read_string(root, "root", "", root_name) &&
            read_string(root, "lineComment", "", line_comment) &&
            read_string(root, "whitespace", "", whitespace);
  if (ok && whitespace) {
    try {
      result.whitespace = std::regex(*whitespace, std::regex::ECMAScript);
    } catch (const std::regex_error& ex) {
      ok = set_error(std::string("invalid pattern: ") + ex.what(), "whitespace");
    }
  }
  if (ok) {
    auto lex_it = root.find("lex");
    ok = lex_it != root.end() ? parse_lex_rules(*lex_it, grammar) : set_error("missing 'lex'", "lex");
  }
  if (ok) {
    auto rules_it = root.find("rules");
    if (rules_it == root.end() || !rules_it->is_object()) {
      ok = set_error("'rules' must be an object", "rules");
    } else {
      for (auto it = rules_it->begin(); ok && it != rules_it->end(); ++it) {
        ok = parse_rule(it.key(), it.value(), grammar);
      }
    }
  }
  if (ok) {
    if (root_name) grammar.root = *root_name;
    std::vector<std::string> problems = validate_grammar(grammar);
    if (!problems.empty()) {
      ok = set_error(problems.front(), "rules");
    }
  }
  if (!ok) {
    result.whitespace.reset();
    result.error = error_;
    return result;
  }
  result.grammar = std::move(grammar);
  result.line_comment = std::move(line_comment);
  return result;
}

}  // namespace

GrammarLoadResult load_grammar_json(const std::string& text) {
  json root = json::parse(text, nullptr, false);
  if (root.is_discarded()) {
    GrammarLoadResult result;
    result.error = GrammarLoadError{"malformed JSON", ""};
    return result;
  }
  GrammarBuilder builder;
  return builder.build(root);
}

GrammarLoadResult load_grammar_file(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    GrammarLoadResult result;
    result.error = GrammarLoadError{"failed to open grammar file: " + path, ""};
    return result;
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return load_grammar_json(buffer.str());
}

}  // namespace rulestack
