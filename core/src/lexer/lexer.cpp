#include "lexer.h"

#include <string>

namespace rulestack {

std::optional<Token> lex(const std::vector<LexRule>& rules, StringStream& stream) {
  for (const auto& rule : rules) {
    std::string value;
    if (stream.match(rule.pattern, &value)) {
      return Token{rule.kind, value};
    }
  }
  return std::nullopt;
}

}  // namespace rulestack
