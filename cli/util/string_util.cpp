#include "util/string_util.h"

#include <cctype>
#include <stdexcept>

namespace rulestack::cli::util {

std::string to_lower(const std::string& s) {
  std::string out = s;
  for (char& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

std::string trim_ws(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
    ++start;
  }
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
    --end;
  }
  return s.substr(start, end - start);
}

std::optional<std::string> unquote(const std::string& raw) {
  std::string trimmed = trim_ws(raw);
  if (trimmed.empty()) return std::nullopt;
  char first = trimmed.front();
  if ((first == '"' || first == '\'') && trimmed.size() >= 2 && trimmed.back() == first) {
    return trimmed.substr(1, trimmed.size() - 2);
  }
  return trimmed;
}

std::optional<size_t> parse_positive(const std::string& raw) {
  // WHY: stoull accepts a leading '-' and wraps it, so digits are checked up front.
  if (raw.empty()) return std::nullopt;
  for (unsigned char c : raw) {
    if (!std::isdigit(c)) return std::nullopt;
  }
  try {
    unsigned long long value = std::stoull(raw);
    if (value == 0) return std::nullopt;
    return static_cast<size_t>(value);
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

}  // namespace rulestack::cli::util
