#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace rulestack::cli::util {

/// Lowercases ASCII letters for case-insensitive config values.
std::string to_lower(const std::string& s);
/// Trims leading and trailing ASCII whitespace.
/// MUST preserve internal whitespace.
std::string trim_ws(const std::string& s);
/// Strips one pair of matching single or double quotes after trimming.
/// Returns nullopt for blank input; unquoted text is returned trimmed.
std::optional<std::string> unquote(const std::string& raw);
/// Parses a whole string as a positive decimal number.
/// Returns nullopt on trailing text, zero, negative or out-of-range values.
std::optional<size_t> parse_positive(const std::string& raw);

}  // namespace rulestack::cli::util
