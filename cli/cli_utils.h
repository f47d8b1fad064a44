#pragma once

#include <string>
#include <vector>

#include "rulestack/document.h"

namespace rulestack::cli {

/// Reads a file into memory for CLI inputs and grammars.
/// MUST throw on missing/unreadable files and MUST not perform network IO.
/// Inputs are a path; outputs are contents; side effects are file reads/errors.
std::string read_file(const std::string& path);
/// Reads all stdin content for non-interactive usage.
/// MUST block until EOF and MUST not interpret the stream contents.
std::string read_stdin();
/// Checks whether a string should be treated as a URL.
/// MUST only match http and https schemes.
bool is_url(const std::string& value);
/// Loads text from a path or URL using CLI-side IO behavior.
/// MUST honor timeouts and MUST fail when network support is disabled.
/// Inputs are path/url and timeout; outputs are the text with IO side effects.
std::string load_text_input(const std::string& input, int timeout_ms);

/// Serializes styled tokens as a JSON array, skipping whitespace tokens.
/// Each element carries line/start/end/text/style/kind/step/depth.
std::string build_tokens_json(const std::vector<StyledToken>& tokens);
/// Serializes collected definitions as a JSON array of {kind,name,type,line}.
std::string build_definitions_json(const std::vector<NamedFrame>& frames);

}  // namespace rulestack::cli
