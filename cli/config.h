#pragma once

#include <map>
#include <optional>
#include <string>

namespace rulestack::cli {

/// Values read from the config file; unset fields keep CLI defaults.
struct HighlightSettings {
  std::optional<int> tab_size;
  std::optional<int> indent_unit;
  std::optional<size_t> max_depth;
  std::optional<std::string> line_comment;
  std::optional<std::string> output_mode;
  std::optional<bool> color;
  // Style tag -> color name, e.g. keyword = "magenta".
  std::map<std::string, std::string> styles;
};

/// Resolves the config path from RULESTACK_CONFIG, XDG_CONFIG_HOME, then HOME.
std::string resolve_config_path();
/// Loads [highlight] and [styles] settings from a TOML-style file.
/// Returns false with an empty error when the file does not exist,
/// and false with a line-numbered error when a value is invalid.
bool load_config(const std::string& path, HighlightSettings& out, std::string& error);

}  // namespace rulestack::cli
