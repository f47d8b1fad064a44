#include "config.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>

#include "cli_args.h"
#include "render/token_renderer.h"
#include "util/string_util.h"

namespace rulestack::cli {

namespace {

std::string get_env(const char* name) {
  if (const char* value = std::getenv(name)) {
    if (*value) return value;
  }
  return {};
}

bool parse_bool(const std::string& raw, bool& out) {
  std::string lower = util::to_lower(raw);
  if (lower != "true" && lower != "false") return false;
  out = lower == "true";
  return true;
}

}  // namespace

std::string resolve_config_path() {
  std::string override = get_env("RULESTACK_CONFIG");
  if (!override.empty()) {
    return override;
  }
  std::string xdg_config = get_env("XDG_CONFIG_HOME");
  if (!xdg_config.empty()) {
    return (std::filesystem::path(xdg_config) / "rulestack" / "config.toml").string();
  }
  std::string home = get_env("HOME");
  if (!home.empty()) {
    return (std::filesystem::path(home) / ".config" / "rulestack" / "config.toml").string();
  }
  return "rulestack.config.toml";
}

bool load_config(const std::string& path, HighlightSettings& out, std::string& error) {
  out = HighlightSettings{};
  if (path.empty()) return false;
  if (!std::filesystem::exists(path)) {
    return false;
  }
  std::ifstream in(path);
  if (!in) {
    error = "Failed to open config: " + path;
    return false;
  }
  std::string section;
  std::string line;
  size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    std::string trimmed = util::trim_ws(line);
    if (trimmed.empty()) continue;
    if (trimmed[0] == '#') continue;
    if (trimmed.front() == '[' && trimmed.back() == ']') {
      section = util::trim_ws(trimmed.substr(1, trimmed.size() - 2));
      continue;
    }
    size_t eq = trimmed.find('=');
    if (eq == std::string::npos) continue;
    std::string key = util::trim_ws(trimmed.substr(0, eq));
    std::string value = util::trim_ws(trimmed.substr(eq + 1));
    if (key.empty()) continue;
    std::string where = " at line " + std::to_string(line_no);
    if (section == "styles") {
      auto parsed = util::unquote(value);
      std::string name = parsed ? util::to_lower(*parsed) : std::string();
      if (!parsed || !color_by_name(name)) {
        error = "Invalid color for style '" + key + "'" + where;
        return false;
      }
      out.styles[key] = name;
      continue;
    }
    if (section != "highlight") continue;
    if (key == "tab_size" || key == "indent_unit" || key == "max_depth") {
      auto parsed = util::parse_positive(value);
      if (!parsed || (key != "max_depth" && *parsed > static_cast<size_t>(std::numeric_limits<int>::max()))) {
        error = "Invalid highlight." + key + where;
        return false;
      }
      if (key == "tab_size") {
        out.tab_size = static_cast<int>(*parsed);
      } else if (key == "indent_unit") {
        out.indent_unit = static_cast<int>(*parsed);
      } else {
        out.max_depth = *parsed;
      }
    } else if (key == "line_comment") {
      auto parsed = util::unquote(value);
      if (!parsed) {
        error = "Invalid highlight.line_comment" + where;
        return false;
      }
      out.line_comment = *parsed;
    } else if (key == "output_mode") {
      auto parsed = util::unquote(value);
      std::string mode = parsed ? util::to_lower(*parsed) : std::string();
      if (!parsed || !is_valid_output_mode(mode)) {
        error = "Invalid highlight.output_mode" + where;
        return false;
      }
      out.output_mode = mode;
    } else if (key == "color") {
      bool parsed = false;
      if (!parse_bool(value, parsed)) {
        error = "Invalid highlight.color" + where;
        return false;
      }
      out.color = parsed;
    }
  }
  return true;
}

}  // namespace rulestack::cli
