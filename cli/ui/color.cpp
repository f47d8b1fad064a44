#include "color.h"

namespace rulestack::cli {

Color kColor;

const char* Color::by_name(const std::string& name) const {
  if (name == "none") return "";
  if (name == "red") return red;
  if (name == "green") return green;
  if (name == "yellow") return yellow;
  if (name == "blue") return blue;
  if (name == "magenta") return magenta;
  if (name == "cyan") return cyan;
  if (name == "dim") return dim;
  if (name == "bold") return bold;
  return nullptr;
}

}  // namespace rulestack::cli
