#include "rulestack/string_stream.h"

#include <utility>

namespace rulestack {

StringStream::StringStream(std::string line, size_t line_number, int tab_size)
    : line_(std::move(line)), line_number_(line_number), tab_size_(tab_size > 0 ? tab_size : 1) {}

char StringStream::peek() const {
  if (eol()) return '\0';
  return line_[pos_];
}

char StringStream::next() {
  if (eol()) return '\0';
  return line_[pos_++];
}

bool StringStream::eat_space() {
  return eat_while([](char c) { return c == ' ' || c == '\t'; });
}

bool StringStream::eat_while(const std::function<bool(char)>& predicate) {
  size_t begin = pos_;
  while (pos_ < line_.size() && predicate(line_[pos_])) {
    ++pos_;
  }
  return pos_ > begin;
}

bool StringStream::match(const std::regex& pattern, std::string* out) {
  if (eol()) return false;
  std::smatch m;
  auto first = line_.cbegin() + static_cast<std::ptrdiff_t>(pos_);
  if (!std::regex_search(first, line_.cend(), m, pattern, std::regex_constants::match_continuous)) {
    return false;
  }
  if (m.length(0) == 0) return false;
  if (out) *out = m.str(0);
  pos_ += static_cast<size_t>(m.length(0));
  return true;
}

bool StringStream::match(const std::string& literal) {
  if (literal.empty()) return false;
  if (line_.compare(pos_, literal.size(), literal) != 0) return false;
  pos_ += literal.size();
  return true;
}

int StringStream::indentation() const {
  int width = 0;
  for (char c : line_) {
    if (c == ' ') {
      ++width;
    } else if (c == '\t') {
      width += tab_size_ - (width % tab_size_);
    } else {
      break;
    }
  }
  return width;
}

}  // namespace rulestack
