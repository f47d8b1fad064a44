#include "rulestack/document.h"

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <utility>

#include "rulestack/indentation.h"

namespace rulestack {

std::vector<std::string> split_lines(const std::string& text) {
  std::vector<std::string> out;
  size_t start = 0;
  while (true) {
    size_t end = text.find('\n', start);
    std::string line = text.substr(start, end == std::string::npos ? std::string::npos : end - start);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    out.push_back(std::move(line));
    if (end == std::string::npos) break;
    start = end + 1;
  }
  return out;
}

namespace {

/// Reads one token and describes it together with the frame it left active.
StyledToken read_token(OnlineParser& parser, StringStream& stream, ParserState& state) {
  stream.set_start();
  StyledToken token;
  token.style = parser.get_token(stream, state);
  if (stream.pos() == stream.start()) {
    // WHY: a custom whitespace eater may report success without consuming.
    stream.next();
  }
  token.line = stream.line_number();
  token.start = stream.start();
  token.end = stream.pos();
  token.text = stream.current();
  if (!state.empty()) {
    token.kind = state.current().kind;
    token.step = state.current().step;
  }
  token.depth = state.depth();
  return token;
}

}  // namespace

void tokenize_line(OnlineParser& parser,
                   ParserState& state,
                   const std::string& line,
                   size_t line_number,
                   std::vector<StyledToken>& out) {
  StringStream stream(line, line_number, parser.options().tab_size);
  while (!stream.eol()) {
    out.push_back(read_token(parser, stream, state));
  }
}

std::vector<StyledToken> tokenize_text(
    OnlineParser& parser,
    const std::string& text,
    const std::function<void(const ParserState&, const StyledToken&)>& visit) {
  std::vector<StyledToken> out;
  ParserState state = parser.start_state();
  std::vector<std::string> lines = split_lines(text);
  for (size_t i = 0; i < lines.size(); ++i) {
    StringStream stream(lines[i], i, parser.options().tab_size);
    while (!stream.eol()) {
      StyledToken token = read_token(parser, stream, state);
      if (visit) visit(state, token);
      out.push_back(std::move(token));
    }
  }
  return out;
}

std::vector<NamedFrame> collect_named_frames(OnlineParser& parser,
                                             const std::string& text,
                                             const std::string& kind) {
  std::vector<NamedFrame> out;
  std::optional<std::pair<std::string, std::string>> last;
  tokenize_text(parser, text, [&](const ParserState& state, const StyledToken& token) {
    if (!find_frame(state, {kind})) {
      last.reset();
      return;
    }
    const Frame& frame = state.current();
    if (frame.kind != kind || !frame.name || !frame.type) return;
    auto key = std::make_pair(*frame.name, *frame.type);
    if (last && *last == key) return;
    last = key;
    out.push_back(NamedFrame{kind, *frame.name, *frame.type, token.line});
  });
  return out;
}

DocumentHighlighter::DocumentHighlighter(OnlineParser& parser) : parser_(parser) {
  set_text("");
}

void DocumentHighlighter::set_text(const std::string& text) {
  lines_.clear();
  for (auto& line : split_lines(text)) {
    LineCache cache;
    cache.text = std::move(line);
    lines_.push_back(std::move(cache));
  }
  frontier_ = 0;
}

void DocumentHighlighter::touch(size_t line) {
  frontier_ = std::min(frontier_, line);
}

void DocumentHighlighter::replace_line(size_t line, const std::string& text) {
  LineCache& cache = lines_.at(line);
  if (cache.text == text) return;
  cache.text = text;
  cache.fresh = false;
  touch(line);
}

void DocumentHighlighter::insert_line(size_t line, const std::string& text) {
  if (line > lines_.size()) {
    throw std::out_of_range("insert_line: line out of range");
  }
  LineCache cache;
  cache.text = text;
  lines_.insert(lines_.begin() + static_cast<std::ptrdiff_t>(line), std::move(cache));
  touch(line);
}

void DocumentHighlighter::erase_line(size_t line) {
  if (line >= lines_.size()) {
    throw std::out_of_range("erase_line: line out of range");
  }
  lines_.erase(lines_.begin() + static_cast<std::ptrdiff_t>(line));
  if (lines_.empty()) {
    lines_.emplace_back();
  }
  touch(line);
}

void DocumentHighlighter::highlight_through(size_t line) {
  if (line >= lines_.size()) {
    throw std::out_of_range("line out of range");
  }
  while (frontier_ <= line) {
    size_t index = frontier_;
    LineCache& cache = lines_[index];
    ParserState entry = index == 0 ? parser_.start_state() : lines_[index - 1].exit;
    if (cache.fresh && cache.entry == entry) {
      // Same text, same entry state: the cached tokens are still what a full pass yields.
      if (!cache.tokens.empty() && cache.tokens.front().line != index) {
        for (auto& token : cache.tokens) token.line = index;
      }
      ++frontier_;
      continue;
    }
    cache.entry = entry;
    cache.tokens.clear();
    tokenize_line(parser_, entry, cache.text, index, cache.tokens);
    cache.exit = std::move(entry);
    cache.fresh = true;
    ++lines_tokenized_;
    ++frontier_;
  }
}

const std::vector<StyledToken>& DocumentHighlighter::line_tokens(size_t line) {
  highlight_through(line);
  return lines_[line].tokens;
}

const ParserState& DocumentHighlighter::state_before(size_t line) {
  highlight_through(line);
  return lines_[line].entry;
}

const ParserState& DocumentHighlighter::state_after(size_t line) {
  highlight_through(line);
  return lines_[line].exit;
}

int DocumentHighlighter::suggested_indent(size_t line, int indent_unit) {
  return rulestack::suggested_indent(state_before(line), lines_.at(line).text, indent_unit);
}

}  // namespace rulestack
