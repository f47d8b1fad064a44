#include "rule_stack.h"

#include <utility>

namespace rulestack::detail {

namespace {

bool is_sequence(const Frame& frame) {
  return frame.rule && frame.rule->kind == RuleDefinition::Kind::Sequence;
}

const RuleItem* active_slot(const Frame& frame) {
  if (!is_sequence(frame) || frame.step >= frame.rule->items.size()) return nullptr;
  return &frame.rule->items[frame.step];
}

bool has_separator(const Frame& frame) {
  const RuleItem* slot = active_slot(frame);
  return slot && slot->separator.has_value();
}

}  // namespace

const RuleItem* expected_item(const Frame& frame,
                              const Token& token,
                              std::optional<RuleItem>& fork_choice) {
  if (!frame.rule) return nullptr;
  if (frame.rule->kind == RuleDefinition::Kind::Fork) {
    if (frame.step != 0 || !frame.rule->fork.choose) return nullptr;
    fork_choice = frame.rule->fork.choose(token);
    return fork_choice ? &*fork_choice : nullptr;
  }
  return active_slot(frame);
}

bool is_list(const Frame& frame) {
  const RuleItem* slot = active_slot(frame);
  return slot && slot->kind == RuleItem::Kind::List;
}

bool is_tolerant(const Frame& frame) {
  const RuleItem* slot = active_slot(frame);
  return slot && (slot->kind == RuleItem::Kind::Optional || slot->kind == RuleItem::Kind::List);
}

bool is_exhausted(const Frame& frame) {
  if (!frame.rule) return true;
  if (frame.rule->kind == RuleDefinition::Kind::Fork) return frame.step > 0;
  return frame.step >= frame.rule->items.size();
}

bool push_rule(ParserState& state, const Grammar& grammar, const std::string& name, size_t max_depth) {
  const RuleDefinition* rule = grammar.find(name);
  if (!rule) return false;
  if (state.frames.size() >= max_depth) return false;
  Frame frame;
  frame.kind = name;
  frame.rule = rule;
  state.frames.push_back(std::move(frame));
  return true;
}

void restart_root(ParserState& state) {
  Frame& root = state.frames.front();
  root.step = 0;
  root.name.reset();
  root.type.reset();
  root.needs_separator = false;
}

void advance_rule(ParserState& state, bool successful) {
  if (state.frames.empty()) return;
  Frame& frame = state.current();

  // A matched list element or separator keeps the list open for repetition.
  if (successful && is_list(frame)) {
    if (has_separator(frame)) {
      frame.needs_separator = !frame.needs_separator;
    }
    return;
  }

  frame.needs_separator = false;
  ++frame.step;
  while (state.frames.size() > 1 && is_exhausted(state.current())) {
    state.frames.pop_back();
    Frame& parent = state.current();
    if (is_list(parent)) {
      // The completed child was one list element; a separator may follow.
      if (has_separator(parent)) {
        parent.needs_separator = !parent.needs_separator;
      }
    } else {
      parent.needs_separator = false;
      ++parent.step;
    }
  }
}

bool unwind(ParserState& state) {
  while (!state.frames.empty() && !is_tolerant(state.current())) {
    state.frames.pop_back();
  }
  if (state.frames.empty()) return false;
  advance_rule(state, false);
  return true;
}

}  // namespace rulestack::detail
