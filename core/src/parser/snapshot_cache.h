#pragma once

#include <optional>

#include "rulestack/parser_state.h"

namespace rulestack {

/// Single-slot rollback buffer for the state seen before the current token.
/// MUST copy, never alias, so later mutation of the live state cannot leak in.
/// Inputs are states to save; outputs are restored states.
class SnapshotCache {
 public:
  /// Replaces the slot with a copy of state.
  void save(const ParserState& state);
  /// Overwrites state with the saved copy; returns false when nothing was saved.
  bool restore(ParserState& state) const;
  bool has_value() const { return saved_.has_value(); }

 private:
  std::optional<ParserState> saved_;
};

}  // namespace rulestack
