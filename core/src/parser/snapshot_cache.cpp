#include "snapshot_cache.h"

namespace rulestack {

void SnapshotCache::save(const ParserState& state) {
  saved_ = state;
}

bool SnapshotCache::restore(ParserState& state) const {
  if (!saved_) return false;
  state = *saved_;
  return true;
}

}  // namespace rulestack
