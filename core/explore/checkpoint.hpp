#pragma once

#include "explore/explorer.hpp"

#include <string>

namespace modex {

// ─── Checkpoint ────────────────────────────────────────────────
// YAML snapshot of an Explorer: cursors, BFS frontiers and visited
// sets, skip counters, exhaustion reasons, draw counts and the
// provenance of every emission. Instances themselves are not stored;
// load() rebuilds them from provenance with the recorded seeds and
// restores the recorded scores.

class Checkpoint {
public:
    static std::string toYaml(const Explorer& explorer);
    static void save(const Explorer& explorer, const std::string& path);

    /// Replace the explorer's runtime state. Throws CheckpointError when
    /// the document is malformed or was written for another search space.
    static void fromYaml(Explorer& explorer, const std::string& text);
    static void load(Explorer& explorer, const std::string& path);
};

} // namespace modex
