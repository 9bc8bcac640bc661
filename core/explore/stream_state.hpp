#pragma once

#include "homomorphism/homomorphism.hpp"
#include "loss/loss.hpp"
#include "schedule/dependency_scheduler.hpp"

#include <cstdint>
#include <deque>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace modex {

enum class ExhaustionReason {
    None,               // still producing
    Depleted,           // underlying production ended
    Stopped,            // stop criterion fired
    LayerExhausted      // too many consecutive skips
};

std::string exhaustionReasonName(ExhaustionReason reason);
/// Throws CheckpointError for unknown names.
ExhaustionReason parseExhaustionReason(const std::string& name);

// ─── Cursors ───────────────────────────────────────────────────

struct PrimitiveCursor {
    size_t index = 0;                       // next source index to draw
};

struct AdditiveCursor {
    std::vector<size_t> odometer;           // current child index per box
    bool started = false;
};

struct ProductCursor {
    std::deque<std::vector<size_t>> frontier;
    std::set<std::vector<size_t>> visited;
    bool started = false;
};

using Cursor = std::variant<PrimitiveCursor, AdditiveCursor, ProductCursor>;

/// How an emitted instance was produced: enough to rebuild it without
/// searching again.
struct Provenance {
    std::vector<size_t> position;           // source index, or child index per slot
    uint32_t seed = 0;                      // seed of the composition rng
    std::optional<double> score;
};

// ─── StreamState ───────────────────────────────────────────────
// Runtime enumeration state of one generator in one sharing scope.

struct StreamState {
    std::string key;
    GeneratorIndex generator = 0;
    std::vector<std::string> children;      // child stream key per slot
    Cursor cursor;
    uint64_t attempts = 0;
    size_t consecutive_skips = 0;
    ExhaustionReason reason = ExhaustionReason::None;

    History history;
    std::vector<Provenance> provenance;     // parallel to history
    std::vector<ConstraintSet> interfaces;  // exposed constraints per emission

    bool exhausted() const { return reason != ExhaustionReason::None; }
};

} // namespace modex
