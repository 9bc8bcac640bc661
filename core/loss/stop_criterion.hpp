#pragma once

#include "loss/loss.hpp"

#include <cstddef>
#include <string>

namespace modex {

enum class Direction {
    Minimize,   // lower is better
    Maximize    // higher is better
};

enum class Comparison { LessEqual, Less, GreaterEqual, Greater };

/// Parse "<=", "<", ">=", ">". Throws ConfigError otherwise.
Comparison parseComparison(const std::string& op);
std::string comparisonSymbol(Comparison op);

// ─── StopCriterion ─────────────────────────────────────────────
// Decides, after each emission, whether a stream should stop. The
// emission that triggers it is still delivered.

struct StopCriterion {
    enum class Kind {
        None,
        Threshold,      // latest score compares `op` to `value`
        MaxEmitted,     // `count` emissions reached
        Plateau         // `count` emissions without improvement
    };

    Kind kind = Kind::None;
    Comparison op = Comparison::LessEqual;
    double value = 0.0;
    size_t count = 0;

    static StopCriterion threshold(Comparison op, double value);
    static StopCriterion maxEmitted(size_t n);
    static StopCriterion plateau(size_t n);

    bool shouldStop(const History& history, Direction direction) const;

    std::string describe() const;
};

} // namespace modex
