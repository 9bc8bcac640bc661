#include "loss/stop_criterion.hpp"
#include "common/errors.hpp"

namespace modex {

Comparison parseComparison(const std::string& op) {
    if (op == "<=") return Comparison::LessEqual;
    if (op == "<") return Comparison::Less;
    if (op == ">=") return Comparison::GreaterEqual;
    if (op == ">") return Comparison::Greater;
    throw ConfigError("unknown comparison '" + op + "' (expected <=, <, >= or >)");
}

std::string comparisonSymbol(Comparison op) {
    switch (op) {
        case Comparison::LessEqual: return "<=";
        case Comparison::Less: return "<";
        case Comparison::GreaterEqual: return ">=";
        case Comparison::Greater: return ">";
    }
    return "?";
}

StopCriterion StopCriterion::threshold(Comparison op, double value) {
    StopCriterion c;
    c.kind = Kind::Threshold;
    c.op = op;
    c.value = value;
    return c;
}

StopCriterion StopCriterion::maxEmitted(size_t n) {
    StopCriterion c;
    c.kind = Kind::MaxEmitted;
    c.count = n;
    return c;
}

StopCriterion StopCriterion::plateau(size_t n) {
    StopCriterion c;
    c.kind = Kind::Plateau;
    c.count = n;
    return c;
}

bool StopCriterion::shouldStop(const History& history, Direction direction) const {
    if (history.empty()) return false;

    switch (kind) {
        case Kind::None:
            return false;

        case Kind::Threshold: {
            const auto& latest = history.back().score;
            if (!latest) return false;
            switch (op) {
                case Comparison::LessEqual: return *latest <= value;
                case Comparison::Less: return *latest < value;
                case Comparison::GreaterEqual: return *latest >= value;
                case Comparison::Greater: return *latest > value;
            }
            return false;
        }

        case Kind::MaxEmitted:
            return history.size() >= count;

        case Kind::Plateau: {
            // Position of the first emission reaching the best score so far.
            std::optional<double> best;
            size_t best_at = 0;
            for (size_t i = 0; i < history.size(); i++) {
                const auto& s = history[i].score;
                if (!s) continue;
                bool better = !best || (direction == Direction::Minimize ? *s < *best : *s > *best);
                if (better) {
                    best = s;
                    best_at = i;
                }
            }
            if (!best) return false;
            return history.size() - 1 - best_at >= count;
        }
    }
    return false;
}

std::string StopCriterion::describe() const {
    switch (kind) {
        case Kind::None: return "none";
        case Kind::Threshold: return "score " + comparisonSymbol(op) + " " + std::to_string(value);
        case Kind::MaxEmitted: return "max " + std::to_string(count) + " emitted";
        case Kind::Plateau: return "plateau of " + std::to_string(count);
    }
    return "?";
}

} // namespace modex
