#pragma once

#include "loss/loss.hpp"
#include "loss/stop_criterion.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace modex {

// ─── Loss Evaluator ────────────────────────────────────────────
// Combines weighted loss terms into one score and owns the stop
// criterion of a generator.

class LossEvaluator {
public:
    explicit LossEvaluator(Direction direction = Direction::Minimize);

    void addTerm(std::unique_ptr<LossFunction> term, double weight = 1.0);

    void setStopCriterion(StopCriterion criterion) { stop_ = criterion; }
    const StopCriterion& stopCriterion() const { return stop_; }

    Direction direction() const { return direction_; }
    size_t termCount() const { return terms_.size(); }
    bool hasTerms() const { return !terms_.empty(); }

    /// Weighted sum of all terms, or nullopt without terms.
    std::optional<double> evaluate(const ModelInstance& instance, const LossContext& context) const;

    bool shouldStop(const History& history) const {
        return stop_.shouldStop(history, direction_);
    }

    /// True iff score a is strictly better than b in this direction.
    bool isBetter(double a, double b) const {
        return direction_ == Direction::Minimize ? a < b : a > b;
    }

    std::string describe() const;

private:
    struct Term {
        std::unique_ptr<LossFunction> fn;
        double weight;
    };

    Direction direction_;
    std::vector<Term> terms_;
    StopCriterion stop_;
};

} // namespace modex
