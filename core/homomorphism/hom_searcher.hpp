#pragma once

#include "homomorphism/homomorphism.hpp"
#include "homomorphism/hom_strategy.hpp"
#include "common/budget.hpp"

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace modex {

enum class StrategyKind {
    Auto,           // exhaustive below exhaustive_limit assignments, else backtracking
    Exhaustive,
    Backtracking
};

struct HomSearchOptions {
    StrategyKind strategy = StrategyKind::Auto;
    bool injective = false;
    uint64_t exhaustive_limit = 4096;   // size of the raw assignment space
};

struct HomSearchResult {
    std::vector<Homomorphism> maps;     // sorted, so independent of strategy
    bool complete = true;               // false: budget ran out, maps is partial
    uint64_t steps = 0;
    std::string strategy;
};

// ─── HomSearcher ───────────────────────────────────────────────
// Finds structure-preserving maps between two instances under extra
// interface constraints. Used for embedding (junction overlap -> box
// instance) and for slicing (dimension instance -> product base).

class HomSearcher {
public:
    explicit HomSearcher(HomSearchOptions options = {});

    /// Every admissible map (possibly none).
    HomSearchResult findAll(const ModelInstance& source, const ModelInstance& target,
                            const ConstraintSet& constraints,
                            const SearchBudget& budget = {}) const;

    /// One admissible map chosen at random with rng: every map gets a
    /// seeded hash key and the smallest key wins, so the choice is uniform
    /// and does not depend on the strategy. Only the current pick is kept.
    /// Throws NoHomomorphism if none exists, SearchTimeout if the budget
    /// runs out (or is cancelled) before the admissible set is known.
    Homomorphism findOne(const ModelInstance& source, const ModelInstance& target,
                         const ConstraintSet& constraints, std::mt19937& rng,
                         const SearchBudget& budget = {}) const;

    const HomSearchOptions& options() const { return options_; }

private:
    const HomStrategy& pick(const HomProblem& problem) const;
    /// Runs the chosen strategy; fills strategy, steps and complete.
    bool run(const ModelInstance& source, const ModelInstance& target,
             const ConstraintSet& constraints, const SearchBudget& budget,
             const HomCallback& emit, HomSearchResult& stats) const;
    void checkCompatible(const ModelInstance& source, const ModelInstance& target,
                         const ConstraintSet& constraints) const;

    HomSearchOptions options_;
    ExhaustiveStrategy exhaustive_;
    BacktrackingStrategy backtracking_;
};

} // namespace modex
