#pragma once

#include "common/budget.hpp"
#include "homomorphism/hom_searcher.hpp"

#include <cstdint>
#include <string>

namespace modex {

/// Search configuration parameters.
struct SearchOptions {
    uint64_t seed = 0;
    size_t iterations = 100;            // root emissions to pull, 0 = until exhausted
    double max_seconds = 0.0;           // wall clock for the run, 0 = unlimited
    bool allow_multiple_roots = false;
    HomSearchOptions homomorphism;
    SearchBudget hom_budget;            // per homomorphism search
    std::string checkpoint_path;        // empty = no checkpoints
    size_t checkpoint_every = 0;        // emissions between saves, 0 = only at the end
    bool resume = false;                // load checkpoint_path before running
};

} // namespace modex
