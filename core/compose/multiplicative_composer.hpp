#pragma once

#include "compose/limit.hpp"
#include "homomorphism/hom_searcher.hpp"
#include "model/model_instance.hpp"

#include <random>
#include <string>
#include <vector>

namespace modex {

/// Dimensions of a multiplicative composite, sliced over a common base.
struct ProductSpec {
    std::vector<std::string> dimensions;    // generator ids, in order
    InstancePtr base;                       // null means the terminal instance
    bool expand_inadmissible = true;        // keep exploring past dropped nodes
};

struct ProductResult {
    InstancePtr instance;
    std::vector<Homomorphism> slices;       // dimension instance -> base
    std::vector<Homomorphism> projections;  // composite -> dimension instance
};

// ─── MultiplicativeComposer ────────────────────────────────────
// Slices one instance per dimension into the base and takes the
// fibre product.

class MultiplicativeComposer {
public:
    explicit MultiplicativeComposer(const HomSearcher& searcher, SearchBudget budget = {});

    /// Throws NoHomomorphism / SearchTimeout when a dimension instance
    /// has no admissible slice; the node is then dropped.
    ProductResult compose(const ModelInstance& base, const std::vector<InstancePtr>& dimensions,
                          std::mt19937& rng) const;

private:
    const HomSearcher& searcher_;
    SearchBudget budget_;
};

} // namespace modex
