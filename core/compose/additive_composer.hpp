#pragma once

#include "compose/wiring.hpp"
#include "homomorphism/hom_searcher.hpp"
#include "model/model_instance.hpp"

#include <random>
#include <vector>

namespace modex {

struct GluingResult {
    InstancePtr instance;
    std::vector<Homomorphism> legs;     // box instance -> composite, one per box
    ConstraintSet exposed;              // port constraints carried over to the composite
};

// ─── AdditiveComposer ──────────────────────────────────────────
// Glues one draw per box along the junction overlaps of a wiring
// pattern (pushout over the used junctions).

class AdditiveComposer {
public:
    AdditiveComposer(SchemaPtr schema, const HomSearcher& searcher, SearchBudget budget = {});

    /// Compose one tuple of box instances (in box order).
    /// Throws NoHomomorphism / SearchTimeout when a wire cannot be
    /// embedded; the tuple is then inadmissible.
    GluingResult compose(const WiringPattern& pattern, const ResolvedWiring& resolved,
                         const std::vector<InstancePtr>& boxes, std::mt19937& rng) const;

    /// Same, resolving the pattern first.
    GluingResult compose(const WiringPattern& pattern, const std::vector<InstancePtr>& boxes,
                         std::mt19937& rng) const;

private:
    SchemaPtr schema_;
    const HomSearcher& searcher_;
    SearchBudget budget_;
};

/// Re-express a box's port constraints on the composite through its leg.
/// Tag constraints carry over unchanged, fixed targets are remapped and
/// predicates are dropped.
ConstraintSet exposeConstraints(const ConstraintSet& constraints, const Homomorphism& leg);

} // namespace modex
