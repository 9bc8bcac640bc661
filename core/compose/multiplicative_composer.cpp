#include "compose/multiplicative_composer.hpp"
#include "common/log.hpp"

namespace modex {

MultiplicativeComposer::MultiplicativeComposer(const HomSearcher& searcher, SearchBudget budget)
    : searcher_(searcher), budget_(std::move(budget)) {}

ProductResult MultiplicativeComposer::compose(const ModelInstance& base,
                                              const std::vector<InstancePtr>& dimensions,
                                              std::mt19937& rng) const {
    static const ConstraintSet kNoConstraints;

    ProductResult result;
    result.slices.reserve(dimensions.size());
    for (const auto& dim : dimensions) {
        result.slices.push_back(searcher_.findOne(*dim, base, kNoConstraints, rng, budget_));
    }

    PullbackResult pullback = computePullback(base, dimensions, result.slices);
    result.instance = pullback.instance;
    result.projections = std::move(pullback.projections);

    logger()->trace("product of {} dimensions over [{}] -> {}", dimensions.size(),
                    base.describe(), result.instance->describe());
    return result;
}

} // namespace modex
