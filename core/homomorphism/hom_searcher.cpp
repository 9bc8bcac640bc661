#include "homomorphism/hom_searcher.hpp"
#include "common/errors.hpp"
#include "common/hash.hpp"
#include "common/log.hpp"

#include <algorithm>
#include <limits>

namespace modex {

namespace {

// Number of raw assignments source -> target, saturating at max().
uint64_t assignmentSpace(const ModelInstance& source, const ModelInstance& target) {
    const uint64_t cap = std::numeric_limits<uint64_t>::max();
    uint64_t space = 1;
    for (size_t o = 0; o < source.schema()->objectCount(); o++) {
        uint64_t base = target.count(o);
        for (size_t i = 0; i < source.count(o); i++) {
            if (base == 0) return 0;
            if (space > cap / base) return cap;
            space *= base;
        }
    }
    return space;
}

// Seeded ranking key of a map. The map with the smallest key wins, which
// makes the choice independent of enumeration order.
uint64_t rankKey(uint64_t salt, const Homomorphism& h) {
    Fnv1a hash;
    hash.add(salt);
    for (const auto& component : h.components) {
        hash.add(static_cast<uint64_t>(component.size()));
        for (size_t v : component) hash.add(static_cast<uint64_t>(v));
    }
    // splitmix64 finalizer
    uint64_t z = hash.value();
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
    return z ^ (z >> 31);
}

} // namespace

HomSearcher::HomSearcher(HomSearchOptions options)
    : options_(options) {}

const HomStrategy& HomSearcher::pick(const HomProblem& problem) const {
    switch (options_.strategy) {
        case StrategyKind::Exhaustive:
            return exhaustive_;
        case StrategyKind::Backtracking:
            return backtracking_;
        case StrategyKind::Auto:
            break;
    }
    if (assignmentSpace(*problem.source, *problem.target) <= options_.exhaustive_limit) {
        return exhaustive_;
    }
    return backtracking_;
}

void HomSearcher::checkCompatible(const ModelInstance& source, const ModelInstance& target,
                                  const ConstraintSet& constraints) const {
    if (source.schema() != target.schema() && *source.schema() != *target.schema()) {
        throw SchemaMismatchError("homomorphism between instances of different schemas ('" +
                                  source.schema()->name() + "' vs '" +
                                  target.schema()->name() + "')");
    }
    const size_t objects = source.schema()->objectCount();
    for (const auto& c : constraints) {
        if (c.object >= objects) {
            throw SchemaMismatchError("constraint on unknown object index " +
                                      std::to_string(c.object));
        }
        if (c.source_element && *c.source_element >= source.count(c.object)) {
            throw SchemaMismatchError("constraint on missing source element: " + c.describe());
        }
    }
}

bool HomSearcher::run(const ModelInstance& source, const ModelInstance& target,
                      const ConstraintSet& constraints, const SearchBudget& budget,
                      const HomCallback& emit, HomSearchResult& stats) const {
    checkCompatible(source, target, constraints);

    HomProblem problem;
    problem.source = &source;
    problem.target = &target;
    problem.constraints = &constraints;
    problem.injective = options_.injective;

    const HomStrategy& strategy = pick(problem);

    BudgetManager manager(budget);
    manager.start();

    stats.strategy = strategy.name();
    stats.complete = strategy.enumerate(problem, manager, emit);
    stats.steps = manager.steps();
    return stats.complete;
}

HomSearchResult HomSearcher::findAll(const ModelInstance& source, const ModelInstance& target,
                                     const ConstraintSet& constraints,
                                     const SearchBudget& budget) const {
    HomSearchResult result;
    run(source, target, constraints, budget,
        [&](const Homomorphism& h) { result.maps.push_back(h); }, result);
    std::sort(result.maps.begin(), result.maps.end());

    logger()->trace("hom search [{}]: {} -> {}: {} maps in {} steps{}",
                    result.strategy, source.describe(), target.describe(),
                    result.maps.size(), result.steps,
                    result.complete ? "" : " (incomplete)");
    return result;
}

Homomorphism HomSearcher::findOne(const ModelInstance& source, const ModelInstance& target,
                                  const ConstraintSet& constraints, std::mt19937& rng,
                                  const SearchBudget& budget) const {
    const uint64_t salt = (static_cast<uint64_t>(rng()) << 32) | rng();

    std::optional<Homomorphism> chosen;
    uint64_t chosen_key = 0;
    size_t admissible = 0;
    HomSearchResult stats;
    bool complete = run(source, target, constraints, budget, [&](const Homomorphism& h) {
        admissible++;
        uint64_t key = rankKey(salt, h);
        if (!chosen || key < chosen_key || (key == chosen_key && h < *chosen)) {
            chosen = h;
            chosen_key = key;
        }
    }, stats);

    if (!complete) {
        throw SearchTimeout("homomorphism search from [" + source.describe() + "] to [" +
                            target.describe() + "] stopped after " +
                            std::to_string(stats.steps) + " steps");
    }
    if (!chosen) {
        throw NoHomomorphism("no admissible homomorphism from [" + source.describe() +
                             "] to [" + target.describe() + "]");
    }
    logger()->trace("hom search [{}]: picked 1 of {} maps in {} steps", stats.strategy,
                    admissible, stats.steps);
    return *chosen;
}

} // namespace modex
