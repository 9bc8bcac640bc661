#include "homomorphism/hom_strategy.hpp"

#include <utility>
#include <vector>

namespace modex {

bool HomProblem::admits(size_t object, size_t source_element, size_t target_element) const {
    if (!constraints) return true;
    for (const auto& c : *constraints) {
        if (!c.appliesTo(object, source_element)) continue;
        if (!c.admits(*source, *target, source_element, target_element)) return false;
    }
    return true;
}

namespace {

struct ExhaustiveState {
    const HomProblem* problem;
    BudgetManager* budget;
    const HomCallback* emit;
    std::vector<std::pair<size_t, size_t>> vars;   // (object, source element)
    Homomorphism current;
};

bool leafAdmissible(const ExhaustiveState& state) {
    const HomProblem& p = *state.problem;
    for (const auto& [object, element] : state.vars) {
        if (!p.admits(object, element, state.current(object, element))) return false;
    }
    if (p.injective) {
        for (size_t o = 0; o < state.current.components.size(); o++) {
            std::vector<char> seen(p.target->count(o), 0);
            for (size_t v : state.current.components[o]) {
                if (seen[v]) return false;
                seen[v] = 1;
            }
        }
    }
    return isHomomorphism(state.current, *p.source, *p.target);
}

bool assign(ExhaustiveState& state, size_t idx) {
    if (idx >= state.vars.size()) {
        if (leafAdmissible(state)) {
            (*state.emit)(state.current);
        }
        return true;
    }

    auto [object, element] = state.vars[idx];
    size_t target_count = state.problem->target->count(object);
    for (size_t t = 0; t < target_count; t++) {
        if (!state.budget->canContinue()) return false;
        state.budget->recordStep();

        state.current.components[object][element] = t;
        if (!assign(state, idx + 1)) return false;
    }
    return true;
}

} // namespace

bool ExhaustiveStrategy::enumerate(const HomProblem& problem, BudgetManager& budget,
                                   const HomCallback& emit) const {
    ExhaustiveState state;
    state.problem = &problem;
    state.budget = &budget;
    state.emit = &emit;

    const ModelInstance& source = *problem.source;
    state.current.components.resize(source.schema()->objectCount());
    for (size_t o = 0; o < state.current.components.size(); o++) {
        state.current.components[o].assign(source.count(o), 0);
        for (size_t e = 0; e < source.count(o); e++) {
            state.vars.emplace_back(o, e);
        }
    }

    return assign(state, 0);
}

} // namespace modex
