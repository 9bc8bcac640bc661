#include "homomorphism/hom_strategy.hpp"

#include <algorithm>
#include <limits>
#include <utility>
#include <vector>

namespace modex {

namespace {

constexpr size_t kUnassigned = std::numeric_limits<size_t>::max();

// Variables are source elements, flattened: var = offset[object] + element.
struct BacktrackState {
    const HomProblem* problem = nullptr;
    BudgetManager* budget = nullptr;
    const HomCallback* emit = nullptr;

    std::vector<size_t> offset;
    std::vector<std::pair<size_t, size_t>> vars;
    std::vector<std::vector<size_t>> domains;
    std::vector<size_t> assignment;

    // preimage[r][y] = source elements x with r(x) == y
    std::vector<std::vector<std::vector<size_t>>> preimage;

    // Saved domains, restored on backtrack.
    std::vector<std::pair<size_t, std::vector<size_t>>> trail;

    size_t var(size_t object, size_t element) const { return offset[object] + element; }
};

void saveDomain(BacktrackState& s, size_t v) {
    s.trail.emplace_back(v, s.domains[v]);
}

void undoTo(BacktrackState& s, size_t mark) {
    while (s.trail.size() > mark) {
        auto& [v, domain] = s.trail.back();
        s.domains[v] = std::move(domain);
        s.trail.pop_back();
    }
}

/// Restrict an unassigned variable's domain to candidates passing keep().
/// Returns false if the domain becomes empty.
template <typename Keep>
bool narrow(BacktrackState& s, size_t v, Keep keep) {
    const auto& domain = s.domains[v];
    bool changes = false;
    for (size_t t : domain) {
        if (!keep(t)) {
            changes = true;
            break;
        }
    }
    if (!changes) return true;

    saveDomain(s, v);
    auto& d = s.domains[v];
    d.erase(std::remove_if(d.begin(), d.end(), [&](size_t t) { return !keep(t); }), d.end());
    return !d.empty();
}

bool propagate(BacktrackState& s, size_t v, size_t t) {
    const HomProblem& p = *s.problem;
    const Schema& schema = *p.source->schema();
    auto [object, element] = s.vars[v];

    // Outgoing relations: r(element) must map to r(t).
    for (size_t r = 0; r < schema.relationCount(); r++) {
        const Relation& rel = schema.relation(r);
        if (rel.dom != object) continue;

        size_t w = s.var(rel.codom, p.source->apply(r, element));
        size_t required = p.target->apply(r, t);
        if (s.assignment[w] != kUnassigned) {
            if (s.assignment[w] != required) return false;
        } else if (!narrow(s, w, [&](size_t c) { return c == required; })) {
            return false;
        }
    }

    // Incoming relations: every x with r(x) == element must land in r^-1(t).
    for (size_t r = 0; r < schema.relationCount(); r++) {
        const Relation& rel = schema.relation(r);
        if (rel.codom != object) continue;

        for (size_t x : s.preimage[r][element]) {
            size_t w = s.var(rel.dom, x);
            if (s.assignment[w] != kUnassigned) {
                if (p.target->apply(r, s.assignment[w]) != t) return false;
            } else if (!narrow(s, w, [&](size_t c) { return p.target->apply(r, c) == t; })) {
                return false;
            }
        }
    }

    if (p.injective) {
        size_t begin = s.offset[object];
        size_t end = begin + p.source->count(object);
        for (size_t w = begin; w < end; w++) {
            if (w == v || s.assignment[w] != kUnassigned) continue;
            if (!narrow(s, w, [&](size_t c) { return c != t; })) return false;
        }
    }
    return true;
}

size_t selectVariable(const BacktrackState& s) {
    size_t best = kUnassigned;
    size_t best_size = std::numeric_limits<size_t>::max();
    for (size_t v = 0; v < s.vars.size(); v++) {
        if (s.assignment[v] != kUnassigned) continue;
        if (s.domains[v].size() < best_size) {
            best = v;
            best_size = s.domains[v].size();
        }
    }
    return best;
}

void emitAssignment(const BacktrackState& s) {
    const ModelInstance& source = *s.problem->source;
    Homomorphism h;
    h.components.resize(source.schema()->objectCount());
    for (size_t o = 0; o < h.components.size(); o++) {
        h.components[o].resize(source.count(o));
        for (size_t e = 0; e < source.count(o); e++) {
            h.components[o][e] = s.assignment[s.var(o, e)];
        }
    }
    (*s.emit)(h);
}

bool search(BacktrackState& s) {
    size_t v = selectVariable(s);
    if (v == kUnassigned) {
        emitAssignment(s);
        return true;
    }

    std::vector<size_t> candidates = s.domains[v];
    for (size_t t : candidates) {
        if (!s.budget->canContinue()) return false;
        s.budget->recordStep();

        size_t mark = s.trail.size();
        s.assignment[v] = t;
        saveDomain(s, v);
        s.domains[v] = {t};

        if (propagate(s, v, t)) {
            if (!search(s)) return false;
        }

        undoTo(s, mark);
        s.assignment[v] = kUnassigned;
    }
    return true;
}

} // namespace

bool BacktrackingStrategy::enumerate(const HomProblem& problem, BudgetManager& budget,
                                     const HomCallback& emit) const {
    BacktrackState s;
    s.problem = &problem;
    s.budget = &budget;
    s.emit = &emit;

    const ModelInstance& source = *problem.source;
    const ModelInstance& target = *problem.target;
    const Schema& schema = *source.schema();

    s.offset.resize(schema.objectCount());
    for (size_t o = 0; o < schema.objectCount(); o++) {
        s.offset[o] = s.vars.size();
        for (size_t e = 0; e < source.count(o); e++) {
            s.vars.emplace_back(o, e);
        }
    }

    s.preimage.resize(schema.relationCount());
    for (size_t r = 0; r < schema.relationCount(); r++) {
        const Relation& rel = schema.relation(r);
        s.preimage[r].resize(source.count(rel.codom));
        for (size_t x = 0; x < source.count(rel.dom); x++) {
            s.preimage[r][source.apply(r, x)].push_back(x);
        }
    }

    // Initial domains from the unary constraints.
    s.domains.resize(s.vars.size());
    for (size_t v = 0; v < s.vars.size(); v++) {
        auto [object, element] = s.vars[v];
        for (size_t t = 0; t < target.count(object); t++) {
            if (problem.admits(object, element, t)) s.domains[v].push_back(t);
        }
        if (s.domains[v].empty()) return true;  // provably no map
    }

    s.assignment.assign(s.vars.size(), kUnassigned);
    return search(s);
}

} // namespace modex
