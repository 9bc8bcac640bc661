#pragma once

#include "homomorphism/homomorphism.hpp"
#include "common/budget.hpp"

#include <functional>
#include <string>

namespace modex {

/// One homomorphism search: source -> target under extra constraints.
struct HomProblem {
    const ModelInstance* source = nullptr;
    const ModelInstance* target = nullptr;
    const ConstraintSet* constraints = nullptr;
    bool injective = false;

    /// Unary check: every constraint that applies to the source element
    /// admits the target element.
    bool admits(size_t object, size_t source_element, size_t target_element) const;
};

using HomCallback = std::function<void(const Homomorphism&)>;

/// Enumeration strategy for admissible homomorphisms.
/// Worst case is exponential in the size of the source instance.
class HomStrategy {
public:
    virtual ~HomStrategy() = default;

    virtual std::string name() const = 0;

    /// Report every admissible map through emit.
    /// Returns false if the budget ran out before the search completed.
    virtual bool enumerate(const HomProblem& problem, BudgetManager& budget,
                           const HomCallback& emit) const = 0;
};

/// Tries every assignment of source elements to target elements and
/// checks constraints and relations at the leaves. For small structures.
class ExhaustiveStrategy : public HomStrategy {
public:
    std::string name() const override { return "exhaustive"; }
    bool enumerate(const HomProblem& problem, BudgetManager& budget,
                   const HomCallback& emit) const override;
};

/// Backtracking over per-element candidate domains. Picks the element
/// with the fewest candidates first and propagates every relation into
/// the domains of related elements, failing as soon as a domain empties.
class BacktrackingStrategy : public HomStrategy {
public:
    std::string name() const override { return "backtracking"; }
    bool enumerate(const HomProblem& problem, BudgetManager& budget,
                   const HomCallback& emit) const override;
};

} // namespace modex
