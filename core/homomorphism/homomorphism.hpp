#pragma once

#include "model/model_instance.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace modex {

/// A structure-preserving map between two instances of one schema:
/// one component function per object, commuting with every relation.
struct Homomorphism {
    std::vector<std::vector<size_t>> components;

    size_t operator()(size_t object, size_t element) const {
        return components.at(object).at(element);
    }

    bool operator==(const Homomorphism& other) const { return components == other.components; }
    bool operator!=(const Homomorphism& other) const { return components != other.components; }
    bool operator<(const Homomorphism& other) const { return components < other.components; }

    /// Identity map on an instance.
    static Homomorphism identity(const ModelInstance& instance);
};

/// True iff h is a total, in-range map from source to target that
/// commutes with every relation of the schema.
bool isHomomorphism(const Homomorphism& h, const ModelInstance& source, const ModelInstance& target);

/// second ∘ first.
Homomorphism composeMaps(const Homomorphism& first, const Homomorphism& second);

// ─── HomConstraint ─────────────────────────────────────────────
// Restricts which target elements a source element may map onto.
// Applies to one object, and to one element of it or to all of them.

struct HomConstraint {
    enum class Kind {
        RequireTargetTag,   // target element must carry `tag`
        PreserveTags,       // source tags must be a subset of target tags
        FixTarget,          // source element maps to `target_element`
        Predicate           // arbitrary test on (source element, target element)
    };

    Kind kind = Kind::RequireTargetTag;
    size_t object = 0;
    std::optional<size_t> source_element;
    std::string tag;
    size_t target_element = 0;
    std::function<bool(size_t source_element, size_t target_element)> predicate;

    static HomConstraint requireTag(size_t object, std::string tag,
                                    std::optional<size_t> element = std::nullopt);
    static HomConstraint preserveTags(size_t object, std::optional<size_t> element = std::nullopt);
    static HomConstraint fixTarget(size_t object, size_t source_element, size_t target_element);
    static HomConstraint where(size_t object, std::function<bool(size_t, size_t)> fn);

    bool appliesTo(size_t obj, size_t element) const {
        return obj == object && (!source_element || *source_element == element);
    }

    bool admits(const ModelInstance& source, const ModelInstance& target,
                size_t source_elem, size_t target_elem) const;

    std::string describe() const;
};

using ConstraintSet = std::vector<HomConstraint>;

} // namespace modex
