#include "homomorphism/homomorphism.hpp"

#include <algorithm>

namespace modex {

Homomorphism Homomorphism::identity(const ModelInstance& instance) {
    Homomorphism h;
    h.components.resize(instance.schema()->objectCount());
    for (size_t o = 0; o < h.components.size(); o++) {
        h.components[o].resize(instance.count(o));
        for (size_t e = 0; e < instance.count(o); e++) {
            h.components[o][e] = e;
        }
    }
    return h;
}

bool isHomomorphism(const Homomorphism& h, const ModelInstance& source, const ModelInstance& target) {
    const Schema& schema = *source.schema();
    if (h.components.size() != schema.objectCount()) return false;

    for (size_t o = 0; o < schema.objectCount(); o++) {
        if (h.components[o].size() != source.count(o)) return false;
        for (size_t v : h.components[o]) {
            if (v >= target.count(o)) return false;
        }
    }

    for (size_t r = 0; r < schema.relationCount(); r++) {
        const Relation& rel = schema.relation(r);
        for (size_t x = 0; x < source.count(rel.dom); x++) {
            size_t via_source = h(rel.codom, source.apply(r, x));
            size_t via_target = target.apply(r, h(rel.dom, x));
            if (via_source != via_target) return false;
        }
    }
    return true;
}

Homomorphism composeMaps(const Homomorphism& first, const Homomorphism& second) {
    Homomorphism out;
    out.components.resize(first.components.size());
    for (size_t o = 0; o < first.components.size(); o++) {
        out.components[o].reserve(first.components[o].size());
        for (size_t v : first.components[o]) {
            out.components[o].push_back(second(o, v));
        }
    }
    return out;
}

// ─── HomConstraint ─────────────────────────────────────────────

HomConstraint HomConstraint::requireTag(size_t object, std::string tag,
                                        std::optional<size_t> element) {
    HomConstraint c;
    c.kind = Kind::RequireTargetTag;
    c.object = object;
    c.source_element = element;
    c.tag = std::move(tag);
    return c;
}

HomConstraint HomConstraint::preserveTags(size_t object, std::optional<size_t> element) {
    HomConstraint c;
    c.kind = Kind::PreserveTags;
    c.object = object;
    c.source_element = element;
    return c;
}

HomConstraint HomConstraint::fixTarget(size_t object, size_t source_element, size_t target_element) {
    HomConstraint c;
    c.kind = Kind::FixTarget;
    c.object = object;
    c.source_element = source_element;
    c.target_element = target_element;
    return c;
}

HomConstraint HomConstraint::where(size_t object, std::function<bool(size_t, size_t)> fn) {
    HomConstraint c;
    c.kind = Kind::Predicate;
    c.object = object;
    c.predicate = std::move(fn);
    return c;
}

bool HomConstraint::admits(const ModelInstance& source, const ModelInstance& target,
                           size_t source_elem, size_t target_elem) const {
    switch (kind) {
        case Kind::RequireTargetTag:
            return target.hasTag(object, target_elem, tag);
        case Kind::PreserveTags: {
            const auto& have = target.tags(object, target_elem);
            const auto& need = source.tags(object, source_elem);
            return std::includes(have.begin(), have.end(), need.begin(), need.end());
        }
        case Kind::FixTarget:
            return target_elem == target_element;
        case Kind::Predicate:
            return !predicate || predicate(source_elem, target_elem);
    }
    return false;
}

std::string HomConstraint::describe() const {
    std::string where = "object " + std::to_string(object);
    if (source_element) where += " element " + std::to_string(*source_element);
    switch (kind) {
        case Kind::RequireTargetTag: return where + " requires tag '" + tag + "'";
        case Kind::PreserveTags:     return where + " preserves tags";
        case Kind::FixTarget:        return where + " fixed to " + std::to_string(target_element);
        case Kind::Predicate:        return where + " predicate";
    }
    return where;
}

} // namespace modex
