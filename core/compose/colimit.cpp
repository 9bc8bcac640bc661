#include "compose/colimit.hpp"
#include "common/errors.hpp"

#include <limits>
#include <numeric>
#include <utility>

namespace modex {

namespace {

class DisjointSets {
public:
    explicit DisjointSets(size_t n) : parent_(n) {
        std::iota(parent_.begin(), parent_.end(), 0);
    }

    size_t find(size_t x) {
        while (parent_[x] != x) {
            parent_[x] = parent_[parent_[x]];
            x = parent_[x];
        }
        return x;
    }

    void unite(size_t a, size_t b) {
        a = find(a);
        b = find(b);
        if (a == b) return;
        // Smaller index stays the root.
        if (b < a) std::swap(a, b);
        parent_[b] = a;
    }

private:
    std::vector<size_t> parent_;
};

} // namespace

ColimitResult computeColimit(const ColimitDiagram& diagram) {
    const Schema& schema = *diagram.schema;
    const size_t objects = schema.objectCount();
    const size_t n = diagram.nodes.size();
    constexpr size_t kNone = std::numeric_limits<size_t>::max();

    for (const auto& node : diagram.nodes) {
        if (node->schema() != diagram.schema && *node->schema() != schema) {
            throw SchemaMismatchError("colimit node does not conform to schema '" +
                                      schema.name() + "'");
        }
    }
    for (const auto& arrow : diagram.arrows) {
        if (arrow.from >= n || arrow.to >= n) {
            throw CompositionError("colimit arrow refers to a missing node");
        }
    }

    // offset[o][i]: position of node i's elements in the disjoint union of object o.
    std::vector<std::vector<size_t>> offset(objects, std::vector<size_t>(n + 1, 0));
    for (size_t o = 0; o < objects; o++) {
        for (size_t i = 0; i < n; i++) {
            offset[o][i + 1] = offset[o][i] + diagram.nodes[i]->count(o);
        }
    }

    // class_of[o][u]: element of the colimit for disjoint-union element u.
    std::vector<std::vector<size_t>> class_of(objects);
    std::vector<std::vector<std::pair<size_t, size_t>>> representative(objects);

    for (size_t o = 0; o < objects; o++) {
        DisjointSets sets(offset[o][n]);
        for (const auto& arrow : diagram.arrows) {
            const auto& component = arrow.map.components.at(o);
            for (size_t x = 0; x < component.size(); x++) {
                sets.unite(offset[o][arrow.from] + x, offset[o][arrow.to] + component[x]);
            }
        }

        std::vector<size_t> root_class(offset[o][n], kNone);
        class_of[o].resize(offset[o][n]);
        for (size_t i = 0; i < n; i++) {
            for (size_t x = 0; x < diagram.nodes[i]->count(o); x++) {
                size_t u = offset[o][i] + x;
                size_t root = sets.find(u);
                if (root_class[root] == kNone) {
                    root_class[root] = representative[o].size();
                    representative[o].emplace_back(i, x);
                }
                class_of[o][u] = root_class[root];
            }
        }
    }

    InstanceBuilder builder(diagram.schema);
    for (size_t o = 0; o < objects; o++) {
        builder.addElements(o, representative[o].size());
    }

    for (size_t r = 0; r < schema.relationCount(); r++) {
        const Relation& rel = schema.relation(r);
        for (size_t c = 0; c < representative[rel.dom].size(); c++) {
            auto [node, x] = representative[rel.dom][c];
            size_t image = diagram.nodes[node]->apply(r, x);
            builder.setRelation(r, c, class_of[rel.codom][offset[rel.codom][node] + image]);
        }
    }

    for (size_t o = 0; o < objects; o++) {
        for (size_t i = 0; i < n; i++) {
            for (size_t x = 0; x < diagram.nodes[i]->count(o); x++) {
                for (const auto& tag : diagram.nodes[i]->tags(o, x)) {
                    builder.addTag(o, class_of[o][offset[o][i] + x], tag);
                }
            }
        }
    }

    ColimitResult result;
    result.instance = builder.build();
    result.legs.resize(n);
    for (size_t i = 0; i < n; i++) {
        result.legs[i].components.resize(objects);
        for (size_t o = 0; o < objects; o++) {
            auto& component = result.legs[i].components[o];
            component.resize(diagram.nodes[i]->count(o));
            for (size_t x = 0; x < component.size(); x++) {
                component[x] = class_of[o][offset[o][i] + x];
            }
        }
    }
    return result;
}

} // namespace modex
