#include "compose/limit.hpp"
#include "common/errors.hpp"

#include <map>

namespace modex {

namespace {

using Key = std::vector<size_t>;   // (base element, x_1, ..., x_k)

// Enumerate the fibre of one base element: every tuple picking one
// element of buckets[i] for each factor, first factor slowest.
void enumerateFibre(const std::vector<const std::vector<size_t>*>& buckets, size_t b,
                    std::vector<Key>& out) {
    for (const auto* bucket : buckets) {
        if (bucket->empty()) return;
    }
    std::vector<size_t> pos(buckets.size(), 0);
    while (true) {
        Key key;
        key.reserve(buckets.size() + 1);
        key.push_back(b);
        for (size_t i = 0; i < buckets.size(); i++) {
            key.push_back((*buckets[i])[pos[i]]);
        }
        out.push_back(std::move(key));

        size_t i = buckets.size();
        while (i > 0) {
            i--;
            if (++pos[i] < buckets[i]->size()) break;
            pos[i] = 0;
            if (i == 0) return;
        }
        if (buckets.empty()) return;
    }
}

} // namespace

PullbackResult computePullback(const ModelInstance& base,
                               const std::vector<InstancePtr>& factors,
                               const std::vector<Homomorphism>& slices) {
    if (factors.size() != slices.size()) {
        throw CompositionError("pullback needs one slice per factor");
    }
    const SchemaPtr& schema = base.schema();
    const size_t objects = schema->objectCount();
    const size_t k = factors.size();

    std::vector<std::vector<Key>> elements(objects);
    std::vector<std::map<Key, size_t>> index(objects);

    for (size_t o = 0; o < objects; o++) {
        // buckets[i][b]: elements of factor i over base element b
        std::vector<std::vector<std::vector<size_t>>> buckets(k);
        for (size_t i = 0; i < k; i++) {
            buckets[i].resize(base.count(o));
            for (size_t x = 0; x < factors[i]->count(o); x++) {
                buckets[i][slices[i](o, x)].push_back(x);
            }
        }

        for (size_t b = 0; b < base.count(o); b++) {
            std::vector<const std::vector<size_t>*> fibre(k);
            for (size_t i = 0; i < k; i++) fibre[i] = &buckets[i][b];
            enumerateFibre(fibre, b, elements[o]);
        }
        for (size_t e = 0; e < elements[o].size(); e++) {
            index[o][elements[o][e]] = e;
        }
    }

    InstanceBuilder builder(schema);
    for (size_t o = 0; o < objects; o++) {
        builder.addElements(o, elements[o].size());
    }

    for (size_t r = 0; r < schema->relationCount(); r++) {
        const Relation& rel = schema->relation(r);
        for (size_t e = 0; e < elements[rel.dom].size(); e++) {
            const Key& key = elements[rel.dom][e];
            Key image;
            image.reserve(k + 1);
            image.push_back(base.apply(r, key[0]));
            for (size_t i = 0; i < k; i++) {
                image.push_back(factors[i]->apply(r, key[i + 1]));
            }
            auto it = index[rel.codom].find(image);
            if (it == index[rel.codom].end()) {
                throw CompositionError("pullback: slice of relation '" + rel.name +
                                       "' does not commute");
            }
            builder.setRelation(r, e, it->second);
        }
    }

    for (size_t o = 0; o < objects; o++) {
        for (size_t e = 0; e < elements[o].size(); e++) {
            for (size_t i = 0; i < k; i++) {
                for (const auto& tag : factors[i]->tags(o, elements[o][e][i + 1])) {
                    builder.addTag(o, e, tag);
                }
            }
        }
    }

    PullbackResult result;
    result.instance = builder.build();
    result.projections.resize(k);
    for (size_t i = 0; i < k; i++) {
        result.projections[i].components.resize(objects);
        for (size_t o = 0; o < objects; o++) {
            auto& component = result.projections[i].components[o];
            component.reserve(elements[o].size());
            for (const auto& key : elements[o]) {
                component.push_back(key[i + 1]);
            }
        }
    }
    return result;
}

} // namespace modex
