#pragma once

#include "homomorphism/homomorphism.hpp"
#include "model/model_instance.hpp"

#include <vector>

namespace modex {

/// A finite diagram of instances and homomorphisms between them.
struct ColimitDiagram {
    struct Arrow {
        size_t from = 0;
        size_t to = 0;
        Homomorphism map;
    };

    SchemaPtr schema;
    std::vector<InstancePtr> nodes;
    std::vector<Arrow> arrows;
};

struct ColimitResult {
    InstancePtr instance;
    std::vector<Homomorphism> legs;     // one per diagram node, into the colimit
};

/// Colimit (gluing) of a diagram, computed objectwise: disjoint union of
/// all nodes quotiented by the arrows. Relations are induced on the
/// classes and element tags are unioned. Element numbering follows the
/// first member of each class in node order, so the result is
/// deterministic.
ColimitResult computeColimit(const ColimitDiagram& diagram);

} // namespace modex
