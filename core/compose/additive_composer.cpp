#include "compose/additive_composer.hpp"
#include "compose/colimit.hpp"
#include "common/errors.hpp"
#include "common/log.hpp"

namespace modex {

AdditiveComposer::AdditiveComposer(SchemaPtr schema, const HomSearcher& searcher,
                                   SearchBudget budget)
    : schema_(std::move(schema)), searcher_(searcher), budget_(std::move(budget)) {}

GluingResult AdditiveComposer::compose(const WiringPattern& pattern,
                                       const std::vector<InstancePtr>& boxes,
                                       std::mt19937& rng) const {
    return compose(pattern, pattern.resolve(), boxes, rng);
}

GluingResult AdditiveComposer::compose(const WiringPattern& pattern,
                                       const ResolvedWiring& resolved,
                                       const std::vector<InstancePtr>& boxes,
                                       std::mt19937& rng) const {
    if (boxes.size() != pattern.boxes.size()) {
        throw CompositionError("additive composition needs " +
                               std::to_string(pattern.boxes.size()) + " box instances, got " +
                               std::to_string(boxes.size()));
    }

    GluingResult result;

    // Identity gluing.
    if (resolved.wires.empty() && boxes.size() == 1) {
        result.instance = boxes[0];
        result.legs.push_back(Homomorphism::identity(*boxes[0]));
        for (size_t p : resolved.box_ports[0]) {
            for (const auto& c : pattern.ports[p].constraints) {
                result.exposed.push_back(c);
            }
        }
        return result;
    }

    ColimitDiagram diagram;
    diagram.schema = schema_;
    diagram.nodes = boxes;

    // junction index -> node index in the diagram
    std::vector<size_t> junction_node(pattern.junctions.size(), 0);
    for (size_t j : resolved.used_junctions) {
        const InstancePtr& overlap = pattern.junctions[j].overlap;
        junction_node[j] = diagram.nodes.size();
        diagram.nodes.push_back(overlap ? overlap : ModelInstance::empty(schema_));
    }

    for (const auto& wire : resolved.wires) {
        const Port& port = pattern.ports[wire.port];
        const ModelInstance& overlap = *diagram.nodes[junction_node[wire.junction]];
        ColimitDiagram::Arrow arrow;
        arrow.from = junction_node[wire.junction];
        arrow.to = wire.box;
        arrow.map = searcher_.findOne(overlap, *boxes[wire.box], port.constraints, rng, budget_);
        diagram.arrows.push_back(std::move(arrow));
    }

    ColimitResult colimit = computeColimit(diagram);
    result.instance = colimit.instance;
    result.legs.assign(colimit.legs.begin(), colimit.legs.begin() + boxes.size());

    for (size_t b = 0; b < boxes.size(); b++) {
        for (size_t p : resolved.box_ports[b]) {
            for (auto& c : exposeConstraints(pattern.ports[p].constraints, result.legs[b])) {
                result.exposed.push_back(std::move(c));
            }
        }
    }

    logger()->trace("glued {} boxes along {} junctions -> {}", boxes.size(),
                    resolved.used_junctions.size(), result.instance->describe());
    return result;
}

ConstraintSet exposeConstraints(const ConstraintSet& constraints, const Homomorphism& leg) {
    ConstraintSet out;
    for (const auto& c : constraints) {
        switch (c.kind) {
            case HomConstraint::Kind::RequireTargetTag:
            case HomConstraint::Kind::PreserveTags:
                out.push_back(c);
                break;
            case HomConstraint::Kind::FixTarget: {
                HomConstraint moved = c;
                moved.target_element = leg(c.object, c.target_element);
                out.push_back(std::move(moved));
                break;
            }
            case HomConstraint::Kind::Predicate:
                break;
        }
    }
    return out;
}

} // namespace modex
