#include "schedule/dependency_scheduler.hpp"
#include "common/errors.hpp"
#include "common/log.hpp"

#include <algorithm>

namespace modex {

namespace {

std::string at(GeneratorIndex i) {
    return "generators[" + std::to_string(i) + "]";
}

void checkInstanceSchema(const InstancePtr& instance, const Schema& schema,
                         const std::string& location) {
    if (instance && instance->schema().get() != &schema && *instance->schema() != schema) {
        throw SchemaMismatchError("instance does not conform to schema '" + schema.name() + "'",
                                  location);
    }
}

void checkPortConstraints(const ConstraintSet& constraints, const ModelInstance* overlap,
                          const Schema& schema, const std::string& location) {
    for (size_t c = 0; c < constraints.size(); c++) {
        const HomConstraint& hc = constraints[c];
        const std::string where = location + ".constraints[" + std::to_string(c) + "]";
        if (hc.object >= schema.objectCount()) {
            throw SchemaMismatchError("constraint on unknown object index " +
                                      std::to_string(hc.object), where);
        }
        size_t available = overlap ? overlap->count(hc.object) : 0;
        if (hc.source_element && *hc.source_element >= available) {
            throw SchemaMismatchError("constraint names overlap element " +
                                      std::to_string(*hc.source_element) + " of '" +
                                      schema.objectName(hc.object) + "' which does not exist",
                                      where);
        }
    }
}

} // namespace

std::optional<GeneratorIndex> Schedule::find(const std::string& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

GeneratorIndex Schedule::indexOf(const std::string& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        throw DanglingReferenceError("unknown generator '" + id + "'");
    }
    return it->second;
}

GeneratorIndex Schedule::root() const {
    if (roots_.size() != 1) {
        std::vector<std::string> ids;
        for (auto r : roots_) ids.push_back(generators_[r].id);
        throw MultipleRootsError(ids);
    }
    return roots_.front();
}

const ResolvedWiring& Schedule::wiring(GeneratorIndex i) const {
    auto it = wirings_.find(i);
    if (it == wirings_.end()) {
        throw ModexError("generator '" + generators_.at(i).id + "' is not additive");
    }
    return it->second;
}

Schedule DependencyScheduler::build(SchemaPtr schema, std::vector<GeneratorDecl> generators,
                                    ScheduleOptions options) {
    if (!schema) {
        throw MissingFieldError("missing schema");
    }
    if (generators.empty()) {
        throw MissingFieldError("no generators declared", "generators");
    }

    Schedule schedule;
    schedule.schema_ = std::move(schema);
    schedule.generators_ = std::move(generators);

    const size_t n = schedule.generators_.size();
    for (GeneratorIndex i = 0; i < n; i++) {
        const std::string& id = schedule.generators_[i].id;
        if (id.empty()) {
            throw MissingFieldError("missing required field 'id'", at(i));
        }
        if (id.find('/') != std::string::npos) {
            throw ConfigError("generator id '" + id + "' must not contain '/'", at(i) + ".id");
        }
        if (!schedule.index_.emplace(id, i).second) {
            throw DuplicateIdError("duplicate generator id '" + id + "'", at(i));
        }
    }

    schedule.deps_.resize(n);
    schedule.dependents_.resize(n);
    for (GeneratorIndex i = 0; i < n; i++) {
        checkGenerator(schedule, i);
        const GeneratorDecl& decl = schedule.generators_[i];
        if (const auto* additive = std::get_if<AdditiveSpec>(&decl.kind)) {
            schedule.wirings_.emplace(i, additive->wiring.resolve(at(i) + ".wiring"));
        }
        for (const auto& dep : decl.dependencies()) {
            GeneratorIndex d = schedule.index_.at(dep);
            schedule.deps_[i].push_back(d);
            auto& back = schedule.dependents_[d];
            if (std::find(back.begin(), back.end(), i) == back.end()) back.push_back(i);
        }
    }

    checkAcyclic(schedule);

    for (GeneratorIndex i = 0; i < n; i++) {
        if (schedule.dependents_[i].empty()) schedule.roots_.push_back(i);
    }
    if (schedule.roots_.size() > 1 && !options.allow_multiple_roots) {
        std::vector<std::string> ids;
        for (auto r : schedule.roots_) ids.push_back(schedule.generators_[r].id);
        throw MultipleRootsError(ids);
    }

    checkSharing(schedule);

    logger()->debug("schedule: {} generators, {} root(s)", n, schedule.roots_.size());
    return schedule;
}

void DependencyScheduler::checkGenerator(const Schedule& schedule, GeneratorIndex i) {
    const GeneratorDecl& decl = schedule.generators_[i];
    const Schema& schema = *schedule.schema_;

    auto requireGenerator = [&](const std::string& id, const std::string& where) {
        if (id.empty()) {
            throw MissingFieldError("missing required field 'generator'", where);
        }
        if (!schedule.index_.count(id)) {
            throw DanglingReferenceError("unknown generator '" + id + "'", where);
        }
    };

    if (const auto* primitive = std::get_if<PrimitiveSpec>(&decl.kind)) {
        if (!primitive->source) {
            throw MissingFieldError("primitive generator has no source", at(i));
        }
    } else if (const auto* additive = std::get_if<AdditiveSpec>(&decl.kind)) {
        const WiringPattern& wiring = additive->wiring;
        const std::string base = at(i) + ".wiring";
        for (size_t b = 0; b < wiring.boxes.size(); b++) {
            requireGenerator(wiring.boxes[b].generator,
                             base + ".boxes[" + std::to_string(b) + "]");
        }
        for (size_t j = 0; j < wiring.junctions.size(); j++) {
            checkInstanceSchema(wiring.junctions[j].overlap, schema,
                                base + ".junctions[" + std::to_string(j) + "]");
        }
        for (size_t w = 0; w < wiring.wires.size(); w++) {
            auto port = wiring.findPort(wiring.wires[w].port);
            auto junction = wiring.findJunction(wiring.wires[w].junction);
            if (!port || !junction) continue;   // reported by resolve()
            checkPortConstraints(wiring.ports[*port].constraints,
                                 wiring.junctions[*junction].overlap.get(), schema,
                                 base + ".ports[" + std::to_string(*port) + "]");
        }
    } else if (const auto* product = std::get_if<MultiplicativeSpec>(&decl.kind)) {
        const std::string base = at(i) + ".product";
        for (size_t d = 0; d < product->product.dimensions.size(); d++) {
            requireGenerator(product->product.dimensions[d],
                             base + ".dimensions[" + std::to_string(d) + "]");
        }
        checkInstanceSchema(product->product.base, schema, base + ".base");
    }
}

void DependencyScheduler::checkAcyclic(Schedule& schedule) {
    enum Color : char { White, Grey, Black };
    const size_t n = schedule.generators_.size();
    std::vector<Color> color(n, White);
    std::vector<GeneratorIndex> path;
    std::vector<GeneratorIndex> topo;

    // Iterative DFS: (node, next dependency to visit).
    for (GeneratorIndex start = 0; start < n; start++) {
        if (color[start] != White) continue;
        std::vector<std::pair<GeneratorIndex, size_t>> stack{{start, 0}};
        color[start] = Grey;
        path.push_back(start);

        while (!stack.empty()) {
            auto& [node, next] = stack.back();
            const auto& deps = schedule.deps_[node];
            if (next < deps.size()) {
                GeneratorIndex d = deps[next++];
                if (color[d] == Grey) {
                    auto from = std::find(path.begin(), path.end(), d);
                    std::vector<std::string> cycle;
                    for (auto it = from; it != path.end(); ++it) {
                        cycle.push_back(schedule.generators_[*it].id);
                    }
                    cycle.push_back(schedule.generators_[d].id);
                    throw CycleError(cycle);
                }
                if (color[d] == White) {
                    color[d] = Grey;
                    path.push_back(d);
                    stack.emplace_back(d, 0);
                }
            } else {
                color[node] = Black;
                topo.push_back(node);
                path.pop_back();
                stack.pop_back();
            }
        }
    }

    schedule.topo_ = std::move(topo);
}

void DependencyScheduler::checkSharing(const Schedule& schedule) {
    const size_t n = schedule.generators_.size();
    std::vector<size_t> slots(n, 0);
    for (GeneratorIndex i = 0; i < n; i++) {
        for (GeneratorIndex d : schedule.deps_[i]) slots[d]++;
    }
    for (GeneratorIndex i = 0; i < n; i++) {
        const GeneratorDecl& decl = schedule.generators_[i];
        if (slots[i] > 1 && decl.sharing == Sharing::Unspecified) {
            throw SharingPolicyError("generator '" + decl.id + "' is referenced from " +
                                     std::to_string(slots[i]) +
                                     " slots and must be declared shared or reentrant",
                                     at(i));
        }
    }
}

} // namespace modex
