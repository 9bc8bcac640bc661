#include "generators/hook_registry.hpp"
#include "common/errors.hpp"

#include <algorithm>

namespace modex {

namespace {

template <typename Map>
const typename Map::mapped_type* lookup(const Map& map, const std::string& name) {
    auto it = map.find(name);
    return it == map.end() ? nullptr : &it->second;
}

template <typename Map>
std::vector<std::string> sortedNames(const Map& map) {
    std::vector<std::string> names;
    for (const auto& [name, hook] : map) names.push_back(name);
    std::sort(names.begin(), names.end());
    return names;
}

size_t parseCount(const std::string& text, const std::string& key) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw ConfigError("parameter '" + key + "' must be a non-negative integer, got '" +
                          text + "'");
    }
    try {
        return static_cast<size_t>(std::stoull(text));
    } catch (const std::out_of_range&) {
        throw ConfigError("parameter '" + key + "' is too large: " + text);
    }
}

// n disjoint copies of the terminal instance: n elements per object,
// every relation maps k -> k.
InstancePtr terminalCopies(const SchemaPtr& schema, size_t n) {
    InstanceBuilder builder(schema);
    for (size_t o = 0; o < schema->objectCount(); o++) {
        builder.addElements(o, n);
    }
    for (size_t r = 0; r < schema->relationCount(); r++) {
        for (size_t k = 0; k < n; k++) {
            builder.setRelation(r, k, k);
        }
    }
    return builder.build();
}

} // namespace

void HookRegistry::registerFilter(const std::string& name, FilterFn fn) {
    filters_[name] = std::move(fn);
}

void HookRegistry::registerChase(const std::string& name, ChaseFn fn) {
    chases_[name] = std::move(fn);
}

void HookRegistry::registerLoss(const std::string& name, LossFactory factory) {
    losses_[name] = std::move(factory);
}

void HookRegistry::registerSource(const std::string& name, SourceFactory factory) {
    sources_[name] = std::move(factory);
}

const FilterFn* HookRegistry::filter(const std::string& name) const { return lookup(filters_, name); }
const ChaseFn* HookRegistry::chase(const std::string& name) const { return lookup(chases_, name); }
const LossFactory* HookRegistry::loss(const std::string& name) const { return lookup(losses_, name); }
const SourceFactory* HookRegistry::source(const std::string& name) const { return lookup(sources_, name); }

std::vector<std::string> HookRegistry::filterNames() const { return sortedNames(filters_); }
std::vector<std::string> HookRegistry::chaseNames() const { return sortedNames(chases_); }
std::vector<std::string> HookRegistry::lossNames() const { return sortedNames(losses_); }
std::vector<std::string> HookRegistry::sourceNames() const { return sortedNames(sources_); }

const std::string& requireParam(const HookParams& params, const std::string& key) {
    auto it = params.find(key);
    if (it == params.end()) {
        throw MissingFieldError("missing required parameter '" + key + "'");
    }
    return it->second;
}

HookRegistry HookRegistry::withDefaults() {
    HookRegistry registry;

    registry.registerFilter("nonempty", [](const ModelInstance& m) { return !m.isEmpty(); });

    registry.registerChase("strip_tags", [](const InstancePtr& m) -> std::optional<InstancePtr> {
        InstanceBuilder builder(m->schema());
        const Schema& schema = *m->schema();
        for (size_t o = 0; o < schema.objectCount(); o++) {
            builder.addElements(o, m->count(o));
        }
        for (size_t r = 0; r < schema.relationCount(); r++) {
            const auto& values = m->relationValues(r);
            for (size_t x = 0; x < values.size(); x++) {
                builder.setRelation(r, x, values[x]);
            }
        }
        return builder.build();
    });

    registry.registerLoss("size", [](const SchemaPtr&, const HookParams&) {
        return std::make_unique<SizeLoss>();
    });
    registry.registerLoss("object_count", [](const SchemaPtr& schema, const HookParams& params) {
        return std::make_unique<ObjectCountLoss>(schema->objectIndex(requireParam(params, "object")));
    });
    registry.registerLoss("dependency_score", [](const SchemaPtr&, const HookParams& params) {
        auto it = params.find("dependency");
        return std::make_unique<DependencyScoreLoss>(it == params.end() ? "" : it->second);
    });

    registry.registerSource("terminal_copies", [](const SchemaPtr& schema, const HookParams& params)
                                                   -> std::shared_ptr<const PrimitiveSource> {
        std::optional<size_t> limit;
        auto it = params.find("limit");
        if (it != params.end()) limit = parseCount(it->second, "limit");
        return std::make_shared<FunctionSource>(
            "terminal_copies",
            [schema](size_t index) -> std::optional<InstancePtr> {
                return terminalCopies(schema, index + 1);
            },
            limit);
    });

    return registry;
}

} // namespace modex
