#include "config/search_space_loader.hpp"
#include "common/errors.hpp"
#include "common/log.hpp"

#include <yaml-cpp/yaml.h>

namespace modex {

namespace {

std::string markOf(const YAML::Node& node) {
    const YAML::Mark mark = node.Mark();
    if (mark.is_null()) return "";
    return " (line " + std::to_string(mark.line + 1) + ", column " +
           std::to_string(mark.column + 1) + ")";
}

std::string indexed(const std::string& where, const char* field, size_t i) {
    return where + "." + field + "[" + std::to_string(i) + "]";
}

YAML::Node require(const YAML::Node& parent, const std::string& key, const std::string& where) {
    YAML::Node child = parent[key];
    if (!child) {
        throw MissingFieldError("missing required field '" + key + "'" + markOf(parent), where);
    }
    return child;
}

template <typename T>
T scalar(const YAML::Node& node, const std::string& where, const char* expected) {
    try {
        return node.as<T>();
    } catch (const YAML::BadConversion&) {
        throw ConfigError(std::string("expected ") + expected + markOf(node), where);
    }
}

template <typename T>
T scalarOr(const YAML::Node& parent, const std::string& key, T fallback,
           const std::string& where, const char* expected) {
    YAML::Node child = parent[key];
    if (!child) return fallback;
    return scalar<T>(child, where + "." + key, expected);
}

void requireSequence(const YAML::Node& node, const std::string& where) {
    if (!node.IsSequence()) {
        throw ConfigError("expected a list" + markOf(node), where);
    }
}

void requireMap(const YAML::Node& node, const std::string& where) {
    if (!node.IsMap()) {
        throw ConfigError("expected a mapping" + markOf(node), where);
    }
}

// Re-throw an unlocated ConfigError from schema or builder code at the
// position of `node`.
template <typename Fn>
auto located(const YAML::Node& node, const std::string& where, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const SchemaMismatchError& e) {
        if (!e.location().empty()) throw;
        throw SchemaMismatchError(e.detail() + markOf(node), where);
    } catch (const MissingFieldError& e) {
        if (!e.location().empty()) throw;
        throw MissingFieldError(e.detail() + markOf(node), where);
    } catch (const ConfigError& e) {
        if (!e.location().empty()) throw;
        throw ConfigError(e.detail() + markOf(node), where);
    }
}

HookParams parseParams(const YAML::Node& node, const std::string& where) {
    HookParams params;
    if (!node) return params;
    requireMap(node, where);
    for (const auto& entry : node) {
        params[entry.first.as<std::string>()] = scalar<std::string>(
            entry.second, where + "." + entry.first.as<std::string>(), "a scalar");
    }
    return params;
}

StrategyKind parseStrategy(const std::string& name, const YAML::Node& node, const std::string& where) {
    if (name == "auto") return StrategyKind::Auto;
    if (name == "exhaustive") return StrategyKind::Exhaustive;
    if (name == "backtracking") return StrategyKind::Backtracking;
    throw ConfigError("unknown strategy '" + name + "' (expected auto, exhaustive or backtracking)" +
                      markOf(node), where);
}

} // namespace

// ─── Instances and constraints ─────────────────────────────────

InstancePtr parseInstance(const YAML::Node& node, const SchemaPtr& schema, const std::string& where) {
    requireMap(node, where);
    InstanceBuilder builder(schema);

    if (YAML::Node counts = node["counts"]) {
        requireMap(counts, where + ".counts");
        for (const auto& entry : counts) {
            const std::string object = entry.first.as<std::string>();
            const std::string at = where + ".counts." + object;
            size_t n = scalar<size_t>(entry.second, at, "an element count");
            located(entry.first, at, [&] { return builder.addElements(object, n); });
        }
    }

    if (YAML::Node relations = node["relations"]) {
        requireMap(relations, where + ".relations");
        for (const auto& entry : relations) {
            const std::string relation = entry.first.as<std::string>();
            const std::string at = where + ".relations." + relation;
            requireSequence(entry.second, at);
            for (size_t x = 0; x < entry.second.size(); x++) {
                size_t to = scalar<size_t>(entry.second[x], at, "an element index");
                located(entry.second[x], at, [&] { builder.setRelation(relation, x, to); });
            }
        }
    }

    if (YAML::Node tags = node["tags"]) {
        requireMap(tags, where + ".tags");
        for (const auto& entry : tags) {
            const std::string object = entry.first.as<std::string>();
            const std::string at = where + ".tags." + object;
            requireMap(entry.second, at);
            for (const auto& element : entry.second) {
                size_t e = scalar<size_t>(element.first, at, "an element index");
                const std::string tag_at = at + "." + std::to_string(e);
                requireSequence(element.second, tag_at);
                for (const auto& tag : element.second) {
                    std::string name = scalar<std::string>(tag, tag_at, "a tag name");
                    located(tag, tag_at, [&] { builder.addTag(object, e, name); });
                }
            }
        }
    }

    return located(node, where, [&] { return builder.build(); });
}

ConstraintSet parseConstraints(const YAML::Node& node, const Schema& schema, const std::string& where) {
    ConstraintSet out;
    if (!node) return out;
    requireSequence(node, where);
    for (size_t i = 0; i < node.size(); i++) {
        const YAML::Node c = node[i];
        const std::string at = where + "[" + std::to_string(i) + "]";
        requireMap(c, at);

        const std::string object_name = scalar<std::string>(require(c, "object", at), at + ".object",
                                                            "an object name");
        size_t object = located(c["object"], at + ".object",
                                [&] { return schema.objectIndex(object_name); });
        std::optional<size_t> element;
        if (c["element"]) element = scalar<size_t>(c["element"], at + ".element", "an element index");

        if (c["require_tag"]) {
            out.push_back(HomConstraint::requireTag(
                object, scalar<std::string>(c["require_tag"], at + ".require_tag", "a tag name"),
                element));
        } else if (c["preserve_tags"]) {
            if (scalar<bool>(c["preserve_tags"], at + ".preserve_tags", "true or false")) {
                out.push_back(HomConstraint::preserveTags(object, element));
            }
        } else if (c["fix_target"]) {
            if (!element) {
                throw MissingFieldError("fix_target needs 'element'" + markOf(c), at);
            }
            out.push_back(HomConstraint::fixTarget(
                object, *element, scalar<size_t>(c["fix_target"], at + ".fix_target",
                                                 "an element index")));
        } else {
            throw ConfigError("constraint needs one of require_tag, preserve_tags, fix_target" +
                              markOf(c), at);
        }
    }
    return out;
}

// ─── SearchSpaceSpec ───────────────────────────────────────────

Schedule SearchSpaceSpec::buildSchedule() const {
    ScheduleOptions schedule_options;
    schedule_options.allow_multiple_roots = options.allow_multiple_roots;
    return DependencyScheduler::build(schema, generators, schedule_options);
}

// ─── SearchSpaceLoader ─────────────────────────────────────────

SearchSpaceLoader::SearchSpaceLoader(HookRegistry hooks)
    : hooks_(std::move(hooks)) {}

SearchSpaceSpec SearchSpaceLoader::loadFile(const std::string& path) const {
    YAML::Node doc;
    try {
        doc = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        throw ConfigError("cannot read search space '" + path + "'");
    } catch (const YAML::ParserException& e) {
        throw ConfigError(e.msg + " (line " + std::to_string(e.mark.line + 1) + ", column " +
                          std::to_string(e.mark.column + 1) + ")", path);
    }
    logger()->debug("loading search space from {}", path);
    return load(doc);
}

SearchSpaceSpec SearchSpaceLoader::loadString(const std::string& text) const {
    YAML::Node doc;
    try {
        doc = YAML::Load(text);
    } catch (const YAML::ParserException& e) {
        throw ConfigError(e.msg + " (line " + std::to_string(e.mark.line + 1) + ", column " +
                          std::to_string(e.mark.column + 1) + ")");
    }
    return load(doc);
}

SearchSpaceSpec SearchSpaceLoader::load(const YAML::Node& doc) const {
    requireMap(doc, "document");

    SearchSpaceSpec spec;
    spec.schema = parseSchema(require(doc, "schema", "document"));

    if (YAML::Node search = doc["search"]) {
        parseSearch(search, spec.options);
    }

    if (YAML::Node logging = doc["logging"]) {
        requireMap(logging, "logging");
        spec.log_level = scalarOr<std::string>(logging, "level", "info", "logging", "a level name");
        located(logging["level"], "logging.level", [&] { return parseLogLevel(spec.log_level); });
    }

    const YAML::Node generators = require(doc, "generators", "document");
    requireSequence(generators, "generators");
    for (size_t i = 0; i < generators.size(); i++) {
        spec.generators.push_back(
            parseGenerator(generators[i], spec.schema, "generators[" + std::to_string(i) + "]"));
    }
    return spec;
}

SchemaPtr SearchSpaceLoader::parseSchema(const YAML::Node& node) const {
    requireMap(node, "schema");
    auto schema = std::make_shared<Schema>(scalarOr<std::string>(node, "name", "schema", "schema",
                                                                 "a name"));

    const YAML::Node objects = require(node, "objects", "schema");
    requireSequence(objects, "schema.objects");
    for (size_t i = 0; i < objects.size(); i++) {
        const std::string at = "schema.objects[" + std::to_string(i) + "]";
        std::string name = scalar<std::string>(objects[i], at, "an object name");
        located(objects[i], at, [&] { return schema->addObject(name); });
    }

    if (YAML::Node relations = node["relations"]) {
        requireSequence(relations, "schema.relations");
        for (size_t i = 0; i < relations.size(); i++) {
            const YAML::Node r = relations[i];
            const std::string at = "schema.relations[" + std::to_string(i) + "]";
            requireMap(r, at);
            std::string name = scalar<std::string>(require(r, "name", at), at + ".name", "a name");
            std::string dom = scalar<std::string>(require(r, "dom", at), at + ".dom", "an object name");
            std::string codom = scalar<std::string>(require(r, "codom", at), at + ".codom",
                                                    "an object name");
            located(r, at, [&] { return schema->addRelation(name, dom, codom); });
        }
    }
    return schema;
}

void SearchSpaceLoader::parseSearch(const YAML::Node& node, SearchOptions& options) const {
    requireMap(node, "search");
    options.seed = scalarOr<uint64_t>(node, "seed", options.seed, "search", "an integer seed");
    options.iterations = scalarOr<size_t>(node, "iterations", options.iterations, "search",
                                          "a non-negative integer");
    options.max_seconds = scalarOr<double>(node, "max_seconds", options.max_seconds, "search",
                                           "a number of seconds");
    options.allow_multiple_roots = scalarOr<bool>(node, "allow_multiple_roots",
                                                  options.allow_multiple_roots, "search",
                                                  "true or false");
    options.checkpoint_every = scalarOr<size_t>(node, "checkpoint_every", options.checkpoint_every,
                                                "search", "a non-negative integer");

    if (YAML::Node hom = node["homomorphism"]) {
        const std::string at = "search.homomorphism";
        requireMap(hom, at);
        if (hom["strategy"]) {
            options.homomorphism.strategy = parseStrategy(
                scalar<std::string>(hom["strategy"], at + ".strategy", "a strategy name"),
                hom["strategy"], at + ".strategy");
        }
        options.homomorphism.injective = scalarOr<bool>(hom, "injective",
                                                        options.homomorphism.injective, at,
                                                        "true or false");
        options.homomorphism.exhaustive_limit = scalarOr<uint64_t>(
            hom, "exhaustive_limit", options.homomorphism.exhaustive_limit, at, "an integer");
        options.hom_budget.max_steps = scalarOr<uint64_t>(hom, "max_steps",
                                                          options.hom_budget.max_steps, at,
                                                          "an integer");
        options.hom_budget.max_seconds = scalarOr<double>(hom, "max_seconds",
                                                          options.hom_budget.max_seconds, at,
                                                          "a number of seconds");
    }
}

GeneratorDecl SearchSpaceLoader::parseGenerator(const YAML::Node& node, const SchemaPtr& schema,
                                                const std::string& where) const {
    requireMap(node, where);
    const std::string id = scalar<std::string>(require(node, "id", where), where + ".id", "an id");
    const YAML::Node kind_node = require(node, "kind", where);
    const std::string kind = scalar<std::string>(kind_node, where + ".kind", "a generator kind");

    GeneratorDecl decl;
    if (kind == "explicit") {
        const YAML::Node instances = require(node, "instances", where);
        requireSequence(instances, where + ".instances");
        std::vector<InstancePtr> list;
        for (size_t i = 0; i < instances.size(); i++) {
            list.push_back(parseInstance(instances[i], schema, indexed(where, "instances", i)));
        }
        decl = GeneratorDecl::primitive(id, std::make_shared<ExplicitSource>(std::move(list), id));
    } else if (kind == "source") {
        const YAML::Node source_node = require(node, "source", where);
        const std::string name = scalar<std::string>(source_node, where + ".source", "a source name");
        const SourceFactory* factory = hooks_.source(name);
        if (!factory) {
            throw DanglingReferenceError("unknown primitive source '" + name + "'" +
                                         markOf(source_node), where + ".source");
        }
        HookParams params = parseParams(node["params"], where + ".params");
        decl = GeneratorDecl::primitive(
            id, located(node, where + ".params", [&] { return (*factory)(schema, params); }));
    } else if (kind == "additive") {
        decl = GeneratorDecl::additive(id, parseWiring(require(node, "wiring", where), schema,
                                                       where + ".wiring"));
    } else if (kind == "multiplicative") {
        decl = GeneratorDecl::multiplicative(id, parseProduct(require(node, "product", where),
                                                              schema, where + ".product"));
    } else {
        throw ConfigError("unknown generator kind '" + kind +
                          "' (expected explicit, source, additive or multiplicative)" +
                          markOf(kind_node), where + ".kind");
    }

    if (YAML::Node sharing = node["sharing"]) {
        std::string name = scalar<std::string>(sharing, where + ".sharing", "shared or reentrant");
        decl.sharing = located(sharing, where + ".sharing", [&] { return parseSharing(name); });
    }
    decl.max_skips = scalarOr<size_t>(node, "max_skips", decl.max_skips, where,
                                      "a non-negative integer");

    if (YAML::Node constraints = node["constraints"]) {
        requireSequence(constraints, where + ".constraints");
        for (size_t i = 0; i < constraints.size(); i++) {
            decl.constraints.push_back(
                parseOutputConstraint(constraints[i], indexed(where, "constraints", i)));
        }
    }

    if (YAML::Node loss = node["loss"]) {
        decl.loss = parseLoss(loss, schema, where + ".loss");
    }
    return decl;
}

WiringPattern SearchSpaceLoader::parseWiring(const YAML::Node& node, const SchemaPtr& schema,
                                             const std::string& where) const {
    requireMap(node, where);
    WiringPattern wiring;
    wiring.allow_self_gluing = scalarOr<bool>(node, "allow_self_gluing", false, where,
                                              "true or false");

    if (YAML::Node boxes = node["boxes"]) {
        requireSequence(boxes, where + ".boxes");
        for (size_t i = 0; i < boxes.size(); i++) {
            const std::string at = indexed(where, "boxes", i);
            requireMap(boxes[i], at);
            Box box;
            box.id = scalar<std::string>(require(boxes[i], "id", at), at + ".id", "an id");
            box.generator = scalar<std::string>(require(boxes[i], "generator", at),
                                                at + ".generator", "a generator id");
            wiring.boxes.push_back(box);
        }
    }

    if (YAML::Node ports = node["ports"]) {
        requireSequence(ports, where + ".ports");
        for (size_t i = 0; i < ports.size(); i++) {
            const std::string at = indexed(where, "ports", i);
            requireMap(ports[i], at);
            Port port;
            port.id = scalar<std::string>(require(ports[i], "id", at), at + ".id", "an id");
            port.box = scalar<std::string>(require(ports[i], "box", at), at + ".box", "a box id");
            port.constraints = parseConstraints(ports[i]["constraints"], *schema, at + ".constraints");
            wiring.ports.push_back(std::move(port));
        }
    }

    if (YAML::Node junctions = node["junctions"]) {
        requireSequence(junctions, where + ".junctions");
        for (size_t i = 0; i < junctions.size(); i++) {
            const std::string at = indexed(where, "junctions", i);
            requireMap(junctions[i], at);
            Junction junction;
            junction.id = scalar<std::string>(require(junctions[i], "id", at), at + ".id", "an id");
            if (YAML::Node overlap = junctions[i]["overlap"]) {
                junction.overlap = parseInstance(overlap, schema, at + ".overlap");
            }
            wiring.junctions.push_back(std::move(junction));
        }
    }

    if (YAML::Node wires = node["wires"]) {
        requireSequence(wires, where + ".wires");
        for (size_t i = 0; i < wires.size(); i++) {
            const std::string at = indexed(where, "wires", i);
            requireMap(wires[i], at);
            Wire wire;
            wire.port = scalar<std::string>(require(wires[i], "port", at), at + ".port", "a port id");
            wire.junction = scalar<std::string>(require(wires[i], "junction", at),
                                                at + ".junction", "a junction id");
            wiring.wires.push_back(wire);
        }
    }
    return wiring;
}

ProductSpec SearchSpaceLoader::parseProduct(const YAML::Node& node, const SchemaPtr& schema,
                                            const std::string& where) const {
    requireMap(node, where);
    ProductSpec product;
    const YAML::Node dims = require(node, "dimensions", where);
    requireSequence(dims, where + ".dimensions");
    for (size_t i = 0; i < dims.size(); i++) {
        product.dimensions.push_back(
            scalar<std::string>(dims[i], indexed(where, "dimensions", i), "a generator id"));
    }
    if (YAML::Node base = node["base"]) {
        product.base = parseInstance(base, schema, where + ".base");
    }
    product.expand_inadmissible = scalarOr<bool>(node, "expand_inadmissible", true, where,
                                                 "true or false");
    return product;
}

std::shared_ptr<const LossEvaluator> SearchSpaceLoader::parseLoss(const YAML::Node& node,
                                                                  const SchemaPtr& schema,
                                                                  const std::string& where) const {
    requireMap(node, where);

    Direction direction = Direction::Minimize;
    if (YAML::Node dir = node["direction"]) {
        std::string name = scalar<std::string>(dir, where + ".direction", "minimize or maximize");
        if (name == "maximize") {
            direction = Direction::Maximize;
        } else if (name != "minimize") {
            throw ConfigError("unknown direction '" + name + "' (expected minimize or maximize)" +
                              markOf(dir), where + ".direction");
        }
    }
    auto evaluator = std::make_shared<LossEvaluator>(direction);

    auto addTerm = [&](const YAML::Node& term, const std::string& at) {
        const YAML::Node fn_node = require(term, "function", at);
        const std::string name = scalar<std::string>(fn_node, at + ".function", "a loss name");
        const LossFactory* factory = hooks_.loss(name);
        if (!factory) {
            throw DanglingReferenceError("unknown loss function '" + name + "'" + markOf(fn_node),
                                         at + ".function");
        }
        HookParams params = parseParams(term["params"], at + ".params");
        double weight = scalarOr<double>(term, "weight", 1.0, at, "a number");
        evaluator->addTerm(located(term, at, [&] { return (*factory)(schema, params); }), weight);
    };

    if (node["function"]) {
        addTerm(node, where);
    }
    if (YAML::Node terms = node["terms"]) {
        requireSequence(terms, where + ".terms");
        for (size_t i = 0; i < terms.size(); i++) {
            requireMap(terms[i], indexed(where, "terms", i));
            addTerm(terms[i], indexed(where, "terms", i));
        }
    }

    if (YAML::Node stop = node["stop"]) {
        const std::string at = where + ".stop";
        requireMap(stop, at);
        const YAML::Node kind_node = require(stop, "kind", at);
        const std::string kind = scalar<std::string>(kind_node, at + ".kind", "a stop kind");
        if (kind == "threshold") {
            std::string op = scalarOr<std::string>(stop, "op", "<=", at, "a comparison");
            Comparison cmp = located(stop, at + ".op", [&] { return parseComparison(op); });
            double value = scalar<double>(require(stop, "value", at), at + ".value", "a number");
            evaluator->setStopCriterion(StopCriterion::threshold(cmp, value));
        } else if (kind == "max_emitted") {
            evaluator->setStopCriterion(StopCriterion::maxEmitted(
                scalar<size_t>(require(stop, "count", at), at + ".count", "a count")));
        } else if (kind == "plateau") {
            evaluator->setStopCriterion(StopCriterion::plateau(
                scalar<size_t>(require(stop, "count", at), at + ".count", "a count")));
        } else {
            throw ConfigError("unknown stop kind '" + kind +
                              "' (expected threshold, max_emitted or plateau)" + markOf(kind_node),
                              at + ".kind");
        }
    }
    return evaluator;
}

OutputConstraint SearchSpaceLoader::parseOutputConstraint(const YAML::Node& node,
                                                          const std::string& where) const {
    requireMap(node, where);
    if (YAML::Node filter = node["filter"]) {
        std::string name = scalar<std::string>(filter, where + ".filter", "a filter name");
        const FilterFn* fn = hooks_.filter(name);
        if (!fn) {
            throw DanglingReferenceError("unknown filter '" + name + "'" + markOf(filter),
                                         where + ".filter");
        }
        return OutputConstraint::filterBy(name, *fn);
    }
    if (YAML::Node chase = node["chase"]) {
        std::string name = scalar<std::string>(chase, where + ".chase", "a chase name");
        const ChaseFn* fn = hooks_.chase(name);
        if (!fn) {
            throw DanglingReferenceError("unknown chase '" + name + "'" + markOf(chase),
                                         where + ".chase");
        }
        return OutputConstraint::chaseWith(name, *fn);
    }
    throw ConfigError("output constraint needs 'filter' or 'chase'" + markOf(node), where);
}

} // namespace modex
