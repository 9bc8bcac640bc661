#include "explore/explorer.hpp"
#include "common/errors.hpp"
#include "common/hash.hpp"
#include "common/log.hpp"

#include <array>

namespace modex {

namespace {

uint32_t lo(uint64_t v) { return static_cast<uint32_t>(v); }
uint32_t hi(uint64_t v) { return static_cast<uint32_t>(v >> 32); }

std::string formatPosition(const std::vector<size_t>& position) {
    std::string out = "(";
    for (size_t i = 0; i < position.size(); i++) {
        if (i) out += ",";
        out += std::to_string(position[i]);
    }
    return out + ")";
}

} // namespace

std::string exhaustionReasonName(ExhaustionReason reason) {
    switch (reason) {
        case ExhaustionReason::None: return "none";
        case ExhaustionReason::Depleted: return "depleted";
        case ExhaustionReason::Stopped: return "stopped";
        case ExhaustionReason::LayerExhausted: return "layer_exhausted";
    }
    return "?";
}

ExhaustionReason parseExhaustionReason(const std::string& name) {
    if (name == "none") return ExhaustionReason::None;
    if (name == "depleted") return ExhaustionReason::Depleted;
    if (name == "stopped") return ExhaustionReason::Stopped;
    if (name == "layer_exhausted") return ExhaustionReason::LayerExhausted;
    throw CheckpointError("unknown exhaustion reason '" + name + "'");
}

Explorer::Explorer(const Schedule& schedule, ExplorerOptions options)
    : schedule_(schedule),
      options_(std::move(options)),
      searcher_(options_.homomorphism),
      additive_(schedule.schema(), searcher_, options_.hom_budget),
      multiplicative_(searcher_, options_.hom_budget) {}

uint32_t Explorer::attemptSeed(uint64_t search_seed, const std::string& key, uint64_t attempt) {
    Fnv1a h;
    h.add(key);
    const uint64_t k = h.value();
    std::seed_seq seq{lo(search_seed), hi(search_seed), lo(k), hi(k), lo(attempt), hi(attempt)};
    std::array<uint32_t, 1> out{};
    seq.generate(out.begin(), out.end());
    return out[0];
}

std::string Explorer::rootKey() const {
    return schedule_.generator(schedule_.root()).id;
}

std::vector<std::string> Explorer::rootKeys() const {
    std::vector<std::string> keys;
    for (GeneratorIndex r : schedule_.roots()) keys.push_back(schedule_.generator(r).id);
    return keys;
}

// ─── Stream registry ───────────────────────────────────────────

std::string Explorer::childKey(const std::string& parent_key, GeneratorIndex parent,
                               GeneratorIndex child, const std::string& slot) const {
    const GeneratorDecl& decl = schedule_.generator(child);
    switch (decl.sharing) {
        case Sharing::Shared:
            return decl.id;
        case Sharing::Reentrant:
            return parent_key + "/" + slot;
        case Sharing::Unspecified:
            break;
    }
    if (parent_key == schedule_.generator(parent).id) return decl.id;
    return parent_key + "/" + slot;
}

StreamState& Explorer::stream(const std::string& key) {
    auto it = streams_.find(key);
    if (it != streams_.end()) return it->second;
    auto generator = schedule_.find(key);
    if (!generator) {
        throw ModexError("unknown stream '" + key + "'");
    }
    return createStream(key, *generator, "");
}

StreamState& Explorer::createStream(const std::string& key, GeneratorIndex generator,
                                    const std::string& parent_key) {
    auto it = streams_.find(key);
    if (it != streams_.end()) {
        if (it->second.generator != generator) {
            throw ModexError("stream '" + key + "' already belongs to generator '" +
                             schedule_.generator(it->second.generator).id + "'");
        }
        return it->second;
    }

    StreamState& s = streams_[key];
    s.key = key;
    s.generator = generator;

    const GeneratorDecl& decl = schedule_.generator(generator);
    const auto& deps = schedule_.dependencies(generator);
    if (std::holds_alternative<PrimitiveSpec>(decl.kind)) {
        s.cursor = PrimitiveCursor{};
    } else if (const auto* additive = std::get_if<AdditiveSpec>(&decl.kind)) {
        s.cursor = AdditiveCursor{};
        for (size_t b = 0; b < deps.size(); b++) {
            s.children.push_back(childKey(key, generator, deps[b], additive->wiring.boxes[b].id));
        }
    } else {
        s.cursor = ProductCursor{};
        for (size_t d = 0; d < deps.size(); d++) {
            s.children.push_back(childKey(key, generator, deps[d], "dim" + std::to_string(d)));
        }
    }

    for (size_t slot = 0; slot < s.children.size(); slot++) {
        createStream(s.children[slot], deps[slot], key);
    }

    if (!parent_key.empty()) {
        logger()->trace("stream '{}' ({}) opened under '{}'", key, decl.id, parent_key);
    }
    return s;
}

std::vector<std::string> Explorer::streamKeys() const {
    std::vector<std::string> keys;
    keys.reserve(streams_.size());
    for (const auto& [key, s] : streams_) keys.push_back(key);
    return keys;
}

const StreamState& Explorer::state(const std::string& key) { return stream(key); }
const History& Explorer::history(const std::string& key) { return stream(key).history; }
bool Explorer::exhausted(const std::string& key) { return stream(key).exhausted(); }
ExhaustionReason Explorer::reason(const std::string& key) { return stream(key).reason; }

uint64_t Explorer::drawCount(const std::string& generator_id) const {
    auto it = draws_.find(generator_id);
    return it == draws_.end() ? 0 : it->second;
}

// ─── Pulling ───────────────────────────────────────────────────

std::optional<InstancePtr> Explorer::next(const std::string& key) {
    StreamState& s = stream(key);
    if (s.exhausted()) return std::nullopt;
    try {
        return advance(s);
    } catch (const LayerExhausted& e) {
        if (e.stream() != s.key) throw;
        s.reason = ExhaustionReason::LayerExhausted;
        logger()->warn("stream '{}': {} consecutive candidates rejected, giving up",
                       s.key, s.consecutive_skips);
        return std::nullopt;
    }
}

std::optional<InstancePtr> Explorer::at(const std::string& key, size_t k) {
    StreamState& s = stream(key);
    while (s.history.size() <= k && !s.exhausted()) {
        next(key);
    }
    if (k < s.history.size()) return s.history[k].instance;
    return std::nullopt;
}

std::optional<InstancePtr> Explorer::advance(StreamState& s) {
    const GeneratorDecl& decl = schedule_.generator(s.generator);

    while (true) {
        std::vector<size_t> position;
        uint32_t seed = 0;
        std::optional<Candidate> candidate;
        try {
            if (std::holds_alternative<PrimitiveCursor>(s.cursor)) {
                candidate = nextPrimitive(s, position);
            } else if (std::holds_alternative<AdditiveCursor>(s.cursor)) {
                candidate = nextAdditive(s, position, seed);
            } else {
                candidate = nextProduct(s, position, seed);
            }
        } catch (const CompositionError& e) {
            recordSkip(s, formatPosition(position) + ": " + e.what());
            continue;
        }

        if (!candidate) {
            logger()->debug("stream '{}' {} after {} emissions", s.key,
                            exhaustionReasonName(s.reason), s.history.size());
            return std::nullopt;
        }

        std::string rejected_by;
        auto accepted = applyOutputConstraints(decl, candidate->instance, rejected_by);
        if (!accepted) {
            recordSkip(s, formatPosition(position) + ": rejected by '" + rejected_by + "'");
            continue;
        }
        candidate->instance = *accepted;
        accept(s, *candidate, std::move(position), seed);
        return s.history.back().instance;
    }
}

std::optional<Explorer::Candidate> Explorer::nextPrimitive(StreamState& s,
                                                           std::vector<size_t>& position) {
    auto& cursor = std::get<PrimitiveCursor>(s.cursor);
    const GeneratorDecl& decl = schedule_.generator(s.generator);
    const auto& spec = std::get<PrimitiveSpec>(decl.kind);

    std::optional<InstancePtr> drawn = spec.source->at(cursor.index);
    if (!drawn) {
        s.reason = ExhaustionReason::Depleted;
        return std::nullopt;
    }
    if (!*drawn) {
        throw ModexError("source '" + spec.source->name() + "' returned a null instance at index " +
                         std::to_string(cursor.index));
    }
    if (*(*drawn)->schema() != *schedule_.schema()) {
        throw SchemaMismatchError("source '" + spec.source->name() +
                                  "' produced an instance of schema '" +
                                  (*drawn)->schema()->name() + "'");
    }
    draws_[decl.id]++;
    position = {cursor.index};
    cursor.index++;
    return Candidate{*drawn, {}};
}

std::optional<Explorer::Candidate> Explorer::nextAdditive(StreamState& s,
                                                          std::vector<size_t>& position,
                                                          uint32_t& seed) {
    auto& cursor = std::get<AdditiveCursor>(s.cursor);
    const size_t n = s.children.size();

    bool more = true;
    if (!cursor.started) {
        cursor.started = true;
        cursor.odometer.assign(n, 0);
        for (size_t b = 0; b < n && more; b++) {
            more = available(s.children[b], 0);
        }
    } else if (n == 0) {
        more = false;
    } else {
        // Odometer step: the last box turns fastest, carries move outward.
        more = false;
        size_t i = n;
        while (i > 0) {
            i--;
            cursor.odometer[i]++;
            if (available(s.children[i], cursor.odometer[i])) {
                more = true;
                break;
            }
            cursor.odometer[i] = 0;
        }
    }
    if (!more) {
        s.reason = ExhaustionReason::Depleted;
        return std::nullopt;
    }

    position = cursor.odometer;
    seed = attemptSeed(options_.seed, s.key, s.attempts++);
    return composeAdditive(s, position, seed);
}

std::optional<Explorer::Candidate> Explorer::nextProduct(StreamState& s,
                                                         std::vector<size_t>& position,
                                                         uint32_t& seed) {
    auto& cursor = std::get<ProductCursor>(s.cursor);
    const GeneratorDecl& decl = schedule_.generator(s.generator);
    const ProductSpec& spec = std::get<MultiplicativeSpec>(decl.kind).product;
    const size_t k = s.children.size();

    if (!cursor.started) {
        cursor.started = true;
        std::vector<size_t> origin(k, 0);
        bool ok = true;
        for (size_t d = 0; d < k && ok; d++) {
            ok = available(s.children[d], 0);
        }
        if (ok) {
            cursor.frontier.push_back(origin);
            cursor.visited.insert(origin);
        }
    }
    if (cursor.frontier.empty()) {
        s.reason = ExhaustionReason::Depleted;
        return std::nullopt;
    }

    position = cursor.frontier.front();
    cursor.frontier.pop_front();

    auto expand = [&](const std::vector<size_t>& node) {
        for (size_t d = 0; d < k; d++) {
            std::vector<size_t> neighbour = node;
            neighbour[d]++;
            if (cursor.visited.count(neighbour)) continue;
            if (!available(s.children[d], neighbour[d])) continue;
            cursor.visited.insert(neighbour);
            cursor.frontier.push_back(std::move(neighbour));
        }
    };

    seed = attemptSeed(options_.seed, s.key, s.attempts++);
    Candidate candidate;
    try {
        candidate = composeProduct(s, position, seed);
    } catch (const CompositionError&) {
        if (spec.expand_inadmissible) expand(position);
        throw;
    }
    expand(position);
    return candidate;
}

// ─── Composition from a recorded position ──────────────────────

Explorer::Candidate Explorer::composeAdditive(const StreamState& s,
                                              const std::vector<size_t>& position,
                                              uint32_t seed) const {
    const auto& spec = std::get<AdditiveSpec>(schedule_.generator(s.generator).kind);
    const ResolvedWiring& resolved = schedule_.wiring(s.generator);
    std::vector<InstancePtr> boxes;
    std::vector<ConstraintSet> inherited(s.children.size());
    boxes.reserve(s.children.size());
    bool any_inherited = false;
    for (size_t b = 0; b < s.children.size(); b++) {
        const StreamState& child = streams_.at(s.children[b]);
        const size_t k = position.at(b);
        boxes.push_back(child.history.at(k).instance);
        if (k >= child.interfaces.size()) continue;
        // Element-free tag constraints of a nested composite's ports still
        // hold for whatever junction is wired into it here.
        for (const auto& c : child.interfaces[k]) {
            if (c.source_element) continue;
            if (c.kind == HomConstraint::Kind::RequireTargetTag ||
                c.kind == HomConstraint::Kind::PreserveTags) {
                inherited[b].push_back(c);
                any_inherited = true;
            }
        }
    }

    std::mt19937 rng(seed);
    if (!any_inherited) {
        GluingResult glued = additive_.compose(spec.wiring, resolved, boxes, rng);
        return Candidate{glued.instance, std::move(glued.exposed)};
    }
    WiringPattern pattern = spec.wiring;
    std::vector<bool> extended(pattern.ports.size(), false);
    for (const auto& wire : resolved.wires) {
        if (extended[wire.port]) continue;
        extended[wire.port] = true;
        auto& constraints = pattern.ports[wire.port].constraints;
        constraints.insert(constraints.end(), inherited[wire.box].begin(),
                           inherited[wire.box].end());
    }
    GluingResult glued = additive_.compose(pattern, resolved, boxes, rng);
    return Candidate{glued.instance, std::move(glued.exposed)};
}

Explorer::Candidate Explorer::composeProduct(const StreamState& s,
                                             const std::vector<size_t>& position,
                                             uint32_t seed) const {
    const auto& spec = std::get<MultiplicativeSpec>(schedule_.generator(s.generator).kind);
    InstancePtr base = spec.product.base ? spec.product.base
                                         : ModelInstance::terminal(schedule_.schema());
    std::vector<InstancePtr> dimensions;
    dimensions.reserve(s.children.size());
    for (size_t d = 0; d < s.children.size(); d++) {
        dimensions.push_back(streams_.at(s.children[d]).history.at(position.at(d)).instance);
    }
    std::mt19937 rng(seed);
    ProductResult product = multiplicative_.compose(*base, dimensions, rng);
    return Candidate{product.instance, {}};
}

// ─── Output pipeline ───────────────────────────────────────────

std::optional<InstancePtr> Explorer::applyOutputConstraints(const GeneratorDecl& decl,
                                                            InstancePtr candidate,
                                                            std::string& rejected_by) const {
    for (const auto& c : decl.constraints) {
        if (c.kind != OutputConstraint::Kind::Chase) continue;
        auto out = c.apply(candidate);
        if (!out || !*out) {
            rejected_by = c.name;
            return std::nullopt;
        }
        candidate = *out;
    }
    for (const auto& c : decl.constraints) {
        if (c.kind != OutputConstraint::Kind::Filter) continue;
        if (!c.apply(candidate)) {
            rejected_by = c.name;
            return std::nullopt;
        }
    }
    return candidate;
}

LossContext Explorer::lossContext(const StreamState& s) const {
    LossContext context;
    const GeneratorDecl& decl = schedule_.generator(s.generator);
    if (const auto* additive = std::get_if<AdditiveSpec>(&decl.kind)) {
        for (size_t b = 0; b < s.children.size(); b++) {
            context.addDependency(additive->wiring.boxes[b].id, &streams_.at(s.children[b]).history);
        }
    } else if (const auto* product = std::get_if<MultiplicativeSpec>(&decl.kind)) {
        for (size_t d = 0; d < s.children.size(); d++) {
            context.addDependency(product->product.dimensions[d], &streams_.at(s.children[d]).history);
        }
    }
    return context;
}

std::optional<double> Explorer::score(const StreamState& s, const ModelInstance& instance) const {
    const GeneratorDecl& decl = schedule_.generator(s.generator);
    if (!decl.loss) return std::nullopt;
    return decl.loss->evaluate(instance, lossContext(s));
}

void Explorer::recordSkip(StreamState& s, const std::string& why) {
    s.consecutive_skips++;
    logger()->debug("stream '{}': skipped {}", s.key, why);
    if (s.consecutive_skips > schedule_.generator(s.generator).max_skips) {
        throw LayerExhausted(s.key);
    }
}

void Explorer::accept(StreamState& s, const Candidate& candidate, std::vector<size_t> position,
                      uint32_t seed) {
    const GeneratorDecl& decl = schedule_.generator(s.generator);
    s.consecutive_skips = 0;

    std::optional<double> value = score(s, *candidate.instance);
    s.history.push_back({candidate.instance, value});
    s.provenance.push_back({std::move(position), seed, value});
    s.interfaces.push_back(candidate.exposed);

    if (decl.loss && decl.loss->shouldStop(s.history)) {
        s.reason = ExhaustionReason::Stopped;
        logger()->debug("stream '{}' stopped by {} after {} emissions", s.key,
                        decl.loss->stopCriterion().describe(), s.history.size());
    }
}

} // namespace modex
