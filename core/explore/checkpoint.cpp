#include "explore/checkpoint.hpp"
#include "common/errors.hpp"
#include "common/log.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace modex {

namespace {

constexpr int kFormatVersion = 1;

void emitTuple(YAML::Emitter& out, const std::vector<size_t>& tuple) {
    out << YAML::Flow << YAML::BeginSeq;
    for (size_t v : tuple) out << v;
    out << YAML::EndSeq;
}

void emitCursor(YAML::Emitter& out, const Cursor& cursor) {
    out << YAML::Key << "cursor" << YAML::Value << YAML::BeginMap;
    if (const auto* p = std::get_if<PrimitiveCursor>(&cursor)) {
        out << YAML::Key << "kind" << YAML::Value << "primitive";
        out << YAML::Key << "index" << YAML::Value << p->index;
    } else if (const auto* a = std::get_if<AdditiveCursor>(&cursor)) {
        out << YAML::Key << "kind" << YAML::Value << "additive";
        out << YAML::Key << "started" << YAML::Value << a->started;
        out << YAML::Key << "odometer" << YAML::Value;
        emitTuple(out, a->odometer);
    } else if (const auto* m = std::get_if<ProductCursor>(&cursor)) {
        out << YAML::Key << "kind" << YAML::Value << "product";
        out << YAML::Key << "started" << YAML::Value << m->started;
        out << YAML::Key << "frontier" << YAML::Value << YAML::BeginSeq;
        for (const auto& node : m->frontier) emitTuple(out, node);
        out << YAML::EndSeq;
        out << YAML::Key << "visited" << YAML::Value << YAML::BeginSeq;
        for (const auto& node : m->visited) emitTuple(out, node);
        out << YAML::EndSeq;
    }
    out << YAML::EndMap;
}

std::vector<size_t> readTuple(const YAML::Node& node) {
    std::vector<size_t> tuple;
    for (const auto& v : node) tuple.push_back(v.as<size_t>());
    return tuple;
}

Cursor readCursor(const YAML::Node& node, const Cursor& expected, const std::string& key) {
    const std::string kind = node["kind"].as<std::string>();
    if (std::holds_alternative<PrimitiveCursor>(expected) && kind == "primitive") {
        PrimitiveCursor c;
        c.index = node["index"].as<size_t>();
        return c;
    }
    if (std::holds_alternative<AdditiveCursor>(expected) && kind == "additive") {
        AdditiveCursor c;
        c.started = node["started"].as<bool>();
        c.odometer = readTuple(node["odometer"]);
        return c;
    }
    if (std::holds_alternative<ProductCursor>(expected) && kind == "product") {
        ProductCursor c;
        c.started = node["started"].as<bool>();
        for (const auto& n : node["frontier"]) c.frontier.push_back(readTuple(n));
        for (const auto& n : node["visited"]) c.visited.insert(readTuple(n));
        return c;
    }
    throw CheckpointError("stream '" + key + "': cursor kind '" + kind +
                          "' does not match its generator");
}

YAML::Node require(const YAML::Node& node, const std::string& field, const std::string& where) {
    YAML::Node child = node[field];
    if (!child) {
        throw CheckpointError(where + ": missing field '" + field + "'");
    }
    return child;
}

} // namespace

std::string Checkpoint::toYaml(const Explorer& explorer) {
    const Schedule& schedule = explorer.schedule();

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "version" << YAML::Value << kFormatVersion;
    out << YAML::Key << "schema" << YAML::Value << schedule.schema()->name();
    out << YAML::Key << "seed" << YAML::Value << explorer.options().seed;

    out << YAML::Key << "generators" << YAML::Value << YAML::Flow << YAML::BeginSeq;
    for (size_t i = 0; i < schedule.size(); i++) out << schedule.generator(i).id;
    out << YAML::EndSeq;

    std::vector<std::pair<std::string, uint64_t>> draws(explorer.draws_.begin(),
                                                        explorer.draws_.end());
    std::sort(draws.begin(), draws.end());
    out << YAML::Key << "draws" << YAML::Value << YAML::BeginMap;
    for (const auto& [id, count] : draws) out << YAML::Key << id << YAML::Value << count;
    out << YAML::EndMap;

    out << YAML::Key << "streams" << YAML::Value << YAML::BeginSeq;
    for (const auto& [key, s] : explorer.streams_) {
        out << YAML::BeginMap;
        out << YAML::Key << "key" << YAML::Value << key;
        out << YAML::Key << "generator" << YAML::Value << schedule.generator(s.generator).id;
        out << YAML::Key << "attempts" << YAML::Value << s.attempts;
        out << YAML::Key << "consecutive_skips" << YAML::Value << s.consecutive_skips;
        out << YAML::Key << "reason" << YAML::Value << exhaustionReasonName(s.reason);
        emitCursor(out, s.cursor);

        out << YAML::Key << "emissions" << YAML::Value << YAML::BeginSeq;
        for (const auto& p : s.provenance) {
            out << YAML::Flow << YAML::BeginMap;
            out << YAML::Key << "position" << YAML::Value;
            emitTuple(out, p.position);
            out << YAML::Key << "seed" << YAML::Value << p.seed;
            if (p.score) out << YAML::Key << "score" << YAML::Value << *p.score;
            out << YAML::EndMap;
        }
        out << YAML::EndSeq;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    if (!out.good()) {
        throw CheckpointError("cannot serialize checkpoint: " + out.GetLastError());
    }
    return std::string(out.c_str()) + "\n";
}

void Checkpoint::save(const Explorer& explorer, const std::string& path) {
    std::string text = toYaml(explorer);
    std::ofstream file(path);
    if (!file) {
        throw CheckpointError("cannot open '" + path + "' for writing");
    }
    file << text;
    if (!file) {
        throw CheckpointError("failed writing checkpoint '" + path + "'");
    }
    logger()->info("checkpoint saved to {} ({} streams)", path, explorer.streams_.size());
}

void Checkpoint::load(Explorer& explorer, const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw CheckpointError("cannot open checkpoint '" + path + "'");
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    fromYaml(explorer, buffer.str());
    logger()->info("checkpoint loaded from {} ({} streams)", path, explorer.streams_.size());
}

void Checkpoint::fromYaml(Explorer& explorer, const std::string& text) {
    const Schedule& schedule = explorer.schedule();

    YAML::Node doc;
    try {
        doc = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        throw CheckpointError(std::string("malformed checkpoint: ") + e.what());
    }
    if (!doc.IsMap()) {
        throw CheckpointError("malformed checkpoint: expected a mapping");
    }

    try {
        if (require(doc, "version", "checkpoint").as<int>() != kFormatVersion) {
            throw CheckpointError("unsupported checkpoint version");
        }
        if (require(doc, "schema", "checkpoint").as<std::string>() != schedule.schema()->name()) {
            throw CheckpointError("checkpoint was written for schema '" +
                                  doc["schema"].as<std::string>() + "'");
        }
        if (require(doc, "seed", "checkpoint").as<uint64_t>() != explorer.options().seed) {
            throw CheckpointError("checkpoint was written with seed " +
                                  doc["seed"].as<std::string>());
        }
        std::vector<std::string> ids;
        for (const auto& id : require(doc, "generators", "checkpoint")) {
            ids.push_back(id.as<std::string>());
        }
        std::vector<std::string> expected;
        for (size_t i = 0; i < schedule.size(); i++) expected.push_back(schedule.generator(i).id);
        if (ids != expected) {
            throw CheckpointError("checkpoint was written for a different set of generators");
        }

        // Rebuild in place; the previous state comes back if anything fails.
        auto saved_streams = std::move(explorer.streams_);
        auto saved_draws = std::move(explorer.draws_);
        explorer.streams_.clear();
        explorer.draws_.clear();
        try {
            for (const auto& entry : doc["draws"]) {
                explorer.draws_[entry.first.as<std::string>()] = entry.second.as<uint64_t>();
            }

            // Open top-level streams; that recreates every nested stream key.
            const YAML::Node streams = require(doc, "streams", "checkpoint");
            for (const auto& entry : streams) {
                std::string key = require(entry, "key", "streams").as<std::string>();
                if (key.find('/') == std::string::npos) {
                    if (!schedule.find(key)) {
                        throw CheckpointError("unknown stream '" + key + "'");
                    }
                    explorer.stream(key);
                }
            }

            std::vector<size_t> rank(schedule.size());
            const auto& topo = schedule.topologicalOrder();
            for (size_t i = 0; i < topo.size(); i++) rank[topo[i]] = i;

            std::vector<YAML::Node> entries;
            for (const auto& entry : streams) entries.push_back(entry);
            std::stable_sort(entries.begin(), entries.end(), [&](const YAML::Node& a, const YAML::Node& b) {
                auto ga = schedule.find(a["generator"].as<std::string>());
                auto gb = schedule.find(b["generator"].as<std::string>());
                if (!ga || !gb) return false;
                return rank[*ga] < rank[*gb];
            });

            for (const auto& entry : entries) {
                const std::string key = entry["key"].as<std::string>();
                const std::string where = "stream '" + key + "'";
                auto it = explorer.streams_.find(key);
                if (it == explorer.streams_.end()) {
                    throw CheckpointError(where + " does not exist in this search space");
                }
                StreamState& s = it->second;
                const GeneratorDecl& decl = schedule.generator(s.generator);
                if (require(entry, "generator", where).as<std::string>() != decl.id) {
                    throw CheckpointError(where + " belongs to generator '" + decl.id + "'");
                }

                s.cursor = readCursor(require(entry, "cursor", where), s.cursor, key);
                s.attempts = require(entry, "attempts", where).as<uint64_t>();
                s.consecutive_skips = require(entry, "consecutive_skips", where).as<size_t>();
                s.reason = parseExhaustionReason(require(entry, "reason", where).as<std::string>());

                for (const auto& e : require(entry, "emissions", where)) {
                    Provenance p;
                    p.position = readTuple(require(e, "position", where));
                    p.seed = require(e, "seed", where).as<uint32_t>();
                    if (e["score"]) p.score = e["score"].as<double>();

                    Explorer::Candidate candidate;
                    try {
                        if (const auto* primitive = std::get_if<PrimitiveSpec>(&decl.kind)) {
                            if (p.position.size() != 1) {
                                throw CheckpointError(where + ": bad primitive position");
                            }
                            auto drawn = primitive->source->at(p.position[0]);
                            if (!drawn || !*drawn) {
                                throw CheckpointError(where + ": source has no instance at index " +
                                                      std::to_string(p.position[0]));
                            }
                            candidate.instance = *drawn;
                        } else if (std::holds_alternative<AdditiveSpec>(decl.kind)) {
                            candidate = explorer.composeAdditive(s, p.position, p.seed);
                        } else {
                            candidate = explorer.composeProduct(s, p.position, p.seed);
                        }
                    } catch (const CompositionError& err) {
                        throw CheckpointError(where + ": cannot rebuild emission " +
                                              std::to_string(s.history.size()) + ": " + err.what());
                    } catch (const std::out_of_range&) {
                        throw CheckpointError(where + ": emission " + std::to_string(s.history.size()) +
                                              " refers to a missing child emission");
                    }

                    std::string rejected_by;
                    auto accepted = explorer.applyOutputConstraints(decl, candidate.instance, rejected_by);
                    if (!accepted) {
                        throw CheckpointError(where + ": rebuilt emission rejected by '" +
                                              rejected_by + "'");
                    }
                    s.history.push_back({*accepted, p.score});
                    s.interfaces.push_back(std::move(candidate.exposed));
                    s.provenance.push_back(std::move(p));
                }
            }
        } catch (...) {
            explorer.streams_ = std::move(saved_streams);
            explorer.draws_ = std::move(saved_draws);
            throw;
        }
    } catch (const YAML::Exception& e) {
        throw CheckpointError(std::string("malformed checkpoint: ") + e.what());
    }
}

} // namespace modex
