#include "compose/wiring.hpp"
#include "common/errors.hpp"

#include <unordered_set>

namespace modex {

namespace {

template <typename T>
std::optional<size_t> findById(const std::vector<T>& items, const std::string& id) {
    for (size_t i = 0; i < items.size(); i++) {
        if (items[i].id == id) return i;
    }
    return std::nullopt;
}

template <typename T>
void checkUnique(const std::vector<T>& items, const std::string& location, const char* what) {
    std::unordered_set<std::string> seen;
    for (size_t i = 0; i < items.size(); i++) {
        const std::string where = location + "." + what + "[" + std::to_string(i) + "]";
        if (items[i].id.empty()) {
            throw MissingFieldError("missing required field 'id'", where);
        }
        if (!seen.insert(items[i].id).second) {
            throw DuplicateIdError("duplicate id '" + items[i].id + "'", where);
        }
    }
}

} // namespace

std::optional<size_t> WiringPattern::findBox(const std::string& id) const {
    return findById(boxes, id);
}

std::optional<size_t> WiringPattern::findPort(const std::string& id) const {
    return findById(ports, id);
}

std::optional<size_t> WiringPattern::findJunction(const std::string& id) const {
    return findById(junctions, id);
}

ResolvedWiring WiringPattern::resolve(const std::string& location) const {
    checkUnique(boxes, location, "boxes");
    checkUnique(ports, location, "ports");
    checkUnique(junctions, location, "junctions");

    ResolvedWiring out;
    out.box_ports.resize(boxes.size());

    std::vector<size_t> port_box(ports.size());
    for (size_t p = 0; p < ports.size(); p++) {
        auto box = findBox(ports[p].box);
        if (!box) {
            throw DanglingReferenceError("port '" + ports[p].id + "' refers to unknown box '" +
                                         ports[p].box + "'",
                                         location + ".ports[" + std::to_string(p) + "]");
        }
        port_box[p] = *box;
        out.box_ports[*box].push_back(p);
    }

    std::vector<char> junction_used(junctions.size(), 0);
    std::vector<std::unordered_set<size_t>> junction_boxes(junctions.size());

    for (size_t w = 0; w < wires.size(); w++) {
        const std::string where = location + ".wires[" + std::to_string(w) + "]";
        if (wires[w].port.empty()) {
            throw MissingFieldError("missing required field 'port'", where);
        }
        if (wires[w].junction.empty()) {
            throw MissingFieldError("missing required field 'junction'", where);
        }
        auto port = findPort(wires[w].port);
        if (!port) {
            throw DanglingReferenceError("unknown port '" + wires[w].port + "'", where);
        }
        auto junction = findJunction(wires[w].junction);
        if (!junction) {
            throw DanglingReferenceError("unknown junction '" + wires[w].junction + "'", where);
        }

        ResolvedWire rw;
        rw.port = *port;
        rw.box = port_box[*port];
        rw.junction = *junction;

        if (!junction_boxes[rw.junction].insert(rw.box).second && !allow_self_gluing) {
            throw ConfigError("box '" + boxes[rw.box].id + "' is wired to junction '" +
                              junctions[rw.junction].id +
                              "' more than once (self-gluing is disabled)", where);
        }

        junction_used[rw.junction] = 1;
        out.wires.push_back(rw);
    }

    for (size_t j = 0; j < junctions.size(); j++) {
        if (junction_used[j]) out.used_junctions.push_back(j);
    }
    return out;
}

} // namespace modex
