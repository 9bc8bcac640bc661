#pragma once

#include "homomorphism/homomorphism.hpp"
#include "model/model_instance.hpp"

#include <optional>
#include <string>
#include <vector>

namespace modex {

/// A slot in a wiring pattern, filled by one draw of a generator.
struct Box {
    std::string id;
    std::string generator;
};

/// Interface point on a box. Constraints restrict where a junction
/// overlap may land inside the box instance.
struct Port {
    std::string id;
    std::string box;
    ConstraintSet constraints;
};

/// Shared overlap along which boxes are glued. A null overlap means the
/// empty structure.
struct Junction {
    std::string id;
    InstancePtr overlap;
};

struct Wire {
    std::string port;
    std::string junction;
};

/// Index form of one wire.
struct ResolvedWire {
    size_t port = 0;
    size_t box = 0;
    size_t junction = 0;
};

struct ResolvedWiring {
    std::vector<ResolvedWire> wires;
    std::vector<size_t> used_junctions;             // junctions with at least one wire
    std::vector<std::vector<size_t>> box_ports;     // ports per box
};

// ─── WiringPattern ─────────────────────────────────────────────
// Boxes / Ports / Junctions / Wires of an additive composite.

struct WiringPattern {
    std::vector<Box> boxes;
    std::vector<Port> ports;
    std::vector<Junction> junctions;
    std::vector<Wire> wires;
    bool allow_self_gluing = false;

    std::optional<size_t> findBox(const std::string& id) const;
    std::optional<size_t> findPort(const std::string& id) const;
    std::optional<size_t> findJunction(const std::string& id) const;

    /// Check ids and references and return the index form.
    /// Errors are located under `location` (e.g. "generators[3].wiring").
    ResolvedWiring resolve(const std::string& location = "wiring") const;
};

} // namespace modex
