#pragma once

#include "compose/wiring.hpp"
#include "generators/generator.hpp"
#include "model/schema.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace modex {

using GeneratorIndex = size_t;

struct ScheduleOptions {
    bool allow_multiple_roots = false;
};

// ─── Schedule ──────────────────────────────────────────────────
// Validated, immutable generator graph. Generators live in an arena
// indexed by GeneratorIndex; edges run from a composite to each
// generator it references.

class Schedule {
public:
    const SchemaPtr& schema() const { return schema_; }

    size_t size() const { return generators_.size(); }
    const GeneratorDecl& generator(GeneratorIndex i) const { return generators_.at(i); }

    std::optional<GeneratorIndex> find(const std::string& id) const;
    /// Throws DanglingReferenceError for unknown ids.
    GeneratorIndex indexOf(const std::string& id) const;

    /// Referenced generators in slot order (a generator used by two boxes
    /// appears twice).
    const std::vector<GeneratorIndex>& dependencies(GeneratorIndex i) const { return deps_.at(i); }
    /// Generators referencing i, without repeats.
    const std::vector<GeneratorIndex>& dependents(GeneratorIndex i) const { return dependents_.at(i); }

    /// Every generator after all of its dependencies.
    const std::vector<GeneratorIndex>& topologicalOrder() const { return topo_; }

    /// Generators nothing depends on, in declaration order.
    const std::vector<GeneratorIndex>& roots() const { return roots_; }
    /// The single root. Throws MultipleRootsError if there are several.
    GeneratorIndex root() const;

    /// Index form of an additive generator's wiring.
    const ResolvedWiring& wiring(GeneratorIndex i) const;

private:
    friend class DependencyScheduler;

    SchemaPtr schema_;
    std::vector<GeneratorDecl> generators_;
    std::unordered_map<std::string, GeneratorIndex> index_;
    std::vector<std::vector<GeneratorIndex>> deps_;
    std::vector<std::vector<GeneratorIndex>> dependents_;
    std::vector<GeneratorIndex> topo_;
    std::vector<GeneratorIndex> roots_;
    std::unordered_map<GeneratorIndex, ResolvedWiring> wirings_;
};

// ─── DependencyScheduler ───────────────────────────────────────
// Checks a set of generator declarations and builds the Schedule.
// Every failure is a ConfigError located at "generators[i]...":
// DuplicateIdError, DanglingReferenceError, CycleError,
// MultipleRootsError, SharingPolicyError, SchemaMismatchError,
// MissingFieldError.

class DependencyScheduler {
public:
    static Schedule build(SchemaPtr schema, std::vector<GeneratorDecl> generators,
                          ScheduleOptions options = {});

private:
    static void checkGenerator(const Schedule& schedule, GeneratorIndex i);
    static void checkAcyclic(Schedule& schedule);
    static void checkSharing(const Schedule& schedule);
};

} // namespace modex
