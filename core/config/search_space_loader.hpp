#pragma once

#include "generators/generator.hpp"
#include "generators/hook_registry.hpp"
#include "model/schema.hpp"
#include "schedule/dependency_scheduler.hpp"
#include "search/search_options.hpp"

#include <string>
#include <vector>

namespace YAML {
class Node;
}

namespace modex {

/// Everything a search-space document declares.
struct SearchSpaceSpec {
    SchemaPtr schema;
    std::vector<GeneratorDecl> generators;
    SearchOptions options;
    std::string log_level = "info";

    /// Validate the generators and build their Schedule.
    Schedule buildSchedule() const;
};

// ─── SearchSpaceLoader ─────────────────────────────────────────
// Reads a YAML search-space document. Every error is a ConfigError
// located by YAML path, with line and column where known:
//   generators[2].wiring.wires[0]: missing required field 'junction' (line 14, column 9)
// Named filters, chases, losses and sources resolve through the
// HookRegistry.

class SearchSpaceLoader {
public:
    explicit SearchSpaceLoader(HookRegistry hooks = HookRegistry::withDefaults());

    SearchSpaceSpec loadFile(const std::string& path) const;
    SearchSpaceSpec loadString(const std::string& text) const;

    HookRegistry& hooks() { return hooks_; }
    const HookRegistry& hooks() const { return hooks_; }

private:
    SearchSpaceSpec load(const YAML::Node& doc) const;

    SchemaPtr parseSchema(const YAML::Node& node) const;
    void parseSearch(const YAML::Node& node, SearchOptions& options) const;
    GeneratorDecl parseGenerator(const YAML::Node& node, const SchemaPtr& schema,
                                 const std::string& where) const;
    WiringPattern parseWiring(const YAML::Node& node, const SchemaPtr& schema,
                              const std::string& where) const;
    ProductSpec parseProduct(const YAML::Node& node, const SchemaPtr& schema,
                             const std::string& where) const;
    std::shared_ptr<const LossEvaluator> parseLoss(const YAML::Node& node, const SchemaPtr& schema,
                                                   const std::string& where) const;
    OutputConstraint parseOutputConstraint(const YAML::Node& node, const std::string& where) const;

    HookRegistry hooks_;
};

/// Parse an instance literal ({counts, relations, tags}) against a schema.
InstancePtr parseInstance(const YAML::Node& node, const SchemaPtr& schema, const std::string& where);

/// Parse a list of port constraints.
ConstraintSet parseConstraints(const YAML::Node& node, const Schema& schema, const std::string& where);

} // namespace modex
