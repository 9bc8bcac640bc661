#pragma once

#include "compose/multiplicative_composer.hpp"
#include "compose/wiring.hpp"
#include "loss/loss_evaluator.hpp"
#include "model/model_instance.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace modex {

// ─── Primitive sources ─────────────────────────────────────────
// Indexed producers: the position in a primitive stream is one integer.

class PrimitiveSource {
public:
    virtual ~PrimitiveSource() = default;

    /// Instance at `index`, or nullopt once the sequence has ended.
    /// Must be pure: the same index always yields an equal instance.
    virtual std::optional<InstancePtr> at(size_t index) const = 0;

    virtual std::string name() const = 0;
};

/// Fixed list of instances.
class ExplicitSource : public PrimitiveSource {
public:
    explicit ExplicitSource(std::vector<InstancePtr> instances, std::string name = "explicit")
        : instances_(std::move(instances)), name_(std::move(name)) {}

    std::optional<InstancePtr> at(size_t index) const override;
    std::string name() const override { return name_; }
    size_t size() const { return instances_.size(); }

private:
    std::vector<InstancePtr> instances_;
    std::string name_;
};

/// Sequence induced by a function of the index, optionally truncated.
class FunctionSource : public PrimitiveSource {
public:
    using Fn = std::function<std::optional<InstancePtr>(size_t index)>;

    FunctionSource(std::string name, Fn fn, std::optional<size_t> limit = std::nullopt)
        : name_(std::move(name)), fn_(std::move(fn)), limit_(limit) {}

    std::optional<InstancePtr> at(size_t index) const override;
    std::string name() const override { return name_; }

private:
    std::string name_;
    Fn fn_;
    std::optional<size_t> limit_;
};

// ─── Output constraints ────────────────────────────────────────

using FilterFn = std::function<bool(const ModelInstance&)>;
/// Rewrites a candidate, or rejects it by returning nullopt.
using ChaseFn = std::function<std::optional<InstancePtr>(const InstancePtr&)>;

struct OutputConstraint {
    enum class Kind { Filter, Chase };

    Kind kind = Kind::Filter;
    std::string name;
    FilterFn filter;
    ChaseFn chase;

    static OutputConstraint filterBy(std::string name, FilterFn fn);
    static OutputConstraint chaseWith(std::string name, ChaseFn fn);

    /// Candidate after this constraint, or nullopt when rejected.
    std::optional<InstancePtr> apply(const InstancePtr& candidate) const;
};

// ─── Generator declarations ────────────────────────────────────

struct PrimitiveSpec {
    std::shared_ptr<const PrimitiveSource> source;
};

struct AdditiveSpec {
    WiringPattern wiring;
};

struct MultiplicativeSpec {
    ProductSpec product;
};

using GeneratorKind = std::variant<PrimitiveSpec, AdditiveSpec, MultiplicativeSpec>;

enum class Sharing {
    Unspecified,
    Shared,     // one stream for the whole search
    Reentrant   // one stream per referencing slot
};

/// Parse "shared" / "reentrant". Throws ConfigError otherwise.
Sharing parseSharing(const std::string& name);
std::string sharingName(Sharing sharing);

struct GeneratorDecl {
    std::string id;
    GeneratorKind kind;
    std::vector<OutputConstraint> constraints;      // applied in order
    std::shared_ptr<const LossEvaluator> loss;      // optional
    Sharing sharing = Sharing::Unspecified;
    size_t max_skips = 1000;

    /// Referenced generator ids in slot order (boxes or dimensions),
    /// repeated once per slot.
    std::vector<std::string> dependencies() const;

    std::string kindName() const;

    static GeneratorDecl primitive(std::string id, std::shared_ptr<const PrimitiveSource> source);
    static GeneratorDecl additive(std::string id, WiringPattern wiring);
    static GeneratorDecl multiplicative(std::string id, ProductSpec product);
};

} // namespace modex
