#pragma once

#include "model/model_instance.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace modex {

/// One emission of a stream and its score (absent when the generator has
/// no loss terms).
struct ScoredInstance {
    InstancePtr instance;
    std::optional<double> score;
};

using History = std::vector<ScoredInstance>;

// ─── LossContext ───────────────────────────────────────────────
// Read-only view of the histories of the streams a composite draws from,
// keyed by box id for additive composites and by dimension generator id
// for multiplicative ones.

class LossContext {
public:
    LossContext() = default;

    void addDependency(const std::string& name, const History* history);

    bool hasDependency(const std::string& name) const;

    /// Throws ModexError for an unknown name.
    const History& history(const std::string& name) const;

    /// Latest score of a dependency, if it emitted a scored instance.
    std::optional<double> latestScore(const std::string& name) const;

    std::vector<std::string> dependencies() const;

private:
    std::map<std::string, const History*> histories_;
};

// ─── Loss Function ─────────────────────────────────────────────
// Abstract base class for individual loss terms.

class LossFunction {
public:
    virtual ~LossFunction() = default;

    virtual double evaluate(const ModelInstance& instance, const LossContext& context) const = 0;

    virtual std::string name() const = 0;
};

/// Total number of elements across all objects.
class SizeLoss : public LossFunction {
public:
    double evaluate(const ModelInstance& instance, const LossContext& context) const override;
    std::string name() const override { return "size"; }
};

/// Number of elements of one object.
class ObjectCountLoss : public LossFunction {
public:
    explicit ObjectCountLoss(size_t object) : object_(object) {}

    double evaluate(const ModelInstance& instance, const LossContext& context) const override;
    std::string name() const override { return "object_count"; }

private:
    size_t object_;
};

/// Latest score of one dependency, or the sum over all dependencies when
/// no name is given. Dependencies without a score contribute 0.
class DependencyScoreLoss : public LossFunction {
public:
    explicit DependencyScoreLoss(std::string dependency = "")
        : dependency_(std::move(dependency)) {}

    double evaluate(const ModelInstance& instance, const LossContext& context) const override;
    std::string name() const override { return "dependency_score"; }

private:
    std::string dependency_;
};

/// Wraps a callable, for programmatic users and the Python bindings.
class FunctionLoss : public LossFunction {
public:
    using Fn = std::function<double(const ModelInstance&, const LossContext&)>;

    FunctionLoss(std::string name, Fn fn) : name_(std::move(name)), fn_(std::move(fn)) {}

    double evaluate(const ModelInstance& instance, const LossContext& context) const override {
        return fn_(instance, context);
    }
    std::string name() const override { return name_; }

private:
    std::string name_;
    Fn fn_;
};

} // namespace modex
