#pragma once

#include "generators/generator.hpp"
#include "loss/loss.hpp"
#include "model/schema.hpp"

#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace modex {

/// Free-form string parameters of a named hook, as written in the
/// search-space document.
using HookParams = std::map<std::string, std::string>;

using SourceFactory =
    std::function<std::shared_ptr<const PrimitiveSource>(const SchemaPtr&, const HookParams&)>;
using LossFactory =
    std::function<std::unique_ptr<LossFunction>(const SchemaPtr&, const HookParams&)>;

/// Named filters, chases, loss functions and primitive sources that a
/// search-space document can refer to.
class HookRegistry {
public:
    void registerFilter(const std::string& name, FilterFn fn);
    void registerChase(const std::string& name, ChaseFn fn);
    void registerLoss(const std::string& name, LossFactory factory);
    void registerSource(const std::string& name, SourceFactory factory);

    /// Lookups return nullptr for unknown names.
    const FilterFn* filter(const std::string& name) const;
    const ChaseFn* chase(const std::string& name) const;
    const LossFactory* loss(const std::string& name) const;
    const SourceFactory* source(const std::string& name) const;

    std::vector<std::string> filterNames() const;
    std::vector<std::string> chaseNames() const;
    std::vector<std::string> lossNames() const;
    std::vector<std::string> sourceNames() const;

    /// Registry with the built-in hooks:
    ///   filters: nonempty
    ///   chases:  strip_tags
    ///   losses:  size, object_count {object}, dependency_score {dependency}
    ///   sources: terminal_copies {limit}
    static HookRegistry withDefaults();

private:
    std::unordered_map<std::string, FilterFn> filters_;
    std::unordered_map<std::string, ChaseFn> chases_;
    std::unordered_map<std::string, LossFactory> losses_;
    std::unordered_map<std::string, SourceFactory> sources_;
};

/// Param lookup used by hook factories. Throws MissingFieldError when a
/// required parameter is absent.
const std::string& requireParam(const HookParams& params, const std::string& key);

} // namespace modex
