#include "loss/loss.hpp"
#include "common/errors.hpp"

namespace modex {

void LossContext::addDependency(const std::string& name, const History* history) {
    histories_.emplace(name, history);
}

bool LossContext::hasDependency(const std::string& name) const {
    return histories_.count(name) > 0;
}

const History& LossContext::history(const std::string& name) const {
    auto it = histories_.find(name);
    if (it == histories_.end()) {
        throw ModexError("loss context has no dependency '" + name + "'");
    }
    return *it->second;
}

std::optional<double> LossContext::latestScore(const std::string& name) const {
    const History& h = history(name);
    for (auto it = h.rbegin(); it != h.rend(); ++it) {
        if (it->score) return it->score;
    }
    return std::nullopt;
}

std::vector<std::string> LossContext::dependencies() const {
    std::vector<std::string> names;
    names.reserve(histories_.size());
    for (const auto& [name, history] : histories_) {
        names.push_back(name);
    }
    return names;
}

double SizeLoss::evaluate(const ModelInstance& instance, const LossContext&) const {
    return static_cast<double>(instance.totalElements());
}

double ObjectCountLoss::evaluate(const ModelInstance& instance, const LossContext&) const {
    return static_cast<double>(instance.count(object_));
}

double DependencyScoreLoss::evaluate(const ModelInstance&, const LossContext& context) const {
    if (!dependency_.empty()) {
        return context.latestScore(dependency_).value_or(0.0);
    }
    double total = 0.0;
    for (const auto& name : context.dependencies()) {
        total += context.latestScore(name).value_or(0.0);
    }
    return total;
}

} // namespace modex
