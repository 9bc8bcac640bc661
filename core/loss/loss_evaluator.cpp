#include "loss/loss_evaluator.hpp"

namespace modex {

LossEvaluator::LossEvaluator(Direction direction)
    : direction_(direction) {}

void LossEvaluator::addTerm(std::unique_ptr<LossFunction> term, double weight) {
    terms_.push_back({std::move(term), weight});
}

std::optional<double> LossEvaluator::evaluate(const ModelInstance& instance,
                                              const LossContext& context) const {
    if (terms_.empty()) return std::nullopt;
    double total = 0.0;
    for (const auto& term : terms_) {
        total += term.weight * term.fn->evaluate(instance, context);
    }
    return total;
}

std::string LossEvaluator::describe() const {
    std::string out = direction_ == Direction::Minimize ? "minimize" : "maximize";
    for (const auto& term : terms_) {
        out += " " + std::to_string(term.weight) + "*" + term.fn->name();
    }
    if (stop_.kind != StopCriterion::Kind::None) {
        out += " stop(" + stop_.describe() + ")";
    }
    return out;
}

} // namespace modex
