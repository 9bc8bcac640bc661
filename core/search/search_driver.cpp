#include "search/search_driver.hpp"
#include "common/errors.hpp"
#include "common/log.hpp"
#include "explore/checkpoint.hpp"

namespace modex {

std::string searchStatusName(SearchStatus status) {
    switch (status) {
        case SearchStatus::Success: return "success";
        case SearchStatus::Exhausted: return "exhausted";
        case SearchStatus::Timeout: return "timeout";
    }
    return "?";
}

SearchDriver::SearchDriver(const Schedule& schedule, SearchOptions options)
    : schedule_(schedule), options_(std::move(options)) {
    ExplorerOptions explorer_options;
    explorer_options.seed = options_.seed;
    explorer_options.homomorphism = options_.homomorphism;
    explorer_options.hom_budget = options_.hom_budget;
    explorer_ = std::make_unique<Explorer>(schedule_, explorer_options);
}

void SearchDriver::consider(SearchOutcome& outcome, const std::string& root,
                            const ScoredInstance& emission) const {
    const GeneratorDecl& decl = schedule_.generator(schedule_.indexOf(root));
    bool better = false;
    if (!outcome.best) {
        better = true;
    } else if (emission.score) {
        better = !outcome.best_score ||
                 (decl.loss && decl.loss->isBetter(*emission.score, *outcome.best_score));
    }
    if (better) {
        outcome.best = emission.instance;
        outcome.best_score = emission.score;
        outcome.best_stream = root;
    }
}

SearchOutcome SearchDriver::run() {
    if (options_.resume && !options_.checkpoint_path.empty()) {
        Checkpoint::load(*explorer_, options_.checkpoint_path);
    }

    const std::vector<std::string> roots = explorer_->rootKeys();
    if (roots.size() > 1 && !options_.allow_multiple_roots) {
        throw MultipleRootsError(roots);
    }

    BudgetManager budget(options_.max_seconds, 0);
    budget.start();

    SearchOutcome outcome;
    for (const auto& root : roots) {
        for (const auto& emission : explorer_->history(root)) {
            consider(outcome, root, emission);
            outcome.emitted++;
        }
    }
    const size_t resumed = outcome.emitted;

    logger()->info("search started: {} root(s), seed {}, {} iterations{}", roots.size(),
                   options_.seed, options_.iterations,
                   resumed ? " (resuming after " + std::to_string(resumed) + ")" : "");

    auto pending = [&]() {
        return options_.iterations == 0 || outcome.emitted - resumed < options_.iterations;
    };

    size_t since_checkpoint = 0;
    bool progress = true;
    while (pending() && progress) {
        progress = false;
        for (const auto& root : roots) {
            if (!pending()) break;
            if (explorer_->exhausted(root)) continue;
            if (!budget.canContinue()) {
                outcome.budget_exhausted = true;
                break;
            }
            progress = true;

            auto instance = explorer_->next(root);
            if (!instance) continue;

            outcome.emitted++;
            consider(outcome, root, explorer_->history(root).back());
            logger()->debug("{} #{}: {}{}", root, explorer_->history(root).size() - 1,
                            (*instance)->describe(),
                            explorer_->history(root).back().score
                                ? " score " + std::to_string(*explorer_->history(root).back().score)
                                : "");

            if (options_.checkpoint_every > 0 && !options_.checkpoint_path.empty() &&
                ++since_checkpoint >= options_.checkpoint_every) {
                Checkpoint::save(*explorer_, options_.checkpoint_path);
                since_checkpoint = 0;
            }
        }
        if (outcome.budget_exhausted) break;
    }

    if (!options_.checkpoint_path.empty()) {
        Checkpoint::save(*explorer_, options_.checkpoint_path);
    }

    for (const auto& root : roots) {
        outcome.root_reasons[root] = explorer_->reason(root);
    }
    outcome.elapsed_seconds = budget.elapsedSeconds();

    if (outcome.best) {
        outcome.status = SearchStatus::Success;
    } else if (outcome.budget_exhausted) {
        outcome.status = SearchStatus::Timeout;
    } else {
        outcome.status = SearchStatus::Exhausted;
    }

    logger()->info("search finished: {} after {} emissions in {:.3f}s{}",
                   searchStatusName(outcome.status), outcome.emitted, outcome.elapsed_seconds,
                   outcome.best_score ? ", best score " + std::to_string(*outcome.best_score) : "");
    return outcome;
}

} // namespace modex
