#pragma once

#include "explore/explorer.hpp"
#include "schedule/dependency_scheduler.hpp"
#include "search/search_options.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>

namespace modex {

enum class SearchStatus {
    Success,        // at least one instance was produced
    Exhausted,      // every root ended without producing anything
    Timeout         // wall clock ran out before any result
};

std::string searchStatusName(SearchStatus status);

/// Result of a search run.
struct SearchOutcome {
    SearchStatus status = SearchStatus::Exhausted;
    InstancePtr best;
    std::optional<double> best_score;
    std::string best_stream;
    size_t emitted = 0;                 // root emissions, including resumed ones
    double elapsed_seconds = 0.0;
    bool budget_exhausted = false;
    std::map<std::string, ExhaustionReason> root_reasons;
};

// ─── SearchDriver ──────────────────────────────────────────────
// Pulls from the root stream(s), round-robin when there are several,
// until the iteration budget, the wall clock, or exhaustion. Tracks the
// best-scoring emission in the root's loss direction (the first one when
// the root has no loss).

class SearchDriver {
public:
    SearchDriver(const Schedule& schedule, SearchOptions options);

    SearchOutcome run();

    Explorer& explorer() { return *explorer_; }
    const SearchOptions& options() const { return options_; }

private:
    void consider(SearchOutcome& outcome, const std::string& root, const ScoredInstance& emission) const;

    const Schedule& schedule_;
    SearchOptions options_;
    std::unique_ptr<Explorer> explorer_;
};

} // namespace modex
