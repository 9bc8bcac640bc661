#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

namespace modex {

/// Cooperative cancellation flag. The only object meant to be shared with
/// another thread: cancel() may be called while a search is running.
class CancellationToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_relaxed); }
    void reset() { cancelled_.store(false, std::memory_order_relaxed); }
    bool cancelled() const { return cancelled_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> cancelled_{false};
};

/// Limits imposed on one bounded operation (a homomorphism search, a
/// search run). Zero means unlimited for both limits.
struct SearchBudget {
    uint64_t max_steps = 1000000;
    double max_seconds = 5.0;
    std::shared_ptr<CancellationToken> cancel;
};

/// Tracks wall-clock time and step count against a SearchBudget.
class BudgetManager {
public:
    explicit BudgetManager(const SearchBudget& budget)
        : max_steps_(budget.max_steps),
          max_seconds_(budget.max_seconds),
          cancel_(budget.cancel) {}

    BudgetManager(double max_seconds, uint64_t max_steps)
        : max_steps_(max_steps), max_seconds_(max_seconds) {}

    void start() {
        start_time_ = std::chrono::steady_clock::now();
        steps_ = 0;
    }

    void recordStep() { steps_++; }

    bool canContinue() const {
        if (isCancelled()) return false;
        if (isStepExhausted()) return false;
        return !isTimeExhausted();
    }

    double elapsedSeconds() const {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration<double>(now - start_time_).count();
    }

    uint64_t steps() const { return steps_; }
    bool isCancelled() const { return cancel_ && cancel_->cancelled(); }
    bool isStepExhausted() const { return max_steps_ > 0 && steps_ >= max_steps_; }
    bool isTimeExhausted() const { return max_seconds_ > 0.0 && elapsedSeconds() >= max_seconds_; }

private:
    uint64_t max_steps_;
    double max_seconds_;
    std::shared_ptr<CancellationToken> cancel_;
    uint64_t steps_ = 0;
    std::chrono::steady_clock::time_point start_time_ = std::chrono::steady_clock::now();
};

} // namespace modex
