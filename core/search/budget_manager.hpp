#pragma once

#include <chrono>
#include <limits>

namespace gearopt {

/// Tracks the state-expansion budget of a search pass and, optionally,
/// a wall-clock cap.
class BudgetManager {
public:
    explicit BudgetManager(long long max_expansions,
                           double max_seconds = std::numeric_limits<double>::infinity())
        : max_seconds_(max_seconds), max_expansions_(max_expansions) {}

    void start() {
        start_time_ = std::chrono::steady_clock::now();
        expansions_ = 0;
    }

    void recordExpansion() { expansions_++; }

    bool canContinue() const {
        return !isExpansionExhausted() && !isTimeExhausted();
    }

    double elapsedSeconds() const {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration<double>(now - start_time_).count();
    }

    long long expansions() const { return expansions_; }
    long long maxExpansions() const { return max_expansions_; }
    long long remainingExpansions() const {
        return expansions_ >= max_expansions_ ? 0 : max_expansions_ - expansions_;
    }

    bool isTimeExhausted() const {
        if (max_seconds_ == std::numeric_limits<double>::infinity()) return false;
        return elapsedSeconds() >= max_seconds_;
    }
    bool isExpansionExhausted() const { return expansions_ >= max_expansions_; }

private:
    double max_seconds_;
    long long max_expansions_;
    long long expansions_ = 0;
    std::chrono::steady_clock::time_point start_time_;
};

} // namespace gearopt
