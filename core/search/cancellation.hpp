#pragma once

#include <atomic>
#include <stdexcept>

namespace gearopt {

/// Thrown when a run observes a cancelled token. Always propagates.
class SearchCancelled : public std::runtime_error {
public:
    SearchCancelled() : std::runtime_error("Search cancelled") {}
};

/// Cooperative cancellation flag. Another thread may call cancel();
/// the engine polls it at stage boundaries.
class CancellationToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_relaxed); }
    void reset() { cancelled_.store(false, std::memory_order_relaxed); }
    bool isCancelled() const { return cancelled_.load(std::memory_order_relaxed); }

    void throwIfCancelled() const {
        if (isCancelled()) throw SearchCancelled();
    }

private:
    std::atomic<bool> cancelled_{false};
};

inline void throwIfCancelled(const CancellationToken* token) {
    if (token) token->throwIfCancelled();
}

} // namespace gearopt
