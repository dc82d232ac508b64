#pragma once

#include <atomic>
#include <functional>
#include <stdexcept>

namespace analyzer {

/**
 * Progress callback, invoked synchronously with a fraction in [0, 1].
 * An empty function means no reporting.
 */
using ProgressCallback = std::function<void(float)>;

/**
 * Cooperative cancellation flag
 *
 * Set from any thread; the analysis checks it at every frame boundary.
 */
class CancellationToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_relaxed); }
    void reset() { cancelled_.store(false, std::memory_order_relaxed); }
    bool isCancelled() const { return cancelled_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> cancelled_{false};
};

/**
 * Thrown when an analysis stops because its token was cancelled
 */
class AnalysisCancelled : public std::runtime_error {
public:
    AnalysisCancelled() : std::runtime_error("Analysis cancelled") {}
};

/**
 * Throws AnalysisCancelled if the token has been set
 */
inline void throwIfCancelled(const CancellationToken* token) {
    if (token && token->isCancelled()) {
        throw AnalysisCancelled();
    }
}

} // namespace analyzer
