#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace analyzer {

/**
 * FFT rotation coefficients for one transform size N
 * cos[k] = cos(-2*pi*k/N), sin[k] = sin(-2*pi*k/N), k in [0, N/2)
 */
struct TwiddleTable {
    std::vector<float> cos;
    std::vector<float> sin;
};

/**
 * Memoized twiddle factors and Hann windows
 *
 * Entries are computed on first request for a size and never change
 * afterwards, so returned references stay valid for the cache's lifetime.
 * Lookups are serialized with a mutex; several analyses may share one cache.
 *
 * Use instance() for the process-wide cache, or own one per session and
 * pass it to the Analyzer.
 */
class SpectralCache {
public:
    SpectralCache() = default;

    // Non-copyable
    SpectralCache(const SpectralCache&) = delete;
    SpectralCache& operator=(const SpectralCache&) = delete;

    /**
     * Get singleton instance
     */
    static SpectralCache& instance();

    /**
     * Twiddle factors for a transform of size n
     * @throws std::invalid_argument if n is zero or not a power of two
     */
    const TwiddleTable& twiddles(size_t n);

    /**
     * Symmetric Hann window: 0.5 * (1 - cos(2*pi*i / (size - 1)))
     * @throws std::invalid_argument if size is zero
     */
    const std::vector<float>& hannWindow(size_t size);

    size_t getTwiddleCount() const;
    size_t getWindowCount() const;

private:
    mutable std::mutex mutex_;
    std::map<size_t, std::unique_ptr<const TwiddleTable>> twiddles_;
    std::map<size_t, std::unique_ptr<const std::vector<float>>> windows_;
};

/**
 * Hann window from the process-wide cache
 */
const std::vector<float>& hannWindow(size_t size);

inline bool isPowerOfTwo(size_t n) {
    return n != 0 && (n & (n - 1)) == 0;
}

} // namespace analyzer
