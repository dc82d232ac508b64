/**
 * Shared twiddle-factor and window cache
 */

#include "SpectralCache.hpp"
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace analyzer {

static constexpr double PI = 3.14159265358979323846;

/**
 * Create Hann window (symmetric, matches scipy.signal.hann)
 */
static void createHannWindow(float* window, size_t length) {
    if (length == 1) {
        // Formula divides by (length - 1)
        window[0] = 1.0f;
        return;
    }
    for (size_t i = 0; i < length; i++) {
        window[i] = static_cast<float>(0.5 * (1.0 - std::cos((2.0 * PI * i) / (length - 1))));
    }
}

static void createTwiddles(TwiddleTable& table, size_t n) {
    const size_t half = n / 2;
    table.cos.resize(half);
    table.sin.resize(half);
    for (size_t k = 0; k < half; k++) {
        const double angle = -2.0 * PI * static_cast<double>(k) / static_cast<double>(n);
        table.cos[k] = static_cast<float>(std::cos(angle));
        table.sin[k] = static_cast<float>(std::sin(angle));
    }
}

SpectralCache& SpectralCache::instance() {
    static SpectralCache inst;
    return inst;
}

const TwiddleTable& SpectralCache::twiddles(size_t n) {
    if (!isPowerOfTwo(n)) {
        throw std::invalid_argument("FFT size must be a non-zero power of two, got " +
                                    std::to_string(n));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = twiddles_.find(n);
    if (it != twiddles_.end()) {
        return *it->second;
    }

    auto table = std::make_unique<TwiddleTable>();
    createTwiddles(*table, n);
    const TwiddleTable& ref = *table;
    twiddles_.emplace(n, std::move(table));
    return ref;
}

const std::vector<float>& SpectralCache::hannWindow(size_t size) {
    if (size == 0) {
        throw std::invalid_argument("Window size must be positive");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = windows_.find(size);
    if (it != windows_.end()) {
        return *it->second;
    }

    auto window = std::make_unique<std::vector<float>>(size);
    createHannWindow(window->data(), size);
    const std::vector<float>& ref = *window;
    windows_.emplace(size, std::move(window));
    return ref;
}

size_t SpectralCache::getTwiddleCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return twiddles_.size();
}

size_t SpectralCache::getWindowCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return windows_.size();
}

const std::vector<float>& hannWindow(size_t size) {
    return SpectralCache::instance().hannWindow(size);
}

} // namespace analyzer
