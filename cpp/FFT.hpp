#pragma once

#include "SpectralCache.hpp"
#include <cstddef>
#include <complex>
#include <memory>
#include <vector>

namespace analyzer {

/**
 * FFT - Radix-2 Cooley-Tukey Fast Fourier Transform
 *
 * Iterative decimation-in-time transform of real input. The bit-reversal
 * permutation is built once per instance; twiddle factors come from a
 * SpectralCache shared between instances of the same size.
 */
class FFT {
public:
    /**
     * Create FFT processor for given size
     * @param size FFT size (must be a non-zero power of 2)
     * @param cache Twiddle factor cache
     * @throws std::invalid_argument if size is not a power of 2
     */
    explicit FFT(size_t size, SpectralCache& cache = SpectralCache::instance());
    ~FFT();

    // Non-copyable
    FFT(const FFT&) = delete;
    FFT& operator=(const FFT&) = delete;

    /**
     * Compute real-to-complex FFT (unscaled)
     * @param input Real input samples (size elements)
     * @param output Complex output (size/2 + 1 elements)
     */
    void forward(const float* input, std::complex<float>* output);

    /**
     * Get normalized magnitude spectrum: |X[k]| / size
     * @param fftOutput Complex FFT output
     * @param magnitudes Output magnitude array (size/2 elements, Nyquist excluded)
     */
    void magnitude(const std::complex<float>* fftOutput, float* magnitudes) const;

    /**
     * Get normalized power spectrum (normalized magnitude squared)
     * @param fftOutput Complex FFT output
     * @param power Output power array (size/2 elements)
     */
    void powerSpectrum(const std::complex<float>* fftOutput, float* power) const;

    /**
     * forward() followed by magnitude()
     * @param input Real input samples (size elements)
     * @param magnitudes Output magnitude array (size/2 elements)
     */
    void computeMagnitudes(const float* input, float* magnitudes);

    size_t getSize() const { return size_; }
    size_t getOutputSize() const { return size_ / 2 + 1; }
    size_t getMagnitudeSize() const { return size_ / 2; }

private:
    size_t size_;

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace analyzer
