/**
 * Radix-2 Cooley-Tukey FFT
 *
 * In-place iterative transform: bit-reversal permutation followed by
 * log2(N) butterfly passes of doubling size.
 */

#include "FFT.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace analyzer {

static size_t reverseBits(size_t n, unsigned bits) {
    size_t result = 0;
    for (unsigned i = 0; i < bits; i++) {
        result = (result << 1) | (n & 1);
        n >>= 1;
    }
    return result;
}

struct FFT::Impl {
    const TwiddleTable* twiddles = nullptr;

    // bitReversed[i] = index i with its log2(N) bits reversed
    std::vector<size_t> bitReversed;

    // Pre-allocated work buffers
    std::vector<float> real;
    std::vector<float> imag;
    std::vector<std::complex<float>> outputBuffer;
};

FFT::FFT(size_t size, SpectralCache& cache) : size_(size) {
    if (!isPowerOfTwo(size)) {
        throw std::invalid_argument("FFT size must be a non-zero power of two, got " +
                                    std::to_string(size));
    }

    impl_ = std::make_unique<Impl>();
    impl_->twiddles = &cache.twiddles(size);

    unsigned bits = 0;
    while ((size_t{1} << bits) < size) {
        bits++;
    }
    impl_->bitReversed.resize(size);
    for (size_t i = 0; i < size; i++) {
        impl_->bitReversed[i] = reverseBits(i, bits);
    }

    impl_->real.resize(size);
    impl_->imag.resize(size);
    impl_->outputBuffer.resize(size / 2 + 1);
}

FFT::~FFT() = default;

void FFT::forward(const float* input, std::complex<float>* output) {
    auto& impl = *impl_;
    const size_t n = size_;
    float* re = impl.real.data();
    float* im = impl.imag.data();

    std::copy(input, input + n, re);
    std::fill(impl.imag.begin(), impl.imag.end(), 0.0f);

    // Bit-reversal permutation (imag is all zeros, only real needs swapping)
    for (size_t i = 0; i < n; i++) {
        const size_t j = impl.bitReversed[i];
        if (j > i) {
            std::swap(re[i], re[j]);
        }
    }

    const float* cosTable = impl.twiddles->cos.data();
    const float* sinTable = impl.twiddles->sin.data();

    for (size_t size = 2; size <= n; size *= 2) {
        const size_t halfSize = size / 2;
        const size_t step = n / size;

        for (size_t i = 0; i < n; i += size) {
            for (size_t j = 0; j < halfSize; j++) {
                const size_t idx = j * step;
                const float cosVal = cosTable[idx];
                const float sinVal = sinTable[idx];

                const size_t even = i + j;
                const size_t odd = even + halfSize;

                const float tReal = cosVal * re[odd] - sinVal * im[odd];
                const float tImag = sinVal * re[odd] + cosVal * im[odd];

                re[odd] = re[even] - tReal;
                im[odd] = im[even] - tImag;
                re[even] += tReal;
                im[even] += tImag;
            }
        }
    }

    const size_t outputSize = n / 2 + 1;
    for (size_t k = 0; k < outputSize; k++) {
        output[k] = {re[k], im[k]};
    }
}

void FFT::magnitude(const std::complex<float>* fftOutput, float* magnitudes) const {
    const size_t bins = size_ / 2;
    const float scale = 1.0f / static_cast<float>(size_);
    for (size_t i = 0; i < bins; ++i) {
        const float re = fftOutput[i].real();
        const float im = fftOutput[i].imag();
        magnitudes[i] = std::sqrt(re * re + im * im) * scale;
    }
}

void FFT::powerSpectrum(const std::complex<float>* fftOutput, float* power) const {
    const size_t bins = size_ / 2;
    const float scale = 1.0f / static_cast<float>(size_);
    for (size_t i = 0; i < bins; ++i) {
        const float re = fftOutput[i].real() * scale;
        const float im = fftOutput[i].imag() * scale;
        power[i] = re * re + im * im;
    }
}

void FFT::computeMagnitudes(const float* input, float* magnitudes) {
    forward(input, impl_->outputBuffer.data());
    magnitude(impl_->outputBuffer.data(), magnitudes);
}

} // namespace analyzer
