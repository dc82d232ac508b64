/**
 * FFT unit tests
 *
 * Tests the radix-2 FFT against analytic spectra: impulse, bin-centred
 * sines and Parseval's theorem. Band analysis uses 2048 points, beat
 * detection 1024.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "FFT.hpp"
#include "AnalysisConfig.hpp"
#include "test_utils.hpp"

#include <cmath>
#include <complex>
#include <stdexcept>
#include <vector>

using namespace analyzer;
using Catch::Approx;

TEST_CASE("FFT initialization", "[fft]") {
    SECTION("creates FFT of band analysis size (2048)") {
        FFT fft(AnalysisConfig::BAND_FFT_SIZE);
        REQUIRE(fft.getSize() == 2048);
        REQUIRE(fft.getOutputSize() == 1025);  // 2048/2 + 1
        REQUIRE(fft.getMagnitudeSize() == 1024);
    }

    SECTION("creates FFT of beat detection size (1024)") {
        FFT fft(AnalysisConfig::BEAT_FRAME_SIZE);
        REQUIRE(fft.getSize() == 1024);
        REQUIRE(fft.getOutputSize() == 513);
        REQUIRE(fft.getMagnitudeSize() == 512);
    }

    SECTION("rejects sizes that are not powers of 2") {
        REQUIRE_THROWS_AS(FFT(0), std::invalid_argument);
        REQUIRE_THROWS_AS(FFT(3), std::invalid_argument);
        REQUIRE_THROWS_AS(FFT(1000), std::invalid_argument);
        REQUIRE_THROWS_AS(FFT(1411), std::invalid_argument);
    }
}

TEST_CASE("FFT impulse response", "[fft]") {
    for (size_t N : {size_t(2), size_t(8), size_t(1024), size_t(2048)}) {
        DYNAMIC_SECTION("N = " << N) {
            FFT fft(N);

            auto impulse = test_utils::generateImpulse(N);
            std::vector<std::complex<float>> output(fft.getOutputSize());
            fft.forward(impulse.data(), output.data());

            // Unscaled transform of a unit impulse is 1 everywhere
            for (const auto& bin : output) {
                REQUIRE(bin.real() == Approx(1.0f).margin(1e-5f));
                REQUIRE(bin.imag() == Approx(0.0f).margin(1e-5f));
            }

            std::vector<float> magnitude(fft.getMagnitudeSize());
            fft.magnitude(output.data(), magnitude.data());
            for (float m : magnitude) {
                REQUIRE(m == Approx(1.0f / N).margin(1e-6f));
            }

            std::vector<float> power(fft.getMagnitudeSize());
            fft.powerSpectrum(output.data(), power.data());
            for (float p : power) {
                REQUIRE(p == Approx(1.0f / (N * N)).margin(1e-7f));
            }
        }
    }
}

TEST_CASE("FFT sine wave detection", "[fft]") {
    constexpr size_t N = 1024;
    constexpr float sampleRate = 44100.0f;
    const float binFrequency = sampleRate / N;
    FFT fft(N);

    std::vector<std::complex<float>> output(fft.getOutputSize());
    std::vector<float> magnitude(fft.getMagnitudeSize());

    SECTION("bin-centred sine peaks at its bin with magnitude 0.5") {
        for (size_t k : {size_t(2), size_t(10), size_t(100), size_t(400)}) {
            INFO("bin " << k);
            auto sine = test_utils::generateSineWave(k * binFrequency, sampleRate, N);
            fft.forward(sine.data(), output.data());
            fft.magnitude(output.data(), magnitude.data());

            REQUIRE(test_utils::argmax(magnitude) == k);
            REQUIRE(magnitude[k] == Approx(0.5f).margin(1e-3f));
            // No leakage for a whole number of cycles
            REQUIRE(magnitude[k + 3] < 1e-3f);
            REQUIRE(magnitude[k - 2] < 1e-3f);
        }
    }

    SECTION("off-grid sine peaks at the nearest bin") {
        const float frequency = 440.0f;
        auto sine = test_utils::generateSineWave(frequency, sampleRate, N);
        fft.forward(sine.data(), output.data());
        fft.magnitude(output.data(), magnitude.data());

        const size_t peakBin = test_utils::argmax(magnitude);
        const float expectedBin = frequency / binFrequency;  // ~10.2
        REQUIRE(std::abs(static_cast<float>(peakBin) - expectedBin) <= 1.0f);
    }

    SECTION("computeMagnitudes matches forward + magnitude") {
        auto noise = test_utils::generateNoise(N, 0.3f);
        fft.forward(noise.data(), output.data());
        fft.magnitude(output.data(), magnitude.data());

        std::vector<float> direct(fft.getMagnitudeSize());
        fft.computeMagnitudes(noise.data(), direct.data());

        REQUIRE(test_utils::maxAbsoluteError(magnitude, direct) == 0.0f);
    }
}

TEST_CASE("FFT Parseval's theorem", "[fft]") {
    constexpr size_t N = 2048;
    FFT fft(N);

    auto signal = test_utils::generateNoise(N, 0.5f);
    std::vector<std::complex<float>> output(fft.getOutputSize());
    fft.forward(signal.data(), output.data());

    double timeEnergy = 0.0;
    for (float s : signal) {
        timeEnergy += static_cast<double>(s) * s;
    }

    // Real input: DC and Nyquist once, every other bin twice
    double freqEnergy = std::norm(output[0]) + std::norm(output[N / 2]);
    for (size_t k = 1; k < N / 2; ++k) {
        freqEnergy += 2.0 * std::norm(output[k]);
    }
    freqEnergy /= N;

    REQUIRE(freqEnergy == Approx(timeEnergy).epsilon(1e-3));
}

TEST_CASE("FFT is linear", "[fft]") {
    constexpr size_t N = 1024;
    FFT fft(N);

    auto a = test_utils::generateNoise(N, 0.2f, 1);
    auto b = test_utils::generateNoise(N, 0.2f, 2);
    std::vector<float> sum(N);
    for (size_t i = 0; i < N; ++i) {
        sum[i] = a[i] + 2.0f * b[i];
    }

    std::vector<std::complex<float>> outA(fft.getOutputSize());
    std::vector<std::complex<float>> outB(fft.getOutputSize());
    std::vector<std::complex<float>> outSum(fft.getOutputSize());
    fft.forward(a.data(), outA.data());
    fft.forward(b.data(), outB.data());
    fft.forward(sum.data(), outSum.data());

    for (size_t k = 0; k < fft.getOutputSize(); ++k) {
        const std::complex<float> expected = outA[k] + 2.0f * outB[k];
        REQUIRE(std::abs(outSum[k] - expected) < 1e-3f);
    }
}

TEST_CASE("FFT instances share twiddle tables", "[fft][cache]") {
    SpectralCache cache;

    FFT first(1024, cache);
    FFT second(1024, cache);
    REQUIRE(cache.getTwiddleCount() == 1);

    FFT other(2048, cache);
    REQUIRE(cache.getTwiddleCount() == 2);

    // Same size through the same cache gives identical output
    auto noise = test_utils::generateNoise(1024, 0.3f);
    std::vector<float> magA(first.getMagnitudeSize());
    std::vector<float> magB(second.getMagnitudeSize());
    first.computeMagnitudes(noise.data(), magA.data());
    second.computeMagnitudes(noise.data(), magB.data());
    REQUIRE(magA == magB);
}
