#pragma once

#include "AudioBuffer.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <random>
#include <utility>
#include <vector>

namespace test_utils {

/**
 * Generate a sine wave for testing
 */
inline std::vector<float> generateSineWave(float frequency, float sampleRate,
                                           size_t numSamples, float amplitude = 1.0f) {
    std::vector<float> samples(numSamples);
    for (size_t i = 0; i < numSamples; ++i) {
        double t = static_cast<double>(i) / sampleRate;
        samples[i] = amplitude * static_cast<float>(std::sin(2.0 * M_PI * frequency * t));
    }
    return samples;
}

/**
 * Generate an impulse signal
 */
inline std::vector<float> generateImpulse(size_t numSamples) {
    std::vector<float> samples(numSamples, 0.0f);
    if (numSamples > 0) {
        samples[0] = 1.0f;
    }
    return samples;
}

/**
 * Generate random noise
 */
inline std::vector<float> generateNoise(size_t numSamples, float amplitude = 0.1f,
                                        unsigned int seed = 42) {
    std::mt19937 rng(seed);
    std::normal_distribution<float> dist(0.0f, amplitude);

    std::vector<float> samples(numSamples);
    for (auto& s : samples) {
        s = dist(rng);
    }
    return samples;
}

/**
 * Generate a click track (synthetic beats)
 */
inline std::vector<float> generateClickTrack(float bpm, float sampleRate,
                                             float durationSeconds,
                                             float clickFrequency = 1000.0f) {
    size_t numSamples = static_cast<size_t>(durationSeconds * sampleRate);
    std::vector<float> samples(numSamples, 0.0f);

    float samplesPerBeat = (60.0f / bpm) * sampleRate;
    size_t clickLength = 100;  // Short click

    for (float pos = 0; pos < numSamples; pos += samplesPerBeat) {
        size_t startSample = static_cast<size_t>(pos);
        for (size_t j = 0; j < clickLength && startSample + j < numSamples; ++j) {
            float t = static_cast<float>(j) / sampleRate;
            float envelope = std::exp(-static_cast<float>(j) / 20.0f);
            samples[startSample + j] = envelope * std::sin(2.0f * M_PI * clickFrequency * t);
        }
    }

    return samples;
}

/**
 * Generate decaying low-frequency hits (synthetic kick drum)
 *
 * Each hit is amplitude * exp(-t / decaySeconds) * sin(2*pi*frequency*t),
 * starting at the given sample offsets and ringing to the end of the buffer.
 * With frequency = sampleRate / 512 every analysis hop holds a whole number of
 * cycles, so the flux between consecutive decaying frames is never positive.
 */
inline std::vector<float> generateKickPattern(const std::vector<size_t>& onsets,
                                              size_t numSamples, float sampleRate,
                                              float frequency, float decaySeconds = 0.3f,
                                              float amplitude = 1.0f) {
    std::vector<float> samples(numSamples, 0.0f);
    const double decaySamples = decaySeconds * sampleRate;

    for (size_t onset : onsets) {
        for (size_t i = onset; i < numSamples; ++i) {
            const double n = static_cast<double>(i - onset);
            const double envelope = std::exp(-n / decaySamples);
            const double phase = 2.0 * M_PI * frequency * n / sampleRate;
            samples[i] += static_cast<float>(amplitude * envelope * std::sin(phase));
        }
    }

    return samples;
}

/**
 * Wrap mono samples in an AudioBuffer
 */
inline analyzer::AudioBuffer makeMonoBuffer(std::vector<float> samples, float sampleRate) {
    std::vector<std::vector<float>> channels;
    channels.push_back(std::move(samples));
    return analyzer::AudioBuffer(std::move(channels), sampleRate);
}

/**
 * Compare floats with tolerance
 */
inline bool floatsEqual(float a, float b, float tolerance = 1e-5f) {
    return std::abs(a - b) < tolerance;
}

/**
 * Calculate max absolute error between two vectors
 */
inline float maxAbsoluteError(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size()) {
        return std::numeric_limits<float>::max();
    }
    float maxErr = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        maxErr = std::max(maxErr, std::abs(a[i] - b[i]));
    }
    return maxErr;
}

/**
 * Find index of maximum value
 */
inline size_t argmax(const std::vector<float>& v) {
    if (v.empty()) return 0;
    return std::max_element(v.begin(), v.end()) - v.begin();
}

/**
 * Largest value of a series (0 for an empty series)
 */
inline float maxValue(const std::vector<float>& v) {
    if (v.empty()) return 0.0f;
    return *std::max_element(v.begin(), v.end());
}

} // namespace test_utils
