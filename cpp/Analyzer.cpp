/**
 * Analyzer - drives band, beat and tempo analysis over a decoded buffer
 */

#include "Analyzer.hpp"
#include "BpmEstimator.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>

#ifdef __ANDROID__
#include <android/log.h>
#define LOG_TAG "Analyzer"
#define LOGI(...) __android_log_print(ANDROID_LOG_INFO, LOG_TAG, __VA_ARGS__)
#define LOGE(...) __android_log_print(ANDROID_LOG_ERROR, LOG_TAG, __VA_ARGS__)
#else
#include <cstdio>
#define LOGI(...) printf("[Analyzer] " __VA_ARGS__)
#define LOGE(...) fprintf(stderr, "[Analyzer] " __VA_ARGS__)
#endif

namespace analyzer {

Analyzer::Analyzer(const AnalyzerOptions& options, SpectralCache& cache)
    : options_(options),
      bandExtractor_(options.bands, cache),
      beatDetector_(options.beats, cache) {
}

Analyzer::~Analyzer() = default;

AnalysisResult Analyzer::analyze(const AudioBuffer& buffer,
                                 const ProgressCallback& onProgress,
                                 const CancellationToken* cancel) const {
    if (buffer.getLength() == 0) {
        throw std::invalid_argument("Cannot analyze an empty audio buffer");
    }

    const float sampleRate = buffer.getSampleRate();
    const std::vector<float> mono = mixToMono(buffer);

    auto report = [&onProgress](float value) {
        if (onProgress) {
            onProgress(value);
        }
    };

    AnalysisResult result;
    result.duration = buffer.getDuration();

    try {
        report(0.1f);

        BandEnergyResult bands = bandExtractor_.extract(
            mono.data(), mono.size(), sampleRate,
            [&report](float p) { report(0.1f + p * 0.4f); },
            cancel);

        report(0.5f);

        result.beats = beatDetector_.detect(
            mono.data(), mono.size(), sampleRate,
            [&report](float p) { report(0.5f + p * 0.4f); },
            cancel);

        report(0.9f);

        result.bpm = BpmEstimator::estimate(result.beats.all, result.duration);

        result.frequency = std::move(bands.frequency);
        result.frequency.sampleRate = AnalysisConfig::FEATURE_RATE;
        result.energy = std::move(bands.energy);
    } catch (const AnalysisCancelled&) {
        LOGE("Analysis cancelled (%.1fs of audio)\n", result.duration);
        throw;
    }

    report(1.0f);

    LOGI("Analyzed %.1fs: %.0f BPM, %zu beats (%zu kicks, %zu snares, %zu hihats)\n",
         result.duration, result.bpm, result.beats.all.size(),
         result.beats.kicks.size(), result.beats.snares.size(), result.beats.hihats.size());

    return result;
}

std::vector<float> generateWaveform(const AudioBuffer& buffer, size_t numPoints) {
    std::vector<float> waveform(numPoints * 2, 0.0f);
    if (numPoints == 0 || buffer.getLength() == 0) {
        return waveform;
    }

    const std::vector<float> mono = mixToMono(buffer);
    const size_t samplesPerPoint = mono.size() / numPoints;

    for (size_t i = 0; i < numPoints; i++) {
        const size_t start = i * samplesPerPoint;
        const size_t end = std::min(start + samplesPerPoint, mono.size());
        if (start >= end) {
            continue;
        }

        const auto range = std::minmax_element(mono.begin() + start, mono.begin() + end);
        waveform[i * 2] = *range.first;
        waveform[i * 2 + 1] = *range.second;
    }

    return waveform;
}

} // namespace analyzer
