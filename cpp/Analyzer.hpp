#pragma once

#include "AnalysisConfig.hpp"
#include "AnalysisResult.hpp"
#include "AudioBuffer.hpp"
#include "BandEnergy.hpp"
#include "BeatDetector.hpp"
#include "Progress.hpp"
#include "SpectralCache.hpp"
#include <cstddef>
#include <vector>

namespace analyzer {

/**
 * Analyzer - Offline feature extraction for synchronized visuals
 *
 * Usage:
 *   1. Decode the audio into an AudioBuffer
 *   2. analyze() - band energies, loudness, beats and BPM
 *   3. generateWaveform() - min/max overview for drawing the waveform
 *
 * analyze() runs synchronously and can take seconds on a long track; run it
 * on a worker thread and use a CancellationToken to stop it early.
 * One Analyzer may be used from several threads at once.
 */
class Analyzer {
public:
    explicit Analyzer(const AnalyzerOptions& options = AnalyzerOptions(),
                      SpectralCache& cache = SpectralCache::instance());
    ~Analyzer();

    /**
     * Analyze a decoded recording
     *
     * Progress milestones: 0.1 (mono mix ready), 0.1-0.5 band analysis,
     * 0.5-0.9 beat detection, 1.0 when the BPM is known.
     *
     * @param buffer Decoded audio (stereo is mixed down to mono)
     * @param onProgress Optional progress callback, values non-decreasing in [0, 1]
     * @param cancel Optional token checked at every frame boundary
     * @throws std::invalid_argument if the buffer holds no samples
     * @throws AnalysisCancelled if cancel is set before the run finishes
     */
    AnalysisResult analyze(const AudioBuffer& buffer,
                           const ProgressCallback& onProgress = nullptr,
                           const CancellationToken* cancel = nullptr) const;

    const AnalyzerOptions& getOptions() const { return options_; }

private:
    AnalyzerOptions options_;
    BandEnergyExtractor bandExtractor_;
    BeatDetector beatDetector_;
};

/**
 * Min/max waveform overview
 *
 * Splits the mono mix into numPoints spans of floor(length / numPoints)
 * samples and returns [min0, max0, min1, max1, ...] (2 * numPoints values).
 * Spans without samples are (0, 0).
 */
std::vector<float> generateWaveform(const AudioBuffer& buffer,
                                    size_t numPoints = AnalysisConfig::DEFAULT_WAVEFORM_POINTS);

} // namespace analyzer
