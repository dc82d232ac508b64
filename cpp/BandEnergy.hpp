#pragma once

#include "AnalysisConfig.hpp"
#include "AnalysisResult.hpp"
#include "Progress.hpp"
#include "SpectralCache.hpp"
#include <cstddef>
#include <vector>

namespace analyzer {

/**
 * FFT bin range [start, end) for a frequency band
 */
struct BinRange {
    size_t start;
    size_t end;

    size_t count() const { return end > start ? end - start : 0; }
};

/**
 * Output of the band / loudness stage
 */
struct BandEnergyResult {
    FrequencySeries frequency;
    std::vector<float> energy;
};

/**
 * Band Energy Extractor
 *
 * Splits the mono buffer into floor(duration * 30) back-to-back frames and
 * produces, per frame:
 * - four band energies (sub/bass/mid/high): RMS of the Hann-windowed
 *   2048-point magnitude spectrum over the band's bins, times bandGain
 * - loudness: RMS of the raw (unwindowed) frame samples, times energyGain
 *
 * Both are clamped to 1, then every series is divided by its own maximum.
 */
class BandEnergyExtractor {
public:
    explicit BandEnergyExtractor(const BandEnergyOptions& options = BandEnergyOptions(),
                                 SpectralCache& cache = SpectralCache::instance());

    /**
     * Run the stage over a mono buffer
     * @param samples Mono samples
     * @param numSamples Number of samples
     * @param sampleRate Sample rate in Hz
     * @param onProgress Called every PROGRESS_INTERVAL frames with this stage's completion
     * @param cancel Checked before every frame
     * @throws AnalysisCancelled if cancel is set mid-run
     */
    BandEnergyResult extract(const float* samples, size_t numSamples, float sampleRate,
                             const ProgressCallback& onProgress = nullptr,
                             const CancellationToken* cancel = nullptr) const;

    /** Number of output frames: floor(duration * FEATURE_RATE) */
    static size_t getFrameCount(size_t numSamples, float sampleRate);

    /**
     * Bins of a band, both edges included:
     * floor(low / binFreq) .. min(ceil(high / binFreq), fftSize/2 - 1)
     */
    static BinRange getBinRange(const BandRange& band, float sampleRate, size_t fftSize);

    /**
     * Divide every value by the series maximum (left as is when the maximum is 0)
     */
    static void normalize(std::vector<float>& series);

    const BandEnergyOptions& getOptions() const { return options_; }

private:
    BandEnergyOptions options_;
    SpectralCache& cache_;
};

} // namespace analyzer
