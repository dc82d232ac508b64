#pragma once

#include "AnalysisConfig.hpp"
#include "AnalysisResult.hpp"
#include "BandEnergy.hpp"
#include "Progress.hpp"
#include "SpectralCache.hpp"
#include <cstddef>
#include <vector>

namespace analyzer {

/**
 * Per-frame spectral flux for each percussive category
 */
struct FluxSignals {
	std::vector<float> kick;
	std::vector<float> snare;
	std::vector<float> hihat;
};

/**
 * Spectral-flux percussive onset detector
 *
 * Algorithm:
 * 1. Slice the buffer into 1024-sample Hann-windowed frames, hop 512
 * 2. Per frame, take the magnitude spectrum and cut out the kick, snare
 *    and hihat bin ranges
 * 3. Flux = sum of positive magnitude increases against the previous frame
 * 4. Peak-pick each flux signal against max(threshold, 1.5 * local mean)
 * 5. Merge the three onset lists and drop onsets within 50 ms of the
 *    previously kept one
 */
class BeatDetector {
public:
	explicit BeatDetector(const BeatDetectorOptions& options = BeatDetectorOptions(),
	                      SpectralCache& cache = SpectralCache::instance());

	/**
	 * Detect percussive onsets in a mono buffer
	 * @param onProgress Called every BEAT_PROGRESS_INTERVAL frames with this stage's completion
	 * @param cancel Checked before every frame
	 * @throws AnalysisCancelled if cancel is set mid-run
	 */
	BeatTimeline detect(const float* samples, size_t numSamples, float sampleRate,
	                    const ProgressCallback& onProgress = nullptr,
	                    const CancellationToken* cancel = nullptr) const;

	/**
	 * Spectral flux signals, one value per hop (the first frame is 0)
	 */
	FluxSignals computeFlux(const float* samples, size_t numSamples, float sampleRate,
	                        const ProgressCallback& onProgress = nullptr,
	                        const CancellationToken* cancel = nullptr) const;

	/**
	 * Sum of positive differences current[i] - previous[i]
	 */
	static float spectralFlux(const float* current, const float* previous, size_t count);

	/**
	 * Adaptive-threshold peak picking
	 *
	 * Index i (PEAK_WINDOW <= i < size - PEAK_WINDOW) is a peak if it is
	 * strictly greater than both neighbours and exceeds
	 * max(threshold, meanMultiplier * mean(signal[i - PEAK_WINDOW .. i + PEAK_WINDOW])).
	 *
	 * @param frameDuration Seconds per signal index (hop / sampleRate)
	 * @return Peak times in seconds, ascending
	 */
	static std::vector<double> findPeaks(const std::vector<float>& signal, double frameDuration,
	                                     float threshold, float meanMultiplier = 1.5f);

	/**
	 * Sorted union of the three lists with entries closer than DEDUPE_WINDOW
	 * to the previously kept entry removed
	 */
	static std::vector<double> mergeBeats(const std::vector<double>& kicks,
	                                      const std::vector<double>& snares,
	                                      const std::vector<double>& hihats);

	/**
	 * Bins [floor(low / binFreq), min(ceil(high / binFreq), fftSize/2 - 1))
	 */
	static BinRange getBinRange(const BandRange& band, float sampleRate, size_t fftSize);

	const BeatDetectorOptions& getOptions() const { return options_; }

private:
	BeatDetectorOptions options_;
	SpectralCache& cache_;
};

} // namespace analyzer
