#pragma once

#include "AnalysisConfig.hpp"
#include <cmath>
#include <cstddef>
#include <vector>

namespace analyzer {

/**
 * Histogram-based tempo estimation from onset timestamps.
 *
 * Algorithm:
 * 1. Convert each inter-beat interval to a tempo: bpm = 60 / interval
 * 2. Vote for bpm, bpm / 2 and bpm * 2 (the detector may lock onto an
 *    octave-related rate) in a 0.5 BPM histogram over 60-200 BPM
 * 3. Smooth with a (1, 2, 3, 2, 1) / 9 kernel
 * 4. Return the centre of the first highest bin, rounded
 */
class BpmEstimator {
public:
	static constexpr float MIN_BPM = AnalysisConfig::MIN_BPM;
	static constexpr float MAX_BPM = AnalysisConfig::MAX_BPM;
	static constexpr float RESOLUTION = AnalysisConfig::BPM_RESOLUTION;
	static constexpr int NUM_BINS = AnalysisConfig::BPM_BINS;
	static constexpr float FALLBACK_BPM = AnalysisConfig::FALLBACK_BPM;
	static constexpr size_t MIN_BEATS = AnalysisConfig::MIN_BEATS_FOR_BPM;

	/**
	 * Estimate BPM from a deduplicated, ascending beat timeline.
	 *
	 * @param beats Beat times in seconds
	 * @param duration Track duration in seconds (reserved, not used by the histogram)
	 * @return Tempo in [60, 200], or FALLBACK_BPM with fewer than MIN_BEATS beats
	 */
	static float estimate(const std::vector<double>& beats, double duration = 0.0) {
		(void)duration;

		if (beats.size() < MIN_BEATS) {
			return FALLBACK_BPM;
		}

		std::vector<float> histogram = buildHistogram(beats);
		std::vector<float> smoothed = smooth(histogram);

		// Strictly greater: ties keep the lowest tempo
		int maxBin = 0;
		float maxValue = 0.0f;
		for (int i = 0; i < NUM_BINS; i++) {
			if (smoothed[i] > maxValue) {
				maxValue = smoothed[i];
				maxBin = i;
			}
		}

		return std::round(MIN_BPM + maxBin * RESOLUTION);
	}

	/**
	 * Tempo votes per 0.5 BPM bin, with harmonic folding
	 */
	static std::vector<float> buildHistogram(const std::vector<double>& beats) {
		std::vector<float> histogram(NUM_BINS, 0.0f);
		static constexpr double multipliers[3] = {0.5, 1.0, 2.0};

		for (size_t i = 1; i < beats.size(); i++) {
			const double interval = beats[i] - beats[i - 1];
			if (interval <= 0.0) {
				continue;
			}
			const double bpm = 60.0 / interval;

			for (double multiplier : multipliers) {
				const double adjusted = bpm * multiplier;
				if (adjusted >= MIN_BPM && adjusted <= MAX_BPM) {
					const int bin = static_cast<int>(std::floor((adjusted - MIN_BPM) / RESOLUTION));
					// adjusted == MAX_BPM lands one past the end
					if (bin >= 0 && bin < NUM_BINS) {
						histogram[bin] += 1.0f;
					}
				}
			}
		}

		return histogram;
	}

	/**
	 * 5-tap smoothing of the interior bins; the two bins at each edge are 0
	 */
	static std::vector<float> smooth(const std::vector<float>& histogram) {
		const int numBins = static_cast<int>(histogram.size());
		std::vector<float> smoothed(histogram.size(), 0.0f);
		for (int i = 2; i < numBins - 2; i++) {
			smoothed[i] = (histogram[i - 2] + histogram[i - 1] * 2.0f + histogram[i] * 3.0f +
			               histogram[i + 1] * 2.0f + histogram[i + 2]) / 9.0f;
		}
		return smoothed;
	}
};

} // namespace analyzer
