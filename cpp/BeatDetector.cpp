/**
 * Spectral-flux percussive onset detection
 */

#include "BeatDetector.hpp"
#include "FFT.hpp"
#include "Framer.hpp"
#include <algorithm>
#include <cmath>

namespace analyzer {

BeatDetector::BeatDetector(const BeatDetectorOptions& options, SpectralCache& cache)
	: options_(options), cache_(cache) {
}

BinRange BeatDetector::getBinRange(const BandRange& band, float sampleRate, size_t fftSize) {
	const double binFrequency = static_cast<double>(sampleRate) / fftSize;
	const size_t lastBin = fftSize / 2 - 1;

	BinRange range;
	range.start = std::min(static_cast<size_t>(std::floor(band.low / binFrequency)), lastBin);
	range.end = std::min(static_cast<size_t>(std::ceil(band.high / binFrequency)), lastBin);
	return range;
}

float BeatDetector::spectralFlux(const float* current, const float* previous, size_t count) {
	float flux = 0.0f;
	for (size_t i = 0; i < count; i++) {
		const float diff = current[i] - previous[i];
		if (diff > 0.0f) {
			flux += diff;
		}
	}
	return flux;
}

FluxSignals BeatDetector::computeFlux(const float* samples, size_t numSamples, float sampleRate,
                                      const ProgressCallback& onProgress,
                                      const CancellationToken* cancel) const {
	constexpr size_t frameSize = AnalysisConfig::BEAT_FRAME_SIZE;
	constexpr size_t hopSize = AnalysisConfig::BEAT_HOP_SIZE;

	const Framer framer = Framer::overlapping(samples, numSamples, frameSize, hopSize);
	const size_t numFrames = framer.getFrameCount();

	FluxSignals flux;
	flux.kick.assign(numFrames, 0.0f);
	flux.snare.assign(numFrames, 0.0f);
	flux.hihat.assign(numFrames, 0.0f);

	if (numFrames == 0) {
		return flux;
	}

	const BinRange ranges[3] = {
		getBinRange(options_.kick, sampleRate, frameSize),
		getBinRange(options_.snare, sampleRate, frameSize),
		getBinRange(options_.hihat, sampleRate, frameSize),
	};
	std::vector<float>* signals[3] = {&flux.kick, &flux.snare, &flux.hihat};

	FFT fft(frameSize, cache_);
	const std::vector<float>& window = cache_.hannWindow(frameSize);

	// Pre-allocated buffers; previous holds last frame's magnitudes
	std::vector<float> frameData(frameSize);
	std::vector<float> magnitudes(fft.getMagnitudeSize());
	std::vector<float> previous(fft.getMagnitudeSize(), 0.0f);

	for (size_t frame = 0; frame < numFrames; frame++) {
		throwIfCancelled(cancel);

		framer.extract(frame, frameData.data(), frameSize, window.data());
		fft.computeMagnitudes(frameData.data(), magnitudes.data());

		// First frame has no predecessor: flux stays 0
		if (frame > 0) {
			for (int c = 0; c < 3; c++) {
				const BinRange& r = ranges[c];
				(*signals[c])[frame] = spectralFlux(magnitudes.data() + r.start,
				                                    previous.data() + r.start, r.count());
			}
		}

		std::swap(previous, magnitudes);

		if (onProgress && frame % AnalysisConfig::BEAT_PROGRESS_INTERVAL == 0) {
			onProgress(static_cast<float>(frame) / numFrames);
		}
	}

	return flux;
}

std::vector<double> BeatDetector::findPeaks(const std::vector<float>& signal, double frameDuration,
                                            float threshold, float meanMultiplier) {
	constexpr size_t windowSize = AnalysisConfig::PEAK_WINDOW;
	std::vector<double> peaks;

	if (signal.size() <= 2 * windowSize) {
		return peaks;
	}

	for (size_t i = windowSize; i < signal.size() - windowSize; i++) {
		float localSum = 0.0f;
		for (size_t j = i - windowSize; j <= i + windowSize; j++) {
			localSum += signal[j];
		}
		const float localMean = localSum / (windowSize * 2 + 1);
		const float adaptiveThreshold = std::max(threshold, localMean * meanMultiplier);

		if (signal[i] > adaptiveThreshold &&
		    signal[i] > signal[i - 1] &&
		    signal[i] > signal[i + 1]) {
			peaks.push_back(static_cast<double>(i) * frameDuration);
		}
	}

	return peaks;
}

std::vector<double> BeatDetector::mergeBeats(const std::vector<double>& kicks,
                                             const std::vector<double>& snares,
                                             const std::vector<double>& hihats) {
	std::vector<double> allBeats;
	allBeats.reserve(kicks.size() + snares.size() + hihats.size());
	allBeats.insert(allBeats.end(), kicks.begin(), kicks.end());
	allBeats.insert(allBeats.end(), snares.begin(), snares.end());
	allBeats.insert(allBeats.end(), hihats.begin(), hihats.end());
	std::sort(allBeats.begin(), allBeats.end());

	std::vector<double> unique;
	for (double beat : allBeats) {
		if (unique.empty() || beat - unique.back() > AnalysisConfig::DEDUPE_WINDOW) {
			unique.push_back(beat);
		}
	}
	return unique;
}

BeatTimeline BeatDetector::detect(const float* samples, size_t numSamples, float sampleRate,
                                  const ProgressCallback& onProgress,
                                  const CancellationToken* cancel) const {
	const FluxSignals flux = computeFlux(samples, numSamples, sampleRate, onProgress, cancel);
	const double frameDuration = static_cast<double>(AnalysisConfig::BEAT_HOP_SIZE) / sampleRate;
	const float multiplier = options_.localMeanMultiplier;

	BeatTimeline beats;
	beats.kicks = findPeaks(flux.kick, frameDuration, options_.kickThreshold, multiplier);
	beats.snares = findPeaks(flux.snare, frameDuration, options_.snareThreshold, multiplier);
	beats.hihats = findPeaks(flux.hihat, frameDuration, options_.hihatThreshold, multiplier);
	beats.all = mergeBeats(beats.kicks, beats.snares, beats.hihats);
	return beats;
}

} // namespace analyzer
