/**
 * Frequency band and loudness series extraction
 */

#include "BandEnergy.hpp"
#include "FFT.hpp"
#include "Framer.hpp"
#include <algorithm>
#include <cmath>
#include <complex>

namespace analyzer {

BandEnergyExtractor::BandEnergyExtractor(const BandEnergyOptions& options, SpectralCache& cache)
    : options_(options), cache_(cache) {
}

size_t BandEnergyExtractor::getFrameCount(size_t numSamples, float sampleRate) {
    const double duration = static_cast<double>(numSamples) / sampleRate;
    return static_cast<size_t>(std::floor(duration * AnalysisConfig::FEATURE_RATE));
}

BinRange BandEnergyExtractor::getBinRange(const BandRange& band, float sampleRate, size_t fftSize) {
    const double binFrequency = static_cast<double>(sampleRate) / fftSize;
    const size_t lastBin = fftSize / 2 - 1;

    BinRange range;
    range.start = static_cast<size_t>(std::floor(band.low / binFrequency));
    range.end = std::min(static_cast<size_t>(std::ceil(band.high / binFrequency)), lastBin) + 1;
    return range;
}

void BandEnergyExtractor::normalize(std::vector<float>& series) {
    float maxValue = 0.0f;
    for (float v : series) {
        if (v > maxValue) {
            maxValue = v;
        }
    }
    if (maxValue > 0.0f) {
        for (float& v : series) {
            v /= maxValue;
        }
    }
}

BandEnergyResult BandEnergyExtractor::extract(const float* samples, size_t numSamples,
                                              float sampleRate,
                                              const ProgressCallback& onProgress,
                                              const CancellationToken* cancel) const {
    constexpr size_t fftSize = AnalysisConfig::BAND_FFT_SIZE;
    const size_t numFrames = getFrameCount(numSamples, sampleRate);

    BandEnergyResult result;
    auto& freq = result.frequency;
    freq.sub.assign(numFrames, 0.0f);
    freq.bass.assign(numFrames, 0.0f);
    freq.mid.assign(numFrames, 0.0f);
    freq.high.assign(numFrames, 0.0f);
    result.energy.assign(numFrames, 0.0f);

    if (numFrames == 0) {
        return result;
    }

    // Band order matches the series order below
    const BinRange bins[4] = {
        getBinRange(options_.sub, sampleRate, fftSize),
        getBinRange(options_.bass, sampleRate, fftSize),
        getBinRange(options_.mid, sampleRate, fftSize),
        getBinRange(options_.high, sampleRate, fftSize),
    };
    std::vector<float>* series[4] = {&freq.sub, &freq.bass, &freq.mid, &freq.high};

    FFT fft(fftSize, cache_);
    const std::vector<float>& window = cache_.hannWindow(fftSize);
    const Framer framer = Framer::contiguous(samples, numSamples, numFrames);

    // Pre-allocated buffers
    std::vector<float> frameData(fftSize);
    std::vector<std::complex<float>> fftOutput(fft.getOutputSize());
    std::vector<float> power(fft.getMagnitudeSize());

    for (size_t frame = 0; frame < numFrames; frame++) {
        throwIfCancelled(cancel);

        framer.extract(frame, frameData.data(), fftSize, window.data());
        fft.forward(frameData.data(), fftOutput.data());
        fft.powerSpectrum(fftOutput.data(), power.data());

        for (int b = 0; b < 4; b++) {
            const size_t count = bins[b].count();
            float value = 0.0f;
            if (count > 0) {
                float sum = 0.0f;
                for (size_t bin = bins[b].start; bin < bins[b].end; bin++) {
                    sum += power[bin];
                }
                value = std::min(1.0f, std::sqrt(sum / count) * options_.bandGain);
            }
            (*series[b])[frame] = value;
        }

        // Loudness from the raw frame samples, not the windowed copy
        const size_t frameLength = framer.getAvailableLength(frame);
        const float* raw = framer.getFrameData(frame);
        float sumSquares = 0.0f;
        for (size_t i = 0; i < frameLength; i++) {
            sumSquares += raw[i] * raw[i];
        }
        if (frameLength > 0) {
            const float rms = std::sqrt(sumSquares / frameLength);
            result.energy[frame] = std::min(1.0f, rms * options_.energyGain);
        }

        if (onProgress && frame % AnalysisConfig::PROGRESS_INTERVAL == 0) {
            onProgress(static_cast<float>(frame) / numFrames);
        }
    }

    for (auto* s : series) {
        normalize(*s);
    }
    normalize(result.energy);

    return result;
}

} // namespace analyzer
