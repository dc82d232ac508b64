/**
 * Decoded audio container and mono mixdown
 */

#include "AudioBuffer.hpp"
#include <stdexcept>
#include <string>
#include <utility>

namespace analyzer {

AudioBuffer::AudioBuffer(std::vector<std::vector<float>> channels, float sampleRate)
    : channels_(std::move(channels)), sampleRate_(sampleRate) {
    if (channels_.empty()) {
        throw std::invalid_argument("AudioBuffer: at least one channel is required");
    }
    if (!(sampleRate_ > 0.0f)) {
        throw std::invalid_argument("AudioBuffer: sample rate must be positive, got " +
                                    std::to_string(sampleRate_));
    }
    const size_t length = channels_.front().size();
    for (size_t c = 1; c < channels_.size(); ++c) {
        if (channels_[c].size() != length) {
            throw std::invalid_argument("AudioBuffer: channel " + std::to_string(c) +
                                        " has " + std::to_string(channels_[c].size()) +
                                        " samples, expected " + std::to_string(length));
        }
    }
}

AudioBuffer AudioBuffer::fromInterleaved(const float* frames, size_t numFrames,
                                         size_t numChannels, float sampleRate) {
    if (numChannels == 0) {
        throw std::invalid_argument("AudioBuffer: at least one channel is required");
    }

    std::vector<std::vector<float>> channels(numChannels, std::vector<float>(numFrames));
    for (size_t i = 0; i < numFrames; ++i) {
        for (size_t c = 0; c < numChannels; ++c) {
            channels[c][i] = frames[i * numChannels + c];
        }
    }
    return AudioBuffer(std::move(channels), sampleRate);
}

const std::vector<float>& AudioBuffer::getChannelData(size_t channel) const {
    if (channel >= channels_.size()) {
        throw std::out_of_range("AudioBuffer: channel " + std::to_string(channel) +
                                " out of range (" + std::to_string(channels_.size()) +
                                " channels)");
    }
    return channels_[channel];
}

std::vector<float> mixToMono(const AudioBuffer& buffer) {
    if (buffer.getNumChannels() == 1) {
        return buffer.getChannelData(0);
    }

    // Only the first two channels contribute
    const auto& left = buffer.getChannelData(0);
    const auto& right = buffer.getChannelData(1);
    std::vector<float> mono(left.size());
    for (size_t i = 0; i < left.size(); ++i) {
        mono[i] = (left[i] + right[i]) / 2.0f;
    }
    return mono;
}

} // namespace analyzer
