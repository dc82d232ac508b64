#pragma once

#include <cstddef>
#include <vector>

namespace analyzer {

/**
 * Decoded PCM audio, one float vector per channel
 *
 * Holds what a decoder produced: a sample rate and equally long channels.
 * Analysis only reads from it.
 */
class AudioBuffer {
public:
    /**
     * @param channels Per-channel samples (all the same length, at least one channel)
     * @param sampleRate Sample rate in Hz (> 0)
     * @throws std::invalid_argument on an empty channel list, mismatched
     *         channel lengths or a non-positive sample rate
     */
    AudioBuffer(std::vector<std::vector<float>> channels, float sampleRate);

    /** Build a buffer from interleaved frames (as decoders emit them) */
    static AudioBuffer fromInterleaved(const float* frames, size_t numFrames,
                                       size_t numChannels, float sampleRate);

    float getSampleRate() const { return sampleRate_; }
    size_t getNumChannels() const { return channels_.size(); }
    size_t getLength() const { return channels_.front().size(); }
    double getDuration() const { return static_cast<double>(getLength()) / sampleRate_; }

    const std::vector<float>& getChannelData(size_t channel) const;

private:
    std::vector<std::vector<float>> channels_;
    float sampleRate_;
};

/**
 * Mix to mono: average of the first two channels, or a copy of a mono buffer
 */
std::vector<float> mixToMono(const AudioBuffer& buffer);

} // namespace analyzer
