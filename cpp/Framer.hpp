#pragma once

#include <cstddef>

namespace analyzer {

/**
 * Frame slicer over a mono sample buffer
 *
 * Frame i starts at i * hopSize and spans frameLength samples. Frames that
 * run past the end of the buffer are zero-padded on extraction. The Framer
 * does not own the samples; the buffer must outlive it.
 */
class Framer {
public:
	Framer(const float* samples, size_t numSamples,
	       size_t frameLength, size_t hopSize, size_t numFrames);

	/**
	 * numFrames equal, back-to-back frames of floor(numSamples / numFrames)
	 * samples. Trailing samples that do not fill a frame are ignored.
	 */
	static Framer contiguous(const float* samples, size_t numSamples, size_t numFrames);

	/**
	 * Hop-spaced frames covering the whole buffer; the last one may be partial
	 */
	static Framer overlapping(const float* samples, size_t numSamples,
	                          size_t frameLength, size_t hopSize);

	/**
	 * Copy frame `index` into output, multiplied by window if given
	 *
	 * Copies min(frameLength, outputLength) samples where available and
	 * zero-fills the rest of output.
	 *
	 * @param index Frame index (< getFrameCount())
	 * @param output Destination buffer
	 * @param outputLength Destination length (typically the FFT size)
	 * @param window Window coefficients (outputLength elements) or nullptr
	 * @return Number of buffer samples copied
	 */
	size_t extract(size_t index, float* output, size_t outputLength,
	               const float* window = nullptr) const;

	/** Samples of frame `index` that lie inside the buffer */
	size_t getAvailableLength(size_t index) const;

	const float* getFrameData(size_t index) const { return samples_ + getFrameStart(index); }
	size_t getFrameStart(size_t index) const { return index * hopSize_; }
	size_t getFrameCount() const { return numFrames_; }
	size_t getFrameLength() const { return frameLength_; }
	size_t getHopSize() const { return hopSize_; }

private:
	const float* samples_;
	size_t numSamples_;
	size_t frameLength_;
	size_t hopSize_;
	size_t numFrames_;
};

} // namespace analyzer
