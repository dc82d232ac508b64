/**
 * Frame slicing shared by the band and beat analyses
 */

#include "Framer.hpp"
#include <algorithm>
#include <stdexcept>

namespace analyzer {

Framer::Framer(const float* samples, size_t numSamples,
               size_t frameLength, size_t hopSize, size_t numFrames)
	: samples_(samples)
	, numSamples_(numSamples)
	, frameLength_(frameLength)
	, hopSize_(hopSize)
	, numFrames_(numFrames)
{
	if (numFrames_ > 0 && (frameLength_ == 0 || hopSize_ == 0)) {
		throw std::invalid_argument("Framer: frame length and hop size must be positive");
	}
}

Framer Framer::contiguous(const float* samples, size_t numSamples, size_t numFrames) {
	if (numFrames == 0) {
		return Framer(samples, numSamples, 0, 0, 0);
	}
	const size_t samplesPerFrame = numSamples / numFrames;
	return Framer(samples, numSamples, samplesPerFrame, samplesPerFrame, numFrames);
}

Framer Framer::overlapping(const float* samples, size_t numSamples,
                           size_t frameLength, size_t hopSize) {
	if (hopSize == 0) {
		throw std::invalid_argument("Framer: hop size must be positive");
	}

	size_t numFrames = 0;
	if (numSamples > 0) {
		numFrames = 1;
		if (numSamples > frameLength) {
			// Round up so the tail lands in a zero-padded final frame
			numFrames += (numSamples - frameLength + hopSize - 1) / hopSize;
		}
	}
	return Framer(samples, numSamples, frameLength, hopSize, numFrames);
}

size_t Framer::getAvailableLength(size_t index) const {
	const size_t start = getFrameStart(index);
	if (start >= numSamples_) {
		return 0;
	}
	return std::min(frameLength_, numSamples_ - start);
}

size_t Framer::extract(size_t index, float* output, size_t outputLength,
                       const float* window) const {
	const size_t copyLen = std::min(getAvailableLength(index), outputLength);
	if (copyLen > 0) {
		const float* frame = getFrameData(index);
		if (window) {
			for (size_t i = 0; i < copyLen; i++) {
				output[i] = frame[i] * window[i];
			}
		} else {
			std::copy(frame, frame + copyLen, output);
		}
	}

	// Zero-pad the rest
	std::fill(output + copyLen, output + outputLength, 0.0f);
	return copyLen;
}

} // namespace analyzer
