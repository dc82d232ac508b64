/**
 * Audio Analyzer CLI - Offline feature extraction from an audio file
 *
 * Usage: ./audio_analyzer_cli <file> [-w <points>] [-b]
 */

#define MINIAUDIO_IMPLEMENTATION
#include "miniaudio.h"

#include "Analyzer.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <signal.h>
#include <string>
#include <thread>
#include <vector>

using namespace analyzer;

// Frames per decoder read
constexpr ma_uint64 CHUNK_SIZE = 4096;

// Width of the waveform bars
constexpr int WAVEFORM_WIDTH = 40;

// Global state
std::atomic<bool> g_running{true};
std::atomic<float> g_progress{0.0f};
std::atomic<bool> g_done{false};

void signalHandler(int) {
	g_running = false;
}

void printUsage(const char* progName) {
	printf("Usage: %s <file> [-w <points>] [-b]\n", progName);
	printf("\n");
	printf("Options:\n");
	printf("  -w <points>  Print a waveform overview with <points> rows\n");
	printf("  -b           List every detected beat\n");
	printf("\n");
	printf("Analyzes an audio file (WAV, FLAC, MP3) and prints tempo,\n");
	printf("beat counts and band levels.\n");
	printf("Press Ctrl+C to cancel.\n");
}

std::string getBasename(const std::string& path) {
	size_t lastSlash = path.find_last_of("/\\");
	return (lastSlash != std::string::npos) ? path.substr(lastSlash + 1) : path;
}

/**
 * Decode a whole file at its native channel count and sample rate
 * @return false if the file could not be opened or holds no audio
 */
bool decodeFile(const std::string& path, std::vector<float>& interleaved,
                ma_uint32& channels, ma_uint32& sampleRate) {
	ma_decoder_config decoderConfig = ma_decoder_config_init(ma_format_f32, 0, 0);
	ma_decoder decoder;

	if (ma_decoder_init_file(path.c_str(), &decoderConfig, &decoder) != MA_SUCCESS) {
		fprintf(stderr, "Error: Failed to open %s\n", path.c_str());
		return false;
	}

	channels = decoder.outputChannels;
	sampleRate = decoder.outputSampleRate;

	std::vector<float> chunk(CHUNK_SIZE * channels);
	ma_uint64 framesRead = 0;
	while (ma_decoder_read_pcm_frames(&decoder, chunk.data(), CHUNK_SIZE, &framesRead) == MA_SUCCESS &&
	       framesRead > 0) {
		interleaved.insert(interleaved.end(), chunk.begin(),
		                   chunk.begin() + static_cast<size_t>(framesRead * channels));
	}

	ma_decoder_uninit(&decoder);

	if (interleaved.empty()) {
		fprintf(stderr, "Error: No audio decoded from %s\n", path.c_str());
		return false;
	}
	return true;
}

float mean(const std::vector<float>& series) {
	if (series.empty()) return 0.0f;
	float sum = 0.0f;
	for (float v : series) {
		sum += v;
	}
	return sum / series.size();
}

void printProgress(float progress) {
	printf("\rAnalyzing... %3.0f%%   ", progress * 100.0f);
	fflush(stdout);
}

void printSummary(const AnalysisResult& result) {
	const long long seconds = static_cast<long long>(result.duration);

	printf("\n");
	printf("Analysis Summary: %s\n", result.name.c_str());
	printf("================\n");
	printf("Duration: %lld:%02lld (%.2fs)\n", seconds / 60, seconds % 60, result.duration);
	printf("BPM: %.0f\n", result.bpm);
	printf("\n");
	printf("Beats: %zu (kicks: %zu, snares: %zu, hihats: %zu)\n",
		result.beats.all.size(), result.beats.kicks.size(),
		result.beats.snares.size(), result.beats.hihats.size());
	printf("\n");
	printf("Mean levels (%d frames at %d Hz):\n", static_cast<int>(result.energy.size()),
		result.frequency.sampleRate);
	printf("  sub:    %.3f\n", mean(result.frequency.sub));
	printf("  bass:   %.3f\n", mean(result.frequency.bass));
	printf("  mid:    %.3f\n", mean(result.frequency.mid));
	printf("  high:   %.3f\n", mean(result.frequency.high));
	printf("  energy: %.3f\n", mean(result.energy));
}

void printBeats(const BeatTimeline& beats) {
	auto contains = [](const std::vector<double>& list, double t) {
		return std::binary_search(list.begin(), list.end(), t);
	};

	printf("\n");
	printf("Beats\n");
	printf("=====\n");
	for (double t : beats.all) {
		printf("  %8.3fs %s%s%s\n", t,
			contains(beats.kicks, t) ? " kick" : "",
			contains(beats.snares, t) ? " snare" : "",
			contains(beats.hihats, t) ? " hihat" : "");
	}
}

void printWaveform(const std::vector<float>& waveform, double duration) {
	const size_t numPoints = waveform.size() / 2;

	printf("\n");
	printf("Waveform\n");
	printf("========\n");
	for (size_t i = 0; i < numPoints; i++) {
		const float peak = std::max(std::abs(waveform[i * 2]), std::abs(waveform[i * 2 + 1]));
		const int width = static_cast<int>(std::min(peak, 1.0f) * WAVEFORM_WIDTH + 0.5f);
		const double t = duration * i / numPoints;
		printf("  %8.2fs |%s\n", t, std::string(width, '#').c_str());
	}
}

int main(int argc, char* argv[]) {
	const char* inputPath = nullptr;
	int waveformPoints = 0;
	bool listBeats = false;

	// Parse arguments
	for (int i = 1; i < argc; i++) {
		if (strcmp(argv[i], "-w") == 0 || strcmp(argv[i], "--waveform") == 0) {
			if (i + 1 < argc) {
				waveformPoints = atoi(argv[++i]);
			} else {
				fprintf(stderr, "Error: -w requires a point count\n");
				return 1;
			}
			if (waveformPoints <= 0) {
				fprintf(stderr, "Error: Point count must be positive\n");
				return 1;
			}
		} else if (strcmp(argv[i], "-b") == 0 || strcmp(argv[i], "--beats") == 0) {
			listBeats = true;
		} else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
			printUsage(argv[0]);
			return 0;
		} else if (argv[i][0] == '-') {
			fprintf(stderr, "Error: Unknown option %s\n", argv[i]);
			printUsage(argv[0]);
			return 1;
		} else {
			inputPath = argv[i];
		}
	}

	if (!inputPath) {
		printUsage(argv[0]);
		return 1;
	}

	// Decode
	printf("Decoding: %s\n", inputPath);
	std::vector<float> interleaved;
	ma_uint32 channels = 0;
	ma_uint32 sampleRate = 0;
	if (!decodeFile(inputPath, interleaved, channels, sampleRate)) {
		return 1;
	}

	const size_t numFrames = interleaved.size() / channels;
	printf("Channels: %u\n", channels);
	printf("Sample rate: %u Hz\n", sampleRate);
	printf("Frames: %zu\n\n", numFrames);

	AudioBuffer buffer = AudioBuffer::fromInterleaved(
		interleaved.data(), numFrames, channels, static_cast<float>(sampleRate));
	interleaved.clear();
	interleaved.shrink_to_fit();

	// Setup signal handler
	signal(SIGINT, signalHandler);
	signal(SIGTERM, signalHandler);

	// Analyze on a worker thread; the main thread reports progress
	Analyzer analyzer;
	CancellationToken cancel;
	AnalysisResult result;
	std::string error;
	bool cancelled = false;

	auto startTime = std::chrono::steady_clock::now();

	std::thread worker([&]() {
		try {
			result = analyzer.analyze(buffer,
				[](float p) { g_progress = p; },
				&cancel);
		} catch (const AnalysisCancelled&) {
			cancelled = true;
		} catch (const std::exception& e) {
			error = e.what();
		}
		g_done = true;
	});

	while (!g_done) {
		if (!g_running) {
			cancel.cancel();
		}
		printProgress(g_progress);
		std::this_thread::sleep_for(std::chrono::milliseconds(100));
	}
	worker.join();

	if (cancelled) {
		printf("\n\nCancelled.\n");
		return 130;
	}
	if (!error.empty()) {
		fprintf(stderr, "\nError: %s\n", error.c_str());
		return 1;
	}

	printProgress(1.0f);
	auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
		std::chrono::steady_clock::now() - startTime).count();
	printf("\nAnalysis took %lld ms\n", static_cast<long long>(elapsed));

	result.name = getBasename(inputPath);
	printSummary(result);

	if (listBeats) {
		printBeats(result.beats);
	}

	if (waveformPoints > 0) {
		printWaveform(generateWaveform(buffer, static_cast<size_t>(waveformPoints)), result.duration);
	}

	return 0;
}
