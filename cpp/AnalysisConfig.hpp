#pragma once

#include <cstddef>

namespace analyzer {

/**
 * Fixed analysis parameters shared by every stage.
 *
 * The feature track is sampled at 30 Hz, which is what the visualizers
 * interpolate between at playback time.
 */
struct AnalysisConfig {
    // Band / energy analysis
    static constexpr int FEATURE_RATE = 30;        // Output frames per second
    static constexpr int BAND_FFT_SIZE = 2048;
    static constexpr int PROGRESS_INTERVAL = 100;  // Frames between progress reports

    // Beat detection
    static constexpr int BEAT_FRAME_SIZE = 1024;
    static constexpr int BEAT_HOP_SIZE = 512;      // 50% overlap
    static constexpr int BEAT_PROGRESS_INTERVAL = 500;
    static constexpr int PEAK_WINDOW = 20;         // Frames on each side for local mean
    static constexpr double DEDUPE_WINDOW = 0.05;  // Seconds

    // Tempo
    static constexpr float MIN_BPM = 60.0f;
    static constexpr float MAX_BPM = 200.0f;
    static constexpr float BPM_RESOLUTION = 0.5f;
    static constexpr int BPM_BINS = 280;           // (MAX_BPM - MIN_BPM) / BPM_RESOLUTION
    static constexpr float FALLBACK_BPM = 120.0f;
    static constexpr size_t MIN_BEATS_FOR_BPM = 4;

    // Waveform overview
    static constexpr size_t DEFAULT_WAVEFORM_POINTS = 1000;

    static constexpr int ANALYSIS_VERSION = 1;
};

/**
 * Frequency range in Hz
 */
struct BandRange {
    float low;
    float high;
};

/**
 * Band / loudness extraction parameters
 *
 * The Hz ranges and gains are empirical tunings for visualization, not
 * derived values. Override them per analysis if a different split is wanted.
 */
struct BandEnergyOptions {
    BandRange sub{20.0f, 60.0f};
    BandRange bass{60.0f, 250.0f};
    BandRange mid{250.0f, 2000.0f};
    BandRange high{2000.0f, 20000.0f};

    float bandGain = 4.0f;     // Applied to the band RMS before clamping
    float energyGain = 3.0f;   // Applied to the sample RMS before clamping
};

/**
 * Percussive onset detection parameters
 */
struct BeatDetectorOptions {
    BandRange kick{40.0f, 120.0f};
    BandRange snare{120.0f, 500.0f};
    BandRange hihat{5000.0f, 15000.0f};

    // Minimum spectral flux for a peak, per category
    float kickThreshold = 0.15f;
    float snareThreshold = 0.12f;
    float hihatThreshold = 0.08f;

    // A peak must also exceed this multiple of the local mean flux
    float localMeanMultiplier = 1.5f;
};

struct AnalyzerOptions {
    BandEnergyOptions bands;
    BeatDetectorOptions beats;
};

} // namespace analyzer
