#pragma once

#include "AnalysisConfig.hpp"
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace analyzer {

/**
 * Percussive event timestamps in seconds, ascending
 *
 * The per-category lists are independent; only `all` is deduplicated
 * (no two entries within AnalysisConfig::DEDUPE_WINDOW).
 */
struct BeatTimeline {
    std::vector<double> all;
    std::vector<double> kicks;
    std::vector<double> snares;
    std::vector<double> hihats;
};

/**
 * Per-frame band energies, each normalized to [0, 1] by its own maximum
 */
struct FrequencySeries {
    int sampleRate = AnalysisConfig::FEATURE_RATE;
    std::vector<float> sub;
    std::vector<float> bass;
    std::vector<float> mid;
    std::vector<float> high;
};

/**
 * Automation curve attached by collaborators: (time, value) pairs
 */
using AutomationCurve = std::vector<std::pair<double, float>>;

/**
 * Complete feature track for one recording
 */
struct AnalysisResult {
    std::string name;          // Filled in by whoever stores the result
    double duration = 0.0;     // Seconds
    float bpm = AnalysisConfig::FALLBACK_BPM;
    int analysisVersion = AnalysisConfig::ANALYSIS_VERSION;
    BeatTimeline beats;
    FrequencySeries frequency;
    std::vector<float> energy; // RMS loudness, same rate and length as the bands

    // Never populated by the analyzer
    std::map<std::string, AutomationCurve> automations;
};

} // namespace analyzer
