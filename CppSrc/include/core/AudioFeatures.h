#pragma once

#include "Severity.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace vera::core {

/**
 * @brief Whole-clip cepstral statistics, one entry per coefficient.
 */
struct CepstralStats {
    std::vector<double> mean;
    std::vector<double> stdDev;
    std::vector<double> deltaMean;
    std::vector<double> deltaStd;
    std::vector<double> delta2Mean;
    std::vector<double> delta2Std;
    size_t frames = 0; ///< Number of analysis frames the statistics cover.
};

/**
 * @brief Fundamental frequency statistics over voiced frames.
 */
struct PitchStats {
    double mean = 0.0;
    double stdDev = 0.0;
    double min = 0.0;
    double max = 0.0;
    double variation = 0.0;        ///< std / mean, 0 when mean <= 0.
    double voicedPercentage = 0.0; ///< 0..100
};

/**
 * @brief Frame-wise RMS and zero-crossing statistics.
 */
struct EnergyStats {
    double rmsMean = 0.0;
    double rmsStd = 0.0;
    double zcrMean = 0.0;
    double zcrStd = 0.0;
};

/**
 * @brief Spectral shape, perturbation and harmonicity measures.
 */
struct VoiceQualityStats {
    double jitter = 0.0;  ///< std of consecutive voiced pitch differences (Hz).
    double shimmer = 0.0; ///< std of consecutive RMS differences.
    double hnr = 20.0;    ///< Harmonic-to-noise ratio in dB.
    double spectralCentroidMean = 0.0;
    double spectralRolloffMean = 0.0;
    double spectralBandwidthMean = 0.0;
    std::vector<double> spectralContrastMean;
    std::vector<double> spectralContrastStd;
};

/**
 * @brief Speech rate and pause measures.
 */
struct ProsodyStats {
    double speechRate = 0.0;      ///< Speech onsets per second.
    double pausePercentage = 0.0; ///< 0..100
    int speechSegments = 0;
};

/**
 * @brief One ~1 second slice of the confidence timeline.
 */
struct TimelineWindow {
    double time = 0.0; ///< Window midpoint in seconds.
    double confidence = 0.0;
    double pitchStability = 0.0;
    double energyLevel = 0.0;
    double voiceQuality = 0.0;
};

enum class StressType {
    HighPitchVariation,
    VocalTension,
    LowEnergy
};

std::string toString(StressType type);
StressType stressTypeFromString(const std::string& label);

/**
 * @brief An acoustic anomaly whose threshold was exceeded.
 */
struct StressIndicator {
    StressType type = StressType::HighPitchVariation;
    Severity severity = Severity::Medium;
    std::string description;
    double metric = 0.0; ///< The value that crossed the threshold.
};

/**
 * @brief Complete acoustic analysis of one recording.
 */
struct AudioFeatures {
    CepstralStats cepstral;
    PitchStats pitch;
    EnergyStats energy;
    VoiceQualityStats voiceQuality;
    ProsodyStats prosody;
    std::vector<TimelineWindow> confidenceTimeline;
    std::vector<StressIndicator> stressIndicators;
    double overallConfidence = 0.5;
    double duration = 0.0;
    double sampleRate = 0.0;
    /** Names of sub-feature modules that failed or were disabled and carry neutral defaults. */
    std::vector<std::string> degraded;

    bool isDegraded(const std::string& moduleName) const;
};

// JSON mapping (camelCase keys). Missing keys read as the defaults above.
void to_json(nlohmann::json& j, const CepstralStats& v);
void from_json(const nlohmann::json& j, CepstralStats& v);
void to_json(nlohmann::json& j, const PitchStats& v);
void from_json(const nlohmann::json& j, PitchStats& v);
void to_json(nlohmann::json& j, const EnergyStats& v);
void from_json(const nlohmann::json& j, EnergyStats& v);
void to_json(nlohmann::json& j, const VoiceQualityStats& v);
void from_json(const nlohmann::json& j, VoiceQualityStats& v);
void to_json(nlohmann::json& j, const ProsodyStats& v);
void from_json(const nlohmann::json& j, ProsodyStats& v);
void to_json(nlohmann::json& j, const TimelineWindow& v);
void from_json(const nlohmann::json& j, TimelineWindow& v);
void to_json(nlohmann::json& j, const StressIndicator& v);
void from_json(const nlohmann::json& j, StressIndicator& v);
void to_json(nlohmann::json& j, const AudioFeatures& v);
void from_json(const nlohmann::json& j, AudioFeatures& v);

} // namespace vera::core
