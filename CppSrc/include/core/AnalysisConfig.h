#pragma once

#include "SignalAnalysis.h"
#include <nlohmann/json.hpp>
#include <string>

namespace vera::core {

/**
 * @brief Scoring weights of the six-factor overall confidence.
 */
struct ConfidenceWeights {
    double f0Stability = 0.25;
    double energyConsistency = 0.20;
    double speechRate = 0.15;
    double hesitation = 0.20;
    double pitchRange = 0.10;
    double voiceQuality = 0.10;
};

/**
 * @brief Values a sub-feature falls back to when its module fails.
 */
struct NeutralDefaults {
    double pitchMean = 125.0;
    double pitchVariation = 0.5;
    double rmsMean = 0.05;
    double rmsStd = 0.02;
    double hnr = 20.0;
    double speechRate = 2.0;
    double pausePercentage = 20.0;
};

/**
 * @brief Immutable parameters of the acoustic feature extractor.
 *
 * Every key of the "extractor" config section is optional; a missing key keeps
 * the default below. Modules receive the whole section as their config and
 * read it back with fromJson(), so one object describes the full analysis.
 */
struct ExtractorConfig {
    dsp::FrameParams frames;

    // Cepstral
    int nMfcc = 20;
    int nMels = 128;
    double topDb = 80.0;
    int deltaWidth = 9;

    // Pitch (whole clip and timeline windows)
    double pitchFmin = 65.4;  // C2
    double pitchFmax = 2093.0; // C7
    double windowPitchFmin = 65.0;
    double windowPitchFmax = 400.0;
    double yinThreshold = 0.1;

    // Voice quality
    double rolloffPercent = 0.85;
    int contrastBands = 6;
    double contrastFmin = 200.0;
    double contrastQuantile = 0.02;
    size_t hpssKernel = 31;
    double hnrZeroNoiseDb = 40.0;
    double hnrFailureDb = 20.0;

    // Prosody
    double speechThresholdRatio = 0.2;

    // Confidence timeline
    double windowSeconds = 1.0;
    double minWindowSeconds = 0.1;
    double timelinePitchWeight = 0.4;
    double timelineEnergyWeight = 0.3;
    double timelineVoiceWeight = 0.3;
    double energyReference = 0.1;
    double hnrReference = 40.0;
    double windowHnrDefault = 20.0;
    double windowFailureScore = 0.5;

    // Stress indicators (strictly exceeded)
    double pitchVariationThreshold = 0.15;
    double jitterThreshold = 10.0;
    double lowEnergyThreshold = 0.02;

    // Overall confidence
    ConfidenceWeights weights;
    double idealSpeechRate = 2.6;
    double maxPausePercentage = 50.0;
    double pitchRangeLow = 100.0;
    double pitchRangeHigh = 150.0;
    double hnrFloorDb = 10.0;
    double hnrSpanDb = 30.0;
    double stressPenalty = 0.03;

    NeutralDefaults neutral;

    /**
     * @brief Reads the extractor section, keeping defaults for missing keys.
     * @throw std::invalid_argument if a value is out of its admissible range.
     */
    static ExtractorConfig fromJson(const nlohmann::json& section);

    /** @brief Serialises every parameter (the form modules are initialised with). */
    nlohmann::json toJson() const;
};

/**
 * @brief Immutable parameters of the cross-modal fusion.
 */
struct FusionConfig {
    double audioWeight = 0.35;
    double textWeight = 0.40;
    double chartWeight = 0.25;
    double chartPenaltyPerInconsistency = 0.15;

    // Neutral substitutes for missing upstream values
    double defaultAudioConfidence = 0.5;
    double defaultSentimentShare = 0.33;

    // Discrepancy rules
    double lowAudioConfidence = 0.5;
    double highAudioConfidence = 0.7;
    int stressMismatchCount = 2;

    // Risk scoring
    double lowCredibility = 0.4;
    double moderateCredibility = 0.6;
    int lowCredibilityPoints = 3;
    int moderateCredibilityPoints = 1;
    int highSeverityPoints = 2;
    int perDiscrepancyPoints = 1;
    int negativeSentimentPoints = 2;
    int manyStressCount = 3;
    int manyStressPoints = 2;
    int someStressCount = 1;
    int someStressPoints = 1;
    int highRiskScore = 6;
    int mediumRiskScore = 3;

    // Attention weights
    double attentionStressBump = 0.1;
    double attentionTopicBump = 0.1;
    double attentionChartBump = 0.15;
    int richTopicCount = 3;

    // Insights
    double confidentDelivery = 0.7;
    double hesitantDelivery = 0.4;
    double dominantPositiveShare = 0.6;
    size_t maxListedStressTypes = 3;

    static FusionConfig fromJson(const nlohmann::json& section);
};

/**
 * @brief Job execution settings.
 */
struct JobsConfig {
    std::string databasePath = "veracity.db";
    size_t workers = 5;

    static JobsConfig fromJson(const nlohmann::json& section);
};

/**
 * @brief Reads and parses a JSON configuration file.
 * @throw std::runtime_error if the file cannot be opened or parsed.
 */
nlohmann::json loadConfigFile(const std::string& path);

} // namespace vera::core
