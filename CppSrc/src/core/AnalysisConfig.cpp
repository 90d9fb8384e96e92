#include "../../include/core/AnalysisConfig.h"
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace vera::core {

namespace {

template<typename T>
void readKey(const nlohmann::json& section, const char* key, T& field) {
    if (section.is_object() && section.contains(key) && !section[key].is_null()) {
        field = section[key].get<T>();
    }
}

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw std::invalid_argument("[Config] " + message);
    }
}

} // namespace

ExtractorConfig ExtractorConfig::fromJson(const nlohmann::json& section) {
    ExtractorConfig c;
    if (section.is_null()) {
        return c;
    }
    if (!section.is_object()) {
        throw std::invalid_argument("[Config] extractor section must be an object");
    }

    readKey(section, "frameLength", c.frames.frameLength);
    readKey(section, "hopLength", c.frames.hopLength);
    readKey(section, "nMfcc", c.nMfcc);
    readKey(section, "nMels", c.nMels);
    readKey(section, "topDb", c.topDb);
    readKey(section, "deltaWidth", c.deltaWidth);
    readKey(section, "pitchFmin", c.pitchFmin);
    readKey(section, "pitchFmax", c.pitchFmax);
    readKey(section, "windowPitchFmin", c.windowPitchFmin);
    readKey(section, "windowPitchFmax", c.windowPitchFmax);
    readKey(section, "yinThreshold", c.yinThreshold);
    readKey(section, "rolloffPercent", c.rolloffPercent);
    readKey(section, "contrastBands", c.contrastBands);
    readKey(section, "contrastFmin", c.contrastFmin);
    readKey(section, "contrastQuantile", c.contrastQuantile);
    readKey(section, "hpssKernel", c.hpssKernel);
    readKey(section, "hnrZeroNoiseDb", c.hnrZeroNoiseDb);
    readKey(section, "hnrFailureDb", c.hnrFailureDb);
    readKey(section, "speechThresholdRatio", c.speechThresholdRatio);
    readKey(section, "windowSeconds", c.windowSeconds);
    readKey(section, "minWindowSeconds", c.minWindowSeconds);
    readKey(section, "timelinePitchWeight", c.timelinePitchWeight);
    readKey(section, "timelineEnergyWeight", c.timelineEnergyWeight);
    readKey(section, "timelineVoiceWeight", c.timelineVoiceWeight);
    readKey(section, "energyReference", c.energyReference);
    readKey(section, "hnrReference", c.hnrReference);
    readKey(section, "windowHnrDefault", c.windowHnrDefault);
    readKey(section, "windowFailureScore", c.windowFailureScore);
    readKey(section, "pitchVariationThreshold", c.pitchVariationThreshold);
    readKey(section, "jitterThreshold", c.jitterThreshold);
    readKey(section, "lowEnergyThreshold", c.lowEnergyThreshold);
    readKey(section, "idealSpeechRate", c.idealSpeechRate);
    readKey(section, "maxPausePercentage", c.maxPausePercentage);
    readKey(section, "pitchRangeLow", c.pitchRangeLow);
    readKey(section, "pitchRangeHigh", c.pitchRangeHigh);
    readKey(section, "hnrFloorDb", c.hnrFloorDb);
    readKey(section, "hnrSpanDb", c.hnrSpanDb);
    readKey(section, "stressPenalty", c.stressPenalty);

    if (section.contains("weights")) {
        const auto& w = section["weights"];
        readKey(w, "f0Stability", c.weights.f0Stability);
        readKey(w, "energyConsistency", c.weights.energyConsistency);
        readKey(w, "speechRate", c.weights.speechRate);
        readKey(w, "hesitation", c.weights.hesitation);
        readKey(w, "pitchRange", c.weights.pitchRange);
        readKey(w, "voiceQuality", c.weights.voiceQuality);
    }

    if (section.contains("neutralDefaults")) {
        const auto& n = section["neutralDefaults"];
        readKey(n, "pitchMean", c.neutral.pitchMean);
        readKey(n, "pitchVariation", c.neutral.pitchVariation);
        readKey(n, "rmsMean", c.neutral.rmsMean);
        readKey(n, "rmsStd", c.neutral.rmsStd);
        readKey(n, "hnr", c.neutral.hnr);
        readKey(n, "speechRate", c.neutral.speechRate);
        readKey(n, "pausePercentage", c.neutral.pausePercentage);
    }

    require(c.frames.frameLength >= 64 && c.frames.frameLength % 2 == 0,
            "frameLength must be an even number >= 64");
    require(c.frames.hopLength > 0, "hopLength must be positive");
    require(c.nMels > 0 && c.nMfcc > 0 && c.nMfcc <= c.nMels, "require 0 < nMfcc <= nMels");
    require(c.deltaWidth >= 3 && c.deltaWidth % 2 == 1, "deltaWidth must be odd and >= 3");
    require(c.pitchFmin > 0.0 && c.pitchFmax > c.pitchFmin, "invalid pitch range");
    require(c.windowPitchFmin > 0.0 && c.windowPitchFmax > c.windowPitchFmin, "invalid window pitch range");
    require(c.contrastBands >= 1 && c.contrastFmin > 0.0, "invalid spectral contrast bands");
    require(c.contrastQuantile > 0.0 && c.contrastQuantile < 0.5, "contrastQuantile must be in (0, 0.5)");
    require(c.rolloffPercent > 0.0 && c.rolloffPercent < 1.0, "rolloffPercent must be in (0, 1)");
    require(c.hpssKernel >= 1, "hpssKernel must be positive");
    require(c.windowSeconds > 0.0 && c.minWindowSeconds >= 0.0, "invalid timeline window");
    require(c.energyReference > 0.0 && c.hnrReference > 0.0 && c.hnrSpanDb > 0.0,
            "reference levels must be positive");
    require(c.idealSpeechRate > 0.0 && c.maxPausePercentage > 0.0, "invalid prosody references");
    return c;
}

nlohmann::json ExtractorConfig::toJson() const {
    return {
        {"frameLength", frames.frameLength},
        {"hopLength", frames.hopLength},
        {"nMfcc", nMfcc},
        {"nMels", nMels},
        {"topDb", topDb},
        {"deltaWidth", deltaWidth},
        {"pitchFmin", pitchFmin},
        {"pitchFmax", pitchFmax},
        {"windowPitchFmin", windowPitchFmin},
        {"windowPitchFmax", windowPitchFmax},
        {"yinThreshold", yinThreshold},
        {"rolloffPercent", rolloffPercent},
        {"contrastBands", contrastBands},
        {"contrastFmin", contrastFmin},
        {"contrastQuantile", contrastQuantile},
        {"hpssKernel", hpssKernel},
        {"hnrZeroNoiseDb", hnrZeroNoiseDb},
        {"hnrFailureDb", hnrFailureDb},
        {"speechThresholdRatio", speechThresholdRatio},
        {"windowSeconds", windowSeconds},
        {"minWindowSeconds", minWindowSeconds},
        {"timelinePitchWeight", timelinePitchWeight},
        {"timelineEnergyWeight", timelineEnergyWeight},
        {"timelineVoiceWeight", timelineVoiceWeight},
        {"energyReference", energyReference},
        {"hnrReference", hnrReference},
        {"windowHnrDefault", windowHnrDefault},
        {"windowFailureScore", windowFailureScore},
        {"pitchVariationThreshold", pitchVariationThreshold},
        {"jitterThreshold", jitterThreshold},
        {"lowEnergyThreshold", lowEnergyThreshold},
        {"idealSpeechRate", idealSpeechRate},
        {"maxPausePercentage", maxPausePercentage},
        {"pitchRangeLow", pitchRangeLow},
        {"pitchRangeHigh", pitchRangeHigh},
        {"hnrFloorDb", hnrFloorDb},
        {"hnrSpanDb", hnrSpanDb},
        {"stressPenalty", stressPenalty},
        {"weights", {
            {"f0Stability", weights.f0Stability},
            {"energyConsistency", weights.energyConsistency},
            {"speechRate", weights.speechRate},
            {"hesitation", weights.hesitation},
            {"pitchRange", weights.pitchRange},
            {"voiceQuality", weights.voiceQuality}
        }},
        {"neutralDefaults", {
            {"pitchMean", neutral.pitchMean},
            {"pitchVariation", neutral.pitchVariation},
            {"rmsMean", neutral.rmsMean},
            {"rmsStd", neutral.rmsStd},
            {"hnr", neutral.hnr},
            {"speechRate", neutral.speechRate},
            {"pausePercentage", neutral.pausePercentage}
        }}
    };
}

FusionConfig FusionConfig::fromJson(const nlohmann::json& section) {
    FusionConfig c;
    if (section.is_null()) {
        return c;
    }
    if (!section.is_object()) {
        throw std::invalid_argument("[Config] fusion section must be an object");
    }

    readKey(section, "audioWeight", c.audioWeight);
    readKey(section, "textWeight", c.textWeight);
    readKey(section, "chartWeight", c.chartWeight);
    readKey(section, "chartPenaltyPerInconsistency", c.chartPenaltyPerInconsistency);
    readKey(section, "defaultAudioConfidence", c.defaultAudioConfidence);
    readKey(section, "defaultSentimentShare", c.defaultSentimentShare);
    readKey(section, "lowAudioConfidence", c.lowAudioConfidence);
    readKey(section, "highAudioConfidence", c.highAudioConfidence);
    readKey(section, "stressMismatchCount", c.stressMismatchCount);
    readKey(section, "lowCredibility", c.lowCredibility);
    readKey(section, "moderateCredibility", c.moderateCredibility);
    readKey(section, "lowCredibilityPoints", c.lowCredibilityPoints);
    readKey(section, "moderateCredibilityPoints", c.moderateCredibilityPoints);
    readKey(section, "highSeverityPoints", c.highSeverityPoints);
    readKey(section, "perDiscrepancyPoints", c.perDiscrepancyPoints);
    readKey(section, "negativeSentimentPoints", c.negativeSentimentPoints);
    readKey(section, "manyStressCount", c.manyStressCount);
    readKey(section, "manyStressPoints", c.manyStressPoints);
    readKey(section, "someStressCount", c.someStressCount);
    readKey(section, "someStressPoints", c.someStressPoints);
    readKey(section, "highRiskScore", c.highRiskScore);
    readKey(section, "mediumRiskScore", c.mediumRiskScore);
    readKey(section, "attentionStressBump", c.attentionStressBump);
    readKey(section, "attentionTopicBump", c.attentionTopicBump);
    readKey(section, "attentionChartBump", c.attentionChartBump);
    readKey(section, "richTopicCount", c.richTopicCount);
    readKey(section, "confidentDelivery", c.confidentDelivery);
    readKey(section, "hesitantDelivery", c.hesitantDelivery);
    readKey(section, "dominantPositiveShare", c.dominantPositiveShare);
    readKey(section, "maxListedStressTypes", c.maxListedStressTypes);

    require(c.audioWeight >= 0.0 && c.textWeight >= 0.0 && c.chartWeight >= 0.0,
            "modality weights must be non-negative");
    require(c.lowCredibility <= c.moderateCredibility, "lowCredibility must not exceed moderateCredibility");
    require(c.mediumRiskScore <= c.highRiskScore, "mediumRiskScore must not exceed highRiskScore");
    return c;
}

JobsConfig JobsConfig::fromJson(const nlohmann::json& section) {
    JobsConfig c;
    if (!section.is_object()) {
        return c;
    }
    readKey(section, "database", c.databasePath);
    readKey(section, "workers", c.workers);
    if (c.workers == 0) {
        std::cerr << "[Config] jobs.workers must be positive, using 1" << std::endl;
        c.workers = 1;
    }
    return c;
}

nlohmann::json loadConfigFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("[Config] Could not open configuration file: " + path);
    }
    nlohmann::json cfg;
    try {
        in >> cfg;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("[Config] Failed to parse JSON ('" + path + "'): " + e.what());
    }
    std::cout << "[Config] Loaded configuration from: " << path << std::endl;
    return cfg;
}

} // namespace vera::core
