#include "../../include/core/AudioFeatures.h"
#include <algorithm>
#include <stdexcept>

namespace vera::core {

std::string toString(StressType type) {
    switch (type) {
        case StressType::HighPitchVariation: return "high_pitch_variation";
        case StressType::VocalTension: return "vocal_tension";
        case StressType::LowEnergy: return "low_energy";
    }
    return "high_pitch_variation";
}

StressType stressTypeFromString(const std::string& label) {
    if (label == "high_pitch_variation") return StressType::HighPitchVariation;
    if (label == "vocal_tension") return StressType::VocalTension;
    if (label == "low_energy") return StressType::LowEnergy;
    throw std::invalid_argument("Unknown stress indicator type: " + label);
}

bool AudioFeatures::isDegraded(const std::string& moduleName) const {
    return std::find(degraded.begin(), degraded.end(), moduleName) != degraded.end();
}

// ----------------------------------------------------------------------------
// JSON mapping
// ----------------------------------------------------------------------------

void to_json(nlohmann::json& j, const CepstralStats& v) {
    j = {
        {"mean", v.mean},
        {"std", v.stdDev},
        {"deltaMean", v.deltaMean},
        {"deltaStd", v.deltaStd},
        {"delta2Mean", v.delta2Mean},
        {"delta2Std", v.delta2Std},
        {"frames", v.frames}
    };
}

void from_json(const nlohmann::json& j, CepstralStats& v) {
    v.mean = j.value("mean", std::vector<double>{});
    v.stdDev = j.value("std", std::vector<double>{});
    v.deltaMean = j.value("deltaMean", std::vector<double>{});
    v.deltaStd = j.value("deltaStd", std::vector<double>{});
    v.delta2Mean = j.value("delta2Mean", std::vector<double>{});
    v.delta2Std = j.value("delta2Std", std::vector<double>{});
    v.frames = j.value("frames", size_t{0});
}

void to_json(nlohmann::json& j, const PitchStats& v) {
    j = {
        {"mean", v.mean},
        {"std", v.stdDev},
        {"min", v.min},
        {"max", v.max},
        {"variation", v.variation},
        {"voicedPercentage", v.voicedPercentage}
    };
}

void from_json(const nlohmann::json& j, PitchStats& v) {
    v.mean = j.value("mean", 0.0);
    v.stdDev = j.value("std", 0.0);
    v.min = j.value("min", 0.0);
    v.max = j.value("max", 0.0);
    v.variation = j.value("variation", 0.0);
    v.voicedPercentage = j.value("voicedPercentage", 0.0);
}

void to_json(nlohmann::json& j, const EnergyStats& v) {
    j = {
        {"rmsMean", v.rmsMean},
        {"rmsStd", v.rmsStd},
        {"zcrMean", v.zcrMean},
        {"zcrStd", v.zcrStd}
    };
}

void from_json(const nlohmann::json& j, EnergyStats& v) {
    v.rmsMean = j.value("rmsMean", 0.0);
    v.rmsStd = j.value("rmsStd", 0.0);
    v.zcrMean = j.value("zcrMean", 0.0);
    v.zcrStd = j.value("zcrStd", 0.0);
}

void to_json(nlohmann::json& j, const VoiceQualityStats& v) {
    j = {
        {"jitter", v.jitter},
        {"shimmer", v.shimmer},
        {"hnr", v.hnr},
        {"spectralCentroidMean", v.spectralCentroidMean},
        {"spectralRolloffMean", v.spectralRolloffMean},
        {"spectralBandwidthMean", v.spectralBandwidthMean},
        {"spectralContrastMean", v.spectralContrastMean},
        {"spectralContrastStd", v.spectralContrastStd}
    };
}

void from_json(const nlohmann::json& j, VoiceQualityStats& v) {
    v.jitter = j.value("jitter", 0.0);
    v.shimmer = j.value("shimmer", 0.0);
    v.hnr = j.value("hnr", 20.0);
    v.spectralCentroidMean = j.value("spectralCentroidMean", 0.0);
    v.spectralRolloffMean = j.value("spectralRolloffMean", 0.0);
    v.spectralBandwidthMean = j.value("spectralBandwidthMean", 0.0);
    v.spectralContrastMean = j.value("spectralContrastMean", std::vector<double>{});
    v.spectralContrastStd = j.value("spectralContrastStd", std::vector<double>{});
}

void to_json(nlohmann::json& j, const ProsodyStats& v) {
    j = {
        {"speechRate", v.speechRate},
        {"pausePercentage", v.pausePercentage},
        {"speechSegments", v.speechSegments}
    };
}

void from_json(const nlohmann::json& j, ProsodyStats& v) {
    v.speechRate = j.value("speechRate", 0.0);
    v.pausePercentage = j.value("pausePercentage", 0.0);
    v.speechSegments = j.value("speechSegments", 0);
}

void to_json(nlohmann::json& j, const TimelineWindow& v) {
    j = {
        {"time", v.time},
        {"confidence", v.confidence},
        {"pitchStability", v.pitchStability},
        {"energyLevel", v.energyLevel},
        {"voiceQuality", v.voiceQuality}
    };
}

void from_json(const nlohmann::json& j, TimelineWindow& v) {
    v.time = j.value("time", 0.0);
    v.confidence = j.value("confidence", 0.5);
    v.pitchStability = j.value("pitchStability", 0.5);
    v.energyLevel = j.value("energyLevel", 0.5);
    v.voiceQuality = j.value("voiceQuality", 0.5);
}

void to_json(nlohmann::json& j, const StressIndicator& v) {
    j = {
        {"type", toString(v.type)},
        {"severity", toString(v.severity)},
        {"description", v.description},
        {"metric", v.metric}
    };
}

void from_json(const nlohmann::json& j, StressIndicator& v) {
    v.type = stressTypeFromString(j.at("type").get<std::string>());
    v.severity = severityFromString(j.value("severity", std::string("medium")));
    v.description = j.value("description", std::string());
    v.metric = j.value("metric", 0.0);
}

void to_json(nlohmann::json& j, const AudioFeatures& v) {
    j = {
        {"mfccs", v.cepstral},
        {"pitch", v.pitch},
        {"energy", v.energy},
        {"voiceQuality", v.voiceQuality},
        {"prosodic", v.prosody},
        {"confidenceTimeline", v.confidenceTimeline},
        {"stressIndicators", v.stressIndicators},
        {"overallConfidence", v.overallConfidence},
        {"duration", v.duration},
        {"sampleRate", v.sampleRate},
        {"degraded", v.degraded}
    };
}

void from_json(const nlohmann::json& j, AudioFeatures& v) {
    v = AudioFeatures{};
    if (j.contains("mfccs")) j.at("mfccs").get_to(v.cepstral);
    if (j.contains("pitch")) j.at("pitch").get_to(v.pitch);
    if (j.contains("energy")) j.at("energy").get_to(v.energy);
    if (j.contains("voiceQuality")) j.at("voiceQuality").get_to(v.voiceQuality);
    if (j.contains("prosodic")) j.at("prosodic").get_to(v.prosody);
    if (j.contains("confidenceTimeline")) j.at("confidenceTimeline").get_to(v.confidenceTimeline);
    if (j.contains("stressIndicators")) j.at("stressIndicators").get_to(v.stressIndicators);
    v.overallConfidence = j.value("overallConfidence", 0.5);
    v.duration = j.value("duration", 0.0);
    v.sampleRate = j.value("sampleRate", 0.0);
    v.degraded = j.value("degraded", std::vector<std::string>{});
}

} // namespace vera::core
