#include "../../include/pipeline/FeatureExtractor.h"
#include "../../include/pipeline/AnalysisPipeline.h"
#include "../../include/pipeline/AudioLoader.h"
#include "../../include/core/Errors.h"
#include "../../include/core/SignalAnalysis.h"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace vera::pipeline {

FeatureExtractor::FeatureExtractor(core::ExtractorConfig config,
                                   nlohmann::json moduleSettings,
                                   std::vector<ModuleFactory> moduleOverrides)
    : m_config(std::move(config)),
      m_moduleSettings(moduleSettings.is_object() ? std::move(moduleSettings) : nlohmann::json::object()),
      m_moduleOverrides(std::move(moduleOverrides))
{
    // Reject invalid per-module overrides now rather than on the first job
    const nlohmann::json base = m_config.toJson();
    for (const auto& [name, settings] : m_moduleSettings.items()) {
        if (settings.is_object() && settings.contains("config")) {
            nlohmann::json merged = base;
            merged.merge_patch(settings["config"]);
            (void)core::ExtractorConfig::fromJson(merged);
        }
    }
}

core::AudioFeatures FeatureExtractor::extract(const std::vector<float>& signal, float sampleRate) const {
    if (!(sampleRate > 0.0f) || !std::isfinite(sampleRate)) {
        throw core::ExtractionError("sample rate must be positive");
    }
    return extract(core::AudioBuffer::fromMono(signal, sampleRate));
}

core::AudioFeatures FeatureExtractor::extract(const core::AudioBuffer& audio) const {
    if (audio.empty()) {
        throw core::ExtractionError("empty audio signal");
    }
    if (!(audio.getSampleRate() > 0.0f) || !std::isfinite(audio.getSampleRate())) {
        throw core::ExtractionError("sample rate must be positive");
    }
    for (size_t ch = 0; ch < audio.getChannelCount(); ++ch) {
        const float* data = audio.getChannel(ch);
        for (size_t i = 0; i < audio.getFrameCount(); ++i) {
            if (!std::isfinite(data[i])) {
                throw core::ExtractionError("non-finite sample at frame " + std::to_string(i));
            }
        }
    }

    PipelineBuilder builder;
    builder.withAcousticModules();
    for (const auto& factory : m_moduleOverrides) {
        builder.withModule(factory());
    }
    auto pipeline = builder.withConfig(m_config.toJson())
                           .withModuleSettings(m_moduleSettings)
                           .build();

    const nlohmann::json result = pipeline->analyze(audio);
    const auto& modules = result["modules"];

    core::AudioFeatures features;
    if (modules.contains("Cepstral")) modules["Cepstral"].get_to(features.cepstral);
    if (modules.contains("Pitch")) modules["Pitch"].get_to(features.pitch);
    if (modules.contains("Energy")) modules["Energy"].get_to(features.energy);
    if (modules.contains("VoiceQuality")) modules["VoiceQuality"].get_to(features.voiceQuality);
    if (modules.contains("Prosody")) modules["Prosody"].get_to(features.prosody);
    if (modules.contains("ConfidenceTimeline")) {
        modules["ConfidenceTimeline"]["windows"].get_to(features.confidenceTimeline);
    }
    features.degraded = result["degraded"].get<std::vector<std::string>>();
    features.duration = audio.getDuration();
    features.sampleRate = audio.getSampleRate();

    features.stressIndicators = detectStress(features);
    features.overallConfidence = overallConfidence(features);

    std::cout << "[Extractor] Feature extraction complete. Confidence: " << features.overallConfidence
              << ", stress indicators: " << features.stressIndicators.size();
    if (!features.degraded.empty()) {
        std::cout << ", degraded: " << features.degraded.size();
    }
    std::cout << std::endl;
    return features;
}

core::AudioFeatures FeatureExtractor::extractFile(const std::string& wavPath) const {
    std::cout << "[Extractor] Extracting audio features from: " << wavPath << std::endl;
    return extract(AudioLoader::loadWav(wavPath));
}

std::vector<core::StressIndicator> FeatureExtractor::detectStress(const core::AudioFeatures& features) const {
    std::vector<core::StressIndicator> indicators;

    if (!features.isDegraded("Pitch") && features.pitch.variation > m_config.pitchVariationThreshold) {
        indicators.push_back({core::StressType::HighPitchVariation, core::Severity::Medium,
                              "Elevated pitch variation may indicate stress or uncertainty",
                              features.pitch.variation});
    }

    if (!features.isDegraded("VoiceQuality") && features.voiceQuality.jitter > m_config.jitterThreshold) {
        indicators.push_back({core::StressType::VocalTension, core::Severity::Medium,
                              "High jitter suggests vocal tension or nervousness",
                              features.voiceQuality.jitter});
    }

    if (!features.isDegraded("Energy") && features.energy.rmsMean < m_config.lowEnergyThreshold) {
        indicators.push_back({core::StressType::LowEnergy, core::Severity::Low,
                              "Low vocal energy may indicate hesitation",
                              features.energy.rmsMean});
    }

    return indicators;
}

double FeatureExtractor::overallConfidence(const core::AudioFeatures& features) const {
    const auto& w = m_config.weights;

    // F0 stability: lower coefficient of variation, higher confidence
    const double f0Stability = std::max(0.0, 1.0 - features.pitch.variation);

    // Energy consistency
    const double rmsMean = features.energy.rmsMean;
    const double rmsRatio = rmsMean > 0.0 ? features.energy.rmsStd / rmsMean : 0.5;
    const double energyConsistency = std::max(0.0, 1.0 - rmsRatio);

    // Speech rate, best at the ideal rate
    const double rateDeviation = std::abs(features.prosody.speechRate - m_config.idealSpeechRate) / m_config.idealSpeechRate;
    const double speechRateScore = std::max(0.0, 1.0 - rateDeviation);

    // Hesitation
    const double hesitationScore = std::max(0.0, 1.0 - features.prosody.pausePercentage / m_config.maxPausePercentage);

    // Pitch range
    const double pitchMean = features.pitch.mean;
    double pitchRangeScore = 1.0;
    if (pitchMean < m_config.pitchRangeLow) {
        pitchRangeScore = std::max(0.0, pitchMean / m_config.pitchRangeLow);
    } else if (pitchMean > m_config.pitchRangeHigh) {
        pitchRangeScore = std::max(0.0, 1.0 - (pitchMean - m_config.pitchRangeHigh) / m_config.pitchRangeHigh);
    }

    // Voice quality
    const double hnrScore = std::clamp((features.voiceQuality.hnr - m_config.hnrFloorDb) / m_config.hnrSpanDb, 0.0, 1.0);

    double confidence = f0Stability * w.f0Stability +
                        energyConsistency * w.energyConsistency +
                        speechRateScore * w.speechRate +
                        hesitationScore * w.hesitation +
                        pitchRangeScore * w.pitchRange +
                        hnrScore * w.voiceQuality;

    confidence -= static_cast<double>(features.stressIndicators.size()) * m_config.stressPenalty;
    confidence = std::clamp(core::dsp::finiteOr(confidence, 0.5), 0.0, 1.0);
    return core::dsp::roundTo(confidence, 3);
}

} // namespace vera::pipeline
