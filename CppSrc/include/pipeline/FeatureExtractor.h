#pragma once

#include "../core/AnalysisConfig.h"
#include "../core/AudioBuffer.h"
#include "../core/AudioFeatures.h"
#include "../core/IAnalysisModule.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace vera::pipeline {

/**
 * @brief Derives AudioFeatures (sub-feature statistics, confidence timeline,
 * stress indicators, overall confidence) from a recording.
 *
 * The extractor is stateless: every call builds its own AnalysisPipeline, so
 * one instance can serve several jobs in parallel.
 */
class FeatureExtractor {
public:
    /** @brief Creates a module replacing the standard module of the same name. */
    using ModuleFactory = std::function<std::unique_ptr<core::IAnalysisModule>()>;

    /**
     * @param config Extractor parameters.
     * @param moduleSettings The "modules" config section ({name: {enabled, config}}).
     * @param moduleOverrides Factories for modules replacing standard ones.
     * @throw std::invalid_argument if a module's config override is invalid.
     */
    explicit FeatureExtractor(core::ExtractorConfig config = core::ExtractorConfig(),
                              nlohmann::json moduleSettings = nlohmann::json::object(),
                              std::vector<ModuleFactory> moduleOverrides = {});

    /**
     * @brief Analyses a mono signal.
     * @throw core::ExtractionError if the signal is empty, the sample rate is not
     *        positive or a sample is not finite.
     */
    core::AudioFeatures extract(const std::vector<float>& signal, float sampleRate) const;

    /** @copydoc extract(const std::vector<float>&, float) const */
    core::AudioFeatures extract(const core::AudioBuffer& audio) const;

    /**
     * @brief Decodes a WAV file and analyses it.
     * @throw core::ExtractionError if the file cannot be decoded or analysed.
     */
    core::AudioFeatures extractFile(const std::string& wavPath) const;

    /**
     * @brief Stress indicators whose thresholds are strictly exceeded.
     *
     * Metrics of degraded sub-features are neutral defaults and never raise an
     * indicator.
     */
    std::vector<core::StressIndicator> detectStress(const core::AudioFeatures& features) const;

    /**
     * @brief Six-factor overall confidence in [0, 1], rounded to 3 decimals.
     *
     * Uses features.stressIndicators for the stress penalty.
     */
    double overallConfidence(const core::AudioFeatures& features) const;

    const core::ExtractorConfig& config() const { return m_config; }

private:
    core::ExtractorConfig m_config;
    nlohmann::json m_moduleSettings;
    std::vector<ModuleFactory> m_moduleOverrides;
};

} // namespace vera::pipeline
