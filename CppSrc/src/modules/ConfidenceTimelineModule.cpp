#include "../../include/core/IAnalysisModule.h"
#include "../../include/core/AudioBuffer.h"
#include "../../include/core/AudioFeatures.h"
#include "../../include/core/AnalysisConfig.h"
#include "../../include/core/SignalAnalysis.h"
#include "../../include/modules/ConfidenceTimelineModule.h"
#include <nlohmann/json.hpp>
#include <vector>
#include <string>
#include <cmath>
#include <iostream>
#include <algorithm>

namespace vera {
namespace modules {

/**
 * @brief Confidence timeline module.
 *
 * The clip is cut into max(floor(duration), 1) consecutive windows of
 * windowSeconds. Each window is analysed on its own:
 * - pitch stability: 1 - std/mean of the voiced f0 inside the window (0.5 when unvoiced)
 * - energy level: mean RMS relative to energyReference, capped at 1
 * - voice quality: HNR relative to hnrReference, in [0, 1]
 *
 * Windows holding less than minWindowSeconds of audio are skipped, so only the
 * trailing window can ever be missing.
 */
class ConfidenceTimelineModule : public core::IAnalysisModule {
public:
    std::string getName() const override { return "ConfidenceTimeline"; }
    std::string getVersion() const override { return "1.0.0"; }

    bool initialize(const nlohmann::json& config) override {
        try {
            m_config = core::ExtractorConfig::fromJson(config);
        } catch (const std::exception& e) {
            std::cerr << "[ConfidenceTimeline] Invalid configuration: " << e.what() << std::endl;
            return false;
        }
        return true;
    }

    void reset() override {}

    nlohmann::json process(const core::AudioBuffer& audio, const core::AnalysisContext& context) override {
        (void)context;
        const std::vector<float> mono = audio.getMono();
        const float sampleRate = audio.getSampleRate();
        const size_t numSamples = mono.size();

        const size_t windowSamples = static_cast<size_t>(m_config.windowSeconds * sampleRate);
        const size_t minSamples = static_cast<size_t>(m_config.minWindowSeconds * sampleRate);
        const size_t numWindows = std::max<size_t>(
            static_cast<size_t>(std::floor(audio.getDuration() / m_config.windowSeconds)), 1);

        std::vector<core::TimelineWindow> timeline;
        timeline.reserve(numWindows);

        for (size_t i = 0; i < numWindows; ++i) {
            const size_t start = i * windowSamples;
            const size_t end = std::min(numSamples, (i + 1) * windowSamples);
            if (start >= end || end - start < minSamples) {
                continue;
            }

            core::TimelineWindow window;
            window.time = (static_cast<double>(i) + 0.5) * m_config.windowSeconds;
            try {
                const std::vector<float> slice(mono.begin() + static_cast<long>(start),
                                               mono.begin() + static_cast<long>(end));
                scoreWindow(slice, sampleRate, window);
            } catch (const std::exception& e) {
                std::cerr << "[ConfidenceTimeline] Window at " << window.time
                          << "s failed, using neutral scores: " << e.what() << std::endl;
                window.confidence = m_config.windowFailureScore;
                window.pitchStability = m_config.windowFailureScore;
                window.energyLevel = m_config.windowFailureScore;
                window.voiceQuality = m_config.windowFailureScore;
            }
            timeline.push_back(window);
        }

        return {{"windows", timeline}};
    }

    bool validateOutput(const nlohmann::json& output) const override {
        if (!output.contains("windows") || !output["windows"].is_array()) return false;
        double previous = -1.0;
        for (const auto& w : output["windows"]) {
            const auto window = w.get<core::TimelineWindow>();
            if (window.time <= previous) return false;
            previous = window.time;
            for (double v : {window.confidence, window.pitchStability, window.energyLevel, window.voiceQuality}) {
                if (!std::isfinite(v) || v < 0.0 || v > 1.0) return false;
            }
        }
        return true;
    }

    nlohmann::json neutralResult() const override {
        return {{"windows", nlohmann::json::array()}};
    }

private:
    core::ExtractorConfig m_config;

    void scoreWindow(const std::vector<float>& slice, float sampleRate, core::TimelineWindow& window) const {
        const std::vector<double> voiced = core::dsp::trackPitch(
            slice, sampleRate, m_config.windowPitchFmin, m_config.windowPitchFmax,
            m_config.frames, m_config.yinThreshold).voiced();

        double pitchStability = 0.5;
        if (!voiced.empty()) {
            const double mean = core::dsp::mean(voiced);
            const double variation = mean > 0.0 ? core::dsp::stddev(voiced) / mean : 0.5;
            pitchStability = std::max(0.0, 1.0 - variation);
        }

        const double rmsMean = core::dsp::mean(core::dsp::frameRms(slice, m_config.frames));
        const double energyLevel = std::clamp(rmsMean / m_config.energyReference, 0.0, 1.0);

        double hnr = m_config.windowHnrDefault;
        try {
            hnr = core::dsp::harmonicToNoiseRatio(slice, sampleRate, m_config.frames, m_config.windowHnrDefault);
        } catch (const std::runtime_error& e) {
            std::cerr << "[ConfidenceTimeline] HNR unavailable, assuming "
                      << m_config.windowHnrDefault << " dB: " << e.what() << std::endl;
            hnr = m_config.windowHnrDefault;
        }
        const double voiceQuality = std::clamp(hnr / m_config.hnrReference, 0.0, 1.0);

        const double confidence = std::clamp(
            pitchStability * m_config.timelinePitchWeight +
            energyLevel * m_config.timelineEnergyWeight +
            voiceQuality * m_config.timelineVoiceWeight, 0.0, 1.0);

        window.confidence = core::dsp::roundTo(confidence, 3);
        window.pitchStability = core::dsp::roundTo(std::min(pitchStability, 1.0), 3);
        window.energyLevel = core::dsp::roundTo(energyLevel, 3);
        window.voiceQuality = core::dsp::roundTo(voiceQuality, 3);
    }
};

std::unique_ptr<core::IAnalysisModule> createConfidenceTimelineModule() {
    return std::make_unique<ConfidenceTimelineModule>();
}

} // namespace modules
} // namespace vera
