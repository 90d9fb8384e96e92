#include "../../include/core/IAnalysisModule.h"
#include "../../include/core/AudioBuffer.h"
#include "../../include/core/AudioFeatures.h"
#include "../../include/core/AnalysisConfig.h"
#include "../../include/core/SignalAnalysis.h"
#include "../../include/modules/PitchModule.h"
#include <nlohmann/json.hpp>
#include <vector>
#include <string>
#include <cmath>
#include <iostream>
#include <algorithm>

namespace vera {
namespace modules {

/**
 * @brief Whole-clip fundamental frequency statistics.
 *
 * Unvoiced frames are excluded from every statistic. A clip without a single
 * voiced frame reports all zeros.
 */
class PitchModule : public core::IAnalysisModule {
public:
    std::string getName() const override { return "Pitch"; }
    std::string getVersion() const override { return "1.0.0"; }

    bool initialize(const nlohmann::json& config) override {
        try {
            m_config = core::ExtractorConfig::fromJson(config);
        } catch (const std::exception& e) {
            std::cerr << "[Pitch] Invalid configuration: " << e.what() << std::endl;
            return false;
        }
        return true;
    }

    void reset() override {}

    nlohmann::json process(const core::AudioBuffer& audio, const core::AnalysisContext& context) override {
        (void)context;
        const std::vector<float> mono = audio.getMono();
        const core::dsp::PitchTrack track = core::dsp::trackPitch(
            mono, audio.getSampleRate(), m_config.pitchFmin, m_config.pitchFmax,
            m_config.frames, m_config.yinThreshold);

        const std::vector<double> voiced = track.voiced();
        core::PitchStats stats;
        if (!voiced.empty()) {
            stats.mean = core::dsp::mean(voiced);
            stats.stdDev = core::dsp::stddev(voiced);
            stats.min = *std::min_element(voiced.begin(), voiced.end());
            stats.max = *std::max_element(voiced.begin(), voiced.end());
            stats.variation = stats.mean > 0.0 ? stats.stdDev / stats.mean : 0.0;
            stats.voicedPercentage = track.voicedFraction() * 100.0;
        }

        nlohmann::json out = stats;
        out["voicedF0"] = voiced;
        return out;
    }

    bool validateOutput(const nlohmann::json& output) const override {
        for (const char* key : {"mean", "std", "min", "max", "variation", "voicedPercentage"}) {
            if (!output.contains(key) || !output[key].is_number()) return false;
            if (!std::isfinite(output[key].get<double>())) return false;
        }
        const double voicedPct = output["voicedPercentage"].get<double>();
        return voicedPct >= 0.0 && voicedPct <= 100.0;
    }

    nlohmann::json neutralResult() const override {
        core::PitchStats stats;
        stats.mean = m_config.neutral.pitchMean;
        stats.variation = m_config.neutral.pitchVariation;
        return stats;
    }

private:
    core::ExtractorConfig m_config;
};

std::unique_ptr<core::IAnalysisModule> createPitchModule() {
    return std::make_unique<PitchModule>();
}

} // namespace modules
} // namespace vera
