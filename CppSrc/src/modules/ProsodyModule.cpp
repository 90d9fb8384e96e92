#include "../../include/core/IAnalysisModule.h"
#include "../../include/core/AudioBuffer.h"
#include "../../include/core/AudioFeatures.h"
#include "../../include/core/AnalysisConfig.h"
#include "../../include/core/SignalAnalysis.h"
#include "../../include/modules/ProsodyModule.h"
#include <nlohmann/json.hpp>
#include <vector>
#include <string>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace vera {
namespace modules {

/**
 * @brief Speech rate and pause measures.
 *
 * A frame is speech when its RMS exceeds speechThresholdRatio times the mean
 * RMS. The speech rate counts silence-to-speech transitions per second; the
 * pause percentage is the share of frames at or below the threshold.
 */
class ProsodyModule : public core::IAnalysisModule {
public:
    std::string getName() const override { return "Prosody"; }
    std::string getVersion() const override { return "1.0.0"; }

    bool initialize(const nlohmann::json& config) override {
        try {
            m_config = core::ExtractorConfig::fromJson(config);
        } catch (const std::exception& e) {
            std::cerr << "[Prosody] Invalid configuration: " << e.what() << std::endl;
            return false;
        }
        return true;
    }

    void reset() override {}

    std::vector<std::string> getDependencies() const override {
        return {"Energy"};
    }

    nlohmann::json process(const core::AudioBuffer& audio, const core::AnalysisContext& context) override {
        std::vector<double> rms;
        auto energy = context.getModuleResult("Energy");
        if (energy && energy->contains("rms")) {
            rms = (*energy)["rms"].get<std::vector<double>>();
        } else {
            rms = core::dsp::frameRms(audio.getMono(), m_config.frames);
        }
        if (rms.empty()) {
            throw std::runtime_error("Prosody analysis needs at least one frame");
        }

        const double threshold = core::dsp::mean(rms) * m_config.speechThresholdRatio;

        int onsets = 0;
        size_t silentFrames = 0;
        bool previous = false;
        for (size_t i = 0; i < rms.size(); ++i) {
            const bool speech = rms[i] > threshold;
            if (i > 0 && speech && !previous) ++onsets;
            if (!speech) ++silentFrames;
            previous = speech;
        }

        const double duration = audio.getDuration();
        core::ProsodyStats stats;
        stats.speechSegments = onsets;
        stats.speechRate = duration > 0.0 ? onsets / duration : 0.0;
        stats.pausePercentage = 100.0 * static_cast<double>(silentFrames) / static_cast<double>(rms.size());
        return stats;
    }

    bool validateOutput(const nlohmann::json& output) const override {
        if (!output.contains("speechRate") || !output.contains("pausePercentage")) return false;
        const double rate = output["speechRate"].get<double>();
        const double pause = output["pausePercentage"].get<double>();
        return std::isfinite(rate) && rate >= 0.0 && pause >= 0.0 && pause <= 100.0;
    }

    nlohmann::json neutralResult() const override {
        core::ProsodyStats stats;
        stats.speechRate = m_config.neutral.speechRate;
        stats.pausePercentage = m_config.neutral.pausePercentage;
        return stats;
    }

private:
    core::ExtractorConfig m_config;
};

std::unique_ptr<core::IAnalysisModule> createProsodyModule() {
    return std::make_unique<ProsodyModule>();
}

} // namespace modules
} // namespace vera
