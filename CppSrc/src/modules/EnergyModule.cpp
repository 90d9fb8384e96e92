#include "../../include/core/IAnalysisModule.h"
#include "../../include/core/AudioBuffer.h"
#include "../../include/core/AudioFeatures.h"
#include "../../include/core/AnalysisConfig.h"
#include "../../include/core/SignalAnalysis.h"
#include "../../include/modules/EnergyModule.h"
#include <nlohmann/json.hpp>
#include <vector>
#include <string>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace vera {
namespace modules {

// Frame RMS and zero-crossing statistics
class EnergyModule : public core::IAnalysisModule {
public:
    std::string getName() const override { return "Energy"; }
    std::string getVersion() const override { return "1.0.0"; }

    bool initialize(const nlohmann::json& config) override {
        try {
            m_config = core::ExtractorConfig::fromJson(config);
        } catch (const std::exception& e) {
            std::cerr << "[Energy] Invalid configuration: " << e.what() << std::endl;
            return false;
        }
        return true;
    }

    void reset() override {}

    nlohmann::json process(const core::AudioBuffer& audio, const core::AnalysisContext& context) override {
        (void)context;
        const std::vector<float> mono = audio.getMono();
        const std::vector<double> rms = core::dsp::frameRms(mono, m_config.frames);
        const std::vector<double> zcr = core::dsp::zeroCrossingRate(mono, m_config.frames);
        if (rms.empty()) {
            throw std::runtime_error("Energy analysis needs at least one frame");
        }

        core::EnergyStats stats;
        stats.rmsMean = core::dsp::mean(rms);
        stats.rmsStd = core::dsp::stddev(rms);
        stats.zcrMean = core::dsp::mean(zcr);
        stats.zcrStd = core::dsp::stddev(zcr);

        nlohmann::json out = stats;
        out["rms"] = rms;
        return out;
    }

    bool validateOutput(const nlohmann::json& output) const override {
        for (const char* key : {"rmsMean", "rmsStd", "zcrMean", "zcrStd"}) {
            if (!output.contains(key) || !output[key].is_number()) return false;
            const double v = output[key].get<double>();
            if (!std::isfinite(v) || v < 0.0) return false;
        }
        return true;
    }

    nlohmann::json neutralResult() const override {
        core::EnergyStats stats;
        stats.rmsMean = m_config.neutral.rmsMean;
        stats.rmsStd = m_config.neutral.rmsStd;
        return stats;
    }

private:
    core::ExtractorConfig m_config;
};

std::unique_ptr<core::IAnalysisModule> createEnergyModule() {
    return std::make_unique<EnergyModule>();
}

} // namespace modules
} // namespace vera
