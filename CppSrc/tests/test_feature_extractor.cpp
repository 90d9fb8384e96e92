#include <iostream>
#include <cmath>
#include <limits>
#include <algorithm>
#include <stdexcept>
#include "../include/core/AudioBuffer.h"
#include "../include/core/AudioFeatures.h"
#include "../include/core/Errors.h"
#include "../include/modules/PitchModule.h"
#include "../include/pipeline/FeatureExtractor.h"

using vera::core::AudioFeatures;
using vera::core::StressType;
using vera::pipeline::FeatureExtractor;

namespace {

std::vector<float> sine(double freq, float sr, double durSec, float amp = 0.5f) {
    std::vector<float> d(static_cast<size_t>(durSec * sr));
    for (size_t n = 0; n < d.size(); ++n) {
        d[n] = amp * static_cast<float>(std::sin(2.0 * M_PI * freq * (static_cast<double>(n) / sr)));
    }
    return d;
}

bool hasIndicator(const AudioFeatures& f, StressType type) {
    return std::any_of(f.stressIndicators.begin(), f.stressIndicators.end(),
                       [type](const vera::core::StressIndicator& s) { return s.type == type; });
}

/** Stands in for the pitch module but fails on every recording. */
class BrokenPitchModule : public vera::core::IAnalysisModule {
public:
    BrokenPitchModule() : m_inner(vera::modules::createPitchModule()) {}

    std::string getName() const override { return m_inner->getName(); }
    std::string getVersion() const override { return "broken"; }
    bool initialize(const nlohmann::json& config) override { return m_inner->initialize(config); }
    void reset() override { m_inner->reset(); }
    nlohmann::json process(const vera::core::AudioBuffer&, const vera::core::AnalysisContext&) override {
        throw std::runtime_error("pitch tracker unavailable");
    }
    bool validateOutput(const nlohmann::json& output) const override { return m_inner->validateOutput(output); }
    nlohmann::json neutralResult() const override { return m_inner->neutralResult(); }

private:
    std::unique_ptr<vera::core::IAnalysisModule> m_inner;
};

bool expectExtractionError(const FeatureExtractor& fx, const std::vector<float>& sig, float sr) {
    try {
        (void)fx.extract(sig, sr);
    } catch (const vera::core::ExtractionError& e) {
        return std::string(e.what()).find("Failed to extract audio features") == 0;
    }
    return false;
}

AudioFeatures idealFeatures() {
    AudioFeatures f;
    f.pitch.mean = 120.0;
    f.pitch.variation = 0.0;
    f.energy.rmsMean = 0.1;
    f.energy.rmsStd = 0.0;
    f.prosody.speechRate = 2.6;
    f.prosody.pausePercentage = 0.0;
    f.voiceQuality.hnr = 40.0;
    return f;
}

} // namespace

bool test_extractor_sine_is_bounded() {
    try {
        FeatureExtractor fx;
        auto f = fx.extract(sine(150.0, 16000.0f, 3.0), 16000.0f);
        std::cout << "Extractor confidence=" << f.overallConfidence << ", pitch=" << f.pitch.mean
                  << ", timeline=" << f.confidenceTimeline.size() << std::endl;
        return f.overallConfidence >= 0.0 && f.overallConfidence <= 1.0 &&
               f.degraded.empty() &&
               f.confidenceTimeline.size() == 3 &&
               std::abs(f.pitch.mean - 150.0) < 5.0 &&
               std::abs(f.duration - 3.0) < 1e-6 &&
               f.sampleRate == 16000.0 &&
               f.cepstral.mean.size() == 20;
    } catch (const std::exception& e) {
        std::cerr << "Extractor test exception: " << e.what() << std::endl;
        return false;
    }
}

bool test_extractor_glide_raises_pitch_variation() {
    // Linear chirp from 100 Hz to 300 Hz over 3 s
    const float sr = 16000.0f;
    const double f0 = 100.0, f1 = 300.0, dur = 3.0;
    std::vector<float> sig(static_cast<size_t>(dur * sr));
    for (size_t n = 0; n < sig.size(); ++n) {
        const double t = n / static_cast<double>(sr);
        sig[n] = 0.5f * static_cast<float>(std::sin(2.0 * M_PI * (f0 * t + (f1 - f0) * t * t / (2.0 * dur))));
    }
    try {
        FeatureExtractor fx;
        auto f = fx.extract(sig, sr);
        std::cout << "Glide pitch mean=" << f.pitch.mean << ", variation=" << f.pitch.variation << std::endl;
        return f.pitch.variation > 0.15 && hasIndicator(f, StressType::HighPitchVariation) &&
               f.pitch.min < 130.0 && f.pitch.max > 270.0;
    } catch (const std::exception& e) {
        std::cerr << "Extractor glide exception: " << e.what() << std::endl;
        return false;
    }
}

bool test_extractor_silence_low_energy() {
    try {
        FeatureExtractor fx;
        auto f = fx.extract(std::vector<float>(32000, 0.0f), 16000.0f);
        return hasIndicator(f, StressType::LowEnergy) &&
               !hasIndicator(f, StressType::HighPitchVariation) &&
               f.overallConfidence >= 0.0 && f.overallConfidence <= 1.0;
    } catch (const std::exception& e) {
        std::cerr << "Extractor silence exception: " << e.what() << std::endl;
        return false;
    }
}

bool test_extractor_rejects_unusable_signals() {
    FeatureExtractor fx;
    auto withNan = sine(200.0, 16000.0f, 0.5);
    withNan[100] = std::numeric_limits<float>::quiet_NaN();
    return expectExtractionError(fx, {}, 16000.0f) &&
           expectExtractionError(fx, sine(200.0, 16000.0f, 0.5), 0.0f) &&
           expectExtractionError(fx, withNan, 16000.0f);
}

bool test_extractor_failed_module_is_neutral() {
    try {
        FeatureExtractor fx(vera::core::ExtractorConfig(), nlohmann::json::object(),
                            {[] { return std::make_unique<BrokenPitchModule>(); }});
        auto f = fx.extract(sine(150.0, 16000.0f, 2.0), 16000.0f);
        return f.isDegraded("Pitch") &&
               f.pitch.mean == 125.0 && f.pitch.variation == 0.5 &&
               // neutral defaults never raise an indicator
               !hasIndicator(f, StressType::HighPitchVariation) &&
               !f.isDegraded("Energy");
    } catch (const std::exception& e) {
        std::cerr << "Extractor degraded exception: " << e.what() << std::endl;
        return false;
    }
}

bool test_extractor_disabled_module_is_neutral() {
    try {
        FeatureExtractor fx(vera::core::ExtractorConfig(), {{"Prosody", {{"enabled", false}}}});
        auto f = fx.extract(sine(150.0, 16000.0f, 2.0), 16000.0f);
        return f.isDegraded("Prosody") &&
               f.prosody.speechRate == 2.0 && f.prosody.pausePercentage == 20.0;
    } catch (const std::exception& e) {
        std::cerr << "Extractor disabled exception: " << e.what() << std::endl;
        return false;
    }
}

bool test_extractor_rejects_bad_module_override() {
    try {
        FeatureExtractor fx(vera::core::ExtractorConfig(), {{"Cepstral", {{"config", {{"nMfcc", 0}}}}}});
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

bool test_stress_thresholds_are_strict() {
    FeatureExtractor fx;
    AudioFeatures atThreshold;
    atThreshold.pitch.variation = 0.15;
    atThreshold.voiceQuality.jitter = 10.0;
    atThreshold.energy.rmsMean = 0.02;
    if (!fx.detectStress(atThreshold).empty()) return false;

    AudioFeatures beyond;
    beyond.pitch.variation = 0.1501;
    beyond.voiceQuality.jitter = 10.01;
    beyond.energy.rmsMean = 0.0199;
    auto indicators = fx.detectStress(beyond);
    return indicators.size() == 3 &&
           indicators[0].type == StressType::HighPitchVariation &&
           indicators[1].type == StressType::VocalTension &&
           indicators[2].type == StressType::LowEnergy &&
           indicators[2].severity == vera::core::Severity::Low;
}

bool test_overall_confidence_formula() {
    FeatureExtractor fx;
    AudioFeatures ideal = idealFeatures();
    const double best = fx.overallConfidence(ideal);

    AudioFeatures stressed = idealFeatures();
    stressed.stressIndicators.resize(3);
    const double penalised = fx.overallConfidence(stressed);

    AudioFeatures extreme;
    extreme.pitch.mean = 0.0;
    extreme.pitch.variation = 2.0;
    extreme.energy.rmsMean = 0.01;
    extreme.energy.rmsStd = 0.05;
    extreme.prosody.speechRate = 0.0;
    extreme.prosody.pausePercentage = 100.0;
    extreme.voiceQuality.hnr = 0.0;
    const double worst = fx.overallConfidence(extreme);

    std::cout << "Confidence ideal=" << best << ", stressed=" << penalised << ", extreme=" << worst << std::endl;
    return std::abs(best - 1.0) < 1e-9 && std::abs(penalised - 0.91) < 1e-9 && worst == 0.0;
}
