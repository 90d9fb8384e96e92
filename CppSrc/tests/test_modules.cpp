#include <iostream>
#include <cmath>
#include <random>
#include <nlohmann/json.hpp>
#include "../include/core/AudioBuffer.h"
#include "../include/core/AudioFeatures.h"
#include "../include/core/AnalysisConfig.h"
#include "../include/core/IAnalysisModule.h"
#include "../include/modules/CepstralModule.h"
#include "../include/modules/PitchModule.h"
#include "../include/modules/EnergyModule.h"
#include "../include/modules/VoiceQualityModule.h"
#include "../include/modules/ProsodyModule.h"
#include "../include/modules/ConfidenceTimelineModule.h"

using vera::core::AudioBuffer;
using vera::core::AnalysisContext;

static AudioBuffer make_sine(float freq, float sr, float durSec, float amp = 0.5f) {
    size_t frames = static_cast<size_t>(durSec * sr);
    AudioBuffer buf(1, frames, sr);
    float* d = buf.getChannel(0);
    const double twopi = 2.0 * M_PI;
    for (size_t n = 0; n < frames; ++n) {
        d[n] = amp * static_cast<float>(std::sin(twopi * freq * (static_cast<double>(n) / sr)));
    }
    return buf;
}

static AudioBuffer make_noise(float sr, float durSec, float amp = 0.3f) {
    AudioBuffer buf(1, static_cast<size_t>(durSec * sr), sr);
    std::mt19937 rng(42);
    std::uniform_real_distribution<float> dist(-amp, amp);
    float* d = buf.getChannel(0);
    for (size_t n = 0; n < buf.getFrameCount(); ++n) d[n] = dist(rng);
    return buf;
}

static nlohmann::json run_module(vera::core::IAnalysisModule& module, const AudioBuffer& buf) {
    if (!module.initialize(vera::core::ExtractorConfig().toJson())) {
        throw std::runtime_error("Failed to initialize " + module.getName());
    }
    AnalysisContext ctx; ctx.sampleRate = buf.getSampleRate();
    nlohmann::json out = module.process(buf, ctx);
    if (!module.validateOutput(out)) {
        throw std::runtime_error(module.getName() + " output validation failed");
    }
    return out;
}

bool test_cepstral_shape_on_noise() {
    try {
        auto mod = vera::modules::createCepstralModule();
        auto stats = run_module(*mod, make_noise(16000.0f, 2.0f)).get<vera::core::CepstralStats>();
        bool ok = stats.mean.size() == 20 && stats.stdDev.size() == 20 &&
                  stats.deltaMean.size() == 20 && stats.deltaStd.size() == 20 &&
                  stats.delta2Mean.size() == 20 && stats.delta2Std.size() == 20;
        std::cout << "Cepstral frames=" << stats.frames << ", c0 mean=" << stats.mean[0] << std::endl;
        return ok && stats.frames > 0;
    } catch (const std::exception& e) {
        std::cerr << "Cepstral test exception: " << e.what() << std::endl;
        return false;
    }
}

bool test_cepstral_rejects_bad_config() {
    auto mod = vera::modules::createCepstralModule();
    nlohmann::json cfg = vera::core::ExtractorConfig().toJson();
    cfg["nMfcc"] = 200; // more coefficients than mel bands
    return !mod->initialize(cfg);
}

bool test_pitch_on_sine_150hz() {
    try {
        auto mod = vera::modules::createPitchModule();
        auto out = run_module(*mod, make_sine(150.0f, 16000.0f, 2.0f));
        auto stats = out.get<vera::core::PitchStats>();
        std::cout << "Pitch mean=" << stats.mean << ", variation=" << stats.variation
                  << ", voiced=" << stats.voicedPercentage << "%" << std::endl;
        return std::abs(stats.mean - 150.0) / 150.0 < 0.03 &&
               stats.variation < 0.05 &&
               stats.voicedPercentage > 80.0 &&
               out.contains("voicedF0") && !out["voicedF0"].empty();
    } catch (const std::exception& e) {
        std::cerr << "Pitch test exception: " << e.what() << std::endl;
        return false;
    }
}

bool test_pitch_on_silence_is_zero() {
    try {
        auto mod = vera::modules::createPitchModule();
        AudioBuffer silence(1, 16000, 16000.0f);
        auto stats = run_module(*mod, silence).get<vera::core::PitchStats>();
        return stats.mean == 0.0 && stats.stdDev == 0.0 && stats.variation == 0.0 &&
               stats.voicedPercentage == 0.0;
    } catch (const std::exception& e) {
        std::cerr << "Pitch silence test exception: " << e.what() << std::endl;
        return false;
    }
}

bool test_energy_on_sine() {
    try {
        auto mod = vera::modules::createEnergyModule();
        auto out = run_module(*mod, make_sine(300.0f, 16000.0f, 1.0f, 0.5f));
        auto stats = out.get<vera::core::EnergyStats>();
        std::cout << "Energy rmsMean=" << stats.rmsMean << ", zcrMean=" << stats.zcrMean << std::endl;
        return stats.rmsMean > 0.3 && stats.rmsMean < 0.36 && stats.zcrMean > 0.0 && out.contains("rms");
    } catch (const std::exception& e) {
        std::cerr << "Energy test exception: " << e.what() << std::endl;
        return false;
    }
}

bool test_voice_quality_on_sine() {
    try {
        auto mod = vera::modules::createVoiceQualityModule();
        auto stats = run_module(*mod, make_sine(200.0f, 16000.0f, 2.0f)).get<vera::core::VoiceQualityStats>();
        std::cout << "VoiceQuality centroid=" << stats.spectralCentroidMean << " Hz, jitter=" << stats.jitter
                  << ", HNR=" << stats.hnr << " dB, contrast bands=" << stats.spectralContrastMean.size() << std::endl;
        return stats.spectralCentroidMean > 100.0 && stats.spectralCentroidMean < 1000.0 &&
               stats.jitter < 10.0 &&
               stats.hnr > 10.0 &&
               !stats.spectralContrastMean.empty() &&
               stats.spectralContrastMean.size() == stats.spectralContrastStd.size();
    } catch (const std::exception& e) {
        std::cerr << "VoiceQuality test exception: " << e.what() << std::endl;
        return false;
    }
}

bool test_prosody_on_bursts() {
    // Four 0.25 s tone bursts separated by silence over 4 s
    const float sr = 16000.0f;
    AudioBuffer buf(1, static_cast<size_t>(4.0f * sr), sr);
    float* d = buf.getChannel(0);
    for (int b = 0; b < 4; ++b) {
        const size_t start = static_cast<size_t>((0.5 + b) * sr);
        for (size_t n = 0; n < static_cast<size_t>(0.25f * sr); ++n) {
            d[start + n] = 0.5f * static_cast<float>(std::sin(2.0 * M_PI * 220.0 * n / sr));
        }
    }
    try {
        auto mod = vera::modules::createProsodyModule();
        auto stats = run_module(*mod, buf).get<vera::core::ProsodyStats>();
        std::cout << "Prosody segments=" << stats.speechSegments << ", rate=" << stats.speechRate
                  << ", pause=" << stats.pausePercentage << "%" << std::endl;
        return stats.speechSegments == 4 &&
               std::abs(stats.speechRate - 1.0) < 1e-9 &&
               stats.pausePercentage > 50.0 && stats.pausePercentage < 90.0;
    } catch (const std::exception& e) {
        std::cerr << "Prosody test exception: " << e.what() << std::endl;
        return false;
    }
}

static bool timeline_window_count(float durSec, size_t expected) {
    auto mod = vera::modules::createConfidenceTimelineModule();
    auto out = run_module(*mod, make_sine(180.0f, 16000.0f, durSec));
    auto windows = out["windows"].get<std::vector<vera::core::TimelineWindow>>();
    if (windows.size() != expected) {
        std::cerr << "Timeline for " << durSec << " s: " << windows.size()
                  << " windows, expected " << expected << std::endl;
        return false;
    }
    double previous = -1.0;
    for (size_t i = 0; i < windows.size(); ++i) {
        const auto& w = windows[i];
        if (std::abs(w.time - (i + 0.5)) > 1e-9 || w.time <= previous) return false;
        previous = w.time;
        for (double v : {w.confidence, w.pitchStability, w.energyLevel, w.voiceQuality}) {
            if (v < 0.0 || v > 1.0) return false;
        }
    }
    return true;
}

bool test_timeline_window_counts() {
    try {
        return timeline_window_count(3.0f, 3) &&  // floor(duration) windows
               timeline_window_count(2.95f, 2) && // trailing partial second not covered
               timeline_window_count(0.5f, 1) &&  // short clip: one window
               timeline_window_count(0.05f, 0);   // less than 0.1 s: dropped
    } catch (const std::exception& e) {
        std::cerr << "Timeline test exception: " << e.what() << std::endl;
        return false;
    }
}

bool test_timeline_steady_tone_is_stable() {
    try {
        auto mod = vera::modules::createConfidenceTimelineModule();
        auto out = run_module(*mod, make_sine(180.0f, 16000.0f, 2.0f, 0.5f));
        auto windows = out["windows"].get<std::vector<vera::core::TimelineWindow>>();
        for (const auto& w : windows) {
            std::cout << "t=" << w.time << " conf=" << w.confidence << " ps=" << w.pitchStability
                      << " el=" << w.energyLevel << " vq=" << w.voiceQuality << std::endl;
            // Loud steady tone: energy saturates, pitch is stable
            if (w.energyLevel != 1.0 || w.pitchStability < 0.95) return false;
        }
        return windows.size() == 2;
    } catch (const std::exception& e) {
        std::cerr << "Timeline test exception: " << e.what() << std::endl;
        return false;
    }
}

bool test_neutral_results_are_valid() {
    const std::vector<std::unique_ptr<vera::core::IAnalysisModule>> modules = [] {
        std::vector<std::unique_ptr<vera::core::IAnalysisModule>> v;
        v.push_back(vera::modules::createCepstralModule());
        v.push_back(vera::modules::createPitchModule());
        v.push_back(vera::modules::createEnergyModule());
        v.push_back(vera::modules::createVoiceQualityModule());
        v.push_back(vera::modules::createProsodyModule());
        v.push_back(vera::modules::createConfidenceTimelineModule());
        return v;
    }();
    for (const auto& m : modules) {
        if (!m->initialize(vera::core::ExtractorConfig().toJson())) return false;
        if (!m->validateOutput(m->neutralResult())) {
            std::cerr << "Neutral result of " << m->getName() << " fails validation" << std::endl;
            return false;
        }
    }
    return true;
}
