#include "../../include/core/IAnalysisModule.h"
#include "../../include/core/AudioBuffer.h"
#include "../../include/core/AudioFeatures.h"
#include "../../include/core/AnalysisConfig.h"
#include "../../include/core/SignalAnalysis.h"
#include "../../include/modules/VoiceQualityModule.h"
#include <nlohmann/json.hpp>
#include <vector>
#include <string>
#include <cmath>
#include <iostream>
#include <algorithm>
#include <stdexcept>

namespace vera {
namespace modules {

/**
 * @brief Voice quality module.
 *
 * Spectral shape descriptors are averaged over all frames of the magnitude
 * spectrogram. Jitter and shimmer are approximated from the pitch and RMS
 * tracks of the Pitch and Energy modules (recomputed when those modules did
 * not run or fell back to defaults). HNR comes from median-filter
 * harmonic/percussive separation.
 */
class VoiceQualityModule : public core::IAnalysisModule {
public:
    std::string getName() const override { return "VoiceQuality"; }
    std::string getVersion() const override { return "1.0.0"; }

    bool initialize(const nlohmann::json& config) override {
        try {
            m_config = core::ExtractorConfig::fromJson(config);
        } catch (const std::exception& e) {
            std::cerr << "[VoiceQuality] Invalid configuration: " << e.what() << std::endl;
            return false;
        }
        return true;
    }

    void reset() override {}

    std::vector<std::string> getDependencies() const override {
        return {"Pitch", "Energy"};
    }

    nlohmann::json process(const core::AudioBuffer& audio, const core::AnalysisContext& context) override {
        const float sampleRate = audio.getSampleRate();
        const std::vector<float> mono = audio.getMono();

        const core::dsp::Spectrogram spec = core::dsp::magnitudeSpectrogram(mono, sampleRate, m_config.frames);
        if (spec.empty()) {
            throw std::runtime_error("Voice quality analysis needs at least one frame");
        }

        core::VoiceQualityStats stats;
        computeSpectralShape(spec, stats);
        computeSpectralContrast(spec, stats);

        // Jitter: spread of consecutive voiced f0 differences
        std::vector<double> voicedF0;
        auto pitch = context.getModuleResult("Pitch");
        if (pitch && pitch->contains("voicedF0")) {
            voicedF0 = (*pitch)["voicedF0"].get<std::vector<double>>();
        } else {
            voicedF0 = core::dsp::trackPitch(mono, sampleRate, m_config.pitchFmin, m_config.pitchFmax,
                                             m_config.frames, m_config.yinThreshold).voiced();
        }
        stats.jitter = voicedF0.size() > 1 ? core::dsp::stddev(core::dsp::diff(voicedF0)) : 0.0;

        // Shimmer: spread of consecutive RMS differences
        std::vector<double> rms;
        auto energy = context.getModuleResult("Energy");
        if (energy && energy->contains("rms")) {
            rms = (*energy)["rms"].get<std::vector<double>>();
        } else {
            rms = core::dsp::frameRms(mono, m_config.frames);
        }
        stats.shimmer = rms.size() > 1 ? core::dsp::stddev(core::dsp::diff(rms)) : 0.0;

        try {
            const auto hp = core::dsp::separateHarmonicPercussive(spec, m_config.hpssKernel);
            if (hp.percussive > 0.0) {
                stats.hnr = 10.0 * std::log10(std::max(hp.harmonic, 1e-20) / hp.percussive);
            } else {
                stats.hnr = m_config.hnrZeroNoiseDb;
            }
            if (!std::isfinite(stats.hnr)) {
                stats.hnr = m_config.hnrFailureDb;
            }
        } catch (const std::runtime_error& e) {
            std::cerr << "[VoiceQuality] Harmonic separation failed, HNR set to "
                      << m_config.hnrFailureDb << " dB: " << e.what() << std::endl;
            stats.hnr = m_config.hnrFailureDb;
        }

        return stats;
    }

    bool validateOutput(const nlohmann::json& output) const override {
        for (const char* key : {"jitter", "shimmer", "hnr", "spectralCentroidMean",
                                "spectralRolloffMean", "spectralBandwidthMean"}) {
            if (!output.contains(key) || !output[key].is_number()) return false;
            if (!std::isfinite(output[key].get<double>())) return false;
        }
        const auto contrast = output.value("spectralContrastMean", std::vector<double>{});
        return core::dsp::allFinite(contrast);
    }

    nlohmann::json neutralResult() const override {
        core::VoiceQualityStats stats;
        stats.hnr = m_config.neutral.hnr;
        return stats;
    }

private:
    core::ExtractorConfig m_config;

    /**
     * @brief Mean spectral centroid, rolloff and bandwidth in Hz.
     *
     * Silent frames contribute zero to each mean.
     */
    void computeSpectralShape(const core::dsp::Spectrogram& spec, core::VoiceQualityStats& stats) const {
        std::vector<double> centroid(spec.numFrames, 0.0);
        std::vector<double> rolloff(spec.numFrames, 0.0);
        std::vector<double> bandwidth(spec.numFrames, 0.0);

        for (size_t f = 0; f < spec.numFrames; ++f) {
            double total = 0.0;
            double weighted = 0.0;
            for (size_t k = 0; k < spec.numBins; ++k) {
                total += spec.at(f, k);
                weighted += spec.at(f, k) * spec.binFrequency(k);
            }
            if (total <= 0.0) continue;

            const double c = weighted / total;
            double spread = 0.0;
            for (size_t k = 0; k < spec.numBins; ++k) {
                const double d = spec.binFrequency(k) - c;
                spread += spec.at(f, k) * d * d;
            }
            centroid[f] = c;
            bandwidth[f] = std::sqrt(spread / total);

            const double target = m_config.rolloffPercent * total;
            double cumulative = 0.0;
            for (size_t k = 0; k < spec.numBins; ++k) {
                cumulative += spec.at(f, k);
                if (cumulative >= target) {
                    rolloff[f] = spec.binFrequency(k);
                    break;
                }
            }
        }

        stats.spectralCentroidMean = core::dsp::mean(centroid);
        stats.spectralRolloffMean = core::dsp::mean(rolloff);
        stats.spectralBandwidthMean = core::dsp::mean(bandwidth);
    }

    /**
     * @brief Octave-band spectral contrast (peak vs valley, in dB).
     *
     * Band 0 covers [0, contrastFmin); each following band one octave, the
     * last one reaching Nyquist. Bands starting above Nyquist are dropped.
     */
    void computeSpectralContrast(const core::dsp::Spectrogram& spec, core::VoiceQualityStats& stats) const {
        const double nyquist = spec.sampleRate / 2.0;
        std::vector<double> edges = {0.0};
        double lo = m_config.contrastFmin;
        for (int b = 0; b < m_config.contrastBands && lo < nyquist; ++b) {
            edges.push_back(lo);
            lo *= 2.0;
        }
        edges.push_back(nyquist);

        const size_t numBands = edges.size() - 1;
        std::vector<std::vector<size_t>> bandBins(numBands);
        for (size_t k = 0; k < spec.numBins; ++k) {
            const double fk = spec.binFrequency(k);
            for (size_t b = 0; b < numBands; ++b) {
                const bool last = (b + 1 == numBands);
                if ((fk >= edges[b] && fk < edges[b + 1]) || (last && fk <= edges[b + 1] && fk >= edges[b])) {
                    bandBins[b].push_back(k);
                    break;
                }
            }
        }

        std::vector<std::vector<double>> contrast(numBands, std::vector<double>(spec.numFrames, 0.0));
        std::vector<double> values;
        for (size_t f = 0; f < spec.numFrames; ++f) {
            for (size_t b = 0; b < numBands; ++b) {
                const auto& bins = bandBins[b];
                if (bins.empty()) continue;
                values.clear();
                for (size_t k : bins) values.push_back(spec.at(f, k));
                std::sort(values.begin(), values.end());

                const size_t n = values.size();
                const size_t count = std::max<size_t>(1, static_cast<size_t>(std::lround(m_config.contrastQuantile * static_cast<double>(n))));
                double valley = 0.0;
                double peak = 0.0;
                for (size_t i = 0; i < count; ++i) {
                    valley += values[i];
                    peak += values[n - 1 - i];
                }
                valley /= static_cast<double>(count);
                peak /= static_cast<double>(count);
                contrast[b][f] = 10.0 * std::log10(std::max(1e-10, peak)) - 10.0 * std::log10(std::max(1e-10, valley));
            }
        }

        for (const auto& band : contrast) {
            stats.spectralContrastMean.push_back(core::dsp::mean(band));
            stats.spectralContrastStd.push_back(core::dsp::stddev(band));
        }
    }
};

std::unique_ptr<core::IAnalysisModule> createVoiceQualityModule() {
    return std::make_unique<VoiceQualityModule>();
}

} // namespace modules
} // namespace vera
