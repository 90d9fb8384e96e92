#include "../../include/core/IAnalysisModule.h"
#include "../../include/core/AudioBuffer.h"
#include "../../include/core/AudioFeatures.h"
#include "../../include/core/AnalysisConfig.h"
#include "../../include/core/SignalAnalysis.h"
#include "../../include/modules/CepstralModule.h"
#include <nlohmann/json.hpp>
#include <vector>
#include <string>
#include <cmath>
#include <limits>
#include <iostream>
#include <algorithm>
#include <stdexcept>

namespace vera {
namespace modules {

namespace {

double hzToMel(double f) { return 2595.0 * std::log10(1.0 + f / 700.0); }
double melToHz(double m) { return 700.0 * (std::pow(10.0, m / 2595.0) - 1.0); }

/**
 * @brief Triangular mel filterbank over [0, Nyquist], area normalised.
 * @return nMels rows of numBins weights.
 */
std::vector<std::vector<double>> melFilterbank(int nMels, size_t fftSize, float sampleRate) {
    const size_t numBins = fftSize / 2 + 1;
    const double melMax = hzToMel(sampleRate / 2.0);

    std::vector<double> hzPoints(static_cast<size_t>(nMels) + 2);
    for (size_t i = 0; i < hzPoints.size(); ++i) {
        hzPoints[i] = melToHz(melMax * static_cast<double>(i) / static_cast<double>(nMels + 1));
    }

    std::vector<std::vector<double>> weights(static_cast<size_t>(nMels), std::vector<double>(numBins, 0.0));
    for (size_t m = 0; m < weights.size(); ++m) {
        const double left = hzPoints[m];
        const double center = hzPoints[m + 1];
        const double right = hzPoints[m + 2];
        const double norm = 2.0 / (right - left);
        for (size_t k = 0; k < numBins; ++k) {
            const double f = static_cast<double>(k) * sampleRate / static_cast<double>(fftSize);
            const double lower = (f - left) / (center - left);
            const double upper = (right - f) / (right - center);
            weights[m][k] = std::max(0.0, std::min(lower, upper)) * norm;
        }
    }
    return weights;
}

/**
 * @brief Savitzky-Golay derivative of a coefficient track (polynomial order = derivative order).
 *
 * Frames closer than width / 2 to either end reuse the fit of the nearest
 * full window. Tracks shorter than the window yield zeros.
 */
std::vector<double> savgolDerivative(const std::vector<double>& x, int width, int order) {
    const size_t n = x.size();
    const long half = width / 2;
    std::vector<double> out(n, 0.0);
    if (n < static_cast<size_t>(width)) {
        return out;
    }

    std::vector<double> w(static_cast<size_t>(width), 0.0);
    if (order == 1) {
        double denom = 0.0;
        for (long j = -half; j <= half; ++j) denom += static_cast<double>(j * j);
        for (long j = -half; j <= half; ++j) w[static_cast<size_t>(j + half)] = static_cast<double>(j) / denom;
    } else {
        double mu = 0.0;
        for (long j = -half; j <= half; ++j) mu += static_cast<double>(j * j);
        mu /= static_cast<double>(width);
        double denom = 0.0;
        for (long j = -half; j <= half; ++j) {
            const double c = static_cast<double>(j * j) - mu;
            denom += c * c;
        }
        for (long j = -half; j <= half; ++j) {
            w[static_cast<size_t>(j + half)] = 2.0 * (static_cast<double>(j * j) - mu) / denom;
        }
    }

    const long last = static_cast<long>(n) - 1 - half;
    for (long t = 0; t < static_cast<long>(n); ++t) {
        const long c = std::clamp(t, half, last);
        double acc = 0.0;
        for (long j = -half; j <= half; ++j) acc += w[static_cast<size_t>(j + half)] * x[static_cast<size_t>(c + j)];
        out[static_cast<size_t>(t)] = acc;
    }
    return out;
}

} // namespace

/**
 * @brief Cepstral statistics module.
 *
 * 1. Power spectrogram (Hann, centred frames).
 * 2. Mel filterbank energies converted to dB, floored at topDb below the peak.
 * 3. Orthonormal DCT-II keeping the first nMfcc coefficients.
 * 4. Per coefficient mean/std of the MFCCs and of their first and second
 *    order Savitzky-Golay derivatives.
 */
class CepstralModule : public core::IAnalysisModule {
public:
    std::string getName() const override { return "Cepstral"; }
    std::string getVersion() const override { return "1.1.0"; }

    bool initialize(const nlohmann::json& config) override {
        try {
            m_config = core::ExtractorConfig::fromJson(config);
        } catch (const std::exception& e) {
            std::cerr << "[Cepstral] Invalid configuration: " << e.what() << std::endl;
            return false;
        }
        return true;
    }

    void reset() override {}

    nlohmann::json process(const core::AudioBuffer& audio, const core::AnalysisContext& context) override {
        (void)context;
        const float sampleRate = audio.getSampleRate();
        const std::vector<float> mono = audio.getMono();

        const core::dsp::Spectrogram spec = core::dsp::magnitudeSpectrogram(mono, sampleRate, m_config.frames);
        if (spec.empty()) {
            throw std::runtime_error("Cepstral analysis needs at least one frame");
        }

        const size_t numFrames = spec.numFrames;
        const size_t numMels = static_cast<size_t>(m_config.nMels);
        const size_t numCoeffs = static_cast<size_t>(m_config.nMfcc);
        const auto melW = melFilterbank(m_config.nMels, spec.fftSize, sampleRate);

        // Mel power in dB
        std::vector<double> melDb(numFrames * numMels, 0.0);
        double peakDb = -std::numeric_limits<double>::infinity();
        for (size_t f = 0; f < numFrames; ++f) {
            for (size_t m = 0; m < numMels; ++m) {
                double s = 0.0;
                for (size_t k = 0; k < spec.numBins; ++k) {
                    const double mag = spec.at(f, k);
                    s += mag * mag * melW[m][k];
                }
                const double db = 10.0 * std::log10(std::max(1e-10, s));
                melDb[f * numMels + m] = db;
                peakDb = std::max(peakDb, db);
            }
        }
        const double floorDb = peakDb - m_config.topDb;
        for (double& db : melDb) db = std::max(db, floorDb);

        // Orthonormal DCT-II
        const double scale0 = std::sqrt(1.0 / static_cast<double>(numMels));
        const double scale = std::sqrt(2.0 / static_cast<double>(numMels));
        std::vector<std::vector<double>> mfcc(numCoeffs, std::vector<double>(numFrames, 0.0));
        for (size_t c = 0; c < numCoeffs; ++c) {
            for (size_t f = 0; f < numFrames; ++f) {
                double acc = 0.0;
                for (size_t m = 0; m < numMels; ++m) {
                    acc += std::cos(M_PI * static_cast<double>(c) * (static_cast<double>(m) + 0.5) / static_cast<double>(numMels))
                           * melDb[f * numMels + m];
                }
                mfcc[c][f] = (c == 0 ? scale0 : scale) * acc;
            }
        }

        core::CepstralStats stats;
        stats.frames = numFrames;
        for (size_t c = 0; c < numCoeffs; ++c) {
            const auto delta = savgolDerivative(mfcc[c], m_config.deltaWidth, 1);
            const auto delta2 = savgolDerivative(mfcc[c], m_config.deltaWidth, 2);
            stats.mean.push_back(core::dsp::mean(mfcc[c]));
            stats.stdDev.push_back(core::dsp::stddev(mfcc[c]));
            stats.deltaMean.push_back(core::dsp::mean(delta));
            stats.deltaStd.push_back(core::dsp::stddev(delta));
            stats.delta2Mean.push_back(core::dsp::mean(delta2));
            stats.delta2Std.push_back(core::dsp::stddev(delta2));
        }

        return stats;
    }

    bool validateOutput(const nlohmann::json& output) const override {
        if (!output.contains("mean") || !output.contains("std")) return false;
        const auto stats = output.get<core::CepstralStats>();
        const size_t n = static_cast<size_t>(m_config.nMfcc);
        return stats.mean.size() == n && stats.stdDev.size() == n &&
               core::dsp::allFinite(stats.mean) && core::dsp::allFinite(stats.stdDev) &&
               core::dsp::allFinite(stats.deltaMean) && core::dsp::allFinite(stats.deltaStd) &&
               core::dsp::allFinite(stats.delta2Mean) && core::dsp::allFinite(stats.delta2Std);
    }

    nlohmann::json neutralResult() const override {
        const std::vector<double> zeros(static_cast<size_t>(m_config.nMfcc), 0.0);
        core::CepstralStats stats;
        stats.mean = zeros;
        stats.stdDev = zeros;
        stats.deltaMean = zeros;
        stats.deltaStd = zeros;
        stats.delta2Mean = zeros;
        stats.delta2Std = zeros;
        return stats;
    }

private:
    core::ExtractorConfig m_config;
};

std::unique_ptr<core::IAnalysisModule> createCepstralModule() {
    return std::make_unique<CepstralModule>();
}

} // namespace modules
} // namespace vera
