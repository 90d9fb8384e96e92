#include "../../include/core/SignalAnalysis.h"
#include "../../include/core/AudioBuffer.h"
#include <fftw3.h>
#include <algorithm>
#include <cmath>
#include <mutex>
#include <new>
#include <numeric>
#include <stdexcept>

namespace vera::core::dsp {

namespace {

// FFTW planning is not thread-safe; only fftw_execute is. Jobs run on a
// worker pool, so every plan create/destroy goes through this lock.
std::mutex& plannerMutex() {
    static std::mutex mutex;
    return mutex;
}

/**
 * @brief Owns an FFTW real-to-complex plan and its aligned buffers.
 */
class RealFft {
public:
    explicit RealFft(size_t size) : m_size(size) {
        std::lock_guard<std::mutex> lock(plannerMutex());
        m_in = static_cast<double*>(fftw_malloc(sizeof(double) * size));
        m_out = static_cast<fftw_complex*>(fftw_malloc(sizeof(fftw_complex) * (size / 2 + 1)));
        if (!m_in || !m_out) {
            fftw_free(m_in);
            fftw_free(m_out);
            throw std::bad_alloc();
        }
        m_plan = fftw_plan_dft_r2c_1d(static_cast<int>(size), m_in, m_out, FFTW_ESTIMATE);
        if (!m_plan) {
            fftw_free(m_in);
            fftw_free(m_out);
            throw std::runtime_error("FFTW could not plan a forward transform of size " + std::to_string(size));
        }
    }

    ~RealFft() {
        std::lock_guard<std::mutex> lock(plannerMutex());
        fftw_destroy_plan(m_plan);
        fftw_free(m_in);
        fftw_free(m_out);
    }

    RealFft(const RealFft&) = delete;
    RealFft& operator=(const RealFft&) = delete;

    double* input() { return m_in; }
    const fftw_complex* output() const { return m_out; }
    size_t bins() const { return m_size / 2 + 1; }
    void execute() { fftw_execute(m_plan); }

private:
    size_t m_size;
    double* m_in = nullptr;
    fftw_complex* m_out = nullptr;
    fftw_plan m_plan = nullptr;
};

/**
 * @brief Owns an FFTW complex-to-real plan (unnormalised inverse).
 */
class InverseRealFft {
public:
    explicit InverseRealFft(size_t size) : m_size(size) {
        std::lock_guard<std::mutex> lock(plannerMutex());
        m_in = static_cast<fftw_complex*>(fftw_malloc(sizeof(fftw_complex) * (size / 2 + 1)));
        m_out = static_cast<double*>(fftw_malloc(sizeof(double) * size));
        if (!m_in || !m_out) {
            fftw_free(m_in);
            fftw_free(m_out);
            throw std::bad_alloc();
        }
        m_plan = fftw_plan_dft_c2r_1d(static_cast<int>(size), m_in, m_out, FFTW_ESTIMATE);
        if (!m_plan) {
            fftw_free(m_in);
            fftw_free(m_out);
            throw std::runtime_error("FFTW could not plan an inverse transform of size " + std::to_string(size));
        }
    }

    ~InverseRealFft() {
        std::lock_guard<std::mutex> lock(plannerMutex());
        fftw_destroy_plan(m_plan);
        fftw_free(m_in);
        fftw_free(m_out);
    }

    InverseRealFft(const InverseRealFft&) = delete;
    InverseRealFft& operator=(const InverseRealFft&) = delete;

    fftw_complex* input() { return m_in; }
    const double* output() const { return m_out; }
    void execute() { fftw_execute(m_plan); }

private:
    size_t m_size;
    fftw_complex* m_in = nullptr;
    double* m_out = nullptr;
    fftw_plan m_plan = nullptr;
};

/**
 * @brief Copies centred frame f into dst (zero outside the signal).
 */
void fillFrame(const std::vector<float>& signal, size_t f, const FrameParams& params, double* dst) {
    const long long half = static_cast<long long>(params.frameLength / 2);
    const long long start = static_cast<long long>(f * params.hopLength) - half;
    const long long n = static_cast<long long>(signal.size());
    for (size_t i = 0; i < params.frameLength; ++i) {
        const long long idx = start + static_cast<long long>(i);
        dst[i] = (idx >= 0 && idx < n) ? static_cast<double>(signal[static_cast<size_t>(idx)]) : 0.0;
    }
}

double median(std::vector<double>& scratch) {
    const size_t mid = scratch.size() / 2;
    std::nth_element(scratch.begin(), scratch.begin() + static_cast<long>(mid), scratch.end());
    return scratch[mid];
}

} // namespace

size_t frameCount(size_t numSamples, const FrameParams& params) {
    if (numSamples == 0 || params.hopLength == 0) {
        return 0;
    }
    return 1 + numSamples / params.hopLength;
}

std::vector<double> frameRms(const std::vector<float>& signal, const FrameParams& params) {
    const size_t numFrames = frameCount(signal.size(), params);
    std::vector<double> rms(numFrames, 0.0);
    std::vector<double> frame(params.frameLength);
    for (size_t f = 0; f < numFrames; ++f) {
        fillFrame(signal, f, params, frame.data());
        double sum = 0.0;
        for (double s : frame) sum += s * s;
        rms[f] = std::sqrt(sum / static_cast<double>(params.frameLength));
    }
    return rms;
}

std::vector<double> zeroCrossingRate(const std::vector<float>& signal, const FrameParams& params) {
    const size_t numFrames = frameCount(signal.size(), params);
    std::vector<double> zcr(numFrames, 0.0);
    std::vector<double> frame(params.frameLength);
    for (size_t f = 0; f < numFrames; ++f) {
        fillFrame(signal, f, params, frame.data());
        size_t crossings = 0;
        for (size_t i = 1; i < frame.size(); ++i) {
            if ((frame[i - 1] >= 0.0) != (frame[i] >= 0.0)) ++crossings;
        }
        zcr[f] = static_cast<double>(crossings) / static_cast<double>(params.frameLength);
    }
    return zcr;
}

Spectrogram magnitudeSpectrogram(const std::vector<float>& signal, float sampleRate,
                                 const FrameParams& params) {
    Spectrogram spec;
    spec.fftSize = params.frameLength;
    spec.sampleRate = sampleRate;
    spec.numFrames = frameCount(signal.size(), params);
    spec.numBins = params.frameLength / 2 + 1;
    if (spec.numFrames == 0) {
        return spec;
    }

    RealFft fft(params.frameLength);
    const std::vector<double> win = window::hann(params.frameLength);
    spec.magnitudes.assign(spec.numFrames * spec.numBins, 0.0);

    for (size_t f = 0; f < spec.numFrames; ++f) {
        double* in = fft.input();
        fillFrame(signal, f, params, in);
        for (size_t i = 0; i < params.frameLength; ++i) in[i] *= win[i];
        fft.execute();
        const fftw_complex* out = fft.output();
        for (size_t k = 0; k < spec.numBins; ++k) {
            spec.at(f, k) = std::hypot(out[k][0], out[k][1]);
        }
    }
    return spec;
}

std::vector<double> PitchTrack::voiced() const {
    std::vector<double> values;
    values.reserve(f0.size());
    for (double v : f0) {
        if (v > 0.0) values.push_back(v);
    }
    return values;
}

double PitchTrack::voicedFraction() const {
    if (f0.empty()) return 0.0;
    const auto count = std::count_if(f0.begin(), f0.end(), [](double v) { return v > 0.0; });
    return static_cast<double>(count) / static_cast<double>(f0.size());
}

PitchTrack trackPitch(const std::vector<float>& signal, float sampleRate,
                      double fmin, double fmax, const FrameParams& params,
                      double threshold) {
    if (!(fmin > 0.0) || !(fmax > fmin)) {
        throw std::invalid_argument("Pitch range must satisfy 0 < fmin < fmax");
    }

    PitchTrack track;
    const size_t numFrames = frameCount(signal.size(), params);
    track.f0.assign(numFrames, 0.0);
    if (numFrames == 0) {
        return track;
    }

    const size_t N = params.frameLength;
    const size_t W = N / 2; // integration window
    const double sr = static_cast<double>(sampleRate);
    const size_t tauMin = std::max<size_t>(2, static_cast<size_t>(std::floor(sr / fmax)));
    const size_t tauMax = std::min<size_t>(static_cast<size_t>(std::ceil(sr / fmin)), N - W - 1);
    if (tauMin >= tauMax) {
        // The frame cannot hold a single period of the requested range
        return track;
    }

    const size_t M = 2 * N;
    RealFft forward(M);
    InverseRealFft inverse(M);
    const size_t bins = forward.bins();

    std::vector<double> frame(N);
    std::vector<double> prefix(N + 1, 0.0);
    std::vector<double> aRe(bins), aIm(bins);
    std::vector<double> d(tauMax + 2, 0.0);
    std::vector<double> cmnd(tauMax + 2, 1.0);

    for (size_t f = 0; f < numFrames; ++f) {
        fillFrame(signal, f, params, frame.data());

        for (size_t i = 0; i < N; ++i) prefix[i + 1] = prefix[i] + frame[i] * frame[i];
        if (prefix[N] < 1e-8 * static_cast<double>(N)) {
            continue; // silence
        }

        // Cross-correlation of the integration window against the whole frame
        double* in = forward.input();
        for (size_t i = 0; i < M; ++i) in[i] = (i < W) ? frame[i] : 0.0;
        forward.execute();
        for (size_t k = 0; k < bins; ++k) {
            aRe[k] = forward.output()[k][0];
            aIm[k] = forward.output()[k][1];
        }
        for (size_t i = 0; i < M; ++i) in[i] = (i < N) ? frame[i] : 0.0;
        forward.execute();

        fftw_complex* spec = inverse.input();
        for (size_t k = 0; k < bins; ++k) {
            const double bRe = forward.output()[k][0];
            const double bIm = forward.output()[k][1];
            spec[k][0] = aRe[k] * bRe + aIm[k] * bIm;
            spec[k][1] = aRe[k] * bIm - aIm[k] * bRe;
        }
        inverse.execute();
        const double* corr = inverse.output();

        // Difference function and its cumulative mean normalisation
        double running = 0.0;
        for (size_t tau = 1; tau <= tauMax + 1; ++tau) {
            const double r = corr[tau] / static_cast<double>(M);
            const double dt = prefix[W] + (prefix[W + tau] - prefix[tau]) - 2.0 * r;
            d[tau] = std::max(0.0, dt);
            running += d[tau];
            cmnd[tau] = running > 0.0 ? d[tau] * static_cast<double>(tau) / running : 1.0;
        }

        size_t best = 0;
        for (size_t tau = tauMin; tau <= tauMax; ++tau) {
            if (cmnd[tau] < threshold) {
                while (tau + 1 <= tauMax && cmnd[tau + 1] < cmnd[tau]) ++tau;
                best = tau;
                break;
            }
        }
        if (best == 0) {
            continue; // unvoiced
        }

        const double s0 = cmnd[best - 1];
        const double s1 = cmnd[best];
        const double s2 = cmnd[best + 1];
        const double denom = s0 - 2.0 * s1 + s2;
        double shift = denom != 0.0 ? 0.5 * (s0 - s2) / denom : 0.0;
        shift = std::clamp(shift, -1.0, 1.0);

        const double hz = sr / (static_cast<double>(best) + shift);
        if (std::isfinite(hz) && hz >= fmin && hz <= fmax) {
            track.f0[f] = hz;
        }
    }
    return track;
}

HarmonicPercussiveEnergy separateHarmonicPercussive(const Spectrogram& spectrogram, size_t kernelSize) {
    if (spectrogram.empty()) {
        throw std::runtime_error("Cannot separate an empty spectrogram");
    }

    const size_t F = spectrogram.numFrames;
    const size_t K = spectrogram.numBins;
    const size_t half = std::max<size_t>(1, kernelSize) / 2;

    std::vector<double> harmonic(F * K, 0.0);
    std::vector<double> percussive(F * K, 0.0);
    std::vector<double> scratch;
    scratch.reserve(2 * half + 1);

    // Harmonic: median along time for each bin
    for (size_t k = 0; k < K; ++k) {
        for (size_t f = 0; f < F; ++f) {
            const size_t lo = f > half ? f - half : 0;
            const size_t hi = std::min(F - 1, f + half);
            scratch.clear();
            for (size_t t = lo; t <= hi; ++t) scratch.push_back(spectrogram.at(t, k));
            harmonic[f * K + k] = median(scratch);
        }
    }

    // Percussive: median along frequency for each frame
    for (size_t f = 0; f < F; ++f) {
        for (size_t k = 0; k < K; ++k) {
            const size_t lo = k > half ? k - half : 0;
            const size_t hi = std::min(K - 1, k + half);
            scratch.clear();
            for (size_t b = lo; b <= hi; ++b) scratch.push_back(spectrogram.at(f, b));
            percussive[f * K + k] = median(scratch);
        }
    }

    HarmonicPercussiveEnergy energy;
    for (size_t i = 0; i < F * K; ++i) {
        const double h2 = harmonic[i] * harmonic[i];
        const double p2 = percussive[i] * percussive[i];
        const double total = h2 + p2;
        if (total <= 0.0) continue;
        const double s = spectrogram.magnitudes[i];
        const double hs = (h2 / total) * s;
        const double ps = (p2 / total) * s;
        energy.harmonic += hs * hs;
        energy.percussive += ps * ps;
    }

    if (!std::isfinite(energy.harmonic) || !std::isfinite(energy.percussive)) {
        throw std::runtime_error("Harmonic/percussive separation produced non-finite energy");
    }
    return energy;
}

double harmonicToNoiseRatio(const std::vector<float>& signal, float sampleRate,
                            const FrameParams& params, double zeroNoiseDb) {
    const Spectrogram spec = magnitudeSpectrogram(signal, sampleRate, params);
    const HarmonicPercussiveEnergy energy = separateHarmonicPercussive(spec);
    if (energy.percussive <= 0.0) {
        return zeroNoiseDb;
    }
    const double hnr = 10.0 * std::log10(std::max(energy.harmonic, 1e-20) / energy.percussive);
    if (!std::isfinite(hnr)) {
        throw std::runtime_error("Harmonic-to-noise ratio is not finite");
    }
    return hnr;
}

double mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double stddev(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    const double m = mean(values);
    double acc = 0.0;
    for (double v : values) acc += (v - m) * (v - m);
    return std::sqrt(acc / static_cast<double>(values.size()));
}

std::vector<double> diff(const std::vector<double>& values) {
    std::vector<double> out;
    if (values.size() < 2) return out;
    out.reserve(values.size() - 1);
    for (size_t i = 1; i < values.size(); ++i) out.push_back(values[i] - values[i - 1]);
    return out;
}

double roundTo(double value, int decimals) {
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

double finiteOr(double value, double fallback) {
    return std::isfinite(value) ? value : fallback;
}

bool allFinite(const std::vector<double>& values) {
    return std::all_of(values.begin(), values.end(), [](double v) { return std::isfinite(v); });
}

} // namespace vera::core::dsp
