#include <iostream>
#include <vector>
#include <cmath>
#include <random>
#include <algorithm>
#include "../include/core/AudioBuffer.h"
#include "../include/core/SignalAnalysis.h"

namespace dsp = vera::core::dsp;

static std::vector<float> make_sine(double freq, float sr, double durSec, float amp = 0.5f) {
    size_t frames = static_cast<size_t>(durSec * sr);
    std::vector<float> d(frames);
    const double twopi = 2.0 * M_PI;
    for (size_t n = 0; n < frames; ++n) {
        d[n] = amp * static_cast<float>(std::sin(twopi * freq * (static_cast<double>(n) / sr)));
    }
    return d;
}

static std::vector<float> make_noise(float sr, double durSec, float amp = 0.3f, unsigned seed = 7) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<float> dist(-amp, amp);
    std::vector<float> d(static_cast<size_t>(durSec * sr));
    for (auto& s : d) s = dist(rng);
    return d;
}

bool test_frame_count_centred() {
    dsp::FrameParams p;
    // 1 + n / hop
    bool ok = dsp::frameCount(16000, p) == 1 + 16000 / 512 &&
              dsp::frameCount(0, p) == 0 &&
              dsp::frameCount(1, p) == 1;
    if (!ok) std::cerr << "frameCount(16000)=" << dsp::frameCount(16000, p) << std::endl;
    return ok;
}

bool test_rms_of_sine() {
    const float sr = 16000.0f;
    auto sig = make_sine(440.0, sr, 1.0, 0.5f);
    auto rms = dsp::frameRms(sig, dsp::FrameParams());
    if (rms.size() != dsp::frameCount(sig.size(), dsp::FrameParams())) return false;

    // Interior frames are not affected by the padding
    const double expected = 0.5 / std::sqrt(2.0);
    const double mid = rms[rms.size() / 2];
    std::cout << "sine RMS mid-frame=" << mid << " (expected " << expected << ")" << std::endl;
    return std::abs(mid - expected) / expected < 0.02;
}

bool test_zero_crossing_rate_of_sine() {
    const float sr = 16000.0f;
    auto sig = make_sine(1000.0, sr, 1.0, 0.5f);
    auto zcr = dsp::zeroCrossingRate(sig, dsp::FrameParams());
    const double mid = zcr[zcr.size() / 2];
    const double expected = 2.0 * 1000.0 / sr;
    std::cout << "ZCR mid-frame=" << mid << " (expected " << expected << ")" << std::endl;
    return std::abs(mid - expected) / expected < 0.1;
}

bool test_pitch_tracker_on_sine() {
    const float sr = 16000.0f;
    auto sig = make_sine(220.0, sr, 1.5, 0.6f);
    auto track = dsp::trackPitch(sig, sr, 65.4, 2093.0, dsp::FrameParams());
    auto voiced = track.voiced();
    if (voiced.empty()) {
        std::cerr << "No voiced frames on a 220 Hz sine" << std::endl;
        return false;
    }
    std::nth_element(voiced.begin(), voiced.begin() + voiced.size() / 2, voiced.end());
    const double median = voiced[voiced.size() / 2];
    std::cout << "YIN median f0=" << median << ", voiced fraction=" << track.voicedFraction() << std::endl;
    return std::abs(median - 220.0) / 220.0 < 0.02 && track.voicedFraction() > 0.8;
}

bool test_pitch_tracker_silence_unvoiced() {
    std::vector<float> silence(16000, 0.0f);
    auto track = dsp::trackPitch(silence, 16000.0f, 65.4, 2093.0, dsp::FrameParams());
    return track.voiced().empty() && track.voicedFraction() == 0.0;
}

bool test_pitch_tracker_rejects_empty_range() {
    std::vector<float> sig = make_sine(200.0, 16000.0f, 0.5);
    try {
        (void)dsp::trackPitch(sig, 16000.0f, 400.0, 100.0, dsp::FrameParams());
    } catch (const std::invalid_argument&) {
        return true;
    }
    std::cerr << "Expected invalid_argument for fmin > fmax" << std::endl;
    return false;
}

bool test_hnr_sine_above_noise() {
    const float sr = 16000.0f;
    const double sineHnr = dsp::harmonicToNoiseRatio(make_sine(200.0, sr, 1.0), sr, dsp::FrameParams(), 40.0);
    const double noiseHnr = dsp::harmonicToNoiseRatio(make_noise(sr, 1.0), sr, dsp::FrameParams(), 40.0);
    std::cout << "HNR sine=" << sineHnr << " dB, noise=" << noiseHnr << " dB" << std::endl;
    return std::isfinite(sineHnr) && std::isfinite(noiseHnr) && sineHnr > noiseHnr + 10.0;
}

bool test_statistics_helpers() {
    const std::vector<double> v = {1.0, 2.0, 3.0, 4.0};
    bool ok = std::abs(dsp::mean(v) - 2.5) < 1e-12;
    ok = ok && std::abs(dsp::stddev(v) - std::sqrt(1.25)) < 1e-12; // population std
    ok = ok && dsp::diff(v) == std::vector<double>({1.0, 1.0, 1.0});
    ok = ok && dsp::mean({}) == 0.0 && dsp::stddev({}) == 0.0 && dsp::diff({1.0}).empty();
    ok = ok && std::abs(dsp::roundTo(1.23456, 3) - 1.235) < 1e-12;
    ok = ok && std::abs(dsp::roundTo(-1.5, 0) + 2.0) < 1e-12;
    ok = ok && dsp::finiteOr(std::nan(""), 0.5) == 0.5 && dsp::finiteOr(0.25, 0.5) == 0.25;
    ok = ok && dsp::allFinite({}) && !dsp::allFinite({1.0, INFINITY});
    return ok;
}

bool test_audio_buffer_mono_mixdown() {
    vera::core::AudioBuffer buf(2, 4, 16000.0f);
    for (size_t i = 0; i < 4; ++i) {
        buf.getChannel(0)[i] = 1.0f;
        buf.getChannel(1)[i] = 0.0f;
    }
    auto mono = buf.getMono();
    bool ok = mono.size() == 4 && std::all_of(mono.begin(), mono.end(), [](float s) { return s == 0.5f; });
    auto slice = buf.slice(1, 10);
    ok = ok && slice.getFrameCount() == 3 && slice.getChannelCount() == 2;
    ok = ok && std::abs(buf.getDuration() - 4.0 / 16000.0) < 1e-12;
    return ok;
}
